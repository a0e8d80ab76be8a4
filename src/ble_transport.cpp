#include "ble_transport.hpp"

const char* transport_error_name(TransportError err) {
    switch (err) {
        case TransportError::None: return "none";
        case TransportError::NotFound: return "not_found";
        case TransportError::ConnectFailed: return "connect_failed";
        case TransportError::SubscribeFailed: return "subscribe_failed";
        case TransportError::Timeout: return "timeout";
        case TransportError::Disconnected: return "disconnected";
    }
    return "unknown";
}
