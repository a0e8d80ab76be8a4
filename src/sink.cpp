#include "sink.hpp"

const char* sink_error_name(SinkError err) {
    switch (err) {
        case SinkError::None: return "none";
        case SinkError::WriteFailed: return "write_failed";
    }
    return "unknown";
}
