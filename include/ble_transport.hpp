#pragma once

#include "telemetry.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Nordic UART Service; RuuviTags push their data on the TX characteristic.
constexpr const char* kNusServiceUuid = "6e400001-b5a3-f393-e0a9-e50e24dcca9e";
constexpr const char* kNusTxCharacteristicUuid = "6e400003-b5a3-f393-e0a9-e50e24dcca9e";

enum class TransportError : uint8_t {
    None = 0,
    NotFound,
    ConnectFailed,
    SubscribeFailed,
    Timeout,
    Disconnected,
};

const char* transport_error_name(TransportError err);

struct ScanFilter {
    // Substring the advertised name must contain. Empty matches everything.
    std::string name_contains;
    std::chrono::milliseconds duration{3000};
};

struct BlePeripheralInfo {
    BleAddress address;
    std::string name;
};

struct BleConnection {
    uint32_t id;
    BleAddress address;
};

struct BleCharacteristic {
    std::string service_uuid;
    std::string uuid;
    bool can_notify;
};

// Host wireless stack. Implementations must be safe to call from several
// threads as long as each connection is used by one caller at a time.
class BleTransport {
public:
    virtual ~BleTransport() = default;

    virtual bool adapter_available() = 0;
    virtual std::vector<BlePeripheralInfo> scan(const ScanFilter& filter) = 0;
    virtual TransportError connect(const BlePeripheralInfo& peripheral, BleConnection& out) = 0;
    virtual TransportError discover_services(const BleConnection& conn,
                                             std::vector<BleCharacteristic>& out) = 0;
    virtual TransportError subscribe(const BleConnection& conn, const BleCharacteristic& characteristic) = 0;
    virtual TransportError await_notification(const BleConnection& conn,
                                              std::chrono::milliseconds timeout,
                                              std::vector<uint8_t>& out) = 0;
    virtual void disconnect(const BleConnection& conn) = 0;
};
