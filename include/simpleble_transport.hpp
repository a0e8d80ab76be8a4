#pragma once

#include "ble_transport.hpp"
#include <simpleble/SimpleBLE.h>

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// BleTransport over SimpleBLE (BlueZ on Linux). Uses the first adapter.
class SimpleBleTransport : public BleTransport {
public:
    SimpleBleTransport();
    ~SimpleBleTransport() override;

    SimpleBleTransport(const SimpleBleTransport&) = delete;
    SimpleBleTransport& operator=(const SimpleBleTransport&) = delete;

    bool adapter_available() override;
    std::vector<BlePeripheralInfo> scan(const ScanFilter& filter) override;
    TransportError connect(const BlePeripheralInfo& peripheral, BleConnection& out) override;
    TransportError discover_services(const BleConnection& conn, std::vector<BleCharacteristic>& out) override;
    TransportError subscribe(const BleConnection& conn, const BleCharacteristic& characteristic) override;
    TransportError await_notification(const BleConnection& conn,
                                      std::chrono::milliseconds timeout,
                                      std::vector<uint8_t>& out) override;
    void disconnect(const BleConnection& conn) override;

private:
    // Notifications arrive on SimpleBLE's thread; callbacks hold the link by
    // shared_ptr so a late callback after disconnect stays harmless.
    struct Link {
        SimpleBLE::Peripheral peripheral;
        std::deque<std::vector<uint8_t>> pending;
        bool up = true;
    };

    std::shared_ptr<Link> find_link(uint32_t id);

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<SimpleBLE::Adapter> adapters_;
    std::map<BleAddress, SimpleBLE::Peripheral> last_scan_;
    std::map<uint32_t, std::shared_ptr<Link>> links_;
    uint32_t next_id_ = 0;
};
