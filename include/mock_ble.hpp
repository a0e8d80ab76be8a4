#pragma once

#include "ble_transport.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// In-memory BLE host stack for tests. Devices are keyed by address; failures,
// delays and notifications are scripted per device.
class MockBleTransport : public BleTransport {
public:
    void set_adapter_available(bool available) {
        std::lock_guard<std::mutex> lock(mutex_);
        adapter_available_ = available;
    }

    void add_device(const BleAddress& address, const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        Device& dev = devices_[address];
        dev.name = name;
        dev.visible = true;
        dev.characteristics = {BleCharacteristic{kNusServiceUuid, kNusTxCharacteristicUuid, true}};
    }

    void set_visible(const BleAddress& address, bool visible) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[address].visible = visible;
    }

    void fail_next_connects(const BleAddress& address, uint32_t count) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[address].connect_failures = count;
    }

    void fail_next_subscribes(const BleAddress& address, uint32_t count) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[address].subscribe_failures = count;
    }

    void set_characteristics(const BleAddress& address, const std::vector<BleCharacteristic>& chars) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[address].characteristics = chars;
    }

    // Reads block this long before answering; longer than the timeout means Timeout.
    void set_read_delay(const BleAddress& address, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[address].read_delay = delay;
    }

    void push_notification(const BleAddress& address, const std::vector<uint8_t>& payload) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            devices_[address].notifications.push_back(payload);
        }
        cv_.notify_all();
    }

    // Simulates the peripheral going away; pending and later reads fail.
    void drop_link(const BleAddress& address) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Device& dev = devices_[address];
            dev.link_up = false;
            dev.visible = false;
        }
        cv_.notify_all();
    }

    std::size_t scan_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return scans_;
    }

    uint32_t connect_count(const BleAddress& address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = devices_.find(address);
        return it == devices_.end() ? 0 : it->second.connects;
    }

    uint32_t disconnect_count(const BleAddress& address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = devices_.find(address);
        return it == devices_.end() ? 0 : it->second.disconnects;
    }

    bool is_subscribed(const BleAddress& address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = devices_.find(address);
        return it != devices_.end() && it->second.link_up && it->second.subscribed;
    }

    bool adapter_available() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return adapter_available_;
    }

    std::vector<BlePeripheralInfo> scan(const ScanFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++scans_;
        std::vector<BlePeripheralInfo> out;
        for (const auto& kv : devices_) {
            if (!kv.second.visible) continue;
            if (!filter.name_contains.empty() &&
                kv.second.name.find(filter.name_contains) == std::string::npos) {
                continue;
            }
            out.push_back(BlePeripheralInfo{kv.first, kv.second.name});
        }
        return out;
    }

    TransportError connect(const BlePeripheralInfo& peripheral, BleConnection& out) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = devices_.find(peripheral.address);
        if (it == devices_.end() || !it->second.visible) {
            return TransportError::NotFound;
        }
        Device& dev = it->second;
        dev.connects++;
        if (dev.connect_failures > 0) {
            dev.connect_failures--;
            return TransportError::ConnectFailed;
        }
        dev.link_up = true;
        dev.subscribed = false;
        dev.notifications.clear();
        out = BleConnection{++next_conn_id_, peripheral.address};
        dev.conn_id = out.id;
        return TransportError::None;
    }

    TransportError discover_services(const BleConnection& conn, std::vector<BleCharacteristic>& out) override {
        std::lock_guard<std::mutex> lock(mutex_);
        Device* dev = live_device(conn);
        if (dev == nullptr) {
            return TransportError::Disconnected;
        }
        out = dev->characteristics;
        return TransportError::None;
    }

    TransportError subscribe(const BleConnection& conn, const BleCharacteristic& characteristic) override {
        std::lock_guard<std::mutex> lock(mutex_);
        Device* dev = live_device(conn);
        if (dev == nullptr) {
            return TransportError::Disconnected;
        }
        if (dev->subscribe_failures > 0) {
            dev->subscribe_failures--;
            return TransportError::SubscribeFailed;
        }
        for (const auto& c : dev->characteristics) {
            if (c.uuid == characteristic.uuid && c.can_notify) {
                dev->subscribed = true;
                return TransportError::None;
            }
        }
        return TransportError::SubscribeFailed;
    }

    TransportError await_notification(const BleConnection& conn,
                                      std::chrono::milliseconds timeout,
                                      std::vector<uint8_t>& out) override {
        const auto start = std::chrono::steady_clock::now();
        std::unique_lock<std::mutex> lock(mutex_);
        Device* dev = live_device(conn);
        if (dev == nullptr || !dev->subscribed) {
            return TransportError::Disconnected;
        }
        const std::chrono::milliseconds delay = dev->read_delay;
        if (delay.count() > 0) {
            const auto wake = start + std::min(delay, timeout);
            cv_.wait_until(lock, wake, [&] { return live_device(conn) == nullptr; });
            if (live_device(conn) == nullptr) {
                return TransportError::Disconnected;
            }
            if (delay >= timeout) {
                return TransportError::Timeout;
            }
        }
        const bool ready = cv_.wait_until(lock, start + timeout, [&] {
            Device* d = live_device(conn);
            return d == nullptr || !d->notifications.empty();
        });
        dev = live_device(conn);
        if (dev == nullptr) {
            return TransportError::Disconnected;
        }
        if (!ready) {
            return TransportError::Timeout;
        }
        out = dev->notifications.back();
        dev->notifications.clear();
        return TransportError::None;
    }

    void disconnect(const BleConnection& conn) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = devices_.find(conn.address);
            if (it == devices_.end()) {
                return;
            }
            it->second.disconnects++;
            if (it->second.conn_id == conn.id) {
                it->second.link_up = false;
                it->second.subscribed = false;
            }
        }
        cv_.notify_all();
    }

private:
    struct Device {
        std::string name;
        bool visible = false;
        bool link_up = false;
        bool subscribed = false;
        uint32_t conn_id = 0;
        uint32_t connect_failures = 0;
        uint32_t subscribe_failures = 0;
        uint32_t connects = 0;
        uint32_t disconnects = 0;
        std::chrono::milliseconds read_delay{0};
        std::vector<BleCharacteristic> characteristics;
        std::deque<std::vector<uint8_t>> notifications;
    };

    Device* live_device(const BleConnection& conn) {
        const auto it = devices_.find(conn.address);
        if (it == devices_.end() || !it->second.link_up || it->second.conn_id != conn.id) {
            return nullptr;
        }
        return &it->second;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<BleAddress, Device> devices_;
    bool adapter_available_ = true;
    std::size_t scans_ = 0;
    uint32_t next_conn_id_ = 0;
};
