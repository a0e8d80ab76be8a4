#include "simpleble_transport.hpp"
#include "logging.hpp"

#include <exception>

namespace {
constexpr const char* kTag = "BLE";
constexpr std::size_t kMaxPendingNotifications = 8;
} // namespace

SimpleBleTransport::SimpleBleTransport() {
    try {
        if (!SimpleBLE::Adapter::bluetooth_enabled()) {
            log_error(kTag, "bluetooth is disabled");
            return;
        }
        adapters_ = SimpleBLE::Adapter::get_adapters();
    } catch (const std::exception& e) {
        log_error(kTag, "adapter enumeration failed: %s", e.what());
        adapters_.clear();
    }
    if (!adapters_.empty()) {
        log_info(kTag, "using adapter %s (%s)",
                 adapters_.front().identifier().c_str(), adapters_.front().address().c_str());
    }
}

SimpleBleTransport::~SimpleBleTransport() {
    std::map<uint32_t, std::shared_ptr<Link>> links;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        links.swap(links_);
    }
    for (auto& kv : links) {
        try {
            if (kv.second->peripheral.is_connected()) {
                kv.second->peripheral.disconnect();
            }
        } catch (const std::exception& e) {
            log_warn(kTag, "disconnect on shutdown failed: %s", e.what());
        }
    }
}

bool SimpleBleTransport::adapter_available() {
    return !adapters_.empty();
}

std::shared_ptr<SimpleBleTransport::Link> SimpleBleTransport::find_link(uint32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = links_.find(id);
    return it == links_.end() ? nullptr : it->second;
}

std::vector<BlePeripheralInfo> SimpleBleTransport::scan(const ScanFilter& filter) {
    std::vector<BlePeripheralInfo> out;
    if (adapters_.empty()) {
        return out;
    }
    std::vector<SimpleBLE::Peripheral> found;
    try {
        adapters_.front().scan_for(static_cast<int>(filter.duration.count()));
        found = adapters_.front().scan_get_results();
    } catch (const std::exception& e) {
        log_warn(kTag, "scan failed: %s", e.what());
        return out;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    last_scan_.clear();
    for (auto& peripheral : found) {
        BlePeripheralInfo info{};
        info.name = peripheral.identifier();
        if (!parse_ble_address(peripheral.address(), info.address)) {
            continue;
        }
        if (!filter.name_contains.empty() && info.name.find(filter.name_contains) == std::string::npos) {
            continue;
        }
        last_scan_.emplace(info.address, peripheral);
        out.push_back(info);
    }
    return out;
}

TransportError SimpleBleTransport::connect(const BlePeripheralInfo& peripheral, BleConnection& out) {
    SimpleBLE::Peripheral target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = last_scan_.find(peripheral.address);
        if (it == last_scan_.end()) {
            return TransportError::NotFound;
        }
        target = it->second;
    }

    try {
        if (!target.is_connected()) {
            target.connect();
        }
        if (!target.is_connected()) {
            return TransportError::ConnectFailed;
        }
    } catch (const std::exception& e) {
        log_warn(kTag, "connect %s failed: %s", format_ble_address(peripheral.address).c_str(), e.what());
        return TransportError::ConnectFailed;
    }

    auto link = std::make_shared<Link>();
    link->peripheral = target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out = BleConnection{++next_id_, peripheral.address};
        links_[out.id] = link;
    }

    std::weak_ptr<Link> weak = link;
    link->peripheral.set_callback_on_disconnected([this, weak]() {
        if (auto l = weak.lock()) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                l->up = false;
            }
            cv_.notify_all();
        }
    });
    return TransportError::None;
}

TransportError SimpleBleTransport::discover_services(const BleConnection& conn, std::vector<BleCharacteristic>& out) {
    auto link = find_link(conn.id);
    if (link == nullptr) {
        return TransportError::Disconnected;
    }
    out.clear();
    try {
        for (auto& service : link->peripheral.services()) {
            for (auto& characteristic : service.characteristics()) {
                out.push_back(BleCharacteristic{service.uuid(), characteristic.uuid(), characteristic.can_notify()});
            }
        }
    } catch (const std::exception& e) {
        log_warn(kTag, "service discovery on %s failed: %s", format_ble_address(conn.address).c_str(), e.what());
        return TransportError::Disconnected;
    }
    return TransportError::None;
}

TransportError SimpleBleTransport::subscribe(const BleConnection& conn, const BleCharacteristic& characteristic) {
    auto link = find_link(conn.id);
    if (link == nullptr) {
        return TransportError::Disconnected;
    }
    std::weak_ptr<Link> weak = link;
    try {
        link->peripheral.notify(characteristic.service_uuid, characteristic.uuid,
                                [this, weak](SimpleBLE::ByteArray payload) {
            auto l = weak.lock();
            if (!l) {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                l->pending.emplace_back(payload.begin(), payload.end());
                while (l->pending.size() > kMaxPendingNotifications) {
                    l->pending.pop_front();
                }
            }
            cv_.notify_all();
        });
    } catch (const std::exception& e) {
        log_warn(kTag, "subscribe on %s failed: %s", format_ble_address(conn.address).c_str(), e.what());
        return TransportError::SubscribeFailed;
    }
    return TransportError::None;
}

TransportError SimpleBleTransport::await_notification(const BleConnection& conn,
                                                      std::chrono::milliseconds timeout,
                                                      std::vector<uint8_t>& out) {
    auto link = find_link(conn.id);
    if (link == nullptr) {
        return TransportError::Disconnected;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = cv_.wait_for(lock, timeout, [&] { return !link->up || !link->pending.empty(); });
    if (!link->up) {
        return TransportError::Disconnected;
    }
    if (!ready) {
        return TransportError::Timeout;
    }
    // Only the newest sample matters to a poll; older ones are stale.
    out = link->pending.back();
    link->pending.clear();
    return TransportError::None;
}

void SimpleBleTransport::disconnect(const BleConnection& conn) {
    std::shared_ptr<Link> link;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = links_.find(conn.id);
        if (it == links_.end()) {
            return;
        }
        link = it->second;
        link->up = false;
        links_.erase(it);
    }
    cv_.notify_all();
    try {
        if (link->peripheral.is_connected()) {
            link->peripheral.disconnect();
        }
    } catch (const std::exception& e) {
        log_warn(kTag, "disconnect %s failed: %s", format_ble_address(conn.address).c_str(), e.what());
    }
}
