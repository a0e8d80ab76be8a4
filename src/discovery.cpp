#include "discovery.hpp"
#include "fault.hpp"
#include "logging.hpp"

#include <vector>

namespace {
constexpr const char* kTag = "DISCOVERY";

const BlePeripheralInfo* find_peripheral(const std::vector<BlePeripheralInfo>& visible, const BleAddress& address) {
    for (const auto& p : visible) {
        if (p.address == address) {
            return &p;
        }
    }
    return nullptr;
}

const BleCharacteristic* find_notify_channel(const std::vector<BleCharacteristic>& chars) {
    for (const auto& c : chars) {
        if (c.uuid == kNusTxCharacteristicUuid && c.can_notify) {
            return &c;
        }
    }
    return nullptr;
}
} // namespace

DiscoverySettings discovery_settings_from(const CollectorConfig& cfg) {
    DiscoverySettings s{};
    s.filter.name_contains = cfg.name_filter;
    s.filter.duration = std::chrono::milliseconds(cfg.scan_duration_ms);
    s.retry_delay = std::chrono::milliseconds(cfg.retry_delay_ms);
    s.reconcile_interval = std::chrono::milliseconds(cfg.reconcile_interval_ms);
    s.startup_timeout = std::chrono::milliseconds(cfg.startup_timeout_ms);
    return s;
}

DiscoveryManager::DiscoveryManager(BleTransport& transport, DeviceRegistry& registry, const DiscoverySettings& settings)
    : transport_(transport), registry_(registry), settings_(settings) {}

DiscoveryManager::~DiscoveryManager() {
    stop();
}

void DiscoveryManager::fail_device(const std::string& name, DeviceState from, const BleConnection* conn,
                                   const char* stage, const char* reason, ReconcileReport& report) {
    record_transport_failure(name.c_str(), stage, reason);
    if (conn != nullptr) {
        transport_.disconnect(*conn);
    }
    if (registry_.mark_failed(name, from)) {
        report.failed_now++;
    }
}

void DiscoveryManager::bring_up(const DeviceDescriptor& desc, const BlePeripheralInfo& peripheral,
                                ReconcileReport& report) {
    const std::string& name = desc.name;

    switch (desc.state) {
        case DeviceState::Unseen:
            if (!registry_.transition(name, DeviceState::Unseen, DeviceState::Discovered)) return;
            if (!registry_.transition(name, DeviceState::Discovered, DeviceState::Connecting)) return;
            break;
        case DeviceState::Discovered:
            if (!registry_.transition(name, DeviceState::Discovered, DeviceState::Connecting)) return;
            break;
        case DeviceState::Failed:
            if (!registry_.transition(name, DeviceState::Failed, DeviceState::Connecting)) return;
            break;
        default:
            return;
    }
    report.attempted++;

    BleConnection conn{};
    TransportError err = transport_.connect(peripheral, conn);
    if (err != TransportError::None) {
        fail_device(name, DeviceState::Connecting, nullptr, "connect", transport_error_name(err), report);
        return;
    }
    if (!registry_.mark_connected(name, conn)) {
        transport_.disconnect(conn);
        return;
    }

    std::vector<BleCharacteristic> chars;
    err = transport_.discover_services(conn, chars);
    if (err != TransportError::None) {
        fail_device(name, DeviceState::Connected, &conn, "discover_services", transport_error_name(err), report);
        return;
    }
    const BleCharacteristic* channel = find_notify_channel(chars);
    if (channel == nullptr) {
        fail_device(name, DeviceState::Connected, &conn, "discover_services", "notify_channel_missing", report);
        return;
    }

    err = transport_.subscribe(conn, *channel);
    if (err != TransportError::None) {
        fail_device(name, DeviceState::Connected, &conn, "subscribe", transport_error_name(err), report);
        return;
    }
    if (!registry_.transition(name, DeviceState::Connected, DeviceState::Subscribed)) {
        transport_.disconnect(conn);
        return;
    }
    report.subscribed_now++;
    log_info(kTag, "%s (%s) subscribed", name.c_str(), format_ble_address(desc.hardware_address).c_str());
}

ReconcileReport DiscoveryManager::reconcile_once() {
    ReconcileReport report{};
    const std::vector<BlePeripheralInfo> visible = transport_.scan(settings_.filter);
    const auto now = std::chrono::system_clock::now();
    log_debug(kTag, "scan found %zu peripherals", visible.size());

    for (const DeviceDescriptor& desc : registry_.snapshot()) {
        const BlePeripheralInfo* peripheral = find_peripheral(visible, desc.hardware_address);
        if (peripheral == nullptr) {
            continue;
        }
        report.visible++;
        registry_.note_seen(desc.name, now);
        if (desc.state == DeviceState::Subscribed) {
            continue;
        }
        bring_up(desc, *peripheral, report);
    }

    report.pending = registry_.size() - registry_.in_state(DeviceState::Subscribed).size();
    if (report.pending > 0) {
        report_unavailable();
    }
    return report;
}

void DiscoveryManager::report_unavailable() const {
    for (const DeviceDescriptor& desc : registry_.snapshot()) {
        if (desc.state == DeviceState::Subscribed) {
            continue;
        }
        log_warn(kTag, "%s (%s) unavailable: state=%s consecutive_failures=%u",
                 desc.name.c_str(),
                 format_ble_address(desc.hardware_address).c_str(),
                 device_state_name(desc.state),
                 desc.consecutive_failures);
    }
}

bool DiscoveryManager::run_until_all_subscribed(ShutdownSignal& shutdown) {
    const auto started = std::chrono::steady_clock::now();
    for (;;) {
        if (shutdown.stop_requested()) {
            return false;
        }
        const ReconcileReport report = reconcile_once();
        if (report.pending == 0) {
            log_info(kTag, "all %zu devices subscribed", registry_.size());
            return true;
        }
        if (settings_.startup_timeout.count() > 0 &&
            std::chrono::steady_clock::now() - started >= settings_.startup_timeout) {
            log_warn(kTag, "startup timeout: %zu of %zu devices still pending", report.pending, registry_.size());
            return false;
        }
        if (shutdown.wait_for(settings_.retry_delay)) {
            return false;
        }
    }
}

void DiscoveryManager::background_loop(ShutdownSignal* shutdown) {
    while (!shutdown->stop_requested()) {
        // Healthy fleets are checked at the slow interval; missing devices at the retry delay.
        const bool healthy = registry_.all_in_state(DeviceState::Subscribed);
        const auto wait = healthy ? settings_.reconcile_interval : settings_.retry_delay;
        if (worker_stop_.wait_for(wait) || shutdown->stop_requested()) {
            break;
        }
        if (registry_.all_in_state(DeviceState::Subscribed)) {
            continue;
        }
        reconcile_once();
    }
    log_debug(kTag, "background reconciler exiting");
}

void DiscoveryManager::start_background(ShutdownSignal& shutdown) {
    if (worker_.joinable()) {
        return;
    }
    worker_stop_.reset();
    worker_ = std::thread(&DiscoveryManager::background_loop, this, &shutdown);
}

void DiscoveryManager::stop() {
    worker_stop_.request_stop();
    if (worker_.joinable()) {
        worker_.join();
    }
}
