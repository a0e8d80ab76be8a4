#pragma once

#include "ble_transport.hpp"
#include "config.hpp"
#include "device_registry.hpp"
#include "shutdown.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <thread>

struct DiscoverySettings {
    ScanFilter filter;
    std::chrono::milliseconds retry_delay;
    std::chrono::milliseconds reconcile_interval;
    std::chrono::milliseconds startup_timeout; // zero waits forever
};

DiscoverySettings discovery_settings_from(const CollectorConfig& cfg);

struct ReconcileReport {
    std::size_t visible;        // configured devices seen in this scan
    std::size_t attempted;      // bring-up attempts started
    std::size_t subscribed_now; // attempts that reached Subscribed
    std::size_t failed_now;     // attempts that ended in Failed
    std::size_t pending;        // devices still not Subscribed after the pass
};

// Matches configured devices against what the adapter can see and walks each
// visible, unsubscribed device through connect / discover / subscribe.
class DiscoveryManager {
public:
    DiscoveryManager(BleTransport& transport, DeviceRegistry& registry, const DiscoverySettings& settings);
    ~DiscoveryManager();

    DiscoveryManager(const DiscoveryManager&) = delete;
    DiscoveryManager& operator=(const DiscoveryManager&) = delete;

    ReconcileReport reconcile_once();

    // Startup phase: repeats reconcile_once() every retry_delay until every
    // device is Subscribed. Returns false on shutdown or startup timeout.
    bool run_until_all_subscribed(ShutdownSignal& shutdown);

    void start_background(ShutdownSignal& shutdown);
    void stop();
    bool background_running() const { return worker_.joinable(); }

private:
    void bring_up(const DeviceDescriptor& desc, const BlePeripheralInfo& peripheral, ReconcileReport& report);
    void fail_device(const std::string& name, DeviceState from, const BleConnection* conn,
                     const char* stage, const char* reason, ReconcileReport& report);
    void report_unavailable() const;
    void background_loop(ShutdownSignal* shutdown);

    BleTransport& transport_;
    DeviceRegistry& registry_;
    DiscoverySettings settings_;
    std::thread worker_;
    ShutdownSignal worker_stop_;
};
