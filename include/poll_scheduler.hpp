#pragma once

#include "ble_transport.hpp"
#include "config.hpp"
#include "device_registry.hpp"
#include "export_pipeline.hpp"
#include "shutdown.hpp"
#include "telemetry.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

struct PollSettings {
    std::chrono::milliseconds period;
    std::chrono::milliseconds read_timeout;
    std::size_t max_parallel_reads;
    uint32_t stale_after_failures; // consecutive read misses before reconnect
};

PollSettings poll_settings_from(const CollectorConfig& cfg);

struct TickResult {
    std::vector<SensorReading> batch;
    std::size_t attempted;
    std::size_t timeouts;
    std::size_t decode_failures;
    std::size_t transport_failures;
    bool discarded;       // shutdown arrived mid-tick; nothing exported
    SinkError export_result;
};

struct SchedulerStatus {
    uint64_t ticks;
    uint64_t discarded_ticks;
    uint64_t late_ticks;      // ticks that started more than one period late
    uint64_t export_failures;
    std::chrono::milliseconds last_tick_duration;
};

// Fixed-rate poll loop: every period, read the latest notification from each
// Subscribed device (bounded fan-out, per-read timeout), decode, and hand the
// batch to the export pipeline on this thread so batches stay in tick order.
class PollScheduler {
public:
    using TickObserver = std::function<void(uint64_t tick, const TickResult& result)>;

    PollScheduler(BleTransport& transport, DeviceRegistry& registry, ExportPipeline& exporter,
                  const PollSettings& settings);

    TickResult collect(const ShutdownSignal* shutdown = nullptr);
    TickResult run_tick(const ShutdownSignal* shutdown = nullptr);
    void run(ShutdownSignal& shutdown);

    // Called on the scheduler thread after every tick, exported or not.
    void set_tick_observer(TickObserver observer) { observer_ = std::move(observer); }
    SchedulerStatus status() const;

private:
    enum class ReadOutcome : uint8_t {
        Ok,
        Timeout,
        DecodeFailed,
        TransportFailed,
    };

    ReadOutcome read_device(const DeviceDescriptor& desc, SensorReading& out);
    void drop_device(const DeviceDescriptor& desc, bool stale);

    BleTransport& transport_;
    DeviceRegistry& registry_;
    ExportPipeline& exporter_;
    PollSettings settings_;
    TickObserver observer_;

    mutable std::mutex status_mutex_;
    SchedulerStatus status_{};
};
