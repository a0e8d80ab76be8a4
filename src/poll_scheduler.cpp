#include "poll_scheduler.hpp"
#include "fault.hpp"
#include "logging.hpp"
#include "ruuvi_payload.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace {
constexpr const char* kTag = "POLL";
} // namespace

PollSettings poll_settings_from(const CollectorConfig& cfg) {
    PollSettings s{};
    s.period = std::chrono::milliseconds(cfg.poll_interval_ms);
    s.read_timeout = std::chrono::milliseconds(cfg.read_timeout_ms);
    s.max_parallel_reads = cfg.max_parallel_reads;
    s.stale_after_failures = cfg.stale_after_failures;
    return s;
}

PollScheduler::PollScheduler(BleTransport& transport, DeviceRegistry& registry, ExportPipeline& exporter,
                             const PollSettings& settings)
    : transport_(transport), registry_(registry), exporter_(exporter), settings_(settings) {
    if (settings_.max_parallel_reads == 0) {
        settings_.max_parallel_reads = 1;
    }
}

void PollScheduler::drop_device(const DeviceDescriptor& desc, bool stale) {
    transport_.disconnect(desc.connection);
    // A stale device's misses are already in its failure counters.
    if (stale) {
        registry_.mark_stale(desc.name);
    } else {
        registry_.mark_failed(desc.name, DeviceState::Subscribed);
    }
}

PollScheduler::ReadOutcome PollScheduler::read_device(const DeviceDescriptor& desc, SensorReading& out) {
    const char* name = desc.name.c_str();
    std::vector<uint8_t> raw;
    const TransportError err = transport_.await_notification(desc.connection, settings_.read_timeout, raw);

    if (err == TransportError::Timeout) {
        record_read_timeout(name);
        if (registry_.note_read_failure(desc.name) >= settings_.stale_after_failures) {
            log_warn(kTag, "%s: no data for %u reads, reconnecting", name, settings_.stale_after_failures);
            drop_device(desc, true);
        }
        return ReadOutcome::Timeout;
    }
    if (err != TransportError::None) {
        record_transport_failure(name, "read", transport_error_name(err));
        drop_device(desc, false);
        return ReadOutcome::TransportFailed;
    }

    RuuviFields fields{};
    const DecodeError derr = decode_ruuvi_payload(raw.data(), raw.size(), fields);
    if (derr != DecodeError::None) {
        record_decode_failure(name, decode_error_name(derr), raw.size());
        log_debug(kTag, "%s raw=%s", name, hex_dump(raw.data(), raw.size()).c_str());
        if (registry_.note_read_failure(desc.name) >= settings_.stale_after_failures) {
            drop_device(desc, true);
        }
        return ReadOutcome::DecodeFailed;
    }

    out.source_name = desc.name;
    out.source_address = desc.hardware_address;
    out.fields = fields;
    out.collected_at = std::chrono::system_clock::now();
    registry_.note_read_success(desc.name, out.collected_at);
    log_debug(kTag, "raw=%s %s", hex_dump(raw.data(), raw.size()).c_str(), format_sensor_reading(out).c_str());
    return ReadOutcome::Ok;
}

TickResult PollScheduler::collect(const ShutdownSignal* shutdown) {
    TickResult result{};
    result.export_result = SinkError::None;

    const std::vector<DeviceDescriptor> devices = registry_.in_state(DeviceState::Subscribed);
    result.attempted = devices.size();

    std::vector<ReadOutcome> outcomes(devices.size(), ReadOutcome::TransportFailed);
    std::vector<SensorReading> readings(devices.size());
    std::atomic<std::size_t> next_index{0};

    auto worker = [&]() {
        for (;;) {
            const std::size_t i = next_index.fetch_add(1);
            if (i >= devices.size()) {
                return;
            }
            outcomes[i] = read_device(devices[i], readings[i]);
        }
    };

    const std::size_t workers = std::min(settings_.max_parallel_reads, devices.size());
    std::vector<std::thread> pool;
    for (std::size_t w = 1; w < workers; ++w) {
        pool.emplace_back(worker);
    }
    if (workers > 0) {
        worker();
    }
    for (auto& t : pool) {
        t.join();
    }

    for (std::size_t i = 0; i < devices.size(); ++i) {
        switch (outcomes[i]) {
            case ReadOutcome::Ok:
                result.batch.push_back(std::move(readings[i]));
                break;
            case ReadOutcome::Timeout:
                result.timeouts++;
                break;
            case ReadOutcome::DecodeFailed:
                result.decode_failures++;
                break;
            case ReadOutcome::TransportFailed:
                result.transport_failures++;
                break;
        }
    }

    if (shutdown != nullptr && shutdown->stop_requested()) {
        result.discarded = true;
        result.batch.clear();
    }
    return result;
}

TickResult PollScheduler::run_tick(const ShutdownSignal* shutdown) {
    const auto started = std::chrono::steady_clock::now();
    TickResult result = collect(shutdown);
    if (!result.discarded) {
        result.export_result = exporter_.export_readings(result.batch);
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    uint64_t tick = 0;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        tick = ++status_.ticks;
        if (result.discarded) status_.discarded_ticks++;
        if (result.export_result != SinkError::None) status_.export_failures++;
        status_.last_tick_duration = elapsed;
    }

    log_info(kTag, "tick=%llu devices=%zu readings=%zu timeouts=%zu decode_errors=%zu transport_errors=%zu export=%s took=%lldms%s",
             static_cast<unsigned long long>(tick),
             result.attempted,
             result.batch.size(),
             result.timeouts,
             result.decode_failures,
             result.transport_failures,
             sink_error_name(result.export_result),
             static_cast<long long>(elapsed.count()),
             result.discarded ? " (discarded)" : "");

    if (observer_) {
        observer_(tick, result);
    }
    return result;
}

void PollScheduler::run(ShutdownSignal& shutdown) {
    log_info(kTag, "poll loop started, period=%lldms read_timeout=%lldms fan_out=%zu",
             static_cast<long long>(settings_.period.count()),
             static_cast<long long>(settings_.read_timeout.count()),
             settings_.max_parallel_reads);

    auto next_release = std::chrono::steady_clock::now();
    while (!shutdown.stop_requested()) {
        run_tick(&shutdown);

        // Period-relative: the next release is one period after the previous
        // one, so a slow tick only shortens the following sleep.
        next_release += settings_.period;
        const auto now = std::chrono::steady_clock::now();
        if (now > next_release + settings_.period) {
            std::lock_guard<std::mutex> lock(status_mutex_);
            status_.late_ticks++;
            next_release = now;
        }
        if (shutdown.wait_until(next_release)) {
            break;
        }
    }
    log_info(kTag, "poll loop stopped");
}

SchedulerStatus PollScheduler::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}
