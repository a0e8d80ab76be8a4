#include "device_registry.hpp"
#include "export_pipeline.hpp"
#include "logging.hpp"
#include "mock_ble.hpp"
#include "poll_scheduler.hpp"
#include "shutdown.hpp"

#include <cassert>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

namespace {

class NullSink : public TimeSeriesSink {
public:
    SinkError write(const std::string&, const std::vector<WritePoint>&) override { return SinkError::None; }
};

long long ms_between(Clock::time_point a, Clock::time_point b) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(b - a).count();
}

PollSettings settings(std::chrono::milliseconds period) {
    PollSettings s{};
    s.period = period;
    s.read_timeout = 10ms;
    s.max_parallel_reads = 2;
    s.stale_after_failures = 5;
    return s;
}

// N ticks take about (N - 1) periods; the schedule does not drift.
void test_fixed_rate() {
    MockBleTransport ble;
    DeviceRegistry registry(std::vector<DeviceConfig>{});
    NullSink sink;
    ExportPipeline exporter(sink, "home", "ruuvi");
    PollScheduler scheduler(ble, registry, exporter, settings(50ms));
    ShutdownSignal shutdown;

    std::vector<Clock::time_point> starts;
    scheduler.set_tick_observer([&](uint64_t tick, const TickResult&) {
        starts.push_back(Clock::now());
        if (tick == 6) shutdown.request_stop();
    });
    scheduler.run(shutdown);

    assert(starts.size() == 6);
    const long long span = ms_between(starts.front(), starts.back());
    assert(span >= 240);
    assert(span < 400);
    assert(scheduler.status().late_ticks == 0);
}

// A tick that overruns its period makes the next one start immediately
// instead of skipping it, and the schedule catches up.
void test_slow_tick_does_not_skip() {
    MockBleTransport ble;
    DeviceRegistry registry(std::vector<DeviceConfig>{});
    NullSink sink;
    ExportPipeline exporter(sink, "home", "ruuvi");
    PollScheduler scheduler(ble, registry, exporter, settings(50ms));
    ShutdownSignal shutdown;

    std::vector<Clock::time_point> ends;
    scheduler.set_tick_observer([&](uint64_t tick, const TickResult&) {
        if (tick == 2) std::this_thread::sleep_for(80ms);
        ends.push_back(Clock::now());
        if (tick == 6) shutdown.request_stop();
    });
    const auto started = Clock::now();
    scheduler.run(shutdown);

    assert(ends.size() == 6);
    // Tick 3 is due 100 ms in and starts right after tick 2 ends at ~130 ms.
    assert(ms_between(ends[1], ends[2]) < 30);
    // Tick 6 is still due at 250 ms.
    const long long total = ms_between(started, ends.back());
    assert(total >= 240);
    assert(total < 400);
    assert(scheduler.status().late_ticks == 0);
}

// Falling more than a full period behind re-anchors the schedule.
void test_late_tick_reanchors() {
    MockBleTransport ble;
    DeviceRegistry registry(std::vector<DeviceConfig>{});
    NullSink sink;
    ExportPipeline exporter(sink, "home", "ruuvi");
    PollScheduler scheduler(ble, registry, exporter, settings(50ms));
    ShutdownSignal shutdown;

    std::vector<Clock::time_point> ends;
    scheduler.set_tick_observer([&](uint64_t tick, const TickResult&) {
        if (tick == 2) std::this_thread::sleep_for(150ms);
        ends.push_back(Clock::now());
        if (tick == 4) shutdown.request_stop();
    });
    scheduler.run(shutdown);

    assert(ends.size() == 4);
    assert(scheduler.status().late_ticks == 1);
    // After re-anchoring the following ticks are a full period apart again.
    assert(ms_between(ends[2], ends[3]) >= 40);
}

void test_stop_interrupts_sleep() {
    MockBleTransport ble;
    DeviceRegistry registry(std::vector<DeviceConfig>{});
    NullSink sink;
    ExportPipeline exporter(sink, "home", "ruuvi");
    PollScheduler scheduler(ble, registry, exporter, settings(5000ms));
    ShutdownSignal shutdown;

    std::thread stopper([&]() {
        std::this_thread::sleep_for(50ms);
        shutdown.request_stop();
    });
    const auto started = Clock::now();
    scheduler.run(shutdown);
    stopper.join();

    assert(ms_between(started, Clock::now()) < 1000);
    assert(scheduler.status().ticks == 1);
}

void test_no_tick_after_stop() {
    MockBleTransport ble;
    DeviceRegistry registry(std::vector<DeviceConfig>{});
    NullSink sink;
    ExportPipeline exporter(sink, "home", "ruuvi");
    PollScheduler scheduler(ble, registry, exporter, settings(10ms));
    ShutdownSignal shutdown;
    shutdown.request_stop();

    scheduler.run(shutdown);
    assert(scheduler.status().ticks == 0);
}

} // namespace

int main() {
    init_logging(LogLevel::Error);

    test_fixed_rate();
    test_slow_tick_does_not_skip();
    test_late_tick_reanchors();
    test_stop_interrupts_sleep();
    test_no_tick_after_stop();
    return 0;
}
