#include "config.hpp"
#include "device_registry.hpp"
#include "discovery.hpp"
#include "export_pipeline.hpp"
#include "fault.hpp"
#include "influx_sink.hpp"
#include "logging.hpp"
#include "poll_scheduler.hpp"
#include "shutdown.hpp"
#include "simpleble_transport.hpp"

#include <csignal>
#include <cstdio>
#include <pthread.h>
#include <string>
#include <thread>

namespace {
constexpr const char* kTag = "MAIN";

int run_collector(const CollectorConfig& cfg, ShutdownSignal& shutdown) {
    SimpleBleTransport transport;
    if (!transport.adapter_available()) {
        log_error(kTag, "no usable Bluetooth adapter found");
        return 1;
    }

    DeviceRegistry registry(cfg.devices);
    InfluxSink sink(cfg.sink);
    ExportPipeline exporter(sink, cfg.sink.bucket, cfg.sink.measurement);
    DiscoveryManager discovery(transport, registry, discovery_settings_from(cfg));
    PollScheduler scheduler(transport, registry, exporter, poll_settings_from(cfg));

    log_info(kTag, "waiting for %zu devices", registry.size());
    discovery.run_until_all_subscribed(shutdown);

    if (!shutdown.stop_requested()) {
        if (cfg.background_reconcile) {
            discovery.start_background(shutdown);
        }
        scheduler.run(shutdown);
    }

    discovery.stop();
    for (const DeviceDescriptor& desc : registry.snapshot()) {
        if (desc.has_connection) {
            transport.disconnect(desc.connection);
        }
        log_info(kTag, "%s (%s) final state=%s failures=%u",
                 desc.name.c_str(),
                 format_ble_address(desc.hardware_address).c_str(),
                 device_state_name(desc.state),
                 desc.total_failures);
    }

    const ExportStats stats = exporter.stats();
    const FaultStatus faults = fault_status();
    log_info(kTag,
             "batches_written=%u batches_failed=%u points=%u decode_failures=%u read_timeouts=%u "
             "transport_failures=%u illegal_transitions=%u",
             stats.batches_written,
             stats.batches_failed,
             stats.points_written,
             faults.counters.decode_failures,
             faults.counters.read_timeouts,
             faults.counters.transport_failures,
             faults.counters.illegal_transitions);
    return 0;
}
} // namespace

int main(int argc, char** argv) {
    init_logging();

    if (argc != 2) {
        std::fprintf(stderr, "usage: %s <config.json>\n", argv[0]);
        return 2;
    }

    CollectorConfig cfg{};
    std::string error;
    if (!load_config(argv[1], cfg, error)) {
        log_error(kTag, "configuration error: %s", error.c_str());
        return 2;
    }
    set_log_level(cfg.log_level);
    init_fault_monitor();

    // Block termination signals in every thread; one thread waits for them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    ShutdownSignal shutdown;
    std::thread signal_thread([&signals, &shutdown]() {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0 && sig != SIGUSR1) {
            log_info(kTag, "signal %d received, shutting down", sig);
        }
        shutdown.request_stop();
    });

    if (!init_http_client()) {
        pthread_kill(signal_thread.native_handle(), SIGUSR1);
        signal_thread.join();
        return 1;
    }

    log_info(kTag, "ruuvi collector starting: %zu devices, interval %ums, sink %s",
             cfg.devices.size(), cfg.poll_interval_ms, cfg.sink.host.c_str());
    const int rc = run_collector(cfg, shutdown);

    // SIGUSR1 releases the signal thread when we stop on our own.
    pthread_kill(signal_thread.native_handle(), SIGUSR1);
    signal_thread.join();
    shutdown_http_client();
    return rc;
}
