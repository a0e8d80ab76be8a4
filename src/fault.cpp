#include "fault.hpp"
#include "logging.hpp"

#include <mutex>

namespace {
constexpr const char* kTag = "FAULT";

std::mutex g_fault_mutex;
FaultStatus g_fault{
    false,
    std::string(),
    {0, 0, 0, 0, 0, 0, 0, 0}
};

void set_fault_locked(const std::string& msg) {
    g_fault.fault_active = true;
    g_fault.fault_msg = msg;
}
} // namespace

void init_fault_monitor() {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    g_fault.fault_active = false;
    g_fault.fault_msg.clear();
    g_fault.counters = {};
}

void record_fault(const char* msg) {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    set_fault_locked(msg ? msg : "");
}

void record_decode_failure(const char* device, const char* reason, std::size_t len) {
    {
        std::lock_guard<std::mutex> lock(g_fault_mutex);
        g_fault.counters.decode_failures += 1;
        set_fault_locked(std::string("decode failure on ") + device);
    }
    log_warn(kTag, "event=decode_failure device=%s reason=%s len=%zu", device, reason, len);
}

void record_read_timeout(const char* device) {
    {
        std::lock_guard<std::mutex> lock(g_fault_mutex);
        g_fault.counters.read_timeouts += 1;
    }
    log_warn(kTag, "event=read_timeout device=%s", device);
}

void record_transport_failure(const char* device, const char* stage, const char* reason) {
    {
        std::lock_guard<std::mutex> lock(g_fault_mutex);
        g_fault.counters.transport_failures += 1;
        set_fault_locked(std::string(stage) + " failed on " + device);
    }
    log_warn(kTag, "event=transport_failure device=%s stage=%s reason=%s", device, stage, reason);
}

void record_export_failure(std::size_t points, const char* reason) {
    {
        std::lock_guard<std::mutex> lock(g_fault_mutex);
        g_fault.counters.export_failures += 1;
        set_fault_locked("export failed");
    }
    log_error(kTag, "event=export_failure points=%zu reason=%s", points, reason);
}

void record_export_ok(std::size_t points) {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    g_fault.counters.exports_ok += 1;
    g_fault.counters.points_written += static_cast<uint32_t>(points);
}

void record_state_transition(const char* device, const char* from, const char* to) {
    {
        std::lock_guard<std::mutex> lock(g_fault_mutex);
        g_fault.counters.state_transitions += 1;
    }
    log_info(kTag, "event=state_transition device=%s from=%s to=%s", device, from, to);
}

void record_illegal_transition(const char* device, const char* from, const char* to) {
    {
        std::lock_guard<std::mutex> lock(g_fault_mutex);
        g_fault.counters.illegal_transitions += 1;
        set_fault_locked(std::string("illegal transition on ") + device);
    }
    log_error(kTag, "event=illegal_transition device=%s from=%s to=%s", device, from, to);
}

FaultStatus fault_status() {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    return g_fault;
}
