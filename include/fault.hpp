#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct FaultCounters {
    uint32_t decode_failures;
    uint32_t read_timeouts;
    uint32_t transport_failures;
    uint32_t export_failures;
    uint32_t exports_ok;
    uint32_t points_written;
    uint32_t state_transitions;
    uint32_t illegal_transitions;
};

struct FaultStatus {
    bool fault_active;
    std::string fault_msg;
    FaultCounters counters;
};

// Event points. Each one bumps its counter and emits one
// "event=<kind> key=value ..." log line.
void init_fault_monitor();
void record_fault(const char* msg);
void record_decode_failure(const char* device, const char* reason, std::size_t len);
void record_read_timeout(const char* device);
void record_transport_failure(const char* device, const char* stage, const char* reason);
void record_export_failure(std::size_t points, const char* reason);
void record_export_ok(std::size_t points);
void record_state_transition(const char* device, const char* from, const char* to);
void record_illegal_transition(const char* device, const char* from, const char* to);
FaultStatus fault_status();
