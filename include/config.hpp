#pragma once

#include "logging.hpp"
#include "telemetry.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct DeviceConfig {
    std::string name;
    BleAddress address;
};

struct SinkConfig {
    std::string host;
    std::string org;
    std::string token;
    std::string bucket;
    std::string measurement;
    uint32_t write_timeout_ms;
};

struct CollectorConfig {
    SinkConfig sink;
    std::vector<DeviceConfig> devices;
    uint32_t poll_interval_ms;
    uint32_t read_timeout_ms;
    uint32_t max_parallel_reads;
    uint32_t retry_delay_ms;
    uint32_t scan_duration_ms;
    std::string name_filter;
    uint32_t startup_timeout_ms;     // 0 waits for every device
    bool background_reconcile;
    uint32_t reconcile_interval_ms;
    uint32_t stale_after_failures;
    LogLevel log_level;
};

CollectorConfig default_config();
bool parse_config(const std::string& json_text, CollectorConfig& out, std::string& error);
bool load_config(const std::string& path, CollectorConfig& out, std::string& error);
