#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <sstream>

namespace {
using nlohmann::json;

bool read_string(const json& doc, const char* key, bool required, std::string& out, std::string& error) {
    const auto it = doc.find(key);
    if (it == doc.end()) {
        if (required) {
            error = std::string("missing key '") + key + "'";
            return false;
        }
        return true;
    }
    if (!it->is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    if (required && out.empty()) {
        error = std::string("'") + key + "' must not be empty";
        return false;
    }
    return true;
}

bool read_uint(const json& doc, const char* key, uint32_t min_value, uint32_t& out, std::string& error) {
    const auto it = doc.find(key);
    if (it == doc.end()) {
        return true;
    }
    if (!it->is_number_integer() || it->get<int64_t>() < static_cast<int64_t>(min_value) ||
        it->get<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
        error = std::string("'") + key + "' must be an integer >= " + std::to_string(min_value);
        return false;
    }
    out = static_cast<uint32_t>(it->get<int64_t>());
    return true;
}

bool read_bool(const json& doc, const char* key, bool& out, std::string& error) {
    const auto it = doc.find(key);
    if (it == doc.end()) {
        return true;
    }
    if (!it->is_boolean()) {
        error = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool read_interval(const json& doc, uint32_t& out_ms, std::string& error) {
    const auto it = doc.find("interval");
    if (it == doc.end()) {
        error = "missing key 'interval'";
        return false;
    }
    if (!it->is_number()) {
        error = "'interval' must be a number of seconds";
        return false;
    }
    const double seconds = it->get<double>();
    const double ms = std::round(seconds * 1000.0);
    if (!(ms >= 1.0) || ms > static_cast<double>(UINT32_MAX)) {
        error = "'interval' must be positive";
        return false;
    }
    out_ms = static_cast<uint32_t>(ms);
    return true;
}

bool read_devices(const json& doc, std::vector<DeviceConfig>& out, std::string& error) {
    const auto it = doc.find("tags");
    if (it == doc.end()) {
        error = "missing key 'tags'";
        return false;
    }
    if (!it->is_object() || it->empty()) {
        error = "'tags' must be a non-empty object of name -> address";
        return false;
    }
    std::vector<DeviceConfig> devices;
    for (const auto& item : it->items()) {
        if (!item.value().is_string()) {
            error = "address for '" + item.key() + "' must be a string";
            return false;
        }
        DeviceConfig dev{};
        dev.name = item.key();
        if (dev.name.empty()) {
            error = "device names must not be empty";
            return false;
        }
        const std::string text = item.value().get<std::string>();
        if (!parse_ble_address(text, dev.address)) {
            error = "invalid hardware address '" + text + "' for '" + dev.name + "'";
            return false;
        }
        for (const DeviceConfig& other : devices) {
            if (other.address == dev.address) {
                error = "address " + format_ble_address(dev.address) + " configured for both '" +
                        other.name + "' and '" + dev.name + "'";
                return false;
            }
        }
        devices.push_back(dev);
    }
    out = devices;
    return true;
}
} // namespace

CollectorConfig default_config() {
    CollectorConfig cfg{};
    cfg.sink.measurement = "ruuvi";
    cfg.sink.write_timeout_ms = 5000;
    cfg.poll_interval_ms = 10000;
    cfg.read_timeout_ms = 2000;
    cfg.max_parallel_reads = 4;
    cfg.retry_delay_ms = 1000;
    cfg.scan_duration_ms = 3000;
    cfg.name_filter = "Ruuvi";
    cfg.startup_timeout_ms = 0;
    cfg.background_reconcile = true;
    cfg.reconcile_interval_ms = 10000;
    cfg.stale_after_failures = 5;
    cfg.log_level = LogLevel::Info;
    return cfg;
}

bool parse_config(const std::string& json_text, CollectorConfig& out, std::string& error) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        error = "configuration is not valid JSON";
        return false;
    }
    if (!doc.is_object()) {
        error = "configuration must be a JSON object";
        return false;
    }

    CollectorConfig cfg = default_config();
    std::string level_text;
    if (!read_string(doc, "host", true, cfg.sink.host, error)) return false;
    if (!read_string(doc, "org", true, cfg.sink.org, error)) return false;
    if (!read_string(doc, "token", true, cfg.sink.token, error)) return false;
    if (!read_string(doc, "bucket", true, cfg.sink.bucket, error)) return false;
    if (!read_string(doc, "measurement", false, cfg.sink.measurement, error)) return false;
    if (!read_string(doc, "name_filter", false, cfg.name_filter, error)) return false;
    if (!read_string(doc, "log_level", false, level_text, error)) return false;
    if (!read_devices(doc, cfg.devices, error)) return false;
    if (!read_interval(doc, cfg.poll_interval_ms, error)) return false;
    if (!read_uint(doc, "read_timeout_ms", 1, cfg.read_timeout_ms, error)) return false;
    if (!read_uint(doc, "max_parallel_reads", 1, cfg.max_parallel_reads, error)) return false;
    if (!read_uint(doc, "retry_delay_ms", 1, cfg.retry_delay_ms, error)) return false;
    if (!read_uint(doc, "scan_duration_ms", 1, cfg.scan_duration_ms, error)) return false;
    if (!read_uint(doc, "startup_timeout_ms", 0, cfg.startup_timeout_ms, error)) return false;
    if (!read_uint(doc, "reconcile_interval_ms", 1, cfg.reconcile_interval_ms, error)) return false;
    if (!read_uint(doc, "stale_after_failures", 1, cfg.stale_after_failures, error)) return false;
    if (!read_uint(doc, "write_timeout_ms", 1, cfg.sink.write_timeout_ms, error)) return false;
    if (!read_bool(doc, "background_reconcile", cfg.background_reconcile, error)) return false;

    if (cfg.sink.measurement.empty()) {
        error = "'measurement' must not be empty";
        return false;
    }
    if (!level_text.empty() && !parse_log_level(level_text.c_str(), cfg.log_level)) {
        error = "'log_level' must be one of error, warn, info, debug";
        return false;
    }

    out = cfg;
    return true;
}

bool load_config(const std::string& path, CollectorConfig& out, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }
    std::ostringstream text;
    text << in.rdbuf();
    if (!parse_config(text.str(), out, error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}
