#include "config.hpp"
#include "logging.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>

namespace {

const char* kValid = R"({
  "host": "http://localhost:8086/",
  "org": "home",
  "token": "secret",
  "bucket": "sensors",
  "interval": 2.5,
  "tags": {
    "sauna": "f2:2d:eb:37:8a:02",
    "kitchen": "F2-2D-EB-37-8A-01"
  }
})";

bool fails_with(const std::string& text, const char* fragment) {
    CollectorConfig cfg{};
    std::string error;
    if (parse_config(text, cfg, error)) {
        return false;
    }
    return error.find(fragment) != std::string::npos;
}

// Replaces the first occurrence of `from` in the valid document.
std::string variant(const std::string& from, const std::string& to) {
    std::string text = kValid;
    const std::size_t pos = text.find(from);
    assert(pos != std::string::npos);
    text.replace(pos, from.size(), to);
    return text;
}

void test_valid_with_defaults() {
    CollectorConfig cfg{};
    std::string error;
    assert(parse_config(kValid, cfg, error));
    assert(cfg.sink.host == "http://localhost:8086/");
    assert(cfg.sink.org == "home");
    assert(cfg.sink.token == "secret");
    assert(cfg.sink.bucket == "sensors");
    assert(cfg.sink.measurement == "ruuvi");
    assert(cfg.sink.write_timeout_ms == 5000);
    assert(cfg.poll_interval_ms == 2500);
    assert(cfg.read_timeout_ms == 2000);
    assert(cfg.max_parallel_reads == 4);
    assert(cfg.retry_delay_ms == 1000);
    assert(cfg.scan_duration_ms == 3000);
    assert(cfg.name_filter == "Ruuvi");
    assert(cfg.startup_timeout_ms == 0);
    assert(cfg.background_reconcile);
    assert(cfg.reconcile_interval_ms == 10000);
    assert(cfg.stale_after_failures == 5);
    assert(cfg.log_level == LogLevel::Info);

    assert(cfg.devices.size() == 2);
    // Object keys come back in sorted order.
    assert(cfg.devices[0].name == "kitchen");
    assert(format_ble_address(cfg.devices[0].address) == "F2:2D:EB:37:8A:01");
    assert(cfg.devices[1].name == "sauna");
    assert(format_ble_address(cfg.devices[1].address) == "F2:2D:EB:37:8A:02");
}

void test_overrides() {
    const std::string text = variant("\"interval\": 2.5,",
                                     "\"interval\": 10, \"measurement\": \"env\", \"read_timeout_ms\": 500,"
                                     "\"max_parallel_reads\": 2, \"startup_timeout_ms\": 30000,"
                                     "\"background_reconcile\": false, \"log_level\": \"debug\",");
    CollectorConfig cfg{};
    std::string error;
    assert(parse_config(text, cfg, error));
    assert(cfg.poll_interval_ms == 10000);
    assert(cfg.sink.measurement == "env");
    assert(cfg.read_timeout_ms == 500);
    assert(cfg.max_parallel_reads == 2);
    assert(cfg.startup_timeout_ms == 30000);
    assert(!cfg.background_reconcile);
    assert(cfg.log_level == LogLevel::Debug);
}

void test_rejections() {
    assert(fails_with("{not json", "not valid JSON"));
    assert(fails_with("[1, 2]", "JSON object"));
    assert(fails_with(variant("\"token\": \"secret\",", ""), "'token'"));
    assert(fails_with(variant("\"org\": \"home\"", "\"org\": 7"), "'org' must be a string"));
    assert(fails_with(variant("\"bucket\": \"sensors\"", "\"bucket\": \"\""), "'bucket' must not be empty"));
    assert(fails_with(variant("f2:2d:eb:37:8a:02", "f2:2d:eb:37:8a"), "invalid hardware address"));
    assert(fails_with(variant("f2:2d:eb:37:8a:02", "zz:2d:eb:37:8a:02"), "invalid hardware address"));
    assert(fails_with(variant("f2:2d:eb:37:8a:02", "f2:2d:eb:37:8a:01"), "configured for both"));
    assert(fails_with(variant("\"interval\": 2.5", "\"interval\": 0"), "'interval' must be positive"));
    assert(fails_with(variant("\"interval\": 2.5", "\"interval\": -3"), "'interval' must be positive"));
    assert(fails_with(variant("\"interval\": 2.5", "\"interval\": \"10\""), "number of seconds"));
    assert(fails_with(variant("\"interval\": 2.5,", ""), "missing key 'interval'"));
    assert(fails_with(variant("\"interval\": 2.5,", "\"interval\": 2.5, \"log_level\": \"loud\","), "'log_level'"));
    assert(fails_with(variant("\"interval\": 2.5,", "\"interval\": 2.5, \"max_parallel_reads\": 0,"),
                      "'max_parallel_reads'"));
    assert(fails_with(variant("\"interval\": 2.5,", "\"interval\": 2.5, \"background_reconcile\": \"yes\","),
                      "'background_reconcile' must be a boolean"));
    assert(fails_with(R"({"host":"h","org":"o","token":"t","bucket":"b","interval":1,"tags":{}})", "'tags'"));
}

void test_load_from_file() {
    CollectorConfig cfg{};
    std::string error;
    assert(!load_config("does-not-exist.json", cfg, error));
    assert(error.find("cannot open") != std::string::npos);

    const char* path = "test_config_tmp.json";
    {
        std::ofstream out(path);
        out << kValid;
    }
    assert(load_config(path, cfg, error));
    assert(cfg.devices.size() == 2);
    std::remove(path);
}

} // namespace

int main() {
    init_logging(LogLevel::Error);

    test_valid_with_defaults();
    test_overrides();
    test_rejections();
    test_load_from_file();
    return 0;
}
