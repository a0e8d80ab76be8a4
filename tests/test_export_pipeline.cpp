#include "export_pipeline.hpp"
#include "fault.hpp"
#include "line_protocol.hpp"
#include "logging.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace {

class RecordingSink : public TimeSeriesSink {
public:
    SinkError write(const std::string& bucket, const std::vector<WritePoint>& points) override {
        last_bucket = bucket;
        calls.push_back(points);
        return fail ? SinkError::WriteFailed : SinkError::None;
    }

    std::string last_bucket;
    std::vector<std::vector<WritePoint>> calls;
    bool fail = false;
};

SensorReading sample_reading(const char* name, uint8_t last_octet) {
    SensorReading r{};
    r.source_name = name;
    r.source_address = BleAddress{{0xF2, 0x2D, 0xEB, 0x37, 0x8A, last_octet}};
    r.fields.temperature_c = 24.3f;
    r.fields.humidity_pct = 53.49f;
    r.fields.pressure_pa = 100044;
    r.fields.acceleration_x_g = 0.004f;
    r.fields.acceleration_y_g = -0.004f;
    r.fields.acceleration_z_g = 1.036f;
    r.fields.battery_v = 2.977f;
    r.fields.tx_power_dbm = 4;
    r.fields.movement_counter = 66;
    r.fields.measurement_sequence = 205;
    r.collected_at = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::nanoseconds(1700000000123456000LL)));
    return r;
}

const FieldValue* field(const WritePoint& p, const char* key) {
    for (const FieldValue& f : p.fields) {
        if (f.key == key) return &f;
    }
    return nullptr;
}

void test_write_point_shape() {
    const WritePoint p = make_write_point("ruuvi", sample_reading("kitchen", 0x01));
    assert(p.measurement == "ruuvi");
    assert(p.tags.size() == 2);
    assert(p.tags[0].first == "address" && p.tags[0].second == "F2:2D:EB:37:8A:01");
    assert(p.tags[1].first == "name" && p.tags[1].second == "kitchen");
    assert(p.fields.size() == 10);
    assert(p.timestamp_ns == 1700000000123456000LL);

    const char* integers[] = {"pressure", "tx_power", "movement_counter", "measurement_sequence"};
    for (const char* key : integers) {
        const FieldValue* f = field(p, key);
        assert(f != nullptr && f->type == FieldType::Integer);
    }
    const char* floats[] = {"temperature", "humidity", "acceleration_x", "acceleration_y", "acceleration_z",
                            "battery_voltage"};
    for (const char* key : floats) {
        const FieldValue* f = field(p, key);
        assert(f != nullptr && f->type == FieldType::Float);
    }
    assert(field(p, "pressure")->int_value == 100044);
    assert(field(p, "tx_power")->int_value == 4);
    assert(field(p, "measurement_sequence")->int_value == 205);
}

void test_line_protocol() {
    assert(escape_measurement("air quality,v2") == "air\\ quality\\,v2");
    assert(escape_measurement("a=b") == "a=b");
    assert(escape_key("a=b c,d") == "a\\=b\\ c\\,d");

    assert(format_float_field(1.0) == "1");
    assert(format_float_field(0.1) == "0.1");
    assert(format_float_field(static_cast<double>(24.3f)) == "24.3");
    assert(format_float_field(static_cast<double>(-0.004f)) == "-0.004");
    assert(format_float_field(std::numeric_limits<double>::quiet_NaN()) == "0");

    const std::string line = encode_line(make_write_point("ruuvi", sample_reading("living room", 0x01)));
    assert(line ==
           "ruuvi,address=F2:2D:EB:37:8A:01,name=living\\ room "
           "temperature=24.3,humidity=53.49,pressure=100044i,"
           "acceleration_x=0.004,acceleration_y=-0.004,acceleration_z=1.036,"
           "battery_voltage=2.977,tx_power=4i,movement_counter=66i,measurement_sequence=205i "
           "1700000000123456000");

    WritePoint bare{};
    bare.measurement = "m";
    bare.tags = {{"name", ""}};
    bare.fields = {FieldValue{"v", FieldType::Integer, 0.0, -7}};
    bare.timestamp_ns = 5;
    assert(encode_line(bare) == "m v=-7i 5");

    const std::string body = encode_lines({bare, bare});
    assert(body == "m v=-7i 5\nm v=-7i 5\n");
}

void test_pipeline_batches() {
    RecordingSink sink;
    ExportPipeline pipeline(sink, "sensors", "ruuvi");

    assert(pipeline.export_readings({}) == SinkError::None);
    assert(sink.calls.empty());
    assert(pipeline.stats().empty_batches == 1);

    const std::vector<SensorReading> batch = {sample_reading("kitchen", 0x01), sample_reading("sauna", 0x02)};
    assert(pipeline.export_readings(batch) == SinkError::None);
    assert(sink.calls.size() == 1);
    assert(sink.calls[0].size() == 2);
    assert(sink.last_bucket == "sensors");
    assert(sink.calls[0][1].tags[1].second == "sauna");
    assert(pipeline.stats().batches_written == 1);
    assert(pipeline.stats().points_written == 2);
}

void test_sink_error_names() {
    assert(std::string(sink_error_name(SinkError::None)) == "none");
    assert(std::string(sink_error_name(SinkError::WriteFailed)) == "write_failed");
}

void test_pipeline_failure() {
    RecordingSink sink;
    ExportPipeline pipeline(sink, "sensors", "ruuvi");
    const uint32_t failures_before = fault_status().counters.export_failures;

    sink.fail = true;
    assert(pipeline.export_readings({sample_reading("kitchen", 0x01)}) == SinkError::WriteFailed);
    assert(pipeline.stats().batches_failed == 1);
    assert(fault_status().counters.export_failures == failures_before + 1);

    sink.fail = false;
    assert(pipeline.export_readings({sample_reading("sauna", 0x02)}) == SinkError::None);
    assert(sink.calls.size() == 2);
    assert(sink.calls[1].size() == 1);
    assert(sink.calls[1][0].tags[1].second == "sauna");
    assert(pipeline.stats().points_written == 1);
}

} // namespace

int main() {
    init_logging(LogLevel::Error);
    init_fault_monitor();

    test_write_point_shape();
    test_line_protocol();
    test_pipeline_batches();
    test_pipeline_failure();
    test_sink_error_names();
    return 0;
}
