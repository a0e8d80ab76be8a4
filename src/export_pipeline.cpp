#include "export_pipeline.hpp"
#include "fault.hpp"
#include "logging.hpp"

#include <chrono>
#include <utility>

namespace {
constexpr const char* kTag = "EXPORT";

FieldValue float_field(const char* key, float value) {
    return FieldValue{key, FieldType::Float, static_cast<double>(value), 0};
}

FieldValue int_field(const char* key, int64_t value) {
    return FieldValue{key, FieldType::Integer, 0.0, value};
}
} // namespace

WritePoint make_write_point(const std::string& measurement, const SensorReading& reading) {
    const RuuviFields& f = reading.fields;
    WritePoint point{};
    point.measurement = measurement;
    point.tags = {
        {"address", format_ble_address(reading.source_address)},
        {"name", reading.source_name},
    };
    point.fields = {
        float_field("temperature", f.temperature_c),
        float_field("humidity", f.humidity_pct),
        int_field("pressure", f.pressure_pa),
        float_field("acceleration_x", f.acceleration_x_g),
        float_field("acceleration_y", f.acceleration_y_g),
        float_field("acceleration_z", f.acceleration_z_g),
        float_field("battery_voltage", f.battery_v),
        int_field("tx_power", f.tx_power_dbm),
        int_field("movement_counter", f.movement_counter),
        int_field("measurement_sequence", f.measurement_sequence),
    };
    point.timestamp_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                             reading.collected_at.time_since_epoch()).count();
    return point;
}

ExportPipeline::ExportPipeline(TimeSeriesSink& sink, std::string bucket, std::string measurement)
    : sink_(sink), bucket_(std::move(bucket)), measurement_(std::move(measurement)) {}

SinkError ExportPipeline::export_readings(const std::vector<SensorReading>& readings) {
    if (readings.empty()) {
        stats_.empty_batches++;
        log_debug(kTag, "empty batch, nothing to write");
        return SinkError::None;
    }

    std::vector<WritePoint> points;
    points.reserve(readings.size());
    for (const SensorReading& reading : readings) {
        points.push_back(make_write_point(measurement_, reading));
    }

    const SinkError err = sink_.write(bucket_, points);
    if (err != SinkError::None) {
        stats_.batches_failed++;
        record_export_failure(points.size(), sink_error_name(err));
        return err;
    }
    stats_.batches_written++;
    stats_.points_written += static_cast<uint32_t>(points.size());
    record_export_ok(points.size());
    log_debug(kTag, "wrote %zu points to bucket %s", points.size(), bucket_.c_str());
    return SinkError::None;
}
