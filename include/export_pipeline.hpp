#pragma once

#include "sink.hpp"
#include "telemetry.hpp"
#include <cstdint>
#include <string>
#include <vector>

WritePoint make_write_point(const std::string& measurement, const SensorReading& reading);

struct ExportStats {
    uint32_t batches_written;
    uint32_t batches_failed;
    uint32_t empty_batches;
    uint32_t points_written;
};

// Converts a tick's readings to points and writes them in one call.
// A failed batch is dropped; nothing is carried over to the next call.
class ExportPipeline {
public:
    ExportPipeline(TimeSeriesSink& sink, std::string bucket, std::string measurement);

    SinkError export_readings(const std::vector<SensorReading>& readings);
    ExportStats stats() const { return stats_; }

private:
    TimeSeriesSink& sink_;
    std::string bucket_;
    std::string measurement_;
    ExportStats stats_{};
};
