#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

enum class SinkError : uint8_t {
    None = 0,
    WriteFailed,
};

const char* sink_error_name(SinkError err);

enum class FieldType : uint8_t {
    Float,
    Integer,
};

struct FieldValue {
    std::string key;
    FieldType type;
    double float_value;
    int64_t int_value;
};

struct WritePoint {
    std::string measurement;
    std::vector<std::pair<std::string, std::string>> tags;
    std::vector<FieldValue> fields;
    int64_t timestamp_ns;
};

// Time-series store client. One write() call carries one tick's batch.
class TimeSeriesSink {
public:
    virtual ~TimeSeriesSink() = default;
    virtual SinkError write(const std::string& bucket, const std::vector<WritePoint>& points) = 0;
};
