#pragma once

#include "sink.hpp"
#include <string>
#include <vector>

// InfluxDB line protocol.
std::string escape_measurement(const std::string& text);
std::string escape_key(const std::string& text);
std::string format_float_field(double value);
std::string encode_line(const WritePoint& point);
// One line per point, each terminated by '\n'.
std::string encode_lines(const std::vector<WritePoint>& points);
