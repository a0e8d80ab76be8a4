#include "line_protocol.hpp"

#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace {
std::string escape(const std::string& text, bool escape_equals) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == ',' || c == ' ' || (escape_equals && c == '=')) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}
} // namespace

std::string escape_measurement(const std::string& text) {
    return escape(text, false);
}

std::string escape_key(const std::string& text) {
    return escape(text, true);
}

std::string format_float_field(double value) {
    if (!std::isfinite(value)) {
        return "0";
    }
    char buf[32];
    // Values that came from a float print with the shortest float round-trip.
    const bool single = static_cast<double>(static_cast<float>(value)) == value;
    const int max_precision = single ? 9 : 17;
    for (int precision = 1; precision <= max_precision; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        const bool round_trips = single ? std::strtof(buf, nullptr) == static_cast<float>(value)
                                        : std::strtod(buf, nullptr) == value;
        if (round_trips) {
            break;
        }
    }
    return std::string(buf);
}

std::string encode_line(const WritePoint& point) {
    std::string line = escape_measurement(point.measurement);
    for (const auto& tag : point.tags) {
        if (tag.second.empty()) {
            continue;
        }
        line += ',';
        line += escape_key(tag.first);
        line += '=';
        line += escape_key(tag.second);
    }

    bool first = true;
    char buf[32];
    for (const FieldValue& field : point.fields) {
        line += first ? ' ' : ',';
        first = false;
        line += escape_key(field.key);
        line += '=';
        if (field.type == FieldType::Integer) {
            std::snprintf(buf, sizeof(buf), "%" PRId64 "i", field.int_value);
            line += buf;
        } else {
            line += format_float_field(field.float_value);
        }
    }

    std::snprintf(buf, sizeof(buf), " %" PRId64, point.timestamp_ns);
    line += buf;
    return line;
}

std::string encode_lines(const std::vector<WritePoint>& points) {
    std::string body;
    for (const WritePoint& point : points) {
        body += encode_line(point);
        body += '\n';
    }
    return body;
}
