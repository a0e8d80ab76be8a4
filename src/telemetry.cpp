#include "telemetry.hpp"

#include <cctype>
#include <cstdio>

namespace {
int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
    return -1;
}
} // namespace

bool parse_ble_address(const std::string& text, BleAddress& out) {
    // 6 octets, 2 hex digits each, 5 separators.
    if (text.size() != kBleAddressLength * 3 - 1) {
        return false;
    }
    BleAddress parsed{};
    for (std::size_t i = 0; i < kBleAddressLength; ++i) {
        const std::size_t pos = i * 3;
        const int hi = hex_value(text[pos]);
        const int lo = hex_value(text[pos + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        if (i + 1 < kBleAddressLength) {
            const char sep = text[pos + 2];
            if (sep != ':' && sep != '-') {
                return false;
            }
        }
        parsed[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    out = parsed;
    return true;
}

std::string format_ble_address(const BleAddress& address) {
    char buf[kBleAddressLength * 3];
    std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                  address[0], address[1], address[2], address[3], address[4], address[5]);
    return std::string(buf);
}

std::string format_sensor_reading(const SensorReading& reading) {
    const RuuviFields& f = reading.fields;
    char buf[256];
    std::snprintf(buf, sizeof(buf),
                  "%s (%s) temp=%.3fC hum=%.4f%% press=%uPa acc=[%.3f,%.3f,%.3f]g bat=%.3fV tx=%ddBm mov=%u seq=%u",
                  reading.source_name.c_str(),
                  format_ble_address(reading.source_address).c_str(),
                  f.temperature_c,
                  f.humidity_pct,
                  static_cast<unsigned>(f.pressure_pa),
                  f.acceleration_x_g,
                  f.acceleration_y_g,
                  f.acceleration_z_g,
                  f.battery_v,
                  static_cast<int>(f.tx_power_dbm),
                  static_cast<unsigned>(f.movement_counter),
                  static_cast<unsigned>(f.measurement_sequence));
    return std::string(buf);
}

std::string hex_dump(const uint8_t* data, std::size_t len) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(hex[data[i] >> 4]);
        out.push_back(hex[data[i] & 0x0F]);
    }
    return out;
}
