#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

constexpr std::size_t kBleAddressLength = 6;

using BleAddress = std::array<uint8_t, kBleAddressLength>;

// Physical quantities carried by one RuuviTag payload.
struct RuuviFields {
    float temperature_c;
    float humidity_pct;
    uint32_t pressure_pa;
    float acceleration_x_g;
    float acceleration_y_g;
    float acceleration_z_g;
    float battery_v;
    int16_t tx_power_dbm;
    uint8_t movement_counter;
    uint16_t measurement_sequence;
};

struct SensorReading {
    std::string source_name;
    BleAddress source_address;
    RuuviFields fields;
    std::chrono::system_clock::time_point collected_at;
};

// "AA:BB:CC:DD:EE:FF" (case-insensitive, ':' or '-' separators).
bool parse_ble_address(const std::string& text, BleAddress& out);
std::string format_ble_address(const BleAddress& address);

std::string format_sensor_reading(const SensorReading& reading);
std::string hex_dump(const uint8_t* data, std::size_t len);
