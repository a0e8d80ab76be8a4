#include "ruuvi_payload.hpp"

namespace {
// MSB-first cursor over a byte buffer.
struct BitReader {
    const uint8_t* data;
    std::size_t len;
    std::size_t bit_idx = 0;

    bool remaining(std::size_t bits) const {
        return bit_idx + bits <= len * 8;
    }

    bool skip(std::size_t bits) {
        if (!remaining(bits)) return false;
        bit_idx += bits;
        return true;
    }

    bool read_bits(std::size_t bits, uint32_t& out) {
        if (bits > 32 || !remaining(bits)) return false;
        uint32_t val = 0;
        for (std::size_t i = 0; i < bits; ++i) {
            const std::size_t byte = bit_idx >> 3;
            const unsigned shift = 7u - static_cast<unsigned>(bit_idx & 0x7);
            val = (val << 1) | ((data[byte] >> shift) & 0x1u);
            ++bit_idx;
        }
        out = val;
        return true;
    }

    bool read_u16(std::size_t bits, uint16_t& out) {
        uint32_t val = 0;
        if (bits > 16 || !read_bits(bits, val)) return false;
        out = static_cast<uint16_t>(val);
        return true;
    }

    bool read_i16(int16_t& out) {
        uint32_t val = 0;
        if (!read_bits(16, val)) return false;
        out = static_cast<int16_t>(static_cast<uint16_t>(val));
        return true;
    }

    bool read_u8(uint8_t& out) {
        uint32_t val = 0;
        if (!read_bits(8, val)) return false;
        out = static_cast<uint8_t>(val);
        return true;
    }
};
} // namespace

const char* decode_error_name(DecodeError err) {
    switch (err) {
        case DecodeError::None: return "none";
        case DecodeError::Truncated: return "truncated";
    }
    return "unknown";
}

DecodeError decode_ruuvi_payload(const uint8_t* raw, std::size_t len, RuuviFields& out) {
    if (raw == nullptr || len < kRuuviPayloadBytes) {
        return DecodeError::Truncated;
    }

    BitReader reader{raw, len};
    uint16_t temperature = 0;
    uint16_t humidity = 0;
    uint16_t pressure = 0;
    int16_t acc_x = 0;
    int16_t acc_y = 0;
    int16_t acc_z = 0;
    uint16_t voltage = 0;
    uint16_t tx_power = 0;
    uint8_t movement = 0;
    uint16_t sequence = 0;

    if (!reader.skip(8)) return DecodeError::Truncated;
    if (!reader.read_u16(16, temperature)) return DecodeError::Truncated;
    if (!reader.read_u16(16, humidity)) return DecodeError::Truncated;
    if (!reader.read_u16(16, pressure)) return DecodeError::Truncated;
    if (!reader.read_i16(acc_x)) return DecodeError::Truncated;
    if (!reader.read_i16(acc_y)) return DecodeError::Truncated;
    if (!reader.read_i16(acc_z)) return DecodeError::Truncated;
    if (!reader.read_u16(11, voltage)) return DecodeError::Truncated;
    if (!reader.read_u16(5, tx_power)) return DecodeError::Truncated;
    if (!reader.read_u8(movement)) return DecodeError::Truncated;
    if (!reader.read_u16(16, sequence)) return DecodeError::Truncated;

    RuuviFields fields{};
    fields.temperature_c = static_cast<float>(temperature) * 0.005f;
    fields.humidity_pct = static_cast<float>(humidity) * 0.0025f;
    fields.pressure_pa = static_cast<uint32_t>(pressure) + 50000u;
    fields.acceleration_x_g = static_cast<float>(acc_x) / 1000.0f;
    fields.acceleration_y_g = static_cast<float>(acc_y) / 1000.0f;
    fields.acceleration_z_g = static_cast<float>(acc_z) / 1000.0f;
    fields.battery_v = static_cast<float>(voltage) * 0.001f + 1.6f;
    fields.tx_power_dbm = static_cast<int16_t>(static_cast<int>(tx_power) * 2 - 40);
    fields.movement_counter = movement;
    fields.measurement_sequence = sequence;

    out = fields;
    return DecodeError::None;
}
