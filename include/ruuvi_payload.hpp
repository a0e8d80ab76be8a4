#pragma once

#include "telemetry.hpp"
#include <cstddef>
#include <cstdint>

// Format tag byte followed by 16,16,16,16,16,16,11,5,8,16 bit fields.
constexpr std::size_t kRuuviPayloadBits = 8 + 6 * 16 + 11 + 5 + 8 + 16;
constexpr std::size_t kRuuviPayloadBytes = kRuuviPayloadBits / 8;

enum class DecodeError : uint8_t {
    None = 0,
    Truncated,
};

const char* decode_error_name(DecodeError err);

// Decodes the fixed RuuviTag layout. `out` is written only on success.
DecodeError decode_ruuvi_payload(const uint8_t* raw, std::size_t len, RuuviFields& out);
