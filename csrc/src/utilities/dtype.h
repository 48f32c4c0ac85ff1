// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_UTILITIES_DTYPE_H
#define LOGSENTINEL_SRC_UTILITIES_DTYPE_H

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

enum class ETensorDType : int {
    FP32,
    BF16,
    FP16,
    INT32,
    BYTE
};

constexpr std::size_t get_dtype_size(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return 4;
        case ETensorDType::BF16: return 2;
        case ETensorDType::FP16: return 2;
        case ETensorDType::INT32: return 4;
        case ETensorDType::BYTE: return 1;
    }
    throw std::logic_error("Unknown dtype");
}

//! Names follow the safetensors header convention.
constexpr const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "F32";
        case ETensorDType::BF16: return "BF16";
        case ETensorDType::FP16: return "F16";
        case ETensorDType::INT32: return "I32";
        case ETensorDType::BYTE: return "U8";
    }
    return "<invalid>";
}

inline ETensorDType dtype_from_str(std::string_view name) {
    if (name == "F32" || name == "fp32" || name == "float32") return ETensorDType::FP32;
    if (name == "BF16" || name == "bf16" || name == "bfloat16") return ETensorDType::BF16;
    if (name == "F16" || name == "fp16" || name == "float16") return ETensorDType::FP16;
    if (name == "I32" || name == "int32") return ETensorDType::INT32;
    if (name == "U8" || name == "byte") return ETensorDType::BYTE;
    throw std::runtime_error("Unsupported dtype: " + std::string(name));
}

template<typename T>
inline constexpr ETensorDType dtype_from_type = ETensorDType::BYTE;
template<> inline constexpr ETensorDType dtype_from_type<float> = ETensorDType::FP32;
template<> inline constexpr ETensorDType dtype_from_type<std::int32_t> = ETensorDType::INT32;
template<> inline constexpr ETensorDType dtype_from_type<std::byte> = ETensorDType::BYTE;

// ----------------------------------------------------------------------------
// Reduced precision emulation. Storage stays FP32, values are rounded to the
// nearest representable bf16 / fp16 number (round-to-nearest-even).

inline std::uint16_t float_to_bf16_bits(float f) {
    std::uint32_t u;
    std::memcpy(&u, &f, sizeof(u));
    if ((u & 0x7F800000u) == 0x7F800000u) {
        // inf / nan: truncate, keep nan quiet
        std::uint16_t h = static_cast<std::uint16_t>(u >> 16);
        if (u & 0x007FFFFFu) h |= 0x0040u;
        return h;
    }
    std::uint32_t lsb = (u >> 16) & 1u;
    u += 0x7FFFu + lsb;
    return static_cast<std::uint16_t>(u >> 16);
}

inline float bf16_bits_to_float(std::uint16_t h) {
    std::uint32_t u = static_cast<std::uint32_t>(h) << 16;
    float f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}

std::uint16_t float_to_fp16_bits(float f);
float fp16_bits_to_float(std::uint16_t h);

//! Round `value` to the precision of `dtype`. Identity for FP32.
float round_to_dtype(float value, ETensorDType dtype);

#endif //LOGSENTINEL_SRC_UTILITIES_DTYPE_H
