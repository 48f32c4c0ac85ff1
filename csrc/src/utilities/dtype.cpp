// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "dtype.h"

#include <cmath>

/**
 * @brief Convert a float to IEEE half precision bits with round-to-nearest-even.
 *
 * Values beyond the half range become +/-inf, values below the smallest subnormal flush to zero.
 *
 * @param f Input value.
 * @return The fp16 bit pattern.
 */
std::uint16_t float_to_fp16_bits(float f) {
    std::uint32_t x;
    std::memcpy(&x, &f, sizeof(x));
    const std::uint32_t sign = (x >> 16) & 0x8000u;
    std::uint32_t mant = x & 0x007FFFFFu;
    const int exp = static_cast<int>((x >> 23) & 0xFFu);

    if (exp == 0xFF) {
        return static_cast<std::uint16_t>(sign | 0x7C00u | (mant ? 0x200u : 0u));
    }

    const int e = exp - 127 + 15;
    if (e >= 0x1F) {
        return static_cast<std::uint16_t>(sign | 0x7C00u);
    }

    if (e <= 0) {
        if (e < -10) {
            return static_cast<std::uint16_t>(sign);
        }
        mant |= 0x00800000u;
        const int shift = 14 - e;
        std::uint32_t half = mant >> shift;
        const std::uint32_t rem = mant & ((1u << shift) - 1u);
        const std::uint32_t halfway = 1u << (shift - 1);
        if (rem > halfway || (rem == halfway && (half & 1u))) {
            ++half;
        }
        return static_cast<std::uint16_t>(sign | half);
    }

    std::uint32_t half = (static_cast<std::uint32_t>(e) << 10) | (mant >> 13);
    const std::uint32_t rem = mant & 0x1FFFu;
    if (rem > 0x1000u || (rem == 0x1000u && (half & 1u))) {
        ++half;  // may carry into the exponent, which correctly yields inf on overflow
    }
    return static_cast<std::uint16_t>(sign | half);
}

/**
 * @brief Convert IEEE half precision bits to float.
 *
 * @param h fp16 bit pattern.
 * @return The exactly representable float value.
 */
float fp16_bits_to_float(std::uint16_t h) {
    const std::uint32_t sign = static_cast<std::uint32_t>(h & 0x8000u) << 16;
    const std::uint32_t exp = (h >> 10) & 0x1Fu;
    const std::uint32_t mant = h & 0x3FFu;

    if (exp == 0) {
        float value = std::ldexp(static_cast<float>(mant), -24);
        return sign ? -value : value;
    }

    std::uint32_t bits;
    if (exp == 0x1F) {
        bits = sign | 0x7F800000u | (mant << 13);
    } else {
        bits = sign | ((exp + 112u) << 23) | (mant << 13);
    }
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

float round_to_dtype(float value, ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::BF16: return bf16_bits_to_float(float_to_bf16_bits(value));
        case ETensorDType::FP16: return fp16_bits_to_float(float_to_fp16_bits(value));
        default: return value;
    }
}
