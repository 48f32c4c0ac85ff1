// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "tensor.h"

#include <cstring>

/**
 * @brief Fill a tensor's buffer with zeros.
 *
 * @param dst Tensor whose underlying memory will be set to 0. Null tensors are ignored.
 */
void fill_zero(Tensor& dst) {
    if (!dst.Data || dst.bytes() == 0) return;
    std::memset(dst.Data, 0, dst.bytes());
}

/**
 * @brief Draw every element of an FP32 tensor from N(@p mean, @p stddev).
 */
void fill_normal(Tensor& dst, float mean, float stddev, std::mt19937_64& rng) {
    std::normal_distribution<float> dist(mean, stddev);
    float* data = dst.get<float>();
    for (std::size_t i = 0; i < dst.nelem(); ++i) {
        data[i] = dist(rng);
    }
}

void fill_uniform(Tensor& dst, float low, float high, std::mt19937_64& rng) {
    std::uniform_real_distribution<float> dist(low, high);
    float* data = dst.get<float>();
    for (std::size_t i = 0; i < dst.nelem(); ++i) {
        data[i] = dist(rng);
    }
}
