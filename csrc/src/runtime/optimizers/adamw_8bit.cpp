// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "adamw_8bit.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <Eigen/Dense>
#include <fmt/core.h>

namespace optimizers {

namespace {

std::size_t num_blocks(std::size_t n) {
    return (n + ADAMW8BIT_BLOCK_SIZE - 1) / ADAMW8BIT_BLOCK_SIZE;
}

std::uint8_t nearest_code(float x, const QuantizationMap& map) {
    auto upper = std::lower_bound(map.begin(), map.end(), x);
    if (upper == map.begin()) return 0;
    if (upper == map.end()) return static_cast<std::uint8_t>(map.size() - 1);
    auto lower = upper - 1;
    auto best = (x - *lower <= *upper - x) ? lower : upper;
    return static_cast<std::uint8_t>(best - map.begin());
}

} // namespace

QuantizationMap create_dynamic_quantization_map(bool signed_map) {
    constexpr int max_exponent_bits = 7;
    std::vector<float> data;
    data.reserve(256);
    for (int i = 0; i < max_exponent_bits; ++i) {
        // midpoints of linspace(0.1, 1, fraction_items) scaled to the decade 10^(i-6)
        const int fraction_items = (1 << (signed_map ? i : i + 1)) + 1;
        const float decade = std::pow(10.f, static_cast<float>(i - (max_exponent_bits - 1)));
        const float step = 0.9f / static_cast<float>(fraction_items - 1);
        for (int j = 0; j + 1 < fraction_items; ++j) {
            const float mean = 0.1f + step * (static_cast<float>(j) + 0.5f);
            data.push_back(decade * mean);
            if (signed_map) data.push_back(-decade * mean);
        }
    }
    data.push_back(0.f);
    data.push_back(1.f);
    if (data.size() != 256) {
        throw std::logic_error(fmt::format("dynamic quantization map has {} entries", data.size()));
    }

    std::sort(data.begin(), data.end());
    QuantizationMap map;
    std::copy(data.begin(), data.end(), map.begin());
    return map;
}

void quantize_blockwise(const float* values, std::size_t n, const QuantizationMap& map,
                        std::uint8_t* codes, float* absmax) {
    for (std::size_t block = 0; block < num_blocks(n); ++block) {
        const std::size_t begin = block * ADAMW8BIT_BLOCK_SIZE;
        const std::size_t len = std::min<std::size_t>(ADAMW8BIT_BLOCK_SIZE, n - begin);
        Eigen::Map<const Eigen::ArrayXf> x(values + begin, static_cast<Eigen::Index>(len));
        absmax[block] = x.abs().maxCoeff();
        const float inv = absmax[block] > 0.f ? 1.f / absmax[block] : 0.f;
        for (std::size_t i = 0; i < len; ++i) {
            codes[begin + i] = nearest_code(values[begin + i] * inv, map);
        }
    }
}

void dequantize_blockwise(const std::uint8_t* codes, const float* absmax, std::size_t n,
                          const QuantizationMap& map, float* values) {
    for (std::size_t i = 0; i < n; ++i) {
        values[i] = map[codes[i]] * absmax[i / ADAMW8BIT_BLOCK_SIZE];
    }
}

void adamw_update_8bit(float* p, const float* g, std::uint8_t* state1, std::uint8_t* state2, std::size_t n,
                       float lr, float beta1, float beta2, int step, float eps, float weight_decay,
                       float grad_scale, const QuantizationMap& quantiles1, const QuantizationMap& quantiles2,
                       float* absmax1, float* absmax2) {
    const float correction1 = 1.f - std::pow(beta1, static_cast<float>(step));
    const float correction2 = 1.f - std::pow(beta2, static_cast<float>(step));

    Eigen::ArrayXf m(ADAMW8BIT_BLOCK_SIZE);
    Eigen::ArrayXf v(ADAMW8BIT_BLOCK_SIZE);
    for (std::size_t block = 0; block < num_blocks(n); ++block) {
        const std::size_t begin = block * ADAMW8BIT_BLOCK_SIZE;
        const auto len = static_cast<Eigen::Index>(std::min<std::size_t>(ADAMW8BIT_BLOCK_SIZE, n - begin));
        auto m_blk = m.head(len);
        auto v_blk = v.head(len);
        dequantize_blockwise(state1 + begin, absmax1 + block, len, quantiles1, m_blk.data());
        dequantize_blockwise(state2 + begin, absmax2 + block, len, quantiles2, v_blk.data());

        Eigen::Map<Eigen::ArrayXf> param(p + begin, len);
        Eigen::ArrayXf grad = Eigen::Map<const Eigen::ArrayXf>(g + begin, len) * grad_scale;
        m_blk = beta1 * m_blk + (1.f - beta1) * grad;
        v_blk = beta2 * v_blk + (1.f - beta2) * grad.square();
        param *= 1.f - lr * weight_decay;
        param -= lr * (m_blk / correction1) / ((v_blk / correction2).sqrt() + eps);

        quantize_blockwise(m_blk.data(), len, quantiles1, state1 + begin, absmax1 + block);
        quantize_blockwise(v_blk.data(), len, quantiles2, state2 + begin, absmax2 + block);
    }
}

AdamW8Bit::AdamW8Bit(std::vector<ParameterSlot> slots, const OptimizerConfig& config) :
    mSlots(std::move(slots)), mQuantiles1(create_dynamic_quantization_map(true)),
    mQuantiles2(create_dynamic_quantization_map(false)), mConfig(config) {
    if (config.type != OptimizerType::ADAMW_8BIT) {
        throw std::invalid_argument(fmt::format("AdamW8Bit constructed with optimizer type {}", to_string(config.type)));
    }
    if (!(config.learning_rate >= 0.f)) {
        throw std::invalid_argument(fmt::format("AdamW8Bit: invalid learning rate {}", config.learning_rate));
    }

    // zero moments quantize to the code of 0.0 with absmax 0
    const auto zero1 = nearest_code(0.f, mQuantiles1);
    const auto zero2 = nearest_code(0.f, mQuantiles2);
    mState.reserve(mSlots.size());
    for (const auto& slot : mSlots) {
        sSlotState state;
        state.State1.assign(slot.Size, zero1);
        state.State2.assign(slot.Size, zero2);
        state.Absmax1.assign(num_blocks(slot.Size), 0.f);
        state.Absmax2.assign(num_blocks(slot.Size), 0.f);
        mState.push_back(std::move(state));
    }
}

void AdamW8Bit::step(float grad_scale) {
    ++mStepCount;
    for (std::size_t i = 0; i < mSlots.size(); ++i) {
        auto& state = mState[i];
        adamw_update_8bit(mSlots[i].Param, mSlots[i].Grad, state.State1.data(), state.State2.data(), mSlots[i].Size,
                          mConfig.learning_rate, mConfig.adamw_beta1, mConfig.adamw_beta2, mStepCount,
                          mConfig.adamw_epsilon, mConfig.weight_decay, grad_scale, mQuantiles1, mQuantiles2,
                          state.Absmax1.data(), state.Absmax2.data());
    }
}

std::size_t AdamW8Bit::num_parameters() const {
    std::size_t total = 0;
    for (const auto& slot : mSlots) total += slot.Size;
    return total;
}

std::size_t AdamW8Bit::state_bytes() const {
    std::size_t total = 0;
    for (const auto& state : mState) {
        total += state.State1.size() + state.State2.size();
        total += (state.Absmax1.size() + state.Absmax2.size()) * sizeof(float);
    }
    return total;
}

std::vector<float> AdamW8Bit::first_moment(std::size_t index) const {
    const auto& state = mState.at(index);
    std::vector<float> values(state.State1.size());
    dequantize_blockwise(state.State1.data(), state.Absmax1.data(), values.size(), mQuantiles1, values.data());
    return values;
}

std::vector<float> AdamW8Bit::second_moment(std::size_t index) const {
    const auto& state = mState.at(index);
    std::vector<float> values(state.State2.size());
    dequantize_blockwise(state.State2.data(), state.Absmax2.data(), values.size(), mQuantiles2, values.data());
    return values;
}

}  // namespace optimizers
