// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// AdamW 8-bit optimizer with block-wise quantization
// Based on bitsandbytes implementation: https://github.com/TimDettmers/bitsandbytes

#ifndef LOGSENTINEL_SRC_RUNTIME_OPTIMIZERS_ADAMW_8BIT_H
#define LOGSENTINEL_SRC_RUNTIME_OPTIMIZERS_ADAMW_8BIT_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "optimizer.h"

namespace optimizers {

// Each block of this many elements has its own absmax.
constexpr int ADAMW8BIT_BLOCK_SIZE = 256;

using QuantizationMap = std::array<float, 256>;

/**
 * @brief Creates a dynamic quantization map for 8-bit optimizer states.
 *
 * Seven decades of magnitude, with twice as many levels per decade as the one below it,
 * plus exact 0 and 1. Sorted ascending.
 *
 * @param signed_map If true, creates a signed map for [-1, 1]; otherwise [0, 1].
 */
QuantizationMap create_dynamic_quantization_map(bool signed_map);

//! Quantizes `n` values block by block: one absmax per block, codes index the nearest map entry.
void quantize_blockwise(const float* values, std::size_t n, const QuantizationMap& map,
                        std::uint8_t* codes, float* absmax);
void dequantize_blockwise(const std::uint8_t* codes, const float* absmax, std::size_t n,
                          const QuantizationMap& map, float* values);

/**
 * @brief One 8-bit AdamW step over `n` elements.
 *
 * Each block is dequantized, updated in FP32, and quantized again with a fresh absmax. The
 * parameter update uses the FP32 moments of this step; only the stored state is quantized.
 */
void adamw_update_8bit(float* p, const float* g, std::uint8_t* state1, std::uint8_t* state2, std::size_t n,
                       float lr, float beta1, float beta2, int step, float eps, float weight_decay,
                       float grad_scale, const QuantizationMap& quantiles1, const QuantizationMap& quantiles2,
                       float* absmax1, float* absmax2);

/**
 * @brief AdamW with both moments stored as 8-bit codes plus per-block FP32 absmax.
 *
 * Uses a signed map for the first moment and an unsigned map for the second.
 */
class AdamW8Bit : public IOptimizer {
public:
    AdamW8Bit(std::vector<ParameterSlot> slots, const OptimizerConfig& config);

    void step(float grad_scale) override;

    [[nodiscard]] int step_count() const override { return mStepCount; }
    [[nodiscard]] float learning_rate() const override { return mConfig.learning_rate; }
    [[nodiscard]] std::size_t num_parameters() const override;

    //! Bytes held by the quantized state.
    [[nodiscard]] std::size_t state_bytes() const;

    //! Dequantized first and second moment of slot `index`.
    [[nodiscard]] std::vector<float> first_moment(std::size_t index) const;
    [[nodiscard]] std::vector<float> second_moment(std::size_t index) const;

private:
    struct sSlotState {
        std::vector<std::uint8_t> State1;
        std::vector<std::uint8_t> State2;
        std::vector<float> Absmax1;
        std::vector<float> Absmax2;
    };

    std::vector<ParameterSlot> mSlots;
    std::vector<sSlotState> mState;
    QuantizationMap mQuantiles1;
    QuantizationMap mQuantiles2;
    OptimizerConfig mConfig;
    int mStepCount = 0;
};

}  // namespace optimizers

#endif  // LOGSENTINEL_SRC_RUNTIME_OPTIMIZERS_ADAMW_8BIT_H
