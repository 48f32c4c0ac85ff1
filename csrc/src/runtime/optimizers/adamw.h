// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Full-precision AdamW optimizer (FP32 state).

#ifndef LOGSENTINEL_SRC_RUNTIME_OPTIMIZERS_ADAMW_H
#define LOGSENTINEL_SRC_RUNTIME_OPTIMIZERS_ADAMW_H

#include <cstddef>
#include <vector>

#include <Eigen/Dense>

#include "optimizer.h"

namespace optimizers {

//! Decoupled weight decay AdamW step over `n` elements. The bias corrections are `1 - beta^t`.
//! Gradients are multiplied by `*grad_scale` before use when `grad_scale` is non-null.
void adamw_update(float* param, const float* grad, float* m, float* v, std::size_t n,
                  float lr, float beta1, float beta2, float beta1_correction, float beta2_correction,
                  float epsilon, float weight_decay, const float* grad_scale);

/**
 * @brief AdamW with FP32 moments.
 *
 * Moment buffers are allocated on construction and zero-initialized, so a fresh
 * instance starts from a clean optimizer state.
 */
class AdamW : public IOptimizer {
public:
    AdamW(std::vector<ParameterSlot> slots, const OptimizerConfig& config);

    void step(float grad_scale) override;

    [[nodiscard]] int step_count() const override { return mStepCount; }
    [[nodiscard]] float learning_rate() const override { return mConfig.learning_rate; }
    [[nodiscard]] std::size_t num_parameters() const override;

private:
    std::vector<ParameterSlot> mSlots;
    std::vector<Eigen::ArrayXf> mFirstMoment;
    std::vector<Eigen::ArrayXf> mSecondMoment;
    OptimizerConfig mConfig;
    int mStepCount = 0;
};

}  // namespace optimizers

#endif  // LOGSENTINEL_SRC_RUNTIME_OPTIMIZERS_ADAMW_H
