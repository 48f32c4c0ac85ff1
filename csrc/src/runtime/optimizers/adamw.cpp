// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "adamw.h"

#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

namespace optimizers {

void adamw_update(float* param, const float* grad, float* m, float* v, std::size_t n,
                  float lr, float beta1, float beta2, float beta1_correction, float beta2_correction,
                  float epsilon, float weight_decay, const float* grad_scale) {
    const auto size = static_cast<Eigen::Index>(n);
    const float scale = grad_scale ? *grad_scale : 1.f;
    Eigen::Map<Eigen::ArrayXf> p(param, size);
    Eigen::Map<Eigen::ArrayXf> m1(m, size);
    Eigen::Map<Eigen::ArrayXf> m2(v, size);
    Eigen::ArrayXf g = Eigen::Map<const Eigen::ArrayXf>(grad, size) * scale;

    m1 = beta1 * m1 + (1.f - beta1) * g;
    m2 = beta2 * m2 + (1.f - beta2) * g.square();
    p *= 1.f - lr * weight_decay;
    p -= lr * (m1 / beta1_correction) / ((m2 / beta2_correction).sqrt() + epsilon);
}

AdamW::AdamW(std::vector<ParameterSlot> slots, const OptimizerConfig& config) :
    mSlots(std::move(slots)), mConfig(config) {
    if (config.type != OptimizerType::ADAMW) {
        throw std::invalid_argument(fmt::format("AdamW constructed with optimizer type {}", to_string(config.type)));
    }
    if (!(config.learning_rate >= 0.f)) {
        throw std::invalid_argument(fmt::format("AdamW: invalid learning rate {}", config.learning_rate));
    }
    mFirstMoment.reserve(mSlots.size());
    mSecondMoment.reserve(mSlots.size());
    for (const auto& slot : mSlots) {
        mFirstMoment.push_back(Eigen::ArrayXf::Zero(static_cast<Eigen::Index>(slot.Size)));
        mSecondMoment.push_back(Eigen::ArrayXf::Zero(static_cast<Eigen::Index>(slot.Size)));
    }
}

void AdamW::step(float grad_scale) {
    ++mStepCount;
    const float beta1_correction = 1.f - std::pow(mConfig.adamw_beta1, static_cast<float>(mStepCount));
    const float beta2_correction = 1.f - std::pow(mConfig.adamw_beta2, static_cast<float>(mStepCount));
    for (std::size_t i = 0; i < mSlots.size(); ++i) {
        const auto& slot = mSlots[i];
        adamw_update(slot.Param, slot.Grad, mFirstMoment[i].data(), mSecondMoment[i].data(), slot.Size,
                     mConfig.learning_rate, mConfig.adamw_beta1, mConfig.adamw_beta2,
                     beta1_correction, beta2_correction, mConfig.adamw_epsilon, mConfig.weight_decay,
                     &grad_scale);
    }
}

std::size_t AdamW::num_parameters() const {
    std::size_t total = 0;
    for (const auto& slot : mSlots) total += slot.Size;
    return total;
}

}  // namespace optimizers
