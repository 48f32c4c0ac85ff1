// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "training/gradient_stepper.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include "kernels/kernels.h"

GradientStepper::GradientStepper(std::vector<modules::Parameter*> params, const optimizers::OptimizerConfig& config,
                                 int grad_accum_steps, bool use_loss_scaling) :
    mParams(std::move(params)), mOptimizer(optimizers::make_optimizer(make_slots(mParams), config)), mScaler(use_loss_scaling),
    mGradAccumSteps(grad_accum_steps), mMaxGradNorm(config.grad_clip) {
    if (grad_accum_steps <= 0) {
        throw std::invalid_argument(fmt::format("GradientStepper: grad_accum_steps must be positive, got {}", grad_accum_steps));
    }
}

std::vector<optimizers::ParameterSlot> GradientStepper::make_slots(const std::vector<modules::Parameter*>& params) {
    std::vector<optimizers::ParameterSlot> slots;
    slots.reserve(params.size());
    for (modules::Parameter* param : params) {
        slots.push_back({param->data(), param->grad(), param->nelem()});
    }
    return slots;
}

float GradientStepper::dloss_multiplier() const {
    return mScaler.scale() / static_cast<float>(mGradAccumSteps);
}

/**
 * @brief Unscale, clip and apply the accumulated gradients, then reset them.
 *
 * The global norm is taken over all parameters of this stepper after unscaling. With
 * non-finite gradients the update is skipped and the loss scaler backs off.
 */
StepResult GradientStepper::step() {
    StepResult result;
    result.Scale = mScaler.scale();
    const float inv_scale = 1.f / result.Scale;

    double norm_squared = 0.0;
    bool finite = true;
    for (modules::Parameter* param : mParams) {
        finite = finite && all_finite(param->grad(), param->nelem());
        norm_squared += global_norm_squared(param->grad(), param->nelem());
    }
    result.FoundInf = !finite || !std::isfinite(norm_squared);
    result.GradNorm = static_cast<float>(std::sqrt(norm_squared)) * inv_scale;

    if (!result.FoundInf) {
        if (mMaxGradNorm > 0.f) {
            result.ClipFactor = std::min(1.f, mMaxGradNorm / (result.GradNorm + 1e-6f));
        }
        mOptimizer->step(inv_scale * result.ClipFactor);
        result.Applied = true;
    }

    mScaler.update(result.FoundInf);
    zero_grad();
    return result;
}

void GradientStepper::zero_grad() {
    for (modules::Parameter* param : mParams) {
        param->zero_grad();
    }
}
