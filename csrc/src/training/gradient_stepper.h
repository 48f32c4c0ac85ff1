// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_GRADIENT_STEPPER_H
#define LOGSENTINEL_SRC_TRAINING_GRADIENT_STEPPER_H

#include <memory>
#include <vector>

#include "modules/parameter.h"
#include "runtime/optimizers/optimizer.h"
#include "training/loss_scaler.h"

//! Outcome of one optimizer step.
struct StepResult {
    bool Applied = false;       ///< false if skipped because of non-finite gradients
    bool FoundInf = false;
    float GradNorm = 0.f;       ///< unscaled global norm before clipping
    float ClipFactor = 1.f;
    float Scale = 1.f;          ///< loss scale used for the accumulated gradients
};

/**
 * @brief Optimizer step with gradient accumulation, loss scaling and global norm clipping.
 *
 * One instance serves one training phase over the parameters trainable in that phase. The
 * backward pass is seeded with `dloss_multiplier()`, so accumulated gradients carry the loss
 * scale and the `1/grad_accum_steps` averaging. step() unscales, clips and applies the configured
 * optimizer (FP32 or 8-bit AdamW).
 */
class GradientStepper {
public:
    GradientStepper(std::vector<modules::Parameter*> params, const optimizers::OptimizerConfig& config,
                    int grad_accum_steps, bool use_loss_scaling);

    //! Gradient of the accumulated objective w.r.t. one micro-batch's mean loss.
    [[nodiscard]] float dloss_multiplier() const;

    StepResult step();
    void zero_grad();

    [[nodiscard]] int grad_accum_steps() const { return mGradAccumSteps; }
    [[nodiscard]] const LossScaler& scaler() const { return mScaler; }
    [[nodiscard]] int step_count() const { return mOptimizer->step_count(); }
    [[nodiscard]] float learning_rate() const { return mOptimizer->learning_rate(); }
    [[nodiscard]] std::size_t num_parameters() const { return mOptimizer->num_parameters(); }

private:
    static std::vector<optimizers::ParameterSlot> make_slots(const std::vector<modules::Parameter*>& params);

    std::vector<modules::Parameter*> mParams;
    std::unique_ptr<optimizers::IOptimizer> mOptimizer;
    LossScaler mScaler;
    int mGradAccumSteps;
    float mMaxGradNorm;
};

#endif //LOGSENTINEL_SRC_TRAINING_GRADIENT_STEPPER_H
