// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_LOSS_SCALER_H
#define LOGSENTINEL_SRC_TRAINING_LOSS_SCALER_H

/**
 * @brief Dynamic loss scaling for FP16 training.
 *
 * The loss is multiplied by `scale()` before backward. A step with non-finite gradients is
 * skipped and backs the scale off; after `growth_interval` consecutive finite steps the scale
 * grows. A disabled scaler always reports a scale of 1.
 */
class LossScaler {
public:
    struct Config {
        float InitScale = 65536.f;
        float GrowthFactor = 2.f;
        float BackoffFactor = 0.5f;
        int GrowthInterval = 2000;
    };

    explicit LossScaler(bool enabled);
    LossScaler(bool enabled, Config config);

    [[nodiscard]] bool enabled() const { return mEnabled; }
    [[nodiscard]] float scale() const { return mEnabled ? mScale : 1.f; }

    //! Record the outcome of one optimizer step and adjust the scale.
    void update(bool found_inf);

private:
    bool mEnabled;
    Config mConfig;
    float mScale;
    int mGoodSteps = 0;
};

#endif //LOGSENTINEL_SRC_TRAINING_LOSS_SCALER_H
