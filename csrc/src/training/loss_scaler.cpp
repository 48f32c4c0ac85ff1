// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "training/loss_scaler.h"

LossScaler::LossScaler(bool enabled) : LossScaler(enabled, Config{}) {
}

LossScaler::LossScaler(bool enabled, Config config) : mEnabled(enabled), mConfig(config), mScale(config.InitScale) {
}

void LossScaler::update(bool found_inf) {
    if (!mEnabled) return;
    if (found_inf) {
        mScale *= mConfig.BackoffFactor;
        mGoodSteps = 0;
        return;
    }
    if (++mGoodSteps >= mConfig.GrowthInterval) {
        mScale *= mConfig.GrowthFactor;
        mGoodSteps = 0;
    }
}
