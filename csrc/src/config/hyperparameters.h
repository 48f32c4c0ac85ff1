// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_CONFIG_HYPERPARAMETERS_H
#define LOGSENTINEL_SRC_CONFIG_HYPERPARAMETERS_H

#include <array>
#include <cstdint>

#include <nlohmann/json_fwd.hpp>

#include "runtime/optimizers/optimizer_config.h"
#include "utilities/dtype.h"

constexpr int NUM_TRAINING_PHASES = 4;

//! Epoch count and learning rate of one training phase.
struct PhaseSchedule {
    int Epochs = 0;
    float LearningRate = 0.f;
};

/**
 * @brief Hyperparameters of a training run.
 *
 * Parsed from the run's JSON hyperparameter object. The same object is stored with the
 * run record, so to_json() reproduces every key, including defaulted optional ones.
 */
struct Hyperparameters {
    int BatchSize = 0;
    int MicroBatchSize = 0;
    std::array<PhaseSchedule, NUM_TRAINING_PHASES> Phases{};
    int MaxContentLen = 0;
    int MaxSeqLen = 0;
    //! Minimum minority class fraction; 0 disables oversampling.
    float MinLessPortion = 0.f;

    std::uint64_t Seed = 42;
    optimizers::OptimizerType Optimizer = optimizers::OptimizerType::ADAMW;
    float WeightDecay = 0.01f;
    float MaxGradNorm = 1.0f;
    float AdamBeta1 = 0.9f;
    float AdamBeta2 = 0.999f;
    float AdamEpsilon = 1e-8f;
    ETensorDType ModelDType = ETensorDType::FP32;

    //! batch_size / micro_batch_size; throws if not divisible.
    [[nodiscard]] int grad_accum_steps() const;

    [[nodiscard]] optimizers::OptimizerConfig optimizer_config(int phase) const;

    //! Throws std::invalid_argument describing the first violated constraint.
    void validate() const;

    static Hyperparameters from_json(const nlohmann::json& hp);
    [[nodiscard]] nlohmann::json to_json() const;
};

#endif //LOGSENTINEL_SRC_CONFIG_HYPERPARAMETERS_H
