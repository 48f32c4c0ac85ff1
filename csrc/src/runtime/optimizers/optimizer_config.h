// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_CONFIG_H
#define LOGSENTINEL_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_CONFIG_H

#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace optimizers {

//! Every phase gets a fresh optimizer instance of the configured type.
enum class OptimizerType {
    ADAMW,          // full-precision AdamW
    ADAMW_8BIT      // block-wise 8-bit quantized moments
};

//! Parses the `optimizer` hyperparameter. "adam" and "paged_adamw_8bit" are accepted as aliases.
inline OptimizerType optimizer_type_from_str(std::string_view name) {
    if (name == "adamw" || name == "adam") {
        return OptimizerType::ADAMW;
    }
    if (name == "adamw_8bit" || name == "paged_adamw_8bit") {
        return OptimizerType::ADAMW_8BIT;
    }
    throw std::invalid_argument(fmt::format("hyperparameters: unknown optimizer `{}`", name));
}

inline std::string to_string(OptimizerType type) {
    switch (type) {
        case OptimizerType::ADAMW: return "adamw";
        case OptimizerType::ADAMW_8BIT: return "adamw_8bit";
    }
    throw std::logic_error(fmt::format("unknown optimizer type {}", static_cast<int>(type)));
}

/**
 * @brief Optimizer settings of one training phase.
 *
 * The learning rate differs per phase; the remaining values are shared by all phases of a run.
 */
struct OptimizerConfig {
    OptimizerType type = OptimizerType::ADAMW;

    float learning_rate = 1e-4f;
    float weight_decay = 0.01f;
    //! Global gradient norm clip; 0 disables clipping.
    float grad_clip = 1.0f;

    float adamw_beta1 = 0.9f;
    float adamw_beta2 = 0.999f;
    float adamw_epsilon = 1e-8f;

    static OptimizerConfig adamw(float lr, float beta1 = 0.9f, float beta2 = 0.999f, float epsilon = 1e-8f,
                                 float weight_decay = 0.01f, float grad_clip = 1.0f) {
        OptimizerConfig config;
        config.learning_rate = lr;
        config.adamw_beta1 = beta1;
        config.adamw_beta2 = beta2;
        config.adamw_epsilon = epsilon;
        config.weight_decay = weight_decay;
        config.grad_clip = grad_clip;
        return config;
    }
};

} // namespace optimizers

#endif // LOGSENTINEL_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_CONFIG_H
