// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "config/hyperparameters.h"

#include <cmath>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "utilities/utils.h"

namespace {

template<typename T>
T read_number(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number()) {
        throw std::invalid_argument(fmt::format("hyperparameters: `{}` must be a number, got {}", key, value.type_name()));
    }
    if constexpr (std::is_integral_v<T>) {
        if (value.is_number_float()) {
            const double number = value.get<double>();
            if (!std::isfinite(number) || std::trunc(number) != number) {
                throw std::invalid_argument(fmt::format("hyperparameters: `{}` must be an integer, got {}", key, number));
            }
            return static_cast<T>(number);
        }
    }
    return value.get<T>();
}

template<typename T>
T get_required(const nlohmann::json& hp, const std::string& key) {
    auto it = hp.find(key);
    if (it == hp.end() || it->is_null()) {
        throw std::invalid_argument(fmt::format("hyperparameters: missing required key `{}`", key));
    }
    return read_number<T>(*it, key);
}

template<typename T>
T get_optional(const nlohmann::json& hp, const std::string& key, T fallback) {
    auto it = hp.find(key);
    if (it == hp.end() || it->is_null()) {
        return fallback;
    }
    return read_number<T>(*it, key);
}

const char* dtype_to_config_str(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "fp32";
        case ETensorDType::BF16: return "bf16";
        case ETensorDType::FP16: return "fp16";
        default: return "<invalid>";
    }
}

}  // namespace

int Hyperparameters::grad_accum_steps() const {
    return div_exact(BatchSize, MicroBatchSize);
}

optimizers::OptimizerConfig Hyperparameters::optimizer_config(int phase) const {
    if (phase < 0 || phase >= NUM_TRAINING_PHASES) {
        throw std::out_of_range(fmt::format("phase index {} out of range", phase));
    }
    auto config = optimizers::OptimizerConfig::adamw(Phases[phase].LearningRate, AdamBeta1, AdamBeta2, AdamEpsilon,
                                                     WeightDecay, MaxGradNorm);
    config.type = Optimizer;
    return config;
}

void Hyperparameters::validate() const {
    if (BatchSize <= 0) {
        throw std::invalid_argument(fmt::format("hyperparameters: batch_size must be positive, got {}", BatchSize));
    }
    if (MicroBatchSize <= 0) {
        throw std::invalid_argument(fmt::format("hyperparameters: micro_batch_size must be positive, got {}", MicroBatchSize));
    }
    if (BatchSize % MicroBatchSize != 0) {
        throw std::invalid_argument(fmt::format("hyperparameters: batch_size {} is not a multiple of micro_batch_size {}",
                                                BatchSize, MicroBatchSize));
    }
    for (int i = 0; i < NUM_TRAINING_PHASES; ++i) {
        if (!std::isfinite(Phases[i].LearningRate) || Phases[i].LearningRate < 0.f) {
            throw std::invalid_argument(fmt::format("hyperparameters: lr_phase{} must be a non-negative number, got {}",
                                                    i + 1, Phases[i].LearningRate));
        }
    }
    if (MaxContentLen <= 0) {
        throw std::invalid_argument(fmt::format("hyperparameters: max_content_len must be positive, got {}", MaxContentLen));
    }
    if (MaxSeqLen <= 0) {
        throw std::invalid_argument(fmt::format("hyperparameters: max_seq_len must be positive, got {}", MaxSeqLen));
    }
    if (!(MinLessPortion >= 0.f && MinLessPortion < 1.f)) {
        throw std::invalid_argument(fmt::format("hyperparameters: min_less_portion must be in [0, 1), got {}", MinLessPortion));
    }
    if (MaxGradNorm < 0.f) {
        throw std::invalid_argument(fmt::format("hyperparameters: max_grad_norm must not be negative, got {}", MaxGradNorm));
    }
    if (ModelDType != ETensorDType::FP32 && ModelDType != ETensorDType::BF16 && ModelDType != ETensorDType::FP16) {
        throw std::invalid_argument(fmt::format("hyperparameters: unsupported model_dtype {}", dtype_to_str(ModelDType)));
    }
}

Hyperparameters Hyperparameters::from_json(const nlohmann::json& hp) {
    if (!hp.is_object()) {
        throw std::invalid_argument("hyperparameters: expected a JSON object");
    }

    Hyperparameters result;
    result.BatchSize = get_required<int>(hp, "batch_size");
    result.MicroBatchSize = get_required<int>(hp, "micro_batch_size");
    for (int i = 0; i < NUM_TRAINING_PHASES; ++i) {
        result.Phases[i].Epochs = get_required<int>(hp, fmt::format("n_epochs_phase{}", i + 1));
        result.Phases[i].LearningRate = get_required<float>(hp, fmt::format("lr_phase{}", i + 1));
    }
    result.MaxContentLen = get_required<int>(hp, "max_content_len");
    result.MaxSeqLen = get_required<int>(hp, "max_seq_len");
    result.MinLessPortion = get_optional<float>(hp, "min_less_portion", 0.f);

    result.Seed = get_optional<std::uint64_t>(hp, "seed", result.Seed);
    result.WeightDecay = get_optional<float>(hp, "weight_decay", result.WeightDecay);
    result.MaxGradNorm = get_optional<float>(hp, "max_grad_norm", result.MaxGradNorm);
    result.AdamBeta1 = get_optional<float>(hp, "adamw_beta1", result.AdamBeta1);
    result.AdamBeta2 = get_optional<float>(hp, "adamw_beta2", result.AdamBeta2);
    result.AdamEpsilon = get_optional<float>(hp, "adamw_epsilon", result.AdamEpsilon);

    if (auto it = hp.find("optimizer"); it != hp.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw std::invalid_argument("hyperparameters: `optimizer` must be a string");
        }
        result.Optimizer = optimizers::optimizer_type_from_str(it->get<std::string>());
    }
    if (auto it = hp.find("model_dtype"); it != hp.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw std::invalid_argument("hyperparameters: `model_dtype` must be a string");
        }
        try {
            result.ModelDType = dtype_from_str(it->get<std::string>());
        } catch (const std::runtime_error& e) {
            throw std::invalid_argument(fmt::format("hyperparameters: {}", e.what()));
        }
    }

    result.validate();
    return result;
}

nlohmann::json Hyperparameters::to_json() const {
    nlohmann::json hp;
    hp["batch_size"] = BatchSize;
    hp["micro_batch_size"] = MicroBatchSize;
    for (int i = 0; i < NUM_TRAINING_PHASES; ++i) {
        hp[fmt::format("n_epochs_phase{}", i + 1)] = Phases[i].Epochs;
        hp[fmt::format("lr_phase{}", i + 1)] = Phases[i].LearningRate;
    }
    hp["max_content_len"] = MaxContentLen;
    hp["max_seq_len"] = MaxSeqLen;
    hp["min_less_portion"] = MinLessPortion;
    hp["seed"] = Seed;
    hp["optimizer"] = optimizers::to_string(Optimizer);
    hp["weight_decay"] = WeightDecay;
    hp["max_grad_norm"] = MaxGradNorm;
    hp["adamw_beta1"] = AdamBeta1;
    hp["adamw_beta2"] = AdamBeta2;
    hp["adamw_epsilon"] = AdamEpsilon;
    hp["model_dtype"] = dtype_to_config_str(ModelDType);
    return hp;
}
