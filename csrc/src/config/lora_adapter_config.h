// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_CONFIG_LORA_ADAPTER_CONFIG_H
#define LOGSENTINEL_SRC_CONFIG_LORA_ADAPTER_CONFIG_H

#include <cmath>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

//! LoRA (Low-Rank Adaptation) adapter hyperparameters for the decoder's attention projections.
struct LoRAAdapterConfig {
    int Rank = 8;
    float Alpha = 16.0f;
    float Dropout = 0.1f;
    std::set<std::string> TargetModules = {"q_proj", "v_proj"};
    bool InitAKaimingUniform = true;
    bool UseRSLoRA = false;

    [[nodiscard]] float scaling() const {
        if (UseRSLoRA) {
            return Alpha / std::sqrt(static_cast<float>(Rank));
        }
        return Alpha / static_cast<float>(Rank);
    }

    [[nodiscard]] bool applies_to(const std::string& module_name) const {
        if (TargetModules.count("all") > 0) {
            return true;
        }
        return TargetModules.count(module_name) > 0;
    }

    [[nodiscard]] bool applies_to_q() const { return applies_to("q_proj"); }
    [[nodiscard]] bool applies_to_v() const { return applies_to("v_proj"); }

    //! PEFT-compatible `adapter_config.json` content.
    [[nodiscard]] nlohmann::json to_peft_json(const std::string& base_model_path) const {
        nlohmann::json adapter_config;
        adapter_config["base_model_name_or_path"] = base_model_path;
        adapter_config["peft_type"] = "LORA";
        adapter_config["task_type"] = "CAUSAL_LM";
        adapter_config["r"] = Rank;
        adapter_config["lora_alpha"] = Alpha;
        adapter_config["lora_dropout"] = Dropout;
        adapter_config["fan_in_fan_out"] = false;
        adapter_config["bias"] = "none";
        adapter_config["use_rslora"] = UseRSLoRA;
        adapter_config["target_modules"] = TargetModules;
        return adapter_config;
    }

    [[nodiscard]] static LoRAAdapterConfig from_peft_json(const nlohmann::json& cfg) {
        LoRAAdapterConfig result;
        result.Rank = cfg.at("r").get<int>();
        result.Alpha = cfg.at("lora_alpha").get<float>();
        result.Dropout = cfg.value("lora_dropout", result.Dropout);
        result.UseRSLoRA = cfg.value("use_rslora", false);
        if (cfg.contains("target_modules")) {
            result.TargetModules = cfg["target_modules"].get<std::set<std::string>>();
        }
        return result;
    }
};

#endif // LOGSENTINEL_SRC_CONFIG_LORA_ADAPTER_CONFIG_H
