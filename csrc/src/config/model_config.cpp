// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "config/model_config.h"

#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace {

template<typename T>
std::optional<T> get_opt(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(fmt::format("model config: invalid value for `{}`: {}", key, e.what()));
    }
}

}  // namespace

void HybridModelConfig::validate() const {
    auto require_positive = [](const char* name, long value) {
        if (value <= 0) {
            throw std::invalid_argument(fmt::format("model config: `{}` must be positive, got {}", name, value));
        }
    };
    require_positive("encoder_vocab_size", EncoderVocabSize);
    require_positive("encoder_hidden_size", EncoderHiddenSize);
    require_positive("encoder_max_positions", EncoderMaxPositions);
    require_positive("decoder_vocab_size", DecoderVocabSize);
    require_positive("decoder_hidden_size", DecoderHiddenSize);
    require_positive("encoder_sub_batch_size", EncoderSubBatchSize);
    require_positive("lora.r", LoRA.Rank);
    if (DecoderNumLayers < 0) {
        throw std::invalid_argument(fmt::format("model config: `decoder_num_layers` must not be negative, got {}", DecoderNumLayers));
    }
    if (EncoderVocabSize <= 4 || DecoderVocabSize <= 4) {
        throw std::invalid_argument("model config: vocabularies must hold more than the special tokens");
    }
    if (DecoderBosTokenId < 0 || DecoderBosTokenId >= DecoderVocabSize) {
        throw std::invalid_argument(fmt::format("model config: `decoder_bos_token_id` {} out of range", DecoderBosTokenId));
    }
    if (NumClasses != 2) {
        throw std::invalid_argument(fmt::format("model config: only binary classification is supported, got {} classes", NumClasses));
    }
    if (LoRA.Dropout < 0.f || LoRA.Dropout >= 1.f) {
        throw std::invalid_argument(fmt::format("model config: `lora.dropout` must be in [0, 1), got {}", LoRA.Dropout));
    }
}

HybridModelConfig model_config_from_json(const nlohmann::json& config_json) {
    HybridModelConfig cfg;

    if (auto v = get_opt<std::string>(config_json, "model_name")) cfg.ModelName = *v;

    if (auto v = get_opt<int>(config_json, "encoder_vocab_size")) cfg.EncoderVocabSize = *v;
    if (auto v = get_opt<int>(config_json, "encoder_hidden_size")) cfg.EncoderHiddenSize = *v;
    if (auto v = get_opt<int>(config_json, "encoder_max_positions")) cfg.EncoderMaxPositions = *v;
    if (auto v = get_opt<bool>(config_json, "encoder_lowercase")) cfg.EncoderLowercase = *v;

    if (auto v = get_opt<int>(config_json, "decoder_vocab_size")) cfg.DecoderVocabSize = *v;
    if (auto v = get_opt<int>(config_json, "decoder_hidden_size")) cfg.DecoderHiddenSize = *v;
    if (auto v = get_opt<int>(config_json, "decoder_num_layers")) cfg.DecoderNumLayers = *v;
    if (auto v = get_opt<int>(config_json, "decoder_bos_token_id")) cfg.DecoderBosTokenId = *v;

    if (auto v = get_opt<int>(config_json, "encoder_sub_batch_size")) cfg.EncoderSubBatchSize = *v;
    if (auto v = get_opt<int>(config_json, "num_classes")) cfg.NumClasses = *v;
    if (auto v = get_opt<std::string>(config_json, "instruction_prefix")) cfg.InstructionPrefix = *v;
    if (auto v = get_opt<std::uint64_t>(config_json, "init_seed")) cfg.InitSeed = *v;

    if (auto it = config_json.find("lora"); it != config_json.end() && it->is_object()) {
        const auto& lora = *it;
        if (auto v = get_opt<int>(lora, "r")) cfg.LoRA.Rank = *v;
        if (auto v = get_opt<float>(lora, "lora_alpha")) cfg.LoRA.Alpha = *v;
        if (auto v = get_opt<float>(lora, "lora_dropout")) cfg.LoRA.Dropout = *v;
        if (auto v = get_opt<bool>(lora, "use_rslora")) cfg.LoRA.UseRSLoRA = *v;
        if (auto v = get_opt<std::set<std::string>>(lora, "target_modules")) cfg.LoRA.TargetModules = *v;
    }

    cfg.validate();
    return cfg;
}

nlohmann::json model_config_to_json(const HybridModelConfig& config) {
    nlohmann::json config_json;
    config_json["model_name"] = config.ModelName;
    config_json["encoder_vocab_size"] = config.EncoderVocabSize;
    config_json["encoder_hidden_size"] = config.EncoderHiddenSize;
    config_json["encoder_max_positions"] = config.EncoderMaxPositions;
    config_json["encoder_lowercase"] = config.EncoderLowercase;
    config_json["decoder_vocab_size"] = config.DecoderVocabSize;
    config_json["decoder_hidden_size"] = config.DecoderHiddenSize;
    config_json["decoder_num_layers"] = config.DecoderNumLayers;
    config_json["decoder_bos_token_id"] = config.DecoderBosTokenId;
    config_json["encoder_sub_batch_size"] = config.EncoderSubBatchSize;
    config_json["num_classes"] = config.NumClasses;
    config_json["instruction_prefix"] = config.InstructionPrefix;
    config_json["init_seed"] = config.InitSeed;
    config_json["lora"] = {
        {"r", config.LoRA.Rank},
        {"lora_alpha", config.LoRA.Alpha},
        {"lora_dropout", config.LoRA.Dropout},
        {"use_rslora", config.LoRA.UseRSLoRA},
        {"target_modules", config.LoRA.TargetModules},
    };
    return config_json;
}

HybridModelConfig load_model_config(const std::string& path) {
    std::filesystem::path file_path{path};
    if (std::filesystem::is_directory(file_path)) {
        file_path /= "config.json";
    }
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open config file {}", file_path.string()));
    }

    auto cfg = model_config_from_json(nlohmann::json::parse(file));
    cfg.SourceDirectory = file_path.parent_path().string();
    return cfg;
}

void save_model_config(const HybridModelConfig& config, const std::string& file_name) {
    std::ofstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open file for writing {}", file_name));
    }
    file << model_config_to_json(config).dump(4);
}
