// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_CONFIG_MODEL_CONFIG_H
#define LOGSENTINEL_SRC_CONFIG_MODEL_CONFIG_H

#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "config/lora_adapter_config.h"

/**
 * @brief Architecture description of the hybrid log classifier.
 *
 * The encoder side is a frozen pooled token encoder, the decoder side is a small causal
 * attention stack. Both are described here so that a model directory can be loaded from
 * `config.json`, optionally together with `encoder.safetensors` and `decoder.safetensors`.
 */
struct HybridModelConfig {
    std::string ModelName = "logsentinel-tiny";

    // Sequence encoder
    int EncoderVocabSize = 8192;
    int EncoderHiddenSize = 64;
    int EncoderMaxPositions = 512;
    bool EncoderLowercase = true;

    // Causal decoder
    int DecoderVocabSize = 8192;
    int DecoderHiddenSize = 128;
    int DecoderNumLayers = 2;
    int DecoderBosTokenId = 2;

    //! Lines encoded per encoder call.
    int EncoderSubBatchSize = 64;
    int NumClasses = 2;

    std::string InstructionPrefix = "Below is a sequence of system log messages:";

    //! Seed used for base weights when no pretrained weights are found.
    std::uint64_t InitSeed = 42;

    LoRAAdapterConfig LoRA;

    //! Directory this config was loaded from; empty for in-memory configs.
    std::string SourceDirectory;

    void validate() const;
};

HybridModelConfig model_config_from_json(const nlohmann::json& config_json);
nlohmann::json model_config_to_json(const HybridModelConfig& config);

//! Loads `config.json` from a model directory, or a config file given directly.
HybridModelConfig load_model_config(const std::string& path);
void save_model_config(const HybridModelConfig& config, const std::string& file_name);

#endif //LOGSENTINEL_SRC_CONFIG_MODEL_CONFIG_H
