// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "training/parameter_stager.h"

#include <stdexcept>

#include <fmt/core.h>

const char* stage_name(ETrainingStage stage) {
    switch (stage) {
        case ETrainingStage::PROJECTOR_ONLY: return "Projector";
        case ETrainingStage::CLASSIFIER_ONLY: return "Classifier";
        case ETrainingStage::PROJECTOR_AND_CLASSIFIER: return "Projector+Classifier";
        case ETrainingStage::FULL_WITH_ADAPTERS: return "Fine-tuning All";
    }
    throw std::logic_error(fmt::format("unknown training stage {}", static_cast<int>(stage)));
}

ParameterStager::ParameterStager(modules::ParameterGroupRegistry& registry) : mRegistry(registry) {
}

std::vector<std::string> ParameterStager::groups_for(ETrainingStage stage) {
    switch (stage) {
        case ETrainingStage::PROJECTOR_ONLY:
            return {modules::PROJECTOR_GROUP};
        case ETrainingStage::CLASSIFIER_ONLY:
            return {modules::CLASSIFIER_GROUP};
        case ETrainingStage::PROJECTOR_AND_CLASSIFIER:
            return {modules::PROJECTOR_GROUP, modules::CLASSIFIER_GROUP};
        case ETrainingStage::FULL_WITH_ADAPTERS:
            return {modules::PROJECTOR_GROUP, modules::CLASSIFIER_GROUP, modules::DECODER_LORA_GROUP};
    }
    throw std::logic_error(fmt::format("unknown training stage {}", static_cast<int>(stage)));
}

void ParameterStager::activate(const std::vector<std::string>& groups) {
    for (const auto& name : groups) {
        if (!mRegistry.has_group(name)) {
            throw std::invalid_argument(fmt::format("cannot activate unknown parameter group `{}`", name));
        }
    }

    mRegistry.freeze_all();
    for (const auto& name : groups) {
        for (modules::Parameter* param : mRegistry.group(name)) {
            param->Trainable = true;
        }
    }
    mActive = groups;
}

void ParameterStager::activate(ETrainingStage stage) {
    activate(groups_for(stage));
}
