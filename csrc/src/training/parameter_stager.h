// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_PARAMETER_STAGER_H
#define LOGSENTINEL_SRC_TRAINING_PARAMETER_STAGER_H

#include <string>
#include <vector>

#include "modules/parameter.h"

//! Training curriculum stages, in the order they are run.
enum class ETrainingStage {
    PROJECTOR_ONLY,
    CLASSIFIER_ONLY,
    PROJECTOR_AND_CLASSIFIER,
    FULL_WITH_ADAPTERS
};

const char* stage_name(ETrainingStage stage);

/**
 * @brief Switches the trainable parameter set between curriculum stages.
 *
 * Activation freezes every registered parameter and then unfreezes exactly the named
 * groups, so only one stage's set is ever trainable.
 */
class ParameterStager {
public:
    explicit ParameterStager(modules::ParameterGroupRegistry& registry);

    static std::vector<std::string> groups_for(ETrainingStage stage);

    //! @throws std::invalid_argument if a group is not registered; nothing is changed in that case.
    void activate(const std::vector<std::string>& groups);
    void activate(ETrainingStage stage);

    [[nodiscard]] const std::vector<std::string>& active_groups() const { return mActive; }
    [[nodiscard]] std::size_t num_trainable_elements() const { return mRegistry.num_trainable_elements(); }

private:
    modules::ParameterGroupRegistry& mRegistry;
    std::vector<std::string> mActive;
};

#endif //LOGSENTINEL_SRC_TRAINING_PARAMETER_STAGER_H
