// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_MODULES_PARAMETER_H
#define LOGSENTINEL_SRC_MODULES_PARAMETER_H

#include <map>
#include <string>
#include <vector>

#include "utilities/tensor.h"

namespace modules {

//! Names of the parameter groups the training curriculum toggles.
inline constexpr const char* PROJECTOR_GROUP = "projector";
inline constexpr const char* CLASSIFIER_GROUP = "classifier";
inline constexpr const char* DECODER_LORA_GROUP = "decoder.lora";

/**
 * @brief A trainable FP32 tensor together with its gradient buffer.
 *
 * Gradients accumulate across backward calls until explicitly zeroed. Backward passes only
 * write into `Grad` while `Trainable` is set.
 */
struct Parameter {
    std::string Name;
    Tensor Value;
    Tensor Grad;
    bool Trainable = false;

    [[nodiscard]] std::size_t nelem() const { return Value.nelem(); }
    [[nodiscard]] float* data() { return Value.get<float>(); }
    [[nodiscard]] float* grad() { return Grad.get<float>(); }
    void zero_grad() { fill_zero(Grad); }
};

/**
 * @brief Maps a group name to the parameters it owns.
 *
 * Built once when the model is assembled. Groups are looked up by exact name only.
 */
class ParameterGroupRegistry {
public:
    //! Adds `param` to `group`, creating the group if necessary.
    void add(const std::string& group, Parameter* param);
    //! Declares a group that may stay empty, e.g. adapters that are not enabled.
    void declare(const std::string& group);

    [[nodiscard]] bool has_group(const std::string& group) const;
    //! @throws std::invalid_argument for unknown groups.
    [[nodiscard]] const std::vector<Parameter*>& group(const std::string& group) const;
    [[nodiscard]] const std::vector<std::string>& group_names() const { return mOrder; }

    [[nodiscard]] std::vector<Parameter*> all() const;
    [[nodiscard]] std::vector<Parameter*> trainable() const;
    [[nodiscard]] std::size_t num_trainable_elements() const;

    void freeze_all();
    void zero_grad();

private:
    std::map<std::string, std::vector<Parameter*>> mGroups;
    std::vector<std::string> mOrder;
};

} // namespace modules

#endif //LOGSENTINEL_SRC_MODULES_PARAMETER_H
