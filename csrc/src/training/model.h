// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_MODEL_H
#define LOGSENTINEL_SRC_TRAINING_MODEL_H

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "training/dataset.h"

class TensorAllocator;
struct PrecisionPolicy;

namespace modules { class ParameterGroupRegistry; }

//! Logits for {normal, anomalous}.
using ClassLogits = std::array<float, 2>;

//! Rows that survived batch assembly in a training-mode pass.
struct TrainBatch {
    std::vector<float> Logits;          ///< (rows, 2)
    std::vector<int> Labels;            ///< class id per row
    std::vector<int> SourceIndices;     ///< position of each row in the input batch

    [[nodiscard]] int rows() const { return static_cast<int>(Labels.size()); }
    [[nodiscard]] bool empty() const { return Labels.empty(); }
};

//! \brief Abstract sequence classifier driven by the training controller.
class IModel {
public:
    virtual ~IModel() = default;

    //! \brief Inference over a batch of log sequences.
    //! \details Returns one entry per input sample; samples that produced no usable embedding
    //! map to `std::nullopt`. No state needed for backward is kept.
    virtual std::vector<std::optional<ClassLogits>> forward(const std::vector<LogSequence>& sequences) = 0;

    //! \brief Training-mode pass returning only the surviving rows and their class ids.
    virtual TrainBatch train_helper(const std::vector<LogSequence>& sequences, const std::vector<std::string>& labels) = 0;

    //! \brief Backward from the logits of the preceding train_helper call.
    //! \details Gradients accumulate into the trainable parameters until zeroed.
    virtual void backward(const float* dlogits, int rows) = 0;

    virtual modules::ParameterGroupRegistry& parameter_groups() = 0;
    [[nodiscard]] virtual const PrecisionPolicy& precision_policy() const = 0;
    [[nodiscard]] virtual const TensorAllocator& allocator() const = 0;

    //! \brief Writes adapter, projector and classifier weights below `directory`.
    virtual void save_finetuned(const std::string& directory) = 0;
};

#endif //LOGSENTINEL_SRC_TRAINING_MODEL_H
