// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_H
#define LOGSENTINEL_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_H

#include <cstddef>
#include <memory>
#include <vector>

#include "optimizer_config.h"

namespace optimizers {

//! A parameter buffer together with its gradient.
struct ParameterSlot {
    float* Param;
    const float* Grad;
    std::size_t Size;
};

//! Optimizer over a fixed set of parameter buffers.
class IOptimizer {
public:
    virtual ~IOptimizer() = default;

    //! Applies one update. `grad_scale` multiplies every gradient (unscale and clip factor).
    virtual void step(float grad_scale) = 0;

    [[nodiscard]] virtual int step_count() const = 0;
    [[nodiscard]] virtual float learning_rate() const = 0;
    [[nodiscard]] virtual std::size_t num_parameters() const = 0;
};

//! Creates the optimizer selected by `config.type`, with zeroed state.
std::unique_ptr<IOptimizer> make_optimizer(std::vector<ParameterSlot> slots, const OptimizerConfig& config);

}  // namespace optimizers

#endif  // LOGSENTINEL_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_H
