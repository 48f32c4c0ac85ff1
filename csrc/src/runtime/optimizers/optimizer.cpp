// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizer.h"

#include <stdexcept>

#include <fmt/core.h>

#include "adamw.h"
#include "adamw_8bit.h"

namespace optimizers {

std::unique_ptr<IOptimizer> make_optimizer(std::vector<ParameterSlot> slots, const OptimizerConfig& config) {
    switch (config.type) {
        case OptimizerType::ADAMW:
            return std::make_unique<AdamW>(std::move(slots), config);
        case OptimizerType::ADAMW_8BIT:
            return std::make_unique<AdamW8Bit>(std::move(slots), config);
    }
    throw std::logic_error(fmt::format("make_optimizer: unsupported optimizer type {}", static_cast<int>(config.type)));
}

}  // namespace optimizers
