// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/parameter.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

namespace modules {

void ParameterGroupRegistry::add(const std::string& group, Parameter* param) {
    if (!param) {
        throw std::logic_error(fmt::format("null parameter registered in group `{}`", group));
    }
    declare(group);
    for (const auto& [name, params] : mGroups) {
        if (std::find(params.begin(), params.end(), param) != params.end()) {
            throw std::logic_error(fmt::format("parameter `{}` is already registered in group `{}`", param->Name, name));
        }
    }
    mGroups[group].push_back(param);
}

void ParameterGroupRegistry::declare(const std::string& group) {
    if (mGroups.try_emplace(group).second) {
        mOrder.push_back(group);
    }
}

bool ParameterGroupRegistry::has_group(const std::string& group) const {
    return mGroups.contains(group);
}

const std::vector<Parameter*>& ParameterGroupRegistry::group(const std::string& group) const {
    auto found = mGroups.find(group);
    if (found == mGroups.end()) {
        throw std::invalid_argument(fmt::format("unknown parameter group `{}`", group));
    }
    return found->second;
}

std::vector<Parameter*> ParameterGroupRegistry::all() const {
    std::vector<Parameter*> result;
    for (const auto& name : mOrder) {
        const auto& params = mGroups.at(name);
        result.insert(result.end(), params.begin(), params.end());
    }
    return result;
}

std::vector<Parameter*> ParameterGroupRegistry::trainable() const {
    std::vector<Parameter*> result;
    for (Parameter* p : all()) {
        if (p->Trainable) result.push_back(p);
    }
    return result;
}

std::size_t ParameterGroupRegistry::num_trainable_elements() const {
    std::size_t total = 0;
    for (Parameter* p : trainable()) total += p->nelem();
    return total;
}

void ParameterGroupRegistry::freeze_all() {
    for (auto& [name, params] : mGroups) {
        for (Parameter* p : params) p->Trainable = false;
    }
}

void ParameterGroupRegistry::zero_grad() {
    for (auto& [name, params] : mGroups) {
        for (Parameter* p : params) p->zero_grad();
    }
}

} // namespace modules
