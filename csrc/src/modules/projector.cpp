// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/projector.h"

#include "kernels/kernels.h"

namespace modules {

ProjectorModule::ProjectorModule(int in_features, int out_features, TensorAllocator& allocator) :
    mUp({.in_features = in_features, .out_features = out_features, .has_bias = true}, "projector.0", allocator),
    mDown({.in_features = out_features, .out_features = out_features, .has_bias = true}, "projector.2", allocator) {
}

void ProjectorModule::init_uniform(std::mt19937_64& rng) {
    mUp.init_uniform(rng);
    mDown.init_uniform(rng);
}

void ProjectorModule::forward(const float* input, float* output, int rows) {
    const long hidden = static_cast<long>(rows) * mUp.out_features();
    mPreActivation.resize(hidden);
    mActivation.resize(hidden);
    mUp.forward(input, mPreActivation.data(), rows);
    gelu_forward(mActivation.data(), mPreActivation.data(), hidden);
    mDown.forward(mActivation.data(), output, rows);
}

void ProjectorModule::backward(const float* dout, int rows) {
    std::vector<float> d_act(static_cast<std::size_t>(rows) * mUp.out_features());
    mDown.backward(dout, d_act.data(), rows);
    gelu_backward(d_act.data(), mPreActivation.data(), d_act.data(), static_cast<long>(d_act.size()));
    mUp.backward(d_act.data(), nullptr, rows);
}

void ProjectorModule::register_parameters(ParameterGroupRegistry& registry, const std::string& group) {
    mUp.register_parameters(registry, group);
    mDown.register_parameters(registry, group);
}

void ProjectorModule::iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) {
    mUp.iterate_tensors([&](std::string name, const Tensor& t) { callback("0." + name, t); });
    mDown.iterate_tensors([&](std::string name, const Tensor& t) { callback("2." + name, t); });
}

} // namespace modules
