// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/linear.h"

#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include "kernels/kernels.h"
#include "utilities/allocator.h"

namespace modules {

LinearModule::LinearModule(Config config, const std::string& name, TensorAllocator& allocator) : mConfig(config) {
    if (config.in_features <= 0 || config.out_features <= 0) {
        throw std::invalid_argument(fmt::format("LinearModule {}: invalid shape {}x{}", name, config.out_features, config.in_features));
    }
    auto ctx = allocator.with_context(name);
    mWeight.Name = name + ".weight";
    mWeight.Value = allocator.allocate(ETensorDType::FP32, "weight", {config.out_features, config.in_features});
    mWeight.Grad = allocator.allocate(ETensorDType::FP32, "weight_grad", {config.out_features, config.in_features});
    if (config.has_bias) {
        mBias.emplace();
        mBias->Name = name + ".bias";
        mBias->Value = allocator.allocate(ETensorDType::FP32, "bias", {config.out_features});
        mBias->Grad = allocator.allocate(ETensorDType::FP32, "bias_grad", {config.out_features});
    }
}

void LinearModule::init_uniform(std::mt19937_64& rng) {
    const float bound = 1.f / std::sqrt(static_cast<float>(mConfig.in_features));
    fill_uniform(mWeight.Value, -bound, bound, rng);
    if (mBias) {
        fill_uniform(mBias->Value, -bound, bound, rng);
    }
}

void LinearModule::forward(const float* input, float* output, int rows) {
    const long in_elems = static_cast<long>(rows) * mConfig.in_features;
    mInputCache.assign(input, input + in_elems);
    mCachedRows = rows;
    matmul(output, input, mWeight.data(), mBias ? mBias->data() : nullptr,
           rows, mConfig.out_features, mConfig.in_features, EMMTranspose::NT, false);
}

void LinearModule::backward(const float* dout, float* dinput, int rows) {
    if (rows != mCachedRows) {
        throw std::logic_error(fmt::format("LinearModule {}: backward over {} rows, forward cached {}",
                                           mWeight.Name, rows, mCachedRows));
    }
    const int in = mConfig.in_features;
    const int out = mConfig.out_features;

    if (dinput) {
        matmul(dinput, dout, mWeight.data(), nullptr, rows, in, out, EMMTranspose::NN, false);
    }
    if (mWeight.Trainable) {
        matmul(mWeight.grad(), dout, mInputCache.data(), nullptr, out, in, rows, EMMTranspose::TN, true);
    }
    if (mBias && mBias->Trainable) {
        bias_backward(mBias->grad(), dout, rows, out);
    }
}

void LinearModule::register_parameters(ParameterGroupRegistry& registry, const std::string& group) {
    registry.add(group, &mWeight);
    if (mBias) {
        registry.add(group, &*mBias);
    }
}

void LinearModule::iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) {
    callback("weight", mWeight.Value);
    if (mBias) {
        callback("bias", mBias->Value);
    }
}

} // namespace modules
