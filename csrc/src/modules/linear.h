// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_MODULES_LINEAR_H
#define LOGSENTINEL_SRC_MODULES_LINEAR_H

#include <optional>
#include <random>
#include <string>
#include <vector>

#include "modules/parameter.h"
#include "utilities/tensor.h"

class TensorAllocator;

namespace modules {

/**
 * @brief Linear projection module: y = x @ W^T + b
 *
 * Weight layout:
 * - weight: (out_features, in_features) - transposed for NT matmul
 * - bias: (out_features,) optional
 *
 * The input of the last forward call is cached for the backward pass. Weight gradients are
 * accumulated only while the parameters are trainable.
 */
class LinearModule : public ITensorContainer {
public:
    /**
     * @brief Configuration for linear projection
     */
    struct Config {
        int in_features;            ///< Input dimension
        int out_features;           ///< Output dimension
        bool has_bias = true;       ///< Whether to add bias after matmul
    };

    LinearModule(Config config, const std::string& name, TensorAllocator& allocator);

    //! PyTorch default init: U(-1/sqrt(in), 1/sqrt(in)) for weight and bias.
    void init_uniform(std::mt19937_64& rng);

    /**
     * @brief Forward pass over `rows` input rows.
     *
     * @param input (rows, in_features)
     * @param output (rows, out_features)
     */
    void forward(const float* input, float* output, int rows);

    /**
     * @brief Backward pass: compute gradients w.r.t. input and weights
     *
     * Computes:
     * - d_input = d_output @ W (skipped if `dinput` is null)
     * - d_weight += d_output^T @ input
     * - d_bias += sum(d_output, dim=0) if has_bias
     */
    void backward(const float* dout, float* dinput, int rows);

    void register_parameters(ParameterGroupRegistry& registry, const std::string& group);
    void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) override;

    // Accessors
    [[nodiscard]] const Config& config() const { return mConfig; }
    [[nodiscard]] int in_features() const { return mConfig.in_features; }
    [[nodiscard]] int out_features() const { return mConfig.out_features; }
    [[nodiscard]] Parameter& weight() { return mWeight; }
    [[nodiscard]] Parameter* bias() { return mBias ? &*mBias : nullptr; }
    [[nodiscard]] bool trainable() const { return mWeight.Trainable; }

private:
    Config mConfig;
    Parameter mWeight;
    std::optional<Parameter> mBias;

    std::vector<float> mInputCache;
    int mCachedRows = 0;
};

} // namespace modules

#endif //LOGSENTINEL_SRC_MODULES_LINEAR_H
