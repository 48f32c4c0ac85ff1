// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_MODULES_PROJECTOR_H
#define LOGSENTINEL_SRC_MODULES_PROJECTOR_H

#include <random>
#include <vector>

#include "modules/linear.h"

namespace modules {

/**
 * @brief Maps pooled encoder embeddings into the decoder's embedding space.
 *
 * Two-layer MLP: Linear(encoder_hidden, decoder_hidden) -> GELU -> Linear(decoder_hidden, decoder_hidden).
 * Tensors are exported as `0.weight`, `0.bias`, `2.weight`, `2.bias`, matching a sequential layout
 * in which the activation occupies index 1.
 */
class ProjectorModule : public ITensorContainer {
public:
    ProjectorModule(int in_features, int out_features, TensorAllocator& allocator);

    void init_uniform(std::mt19937_64& rng);

    //! input (rows, in_features) -> output (rows, out_features)
    void forward(const float* input, float* output, int rows);
    //! Accumulates parameter gradients. The encoder is frozen, so there is no input gradient.
    void backward(const float* dout, int rows);

    void register_parameters(ParameterGroupRegistry& registry, const std::string& group);
    void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) override;

    [[nodiscard]] int in_features() const { return mUp.in_features(); }
    [[nodiscard]] int out_features() const { return mDown.out_features(); }

private:
    LinearModule mUp;
    LinearModule mDown;

    std::vector<float> mPreActivation;
    std::vector<float> mActivation;
};

} // namespace modules

#endif //LOGSENTINEL_SRC_MODULES_PROJECTOR_H
