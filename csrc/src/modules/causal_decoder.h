// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_MODULES_CAUSAL_DECODER_H
#define LOGSENTINEL_SRC_MODULES_CAUSAL_DECODER_H

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "config/lora_adapter_config.h"
#include "modules/parameter.h"
#include "training/precision_policy.h"
#include "utilities/tensor.h"

class TensorAllocator;

namespace modules {

/**
 * @brief Causal sequence model seen from the outside: embeddings in, hidden states out.
 *
 * Inputs are left- or right-padded batches of embeddings together with a (B, T) attention mask.
 * Gradients w.r.t. the input embeddings are available after a training-mode forward.
 */
class ICausalDecoder {
public:
    virtual ~ICausalDecoder() = default;

    [[nodiscard]] virtual int hidden_size() const = 0;
    [[nodiscard]] virtual int vocab_size() const = 0;

    //! Rows of the frozen input embedding table, (ids.size(), hidden_size).
    [[nodiscard]] virtual std::vector<float> embed_tokens(const std::vector<std::int32_t>& ids) const = 0;

    //! embeds (B, T, H), mask (B, T) -> hidden (B, T, H)
    virtual void forward(const float* embeds, const std::uint8_t* mask, int B, int T, float* hidden, bool training) = 0;
    //! d_hidden (B, T, H) -> d_embeds (B, T, H). Accumulates gradients of trainable adapters.
    virtual void backward(const float* d_hidden, float* d_embeds, int B, int T) = 0;

    [[nodiscard]] virtual bool has_adapters() const = 0;
    [[nodiscard]] virtual const LoRAAdapterConfig& adapter_config() const = 0;
    //! Attach fresh low-rank adapters. Must be called before `register_parameters`.
    virtual void enable_adapters(const LoRAAdapterConfig& config, std::uint64_t seed) = 0;
    //! Adds adapter parameters to `DECODER_LORA_GROUP`. Base weights are frozen and not registered.
    virtual void register_parameters(ParameterGroupRegistry& registry) = 0;

    virtual ITensorContainer& base_weights() = 0;
    virtual ITensorContainer& adapter_weights() = 0;
};

/**
 * @brief Stack of single-head causal self-attention blocks with LoRA adapters on q and v.
 *
 * Each block computes `y = x + Attn(x) Wo^T`. With adapters, the q and v projections become
 * `x W^T + scaling * dropout(x) A^T B^T`, with A Kaiming-uniform and B zero at creation. Keys at
 * padded positions and at future positions are hidden from every query; a query without any
 * visible key produces a zero attention output.
 */
class LoRACausalDecoder final : public ICausalDecoder {
public:
    LoRACausalDecoder(int vocab_size, int hidden_size, int num_layers, const PrecisionPolicy& policy,
                      TensorAllocator& allocator);
    ~LoRACausalDecoder() override;

    [[nodiscard]] int hidden_size() const override { return mHiddenSize; }
    [[nodiscard]] int vocab_size() const override { return mVocabSize; }
    [[nodiscard]] int num_layers() const { return static_cast<int>(mLayers.size()); }

    [[nodiscard]] std::vector<float> embed_tokens(const std::vector<std::int32_t>& ids) const override;

    void forward(const float* embeds, const std::uint8_t* mask, int B, int T, float* hidden, bool training) override;
    void backward(const float* d_hidden, float* d_embeds, int B, int T) override;

    [[nodiscard]] bool has_adapters() const override { return mAdapterConfig.has_value(); }
    [[nodiscard]] const LoRAAdapterConfig& adapter_config() const override;
    void enable_adapters(const LoRAAdapterConfig& config, std::uint64_t seed) override;
    void register_parameters(ParameterGroupRegistry& registry) override;

    void init_weights(std::uint64_t seed);

    ITensorContainer& base_weights() override { return mBaseWeights; }
    ITensorContainer& adapter_weights() override { return mAdapterWeights; }

private:
    struct LoRAProjection;
    struct AttentionLayer;

    class BaseWeights : public ITensorContainer {
    public:
        explicit BaseWeights(LoRACausalDecoder* parent) : mParent(parent) {}
        void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) override;
    private:
        LoRACausalDecoder* mParent;
    };

    class AdapterWeights : public ITensorContainer {
    public:
        explicit AdapterWeights(LoRACausalDecoder* parent) : mParent(parent) {}
        void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) override;
    private:
        LoRACausalDecoder* mParent;
    };

    void layer_forward(AttentionLayer& layer, const float* x, float* y, const std::uint8_t* mask, int B, int T, bool training);
    void layer_backward(AttentionLayer& layer, const float* dy, float* dx, int B, int T);

    int mVocabSize;
    int mHiddenSize;
    PrecisionPolicy mPolicy;
    TensorAllocator& mAllocator;

    Tensor mTokenEmbeddings;    ///< (vocab_size, hidden_size), frozen
    std::vector<std::unique_ptr<AttentionLayer>> mLayers;

    std::optional<LoRAAdapterConfig> mAdapterConfig;
    std::mt19937_64 mDropoutRng;

    // shapes of the last forward call
    int mLastB = 0;
    int mLastT = 0;
    bool mLastTraining = false;

    BaseWeights mBaseWeights{this};
    AdapterWeights mAdapterWeights{this};
};

} // namespace modules

#endif //LOGSENTINEL_SRC_MODULES_CAUSAL_DECODER_H
