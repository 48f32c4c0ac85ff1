// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/causal_decoder.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include "kernels/kernels.h"
#include "utilities/allocator.h"

namespace modules {

struct LoRACausalDecoder::LoRAProjection {
    Parameter A;    ///< (rank, hidden)
    Parameter B;    ///< (hidden, rank)

    // forward state
    std::vector<float> DropMask;    ///< empty if no dropout was applied
    std::vector<float> Xd;          ///< dropout(x)
    std::vector<float> SU;          ///< scaling * dropout(x) A^T
};

struct LoRACausalDecoder::AttentionLayer {
    Tensor Wq, Wk, Wv, Wo;  ///< (hidden, hidden), frozen
    std::optional<LoRAProjection> LoraQ;
    std::optional<LoRAProjection> LoraV;

    // forward state
    std::vector<float> X;
    std::vector<float> Q, K, V;
    std::vector<float> P;           ///< (B, T, T) attention probabilities
    std::vector<float> Att;         ///< (B, T, H) attention output before Wo
};

namespace {

void lora_forward(float* out, const float* x, long rows, int H, int rank, float scaling,
                  float dropout, bool training, std::mt19937_64& rng, Parameter& A, Parameter& B,
                  std::vector<float>& drop_mask, std::vector<float>& xd, std::vector<float>& su) {
    const long elems = rows * H;
    xd.assign(x, x + elems);
    drop_mask.clear();
    if (training && dropout > 0.f) {
        std::bernoulli_distribution keep(1.0 - dropout);
        const float inv_keep = 1.f / (1.f - dropout);
        drop_mask.resize(elems);
        for (long i = 0; i < elems; ++i) {
            drop_mask[i] = keep(rng) ? inv_keep : 0.f;
            xd[i] *= drop_mask[i];
        }
    }

    su.resize(static_cast<std::size_t>(rows) * rank);
    matmul(su.data(), xd.data(), A.data(), nullptr, static_cast<int>(rows), rank, H, EMMTranspose::NT, false);
    scale_inplace(su.data(), scaling, static_cast<long>(su.size()));
    matmul(out, su.data(), B.data(), nullptr, static_cast<int>(rows), H, rank, EMMTranspose::NT, true);
}

/**
 * @brief Backward through `out += scaling * (dropout(x) A^T) B^T`.
 *
 * The input gradient is always accumulated into @p dx; adapter gradients only when trainable.
 */
void lora_backward(const float* dout, float* dx, long rows, int H, int rank, float scaling, Parameter& A, Parameter& B,
                   const std::vector<float>& drop_mask, const std::vector<float>& xd, const std::vector<float>& su) {
    const int R = static_cast<int>(rows);
    if (B.Trainable) {
        matmul(B.grad(), dout, su.data(), nullptr, H, rank, R, EMMTranspose::TN, true);
    }

    std::vector<float> du(static_cast<std::size_t>(rows) * rank);
    matmul(du.data(), dout, B.data(), nullptr, R, rank, H, EMMTranspose::NN, false);
    scale_inplace(du.data(), scaling, static_cast<long>(du.size()));

    if (A.Trainable) {
        matmul(A.grad(), du.data(), xd.data(), nullptr, rank, H, R, EMMTranspose::TN, true);
    }

    std::vector<float> dxd(static_cast<std::size_t>(rows) * H);
    matmul(dxd.data(), du.data(), A.data(), nullptr, R, H, rank, EMMTranspose::NN, false);
    if (!drop_mask.empty()) {
        ArrayMap(dxd.data(), static_cast<long>(dxd.size())) *= ConstArrayMap(drop_mask.data(), static_cast<long>(drop_mask.size()));
    }
    add_inplace(dx, dxd.data(), static_cast<long>(dxd.size()));
}

} // namespace

LoRACausalDecoder::LoRACausalDecoder(int vocab_size, int hidden_size, int num_layers, const PrecisionPolicy& policy,
                                     TensorAllocator& allocator) :
    mVocabSize(vocab_size), mHiddenSize(hidden_size), mPolicy(policy), mAllocator(allocator) {
    if (vocab_size <= 0 || hidden_size <= 0 || num_layers < 0) {
        throw std::invalid_argument(fmt::format("LoRACausalDecoder: invalid shape vocab={} hidden={} layers={}",
                                                vocab_size, hidden_size, num_layers));
    }

    auto ctx = allocator.with_context("decoder");
    mTokenEmbeddings = allocator.allocate(ETensorDType::FP32, "embed_tokens", {vocab_size, hidden_size});
    mLayers.reserve(num_layers);
    for (int l = 0; l < num_layers; ++l) {
        auto layer_ctx = allocator.with_context(fmt::format("layer{}", l));
        auto layer = std::make_unique<AttentionLayer>();
        layer->Wq = allocator.allocate(ETensorDType::FP32, "q_proj", {hidden_size, hidden_size});
        layer->Wk = allocator.allocate(ETensorDType::FP32, "k_proj", {hidden_size, hidden_size});
        layer->Wv = allocator.allocate(ETensorDType::FP32, "v_proj", {hidden_size, hidden_size});
        layer->Wo = allocator.allocate(ETensorDType::FP32, "o_proj", {hidden_size, hidden_size});
        mLayers.push_back(std::move(layer));
    }
}

LoRACausalDecoder::~LoRACausalDecoder() = default;

void LoRACausalDecoder::init_weights(std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    fill_normal(mTokenEmbeddings, 0.f, 0.02f, rng);
    for (auto& layer : mLayers) {
        fill_normal(layer->Wq, 0.f, 0.02f, rng);
        fill_normal(layer->Wk, 0.f, 0.02f, rng);
        fill_normal(layer->Wv, 0.f, 0.02f, rng);
        fill_normal(layer->Wo, 0.f, 0.02f, rng);
    }
}

std::vector<float> LoRACausalDecoder::embed_tokens(const std::vector<std::int32_t>& ids) const {
    const int H = mHiddenSize;
    std::vector<float> result(ids.size() * H);
    const float* table = mTokenEmbeddings.get<float>();
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (ids[i] < 0 || ids[i] >= mVocabSize) {
            throw std::out_of_range(fmt::format("LoRACausalDecoder: token id {} outside vocabulary of {}", ids[i], mVocabSize));
        }
        std::copy_n(table + static_cast<long>(ids[i]) * H, H, result.begin() + static_cast<long>(i) * H);
    }
    mPolicy.cast(result.data(), result.size());
    return result;
}

const LoRAAdapterConfig& LoRACausalDecoder::adapter_config() const {
    if (!mAdapterConfig) {
        throw std::logic_error("LoRACausalDecoder: no adapters enabled");
    }
    return *mAdapterConfig;
}

/**
 * @brief Attach fresh LoRA adapters to the targeted projections of every layer.
 *
 * A is initialized Kaiming-uniform with bound 1/sqrt(hidden), B with zeros, so the adapted
 * decoder computes exactly the base decoder until B receives updates.
 *
 * @param config Adapter rank, scaling, dropout and target modules.
 * @param seed Seed for A initialization and for adapter dropout.
 *
 * @throws std::logic_error if adapters are already enabled.
 */
void LoRACausalDecoder::enable_adapters(const LoRAAdapterConfig& config, std::uint64_t seed) {
    if (mAdapterConfig) {
        throw std::logic_error("LoRACausalDecoder: adapters are already enabled");
    }
    if (config.Rank <= 0) {
        throw std::invalid_argument(fmt::format("LoRACausalDecoder: adapter rank must be positive, got {}", config.Rank));
    }

    std::mt19937_64 rng(seed);
    mDropoutRng.seed(seed + 1);
    const int H = mHiddenSize;
    const int r = config.Rank;
    const float bound = 1.f / std::sqrt(static_cast<float>(H));

    auto ctx = mAllocator.with_context("decoder.lora");
    auto make_projection = [&](int layer_idx, const char* proj) {
        LoRAProjection lora;
        lora.A.Name = fmt::format("decoder.layers.{}.{}.lora_A", layer_idx, proj);
        lora.A.Value = mAllocator.allocate(ETensorDType::FP32, "lora_A", {r, H});
        lora.A.Grad = mAllocator.allocate(ETensorDType::FP32, "lora_A_grad", {r, H});
        lora.B.Name = fmt::format("decoder.layers.{}.{}.lora_B", layer_idx, proj);
        lora.B.Value = mAllocator.allocate(ETensorDType::FP32, "lora_B", {H, r});
        lora.B.Grad = mAllocator.allocate(ETensorDType::FP32, "lora_B_grad", {H, r});
        if (config.InitAKaimingUniform) {
            fill_uniform(lora.A.Value, -bound, bound, rng);
        } else {
            fill_normal(lora.A.Value, 0.f, 1.f / static_cast<float>(r), rng);
        }
        return lora;
    };

    for (int l = 0; l < num_layers(); ++l) {
        auto& layer = *mLayers[l];
        if (config.applies_to_q()) layer.LoraQ = make_projection(l, "q_proj");
        if (config.applies_to_v()) layer.LoraV = make_projection(l, "v_proj");
    }
    mAdapterConfig = config;
}

void LoRACausalDecoder::register_parameters(ParameterGroupRegistry& registry) {
    registry.declare(DECODER_LORA_GROUP);
    for (auto& layer : mLayers) {
        for (auto* lora : {&layer->LoraQ, &layer->LoraV}) {
            if (lora->has_value()) {
                registry.add(DECODER_LORA_GROUP, &(*lora)->A);
                registry.add(DECODER_LORA_GROUP, &(*lora)->B);
            }
        }
    }
}

/**
 * @brief Run the attention stack over a padded batch of embeddings.
 *
 * @param embeds Input embeddings, (B, T, H).
 * @param mask Attention mask, (B, T); zero marks padding.
 * @param hidden Output hidden states of the last layer, (B, T, H).
 * @param training Enables adapter dropout and keeps the state needed by backward().
 */
void LoRACausalDecoder::forward(const float* embeds, const std::uint8_t* mask, int B, int T, float* hidden, bool training) {
    const long elems = static_cast<long>(B) * T * mHiddenSize;
    std::vector<float> current(embeds, embeds + elems);
    std::vector<float> next(elems);
    for (auto& layer : mLayers) {
        layer_forward(*layer, current.data(), next.data(), mask, B, T, training);
        current.swap(next);
    }
    std::copy(current.begin(), current.end(), hidden);

    mLastB = B;
    mLastT = T;
    mLastTraining = training;
}

/**
 * @brief Backpropagate from the last layer's hidden states to the input embeddings.
 *
 * @throws std::logic_error if the preceding forward call was not in training mode or had a
 *         different shape.
 */
void LoRACausalDecoder::backward(const float* d_hidden, float* d_embeds, int B, int T) {
    if (!mLastTraining) {
        throw std::logic_error("LoRACausalDecoder: backward requires a preceding training-mode forward");
    }
    if (B != mLastB || T != mLastT) {
        throw std::logic_error(fmt::format("LoRACausalDecoder: backward shape ({}, {}) does not match forward ({}, {})",
                                           B, T, mLastB, mLastT));
    }

    const long elems = static_cast<long>(B) * T * mHiddenSize;
    std::vector<float> current(d_hidden, d_hidden + elems);
    std::vector<float> next(elems);
    for (auto it = mLayers.rbegin(); it != mLayers.rend(); ++it) {
        layer_backward(**it, current.data(), next.data(), B, T);
        current.swap(next);
    }
    std::copy(current.begin(), current.end(), d_embeds);
}

void LoRACausalDecoder::layer_forward(AttentionLayer& layer, const float* x, float* y, const std::uint8_t* mask,
                                      int B, int T, bool training) {
    const int H = mHiddenSize;
    const long rows = static_cast<long>(B) * T;
    const long elems = rows * H;
    const int R = static_cast<int>(rows);

    layer.X.assign(x, x + elems);
    layer.Q.resize(elems);
    layer.K.resize(elems);
    layer.V.resize(elems);
    layer.Att.resize(elems);
    layer.P.resize(static_cast<std::size_t>(B) * T * T);

    matmul(layer.Q.data(), x, layer.Wq.get<float>(), nullptr, R, H, H, EMMTranspose::NT, false);
    matmul(layer.K.data(), x, layer.Wk.get<float>(), nullptr, R, H, H, EMMTranspose::NT, false);
    matmul(layer.V.data(), x, layer.Wv.get<float>(), nullptr, R, H, H, EMMTranspose::NT, false);
    if (layer.LoraQ) {
        auto& l = *layer.LoraQ;
        lora_forward(layer.Q.data(), x, rows, H, mAdapterConfig->Rank, mAdapterConfig->scaling(),
                     mAdapterConfig->Dropout, training, mDropoutRng, l.A, l.B, l.DropMask, l.Xd, l.SU);
    }
    if (layer.LoraV) {
        auto& l = *layer.LoraV;
        lora_forward(layer.V.data(), x, rows, H, mAdapterConfig->Rank, mAdapterConfig->scaling(),
                     mAdapterConfig->Dropout, training, mDropoutRng, l.A, l.B, l.DropMask, l.Xd, l.SU);
    }
    mPolicy.cast(layer.Q.data(), elems);
    mPolicy.cast(layer.K.data(), elems);
    mPolicy.cast(layer.V.data(), elems);

    const float inv_sqrt_h = 1.f / std::sqrt(static_cast<float>(H));
    RowMatrix scores(T, T);
    std::vector<std::uint8_t> visible(static_cast<std::size_t>(T) * T);
    for (int b = 0; b < B; ++b) {
        const long off = static_cast<long>(b) * T * H;
        const std::uint8_t* row_mask = mask + static_cast<long>(b) * T;
        for (int i = 0; i < T; ++i) {
            for (int j = 0; j < T; ++j) {
                visible[static_cast<long>(i) * T + j] = (j <= i && row_mask[j]) ? 1 : 0;
            }
        }

        ConstMatrixMap q(layer.Q.data() + off, T, H);
        ConstMatrixMap k(layer.K.data() + off, T, H);
        ConstMatrixMap v(layer.V.data() + off, T, H);
        MatrixMap probs(layer.P.data() + static_cast<long>(b) * T * T, T, T);

        scores.noalias() = inv_sqrt_h * (q * k.transpose());
        masked_softmax_forward(probs.data(), scores.data(), visible.data(), T, T);
        MatrixMap(layer.Att.data() + off, T, H).noalias() = probs * v;
    }

    matmul(y, layer.Att.data(), layer.Wo.get<float>(), nullptr, R, H, H, EMMTranspose::NT, false);
    add_inplace(y, x, elems);
    mPolicy.cast(y, elems);
}

void LoRACausalDecoder::layer_backward(AttentionLayer& layer, const float* dy, float* dx, int B, int T) {
    const int H = mHiddenSize;
    const long rows = static_cast<long>(B) * T;
    const long elems = rows * H;
    const int R = static_cast<int>(rows);

    // residual
    std::copy(dy, dy + elems, dx);

    std::vector<float> d_att(elems);
    matmul(d_att.data(), dy, layer.Wo.get<float>(), nullptr, R, H, H, EMMTranspose::NN, false);

    std::vector<float> dq(elems), dk(elems), dv(elems);
    RowMatrix dprobs(T, T);
    RowMatrix dscores(T, T);
    const float inv_sqrt_h = 1.f / std::sqrt(static_cast<float>(H));
    for (int b = 0; b < B; ++b) {
        const long off = static_cast<long>(b) * T * H;
        ConstMatrixMap probs(layer.P.data() + static_cast<long>(b) * T * T, T, T);
        ConstMatrixMap d_out(d_att.data() + off, T, H);
        ConstMatrixMap q(layer.Q.data() + off, T, H);
        ConstMatrixMap k(layer.K.data() + off, T, H);
        ConstMatrixMap v(layer.V.data() + off, T, H);

        dprobs.noalias() = d_out * v.transpose();
        MatrixMap(dv.data() + off, T, H).noalias() = probs.transpose() * d_out;
        softmax_backward(dscores.data(), probs.data(), dprobs.data(), T, T, inv_sqrt_h);
        MatrixMap(dq.data() + off, T, H).noalias() = dscores * k;
        MatrixMap(dk.data() + off, T, H).noalias() = dscores.transpose() * q;
    }

    matmul(dx, dq.data(), layer.Wq.get<float>(), nullptr, R, H, H, EMMTranspose::NN, true);
    matmul(dx, dk.data(), layer.Wk.get<float>(), nullptr, R, H, H, EMMTranspose::NN, true);
    matmul(dx, dv.data(), layer.Wv.get<float>(), nullptr, R, H, H, EMMTranspose::NN, true);

    if (layer.LoraQ) {
        auto& l = *layer.LoraQ;
        lora_backward(dq.data(), dx, rows, H, mAdapterConfig->Rank, mAdapterConfig->scaling(), l.A, l.B, l.DropMask, l.Xd, l.SU);
    }
    if (layer.LoraV) {
        auto& l = *layer.LoraV;
        lora_backward(dv.data(), dx, rows, H, mAdapterConfig->Rank, mAdapterConfig->scaling(), l.A, l.B, l.DropMask, l.Xd, l.SU);
    }
}

void LoRACausalDecoder::BaseWeights::iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) {
    callback("model.embed_tokens.weight", mParent->mTokenEmbeddings);
    for (int l = 0; l < mParent->num_layers(); ++l) {
        auto& layer = *mParent->mLayers[l];
        callback(fmt::format("model.layers.{}.self_attn.q_proj.weight", l), layer.Wq);
        callback(fmt::format("model.layers.{}.self_attn.k_proj.weight", l), layer.Wk);
        callback(fmt::format("model.layers.{}.self_attn.v_proj.weight", l), layer.Wv);
        callback(fmt::format("model.layers.{}.self_attn.o_proj.weight", l), layer.Wo);
    }
}

void LoRACausalDecoder::AdapterWeights::iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) {
    for (int l = 0; l < mParent->num_layers(); ++l) {
        auto& layer = *mParent->mLayers[l];
        if (layer.LoraQ) {
            callback(fmt::format("base_model.model.layers.{}.self_attn.q_proj.lora_A.weight", l), layer.LoraQ->A.Value);
            callback(fmt::format("base_model.model.layers.{}.self_attn.q_proj.lora_B.weight", l), layer.LoraQ->B.Value);
        }
        if (layer.LoraV) {
            callback(fmt::format("base_model.model.layers.{}.self_attn.v_proj.lora_A.weight", l), layer.LoraV->A.Value);
            callback(fmt::format("base_model.model.layers.{}.self_attn.v_proj.lora_B.weight", l), layer.LoraV->B.Value);
        }
    }
}

} // namespace modules
