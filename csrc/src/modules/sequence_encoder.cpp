// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/sequence_encoder.h"

#include <random>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>

#include "kernels/kernels.h"
#include "utilities/allocator.h"

namespace modules {

PooledTokenEncoder::PooledTokenEncoder(int vocab_size, int hidden_size, int max_positions, TensorAllocator& allocator) :
    mVocabSize(vocab_size), mHiddenSize(hidden_size), mMaxPositions(max_positions) {
    auto ctx = allocator.with_context("encoder");
    mTokenEmbeddings = allocator.allocate(ETensorDType::FP32, "word_embeddings", {vocab_size, hidden_size});
    mPositionEmbeddings = allocator.allocate(ETensorDType::FP32, "position_embeddings", {max_positions, hidden_size});
    mPoolerWeight = allocator.allocate(ETensorDType::FP32, "pooler_weight", {hidden_size, hidden_size});
    mPoolerBias = allocator.allocate(ETensorDType::FP32, "pooler_bias", {hidden_size});
}

void PooledTokenEncoder::init_weights(std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    fill_normal(mTokenEmbeddings, 0.f, 0.02f, rng);
    fill_normal(mPositionEmbeddings, 0.f, 0.02f, rng);
    fill_normal(mPoolerWeight, 0.f, 0.02f, rng);
    fill_zero(mPoolerBias);
}

/**
 * @brief Encode a tokenized batch into pooled sentence embeddings.
 *
 * @param batch Token ids and attention mask, (Rows, Length).
 * @param pooled Output buffer of Rows x hidden_size floats.
 *
 * @throws std::out_of_range if the batch is longer than the position table or holds a token
 *         id outside the vocabulary.
 */
void PooledTokenEncoder::encode(const TokenizedBatch& batch, float* pooled) const {
    if (batch.Length > mMaxPositions) {
        throw std::out_of_range(fmt::format("PooledTokenEncoder: sequence length {} exceeds {} positions",
                                            batch.Length, mMaxPositions));
    }

    const int H = mHiddenSize;
    const float* tok = mTokenEmbeddings.get<float>();
    const float* pos = mPositionEmbeddings.get<float>();
    std::vector<float> mean(static_cast<std::size_t>(batch.Rows) * H, 0.f);

    for (int r = 0; r < batch.Rows; ++r) {
        ArrayMap acc(mean.data() + static_cast<long>(r) * H, H);
        int count = 0;
        for (int t = 0; t < batch.Length; ++t) {
            const long idx = static_cast<long>(r) * batch.Length + t;
            if (!batch.AttentionMask[idx]) continue;
            const int id = batch.InputIds[idx];
            if (id < 0 || id >= mVocabSize) {
                throw std::out_of_range(fmt::format("PooledTokenEncoder: token id {} outside vocabulary of {}", id, mVocabSize));
            }
            acc += ConstArrayMap(tok + static_cast<long>(id) * H, H) + ConstArrayMap(pos + static_cast<long>(t) * H, H);
            ++count;
        }
        if (count > 0) {
            acc /= static_cast<float>(count);
        }
    }

    matmul(pooled, mean.data(), mPoolerWeight.get<float>(), mPoolerBias.get<float>(),
           batch.Rows, H, H, EMMTranspose::NT, false);
    tanh_forward(pooled, pooled, static_cast<long>(batch.Rows) * H);
}

void PooledTokenEncoder::iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) {
    callback("embeddings.word_embeddings.weight", mTokenEmbeddings);
    callback("embeddings.position_embeddings.weight", mPositionEmbeddings);
    callback("pooler.dense.weight", mPoolerWeight);
    callback("pooler.dense.bias", mPoolerBias);
}

} // namespace modules
