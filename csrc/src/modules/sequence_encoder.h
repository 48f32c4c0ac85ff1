// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_MODULES_SEQUENCE_ENCODER_H
#define LOGSENTINEL_SRC_MODULES_SEQUENCE_ENCODER_H

#include <cstdint>

#include "modules/tokenizer.h"
#include "utilities/tensor.h"

class TensorAllocator;

namespace modules {

//! Turns tokenized text rows into one fixed-size embedding per row. Always frozen.
class ISequenceEncoder {
public:
    virtual ~ISequenceEncoder() = default;

    [[nodiscard]] virtual int hidden_size() const = 0;
    [[nodiscard]] virtual int max_positions() const = 0;

    //! Writes `batch.Rows` pooled vectors of `hidden_size()` floats to `pooled`.
    virtual void encode(const TokenizedBatch& batch, float* pooled) const = 0;
};

/**
 * @brief Frozen BERT-style sentence encoder.
 *
 * Token and position embeddings are summed, mean-pooled over the attention mask and passed
 * through a dense tanh pooler. Weight names follow the BERT layout so that exported encoder
 * weights can be read from `encoder.safetensors`.
 */
class PooledTokenEncoder final : public ISequenceEncoder, public ITensorContainer {
public:
    PooledTokenEncoder(int vocab_size, int hidden_size, int max_positions, TensorAllocator& allocator);

    [[nodiscard]] int hidden_size() const override { return mHiddenSize; }
    [[nodiscard]] int max_positions() const override { return mMaxPositions; }

    void encode(const TokenizedBatch& batch, float* pooled) const override;

    void init_weights(std::uint64_t seed);
    void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) override;

private:
    int mVocabSize;
    int mHiddenSize;
    int mMaxPositions;

    Tensor mTokenEmbeddings;    ///< (vocab_size, hidden_size)
    Tensor mPositionEmbeddings; ///< (max_positions, hidden_size)
    Tensor mPoolerWeight;       ///< (hidden_size, hidden_size)
    Tensor mPoolerBias;         ///< (hidden_size,)
};

} // namespace modules

#endif //LOGSENTINEL_SRC_MODULES_SEQUENCE_ENCODER_H
