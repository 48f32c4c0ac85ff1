// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_HYBRID_MODEL_H
#define LOGSENTINEL_SRC_TRAINING_HYBRID_MODEL_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/model_config.h"
#include "modules/causal_decoder.h"
#include "modules/embedding_batch.h"
#include "modules/linear.h"
#include "modules/parameter.h"
#include "modules/projector.h"
#include "modules/sequence_encoder.h"
#include "modules/tokenizer.h"
#include "training/model.h"
#include "training/precision_policy.h"
#include "utilities/allocator.h"

class ILogSink;

/**
 * @brief Log anomaly classifier built from a frozen sentence encoder and a causal decoder.
 *
 * Every log line is encoded to one pooled vector, projected into the decoder's embedding
 * space and appended to a fixed instruction prefix. The decoder's hidden state at the last
 * position of each sample is classified into {normal, anomalous}.
 *
 * Trainable parameter groups: `projector`, `classifier` and `decoder.lora`.
 */
class HybridEncoderModel final : public IModel {
public:
    /**
     * @param config Architecture; base weights are read from `config.SourceDirectory` if present.
     * @param policy Numeric precision of activations.
     * @param max_content_len Maximum tokens per log line, special tokens included.
     * @param max_seq_len Maximum number of log lines per sample.
     * @param finetuned_path Directory written by save_finetuned() to resume from.
     * @param train_mode Create fresh adapters if no fine-tuned adapter is found.
     * @param sink Receives informational messages; may be null.
     */
    HybridEncoderModel(const HybridModelConfig& config, const PrecisionPolicy& policy, int max_content_len,
                       int max_seq_len, const std::optional<std::string>& finetuned_path, bool train_mode,
                       ILogSink* sink = nullptr);
    ~HybridEncoderModel() override;

    std::vector<std::optional<ClassLogits>> forward(const std::vector<LogSequence>& sequences) override;
    TrainBatch train_helper(const std::vector<LogSequence>& sequences, const std::vector<std::string>& labels) override;
    void backward(const float* dlogits, int rows) override;

    modules::ParameterGroupRegistry& parameter_groups() override { return mRegistry; }
    [[nodiscard]] const PrecisionPolicy& precision_policy() const override { return mPolicy; }
    [[nodiscard]] const TensorAllocator& allocator() const override { return mAllocator; }

    void save_finetuned(const std::string& directory) override;

    [[nodiscard]] const HybridModelConfig& config() const { return mConfig; }
    [[nodiscard]] int max_content_len() const { return mMaxContentLen; }
    [[nodiscard]] int max_seq_len() const { return mMaxSeqLen; }
    //! Number of decoder positions taken by the instruction prefix.
    [[nodiscard]] int prefix_length() const { return mPrefixLength; }
    [[nodiscard]] modules::ICausalDecoder& decoder() { return *mDecoder; }

private:
    struct ForwardResult {
        std::vector<float> Logits;          ///< (rows, 2)
        std::vector<int> SourceIndices;
    };

    //! State of the last training-mode pass.
    struct BackwardCache {
        bool Valid = false;
        modules::PaddedBatch Batch;
        std::vector<int> LinePositions;     ///< last valid column per row
        std::vector<int> LineBegin;         ///< first projected row per surviving sample
        std::vector<int> LineCount;         ///< projected rows per surviving sample
        int ProjectedRows = 0;
    };

    ForwardResult compute_logits(const std::vector<LogSequence>& sequences, bool training);
    void encode_lines(const std::vector<std::string>& lines, float* pooled) const;

    void load_base_weights();
    void setup_adapters(const std::optional<std::string>& finetuned_path, bool train_mode);
    [[nodiscard]] bool group_trainable(const char* group) const;
    void log(const std::string& message) const;

    HybridModelConfig mConfig;
    PrecisionPolicy mPolicy;
    int mMaxContentLen;
    int mMaxSeqLen;
    ILogSink* mSink;

    TensorAllocator mAllocator;
    modules::HashingTokenizer mEncoderTokenizer;
    modules::HashingTokenizer mDecoderTokenizer;
    std::unique_ptr<modules::PooledTokenEncoder> mEncoder;
    std::unique_ptr<modules::ProjectorModule> mProjector;
    std::unique_ptr<modules::LoRACausalDecoder> mDecoder;
    std::unique_ptr<modules::LinearModule> mClassifier;
    modules::ParameterGroupRegistry mRegistry;

    std::vector<float> mPrefixEmbeds;   ///< (prefix_length, decoder_hidden)
    int mPrefixLength = 0;

    BackwardCache mCache;
};

#endif //LOGSENTINEL_SRC_TRAINING_HYBRID_MODEL_H
