// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "training/hybrid_model.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "kernels/kernels.h"
#include "training/callback.h"
#include "utilities/safetensors.h"

namespace {

constexpr const char* ADAPTER_DIR = "decoder_adapter";
constexpr const char* ADAPTER_CONFIG_FILE = "adapter_config.json";
constexpr const char* ADAPTER_WEIGHTS_FILE = "adapter_model.safetensors";
constexpr const char* PROJECTOR_FILE = "projector.safetensors";
constexpr const char* CLASSIFIER_FILE = "classifier.safetensors";
constexpr const char* ENCODER_WEIGHTS_FILE = "encoder.safetensors";
constexpr const char* DECODER_WEIGHTS_FILE = "decoder.safetensors";

// seed offsets for independently initialized components
constexpr std::uint64_t ENCODER_SEED = 0;
constexpr std::uint64_t DECODER_SEED = 1;
constexpr std::uint64_t HEAD_SEED = 2;
constexpr std::uint64_t ADAPTER_SEED = 3;

} // namespace

HybridEncoderModel::HybridEncoderModel(const HybridModelConfig& config, const PrecisionPolicy& policy,
                                       int max_content_len, int max_seq_len,
                                       const std::optional<std::string>& finetuned_path, bool train_mode,
                                       ILogSink* sink) :
    mConfig(config), mPolicy(policy), mMaxContentLen(max_content_len), mMaxSeqLen(max_seq_len), mSink(sink),
    mEncoderTokenizer(config.EncoderVocabSize, config.EncoderLowercase),
    mDecoderTokenizer(config.DecoderVocabSize, false) {
    mConfig.validate();
    if (max_content_len <= 0 || max_seq_len <= 0) {
        throw std::invalid_argument(fmt::format("HybridEncoderModel: max_content_len ({}) and max_seq_len ({}) must be positive",
                                                max_content_len, max_seq_len));
    }

    mEncoder = std::make_unique<modules::PooledTokenEncoder>(config.EncoderVocabSize, config.EncoderHiddenSize,
                                                             config.EncoderMaxPositions, mAllocator);
    mProjector = std::make_unique<modules::ProjectorModule>(config.EncoderHiddenSize, config.DecoderHiddenSize, mAllocator);
    mDecoder = std::make_unique<modules::LoRACausalDecoder>(config.DecoderVocabSize, config.DecoderHiddenSize,
                                                            config.DecoderNumLayers, mPolicy, mAllocator);
    mClassifier = std::make_unique<modules::LinearModule>(
        modules::LinearModule::Config{.in_features = config.DecoderHiddenSize, .out_features = config.NumClasses, .has_bias = true},
        "classifier", mAllocator);

    load_base_weights();
    std::mt19937_64 head_rng(config.InitSeed + HEAD_SEED);
    mProjector->init_uniform(head_rng);
    mClassifier->init_uniform(head_rng);

    setup_adapters(finetuned_path, train_mode);

    mProjector->register_parameters(mRegistry, modules::PROJECTOR_GROUP);
    mClassifier->register_parameters(mRegistry, modules::CLASSIFIER_GROUP);
    mDecoder->register_parameters(mRegistry);
    mRegistry.freeze_all();

    std::vector<std::int32_t> prefix_ids{config.DecoderBosTokenId};
    auto prefix_tokens = mDecoderTokenizer.tokenize(config.InstructionPrefix);
    prefix_ids.insert(prefix_ids.end(), prefix_tokens.begin(), prefix_tokens.end());
    mPrefixEmbeds = mDecoder->embed_tokens(prefix_ids);
    mPrefixLength = static_cast<int>(prefix_ids.size());
}

HybridEncoderModel::~HybridEncoderModel() = default;

void HybridEncoderModel::load_base_weights() {
    namespace fs = std::filesystem;
    const fs::path source = mConfig.SourceDirectory;

    if (!source.empty() && fs::exists(source / ENCODER_WEIGHTS_FILE)) {
        load_safetensors((source / ENCODER_WEIGHTS_FILE).string(), *mEncoder, true);
    } else {
        mEncoder->init_weights(mConfig.InitSeed + ENCODER_SEED);
    }

    if (!source.empty() && fs::exists(source / DECODER_WEIGHTS_FILE)) {
        load_safetensors((source / DECODER_WEIGHTS_FILE).string(), mDecoder->base_weights(), true);
    } else {
        mDecoder->init_weights(mConfig.InitSeed + DECODER_SEED);
    }
}

/**
 * @brief Attach decoder adapters, resuming from a fine-tuned directory when one is given.
 *
 * With `<finetuned_path>/decoder_adapter/adapter_config.json` present, adapters, projector and
 * classifier are all loaded from @p finetuned_path. Otherwise training starts from fresh
 * adapters, and inference proceeds on the base decoder with a warning.
 */
void HybridEncoderModel::setup_adapters(const std::optional<std::string>& finetuned_path, bool train_mode) {
    namespace fs = std::filesystem;
    if (finetuned_path && fs::exists(fs::path(*finetuned_path) / ADAPTER_DIR / ADAPTER_CONFIG_FILE)) {
        const fs::path root = *finetuned_path;
        log(fmt::format("Loading components from fine-tuned path: {}", root.string()));

        std::ifstream config_file(root / ADAPTER_DIR / ADAPTER_CONFIG_FILE);
        if (!config_file.is_open()) {
            throw std::runtime_error(fmt::format("could not open {}", (root / ADAPTER_DIR / ADAPTER_CONFIG_FILE).string()));
        }
        auto adapter_config = LoRAAdapterConfig::from_peft_json(nlohmann::json::parse(config_file));
        mDecoder->enable_adapters(adapter_config, mConfig.InitSeed + ADAPTER_SEED);
        load_safetensors((root / ADAPTER_DIR / ADAPTER_WEIGHTS_FILE).string(), mDecoder->adapter_weights(), true);
        load_safetensors((root / PROJECTOR_FILE).string(), *mProjector, true);
        load_safetensors((root / CLASSIFIER_FILE).string(), *mClassifier, true);
        log("Adapter and other components loaded for inference/continued training.");
    } else if (train_mode) {
        log("No adapter found. Creating new adapter configuration for training.");
        mDecoder->enable_adapters(mConfig.LoRA, mConfig.InitSeed + ADAPTER_SEED);
    } else {
        log("Warning: Inference mode selected but no fine-tuned adapter path was provided.");
    }
}

void HybridEncoderModel::log(const std::string& message) const {
    if (mSink) {
        mSink->on_event(TrainingEvent::log(message));
    }
}

bool HybridEncoderModel::group_trainable(const char* group) const {
    const auto& params = mRegistry.group(group);
    return std::any_of(params.begin(), params.end(), [](const modules::Parameter* p) { return p->Trainable; });
}

/**
 * @brief Encode log lines in sub-batches of `EncoderSubBatchSize`.
 *
 * @param lines All log lines of the batch.
 * @param pooled Output buffer, (lines.size(), encoder_hidden).
 */
void HybridEncoderModel::encode_lines(const std::vector<std::string>& lines, float* pooled) const {
    const int H = mEncoder->hidden_size();
    const int max_length = std::max(2, std::min(mMaxContentLen, mEncoder->max_positions()));
    const std::size_t sub_batch = static_cast<std::size_t>(mConfig.EncoderSubBatchSize);

    for (std::size_t begin = 0; begin < lines.size(); begin += sub_batch) {
        const std::size_t end = std::min(lines.size(), begin + sub_batch);
        std::vector<std::string> chunk(lines.begin() + static_cast<long>(begin), lines.begin() + static_cast<long>(end));
        auto tokens = mEncoderTokenizer.encode_batch(chunk, max_length);
        mEncoder->encode(tokens, pooled + static_cast<long>(begin) * H);
    }
}

/**
 * @brief Shared pipeline from raw log sequences to logits of the surviving samples.
 *
 * Samples whose line list is empty after truncation have nothing to classify and are dropped.
 * In training mode the intermediate state for backward() is kept.
 */
HybridEncoderModel::ForwardResult HybridEncoderModel::compute_logits(const std::vector<LogSequence>& sequences, bool training) {
    mCache.Valid = false;
    ForwardResult result;

    std::vector<LogSequence> truncated;
    truncated.reserve(sequences.size());
    for (const auto& seq : sequences) {
        const std::size_t keep = std::min(seq.size(), static_cast<std::size_t>(mMaxSeqLen));
        truncated.emplace_back(seq.begin(), seq.begin() + static_cast<long>(keep));
    }

    auto merged = modules::merge_lines(truncated);
    if (merged.Lines.empty()) {
        return result;
    }

    const int num_lines = static_cast<int>(merged.Lines.size());
    const int He = mEncoder->hidden_size();
    const int Hd = mDecoder->hidden_size();

    std::vector<float> pooled(static_cast<std::size_t>(num_lines) * He);
    encode_lines(merged.Lines, pooled.data());
    mPolicy.cast(pooled.data(), pooled.size());

    std::vector<float> projected(static_cast<std::size_t>(num_lines) * Hd);
    mProjector->forward(pooled.data(), projected.data(), num_lines);
    mPolicy.cast(projected.data(), projected.size());

    std::vector<std::vector<float>> segments;
    std::vector<int> line_begin;
    std::vector<int> line_count;
    for (int i = 0; i < static_cast<int>(truncated.size()); ++i) {
        const int begin = merged.sample_begin(i);
        const int count = merged.sample_end(i) - begin;
        if (count == 0) continue;

        std::vector<float> segment(mPrefixEmbeds);
        segment.insert(segment.end(), projected.begin() + static_cast<long>(begin) * Hd,
                       projected.begin() + static_cast<long>(begin + count) * Hd);
        segments.push_back(std::move(segment));
        result.SourceIndices.push_back(i);
        line_begin.push_back(begin);
        line_count.push_back(count);
    }
    if (segments.empty()) {
        return result;
    }

    auto batch = modules::stack_and_pad_left(segments, Hd);
    std::vector<float> hidden(batch.Embeds.size());
    mDecoder->forward(batch.Embeds.data(), batch.Mask.data(), batch.B, batch.T, hidden.data(), training);

    std::vector<int> positions(batch.B);
    std::vector<float> last_hidden(static_cast<std::size_t>(batch.B) * Hd);
    for (int b = 0; b < batch.B; ++b) {
        positions[b] = modules::last_valid_position(batch.Mask.data() + static_cast<long>(b) * batch.T, batch.T);
        const long src = (static_cast<long>(b) * batch.T + positions[b]) * Hd;
        std::copy_n(hidden.begin() + src, Hd, last_hidden.begin() + static_cast<long>(b) * Hd);
    }

    result.Logits.resize(static_cast<std::size_t>(batch.B) * mConfig.NumClasses);
    mClassifier->forward(last_hidden.data(), result.Logits.data(), batch.B);
    mPolicy.cast(result.Logits.data(), result.Logits.size());

    if (training) {
        mCache.Batch = std::move(batch);
        mCache.LinePositions = std::move(positions);
        mCache.LineBegin = std::move(line_begin);
        mCache.LineCount = std::move(line_count);
        mCache.ProjectedRows = num_lines;
        mCache.Valid = true;
    }
    return result;
}

std::vector<std::optional<ClassLogits>> HybridEncoderModel::forward(const std::vector<LogSequence>& sequences) {
    auto result = compute_logits(sequences, false);

    std::vector<std::optional<ClassLogits>> output(sequences.size());
    for (std::size_t r = 0; r < result.SourceIndices.size(); ++r) {
        ClassLogits row{result.Logits[2 * r], result.Logits[2 * r + 1]};
        output[result.SourceIndices[r]] = row;
    }
    return output;
}

TrainBatch HybridEncoderModel::train_helper(const std::vector<LogSequence>& sequences, const std::vector<std::string>& labels) {
    if (sequences.size() != labels.size()) {
        throw std::invalid_argument(fmt::format("train_helper: {} sequences but {} labels", sequences.size(), labels.size()));
    }

    auto result = compute_logits(sequences, true);
    TrainBatch batch;
    batch.Logits = std::move(result.Logits);
    batch.SourceIndices = std::move(result.SourceIndices);
    batch.Labels.reserve(batch.SourceIndices.size());
    for (int idx : batch.SourceIndices) {
        batch.Labels.push_back(label_to_class(labels[idx]));
    }
    return batch;
}

/**
 * @brief Backpropagate the logit gradients of the last train_helper call.
 *
 * The classifier receives its gradients directly. The decoder is only traversed if the
 * projector or the adapters are trainable; its input gradient is gathered at the positions of
 * the projected log lines and passed on to the projector.
 *
 * @param dlogits Gradient w.r.t. the logits, (rows, 2).
 * @param rows Must equal the row count of the preceding train_helper result.
 *
 * @throws std::logic_error without a preceding non-empty train_helper call.
 */
void HybridEncoderModel::backward(const float* dlogits, int rows) {
    if (!mCache.Valid) {
        throw std::logic_error("HybridEncoderModel: backward requires a preceding non-empty train_helper call");
    }
    const auto& batch = mCache.Batch;
    if (rows != batch.B) {
        throw std::logic_error(fmt::format("HybridEncoderModel: backward over {} rows, forward produced {}", rows, batch.B));
    }

    const int Hd = mDecoder->hidden_size();
    const bool projector_trainable = group_trainable(modules::PROJECTOR_GROUP);
    const bool adapters_trainable = group_trainable(modules::DECODER_LORA_GROUP);

    std::vector<float> d_last(static_cast<std::size_t>(rows) * Hd);
    mClassifier->backward(dlogits, d_last.data(), rows);
    if (!projector_trainable && !adapters_trainable) {
        return;
    }

    std::vector<float> d_hidden(batch.Embeds.size(), 0.f);
    for (int b = 0; b < rows; ++b) {
        const long dst = (static_cast<long>(b) * batch.T + mCache.LinePositions[b]) * Hd;
        std::copy_n(d_last.begin() + static_cast<long>(b) * Hd, Hd, d_hidden.begin() + dst);
    }

    std::vector<float> d_embeds(batch.Embeds.size());
    mDecoder->backward(d_hidden.data(), d_embeds.data(), batch.B, batch.T);
    if (!projector_trainable) {
        return;
    }

    // log lines occupy the last LineCount columns of each left-padded row
    std::vector<float> d_projected(static_cast<std::size_t>(mCache.ProjectedRows) * Hd, 0.f);
    for (int b = 0; b < rows; ++b) {
        const int count = mCache.LineCount[b];
        const long src = (static_cast<long>(b) * batch.T + (batch.T - count)) * Hd;
        std::copy_n(d_embeds.begin() + src, static_cast<long>(count) * Hd,
                    d_projected.begin() + static_cast<long>(mCache.LineBegin[b]) * Hd);
    }
    mProjector->backward(d_projected.data(), mCache.ProjectedRows);
}

/**
 * @brief Save the fine-tuned components.
 *
 * Layout:
 * - `decoder_adapter/adapter_model.safetensors` and `decoder_adapter/adapter_config.json`
 * - `projector.safetensors`
 * - `classifier.safetensors`
 */
void HybridEncoderModel::save_finetuned(const std::string& directory) {
    namespace fs = std::filesystem;
    const fs::path root = directory;
    fs::create_directories(root / ADAPTER_DIR);

    if (mDecoder->has_adapters()) {
        write_safetensors((root / ADAPTER_DIR / ADAPTER_WEIGHTS_FILE).string(), mDecoder->adapter_weights());
        const std::string base_model = mConfig.SourceDirectory.empty() ? mConfig.ModelName : mConfig.SourceDirectory;
        std::ofstream config_file(root / ADAPTER_DIR / ADAPTER_CONFIG_FILE);
        if (!config_file.is_open()) {
            throw std::runtime_error(fmt::format("could not open {} for writing", (root / ADAPTER_DIR / ADAPTER_CONFIG_FILE).string()));
        }
        config_file << mDecoder->adapter_config().to_peft_json(base_model).dump(4);
    }
    write_safetensors((root / PROJECTOR_FILE).string(), *mProjector);
    write_safetensors((root / CLASSIFIER_FILE).string(), *mClassifier);
    log(fmt::format("Fine-tuned adapter and components saved to {}", root.string()));
}
