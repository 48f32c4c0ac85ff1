// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "modules/parameter.h"
#include "training/hybrid_model.h"
#include "training/parameter_stager.h"
#include "training/precision_policy.h"
#include "../utilities/test_utils.h"

using Catch::Matchers::WithinAbs;

namespace {

std::unique_ptr<HybridEncoderModel> make_model(ILogSink* sink = nullptr, int max_seq_len = 4,
                                               std::optional<std::string> finetuned = std::nullopt,
                                               bool train_mode = true) {
    return std::make_unique<HybridEncoderModel>(testing_utils::tiny_model_config(), PrecisionPolicy{}, 8, max_seq_len,
                                                finetuned, train_mode, sink);
}

std::vector<LogSequence> sample_sequences() {
    return {
        {"service started pid 12", "request 3 served in 10 ms"},
        {"ERROR disk failure on block 9"},
        {"service started pid 13", "ERROR disk failure on block 2", "request 4 served in 11 ms"},
    };
}

void randomize_group(modules::ParameterGroupRegistry& registry, const char* group, float scale, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<float> dist(-scale, scale);
    for (auto* p : registry.group(group)) {
        for (std::size_t i = 0; i < p->nelem(); ++i) p->data()[i] = dist(rng);
    }
}

double weighted_logits(HybridEncoderModel& model, const std::vector<LogSequence>& seqs, const std::vector<float>& w) {
    auto out = model.forward(seqs);
    double acc = 0.0;
    for (std::size_t r = 0; r < out.size(); ++r) {
        acc += static_cast<double>((*out[r])[0]) * w[2 * r] + static_cast<double>((*out[r])[1]) * w[2 * r + 1];
    }
    return acc;
}

} // namespace

TEST_CASE("hybrid model produces one prediction per non-empty sample", "[training][model]") {
    auto model = make_model();
    REQUIRE(model->prefix_length() == 3);  // BOS, "logs", ":"

    auto seqs = sample_sequences();
    seqs.insert(seqs.begin() + 1, LogSequence{});
    auto out = model->forward(seqs);

    REQUIRE(out.size() == 4);
    REQUIRE(out[0].has_value());
    REQUIRE_FALSE(out[1].has_value());
    REQUIRE(out[2].has_value());
    REQUIRE(out[3].has_value());
    for (const auto& row : out) {
        if (!row) continue;
        REQUIRE(std::isfinite((*row)[0]));
        REQUIRE(std::isfinite((*row)[1]));
    }

    REQUIRE(model->forward({}).empty());
    auto all_empty = model->forward({{}, {}});
    REQUIRE(all_empty.size() == 2);
    REQUIRE_FALSE(all_empty[0].has_value());
}

TEST_CASE("a sample's logits do not depend on the rest of the batch", "[training][model]") {
    auto model = make_model();
    auto seqs = sample_sequences();
    auto batched = model->forward(seqs);
    for (std::size_t i = 0; i < seqs.size(); ++i) {
        auto alone = model->forward({seqs[i]});
        REQUIRE_THAT((*alone[0])[0], WithinAbs((*batched[i])[0], 1e-5));
        REQUIRE_THAT((*alone[0])[1], WithinAbs((*batched[i])[1], 1e-5));
    }
}

TEST_CASE("samples are truncated to max_seq_len lines", "[training][model]") {
    auto model = make_model(nullptr, 2);
    LogSequence longer = {"line one", "line two", "line three"};
    LogSequence truncated = {"line one", "line two"};
    auto out = model->forward({longer, truncated});
    REQUIRE((*out[0])[0] == (*out[1])[0]);
    REQUIRE((*out[0])[1] == (*out[1])[1]);
}

TEST_CASE("train_helper keeps labels of surviving rows", "[training][model]") {
    auto model = make_model();
    std::vector<LogSequence> seqs = {{"a"}, {}, {"ERROR b"}};
    auto batch = model->train_helper(seqs, {"normal", "anomalous", "anomalous"});
    REQUIRE(batch.rows() == 2);
    REQUIRE(batch.Labels == std::vector<int>{0, 1});
    REQUIRE(batch.SourceIndices == std::vector<int>{0, 2});
    REQUIRE(batch.Logits.size() == 4);

    REQUIRE_THROWS_AS(model->train_helper(seqs, {"normal"}), std::invalid_argument);

    auto empty = model->train_helper({{}, {}}, {"normal", "normal"});
    REQUIRE(empty.empty());
    std::vector<float> dlogits(2);
    REQUIRE_THROWS_AS(model->backward(dlogits.data(), 1), std::logic_error);
}

TEST_CASE("model starts frozen with three parameter groups", "[training][model]") {
    auto model = make_model();
    auto& registry = model->parameter_groups();
    REQUIRE(registry.group_names() == std::vector<std::string>{"projector", "classifier", "decoder.lora"});
    REQUIRE(registry.trainable().empty());
    // two adapted projections per layer, A and B each
    REQUIRE(registry.group(modules::DECODER_LORA_GROUP).size() ==
            static_cast<std::size_t>(4 * testing_utils::tiny_model_config().DecoderNumLayers));
}

TEST_CASE("model gradients match finite differences", "[training][model]") {
    auto model = make_model();
    auto& registry = model->parameter_groups();
    randomize_group(registry, modules::DECODER_LORA_GROUP, 0.3f, 5);
    ParameterStager stager(registry);
    stager.activate(ETrainingStage::FULL_WITH_ADAPTERS);
    registry.zero_grad();

    auto seqs = sample_sequences();
    auto w = testing_utils::uniform_host(2 * static_cast<long>(seqs.size()), -1.f, 1.f, 6);
    auto batch = model->train_helper(seqs, {"normal", "anomalous", "anomalous"});
    model->backward(w.data(), batch.rows());

    const float eps = 3e-3f;
    for (const char* group : {modules::PROJECTOR_GROUP, modules::CLASSIFIER_GROUP, modules::DECODER_LORA_GROUP}) {
        for (auto* p : registry.group(group)) {
            // a few entries per tensor keep the test fast
            for (std::size_t i = 0; i < p->nelem(); i += std::max<std::size_t>(1, p->nelem() / 5)) {
                float saved = p->data()[i];
                p->data()[i] = saved + eps; double plus = weighted_logits(*model, seqs, w);
                p->data()[i] = saved - eps; double minus = weighted_logits(*model, seqs, w);
                p->data()[i] = saved;
                INFO(p->Name << "[" << i << "]");
                REQUIRE_THAT(p->grad()[i], WithinAbs((plus - minus) / (2 * eps), 2e-3));
            }
        }
    }
}

TEST_CASE("classifier-only training leaves other gradients untouched", "[training][model]") {
    auto model = make_model();
    auto& registry = model->parameter_groups();
    registry.zero_grad();
    ParameterStager stager(registry);
    stager.activate(ETrainingStage::CLASSIFIER_ONLY);

    auto batch = model->train_helper(sample_sequences(), {"normal", "anomalous", "anomalous"});
    std::vector<float> dlogits(batch.Logits.size(), 1.f);
    model->backward(dlogits.data(), batch.rows());

    for (auto* p : registry.group(modules::PROJECTOR_GROUP)) {
        for (std::size_t i = 0; i < p->nelem(); ++i) REQUIRE(p->grad()[i] == 0.f);
    }
    bool any_nonzero = false;
    for (auto* p : registry.group(modules::CLASSIFIER_GROUP)) {
        for (std::size_t i = 0; i < p->nelem(); ++i) any_nonzero = any_nonzero || p->grad()[i] != 0.f;
    }
    REQUIRE(any_nonzero);
}

TEST_CASE("fine-tuned components round-trip through save_finetuned", "[training][model][io]") {
    auto dir = testing_utils::make_temp_dir("finetuned");
    testing_utils::RecordingSink sink;

    auto trained = make_model(&sink);
    REQUIRE(sink.has_log_containing("No adapter found. Creating new adapter configuration for training."));
    auto& registry = trained->parameter_groups();
    randomize_group(registry, modules::DECODER_LORA_GROUP, 0.3f, 1);
    randomize_group(registry, modules::PROJECTOR_GROUP, 0.3f, 2);
    randomize_group(registry, modules::CLASSIFIER_GROUP, 0.3f, 3);
    trained->save_finetuned(dir.string());
    REQUIRE(sink.has_log_containing("Fine-tuned adapter and components saved to"));

    REQUIRE(std::filesystem::exists(dir / "decoder_adapter" / "adapter_model.safetensors"));
    REQUIRE(std::filesystem::exists(dir / "projector.safetensors"));
    REQUIRE(std::filesystem::exists(dir / "classifier.safetensors"));
    std::ifstream config_file(dir / "decoder_adapter" / "adapter_config.json");
    auto adapter_config = nlohmann::json::parse(config_file);
    REQUIRE(adapter_config["peft_type"] == "LORA");
    REQUIRE(adapter_config["r"] == testing_utils::tiny_model_config().LoRA.Rank);
    REQUIRE(adapter_config["base_model_name_or_path"] == "logsentinel-test");

    testing_utils::RecordingSink load_sink;
    auto loaded = make_model(&load_sink, 4, dir.string(), false);
    REQUIRE(load_sink.has_log_containing("Loading components from fine-tuned path"));

    auto seqs = sample_sequences();
    auto expected = trained->forward(seqs);
    auto actual = loaded->forward(seqs);
    for (std::size_t i = 0; i < seqs.size(); ++i) {
        REQUIRE((*actual[i])[0] == (*expected[i])[0]);
        REQUIRE((*actual[i])[1] == (*expected[i])[1]);
    }
}

TEST_CASE("inference without adapters warns and uses the base decoder", "[training][model]") {
    testing_utils::RecordingSink sink;
    auto model = make_model(&sink, 4, std::nullopt, false);
    REQUIRE(sink.has_log_containing("Warning: Inference mode selected but no fine-tuned adapter path was provided."));
    REQUIRE_FALSE(model->decoder().has_adapters());
    REQUIRE(model->parameter_groups().group(modules::DECODER_LORA_GROUP).empty());
    REQUIRE(model->forward(sample_sequences()).size() == 3);
}

TEST_CASE("reduced precision keeps logits representable", "[training][model]") {
    PrecisionPolicy policy;
    policy.ModelDType = ETensorDType::BF16;
    HybridEncoderModel model(testing_utils::tiny_model_config(), policy, 8, 4, std::nullopt, true);
    auto out = model.forward(sample_sequences());
    for (const auto& row : out) {
        REQUIRE(round_to_dtype((*row)[0], ETensorDType::BF16) == (*row)[0]);
        REQUIRE(round_to_dtype((*row)[1], ETensorDType::BF16) == (*row)[1]);
    }
}
