// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

#include "modules/parameter.h"
#include "runtime/optimizers/adamw.h"
#include "runtime/optimizers/adamw_8bit.h"
#include "training/gradient_stepper.h"
#include "training/loss_scaler.h"
#include "training/parameter_stager.h"
#include "utilities/allocator.h"
#include "../utilities/test_utils.h"

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

modules::Parameter make_param(TensorAllocator& alloc, const char* name, long n, float value) {
    modules::Parameter p;
    p.Name = name;
    p.Value = alloc.allocate(ETensorDType::FP32, name, {n});
    p.Grad = alloc.allocate(ETensorDType::FP32, name, {n});
    std::fill_n(p.data(), n, value);
    p.zero_grad();
    p.Trainable = true;
    return p;
}

struct Groups {
    TensorAllocator Alloc;
    modules::Parameter Proj = make_param(Alloc, "projector.w", 4, 0.f);
    modules::Parameter Head = make_param(Alloc, "classifier.w", 2, 0.f);
    modules::Parameter LoRA = make_param(Alloc, "decoder.lora.A", 3, 0.f);
    modules::ParameterGroupRegistry Registry;

    Groups() {
        Registry.add(modules::PROJECTOR_GROUP, &Proj);
        Registry.add(modules::CLASSIFIER_GROUP, &Head);
        Registry.add(modules::DECODER_LORA_GROUP, &LoRA);
    }
};

} // namespace

TEST_CASE("stager enables exactly the groups of each stage", "[training][stager]") {
    Groups g;
    ParameterStager stager(g.Registry);

    stager.activate(ETrainingStage::PROJECTOR_ONLY);
    REQUIRE(g.Proj.Trainable);
    REQUIRE_FALSE(g.Head.Trainable);
    REQUIRE_FALSE(g.LoRA.Trainable);
    REQUIRE(stager.num_trainable_elements() == 4);

    stager.activate(ETrainingStage::CLASSIFIER_ONLY);
    REQUIRE_FALSE(g.Proj.Trainable);
    REQUIRE(g.Head.Trainable);

    stager.activate(ETrainingStage::PROJECTOR_AND_CLASSIFIER);
    REQUIRE(g.Proj.Trainable);
    REQUIRE(g.Head.Trainable);
    REQUIRE_FALSE(g.LoRA.Trainable);

    stager.activate(ETrainingStage::FULL_WITH_ADAPTERS);
    REQUIRE(stager.num_trainable_elements() == 9);
    REQUIRE(stager.active_groups().size() == 3);
}

TEST_CASE("stager rejects unknown groups without changing state", "[training][stager]") {
    Groups g;
    ParameterStager stager(g.Registry);
    stager.activate(ETrainingStage::CLASSIFIER_ONLY);
    REQUIRE_THROWS_AS(stager.activate(std::vector<std::string>{"projector", "encoder"}), std::invalid_argument);
    REQUIRE(g.Head.Trainable);
    REQUIRE_FALSE(g.Proj.Trainable);
}

TEST_CASE("stage names", "[training][stager]") {
    REQUIRE(std::string(stage_name(ETrainingStage::PROJECTOR_ONLY)) == "Projector");
    REQUIRE(std::string(stage_name(ETrainingStage::CLASSIFIER_ONLY)) == "Classifier");
    REQUIRE(std::string(stage_name(ETrainingStage::PROJECTOR_AND_CLASSIFIER)) == "Projector+Classifier");
    REQUIRE(std::string(stage_name(ETrainingStage::FULL_WITH_ADAPTERS)) == "Fine-tuning All");
}

TEST_CASE("loss scaler grows, backs off and can be disabled", "[training][scaler]") {
    LossScaler disabled(false);
    disabled.update(true);
    REQUIRE(disabled.scale() == 1.f);

    LossScaler scaler(true, {.InitScale = 8.f, .GrowthFactor = 2.f, .BackoffFactor = 0.5f, .GrowthInterval = 2});
    REQUIRE(scaler.scale() == 8.f);
    scaler.update(false);
    REQUIRE(scaler.scale() == 8.f);
    scaler.update(false);
    REQUIRE(scaler.scale() == 16.f);
    scaler.update(true);
    REQUIRE(scaler.scale() == 8.f);
    // the growth counter restarts after a backoff
    scaler.update(false);
    REQUIRE(scaler.scale() == 8.f);

    REQUIRE(LossScaler(true).scale() == 65536.f);
}

TEST_CASE("adamw first step moves each weight by the learning rate", "[training][optimizer]") {
    std::vector<float> param = {1.f, -1.f};
    std::vector<float> grad = {0.5f, -2.f};
    optimizers::AdamW adam({{param.data(), grad.data(), param.size()}},
                           optimizers::OptimizerConfig::adamw(0.1f, 0.9f, 0.999f, 1e-8f, 0.f, 0.f));
    adam.step(1.f);
    REQUIRE(adam.step_count() == 1);
    REQUIRE_THAT(param[0], WithinAbs(0.9f, 1e-5));
    REQUIRE_THAT(param[1], WithinAbs(-0.9f, 1e-5));
}

TEST_CASE("gradient stepper clips the global norm", "[training][stepper]") {
    Groups g;
    // gradient (3, 4) has norm 5
    g.Head.grad()[0] = 3.f;
    g.Head.grad()[1] = 4.f;
    GradientStepper stepper({&g.Head}, optimizers::OptimizerConfig::adamw(0.1f, 0.9f, 0.999f, 1e-8f, 0.f, 1.f), 1, false);
    REQUIRE(stepper.dloss_multiplier() == 1.f);

    auto result = stepper.step();
    REQUIRE(result.Applied);
    REQUIRE_FALSE(result.FoundInf);
    REQUIRE_THAT(result.GradNorm, WithinRel(5.f, 1e-5f));
    REQUIRE_THAT(result.ClipFactor, WithinRel(0.2f, 1e-4f));
    REQUIRE(stepper.step_count() == 1);
    // gradients are reset after the step
    REQUIRE(g.Head.grad()[0] == 0.f);
    REQUIRE(g.Head.data()[0] < 0.f);
}

TEST_CASE("gradient stepper averages accumulated micro-batches", "[training][stepper]") {
    Groups g;
    GradientStepper stepper({&g.Proj}, optimizers::OptimizerConfig::adamw(0.1f), 4, false);
    REQUIRE(stepper.grad_accum_steps() == 4);
    REQUIRE(stepper.dloss_multiplier() == 0.25f);
    REQUIRE_THROWS_AS(GradientStepper({&g.Proj}, optimizers::OptimizerConfig::adamw(0.1f), 0, false), std::invalid_argument);
}

TEST_CASE("gradient stepper skips non-finite steps under loss scaling", "[training][stepper]") {
    Groups g;
    GradientStepper stepper({&g.Head}, optimizers::OptimizerConfig::adamw(0.1f), 2, true);
    REQUIRE(stepper.scaler().enabled());
    REQUIRE(stepper.dloss_multiplier() == 65536.f / 2.f);

    g.Head.grad()[0] = std::numeric_limits<float>::infinity();
    auto result = stepper.step();
    REQUIRE_FALSE(result.Applied);
    REQUIRE(result.FoundInf);
    REQUIRE(g.Head.data()[0] == 0.f);
    REQUIRE(stepper.scaler().scale() == 32768.f);
    REQUIRE(stepper.step_count() == 0);
    REQUIRE(g.Head.grad()[0] == 0.f);

    // finite gradients are unscaled before use
    g.Head.grad()[0] = 32768.f * 0.5f;
    result = stepper.step();
    REQUIRE(result.Applied);
    REQUIRE_THAT(result.GradNorm, WithinRel(0.5f, 1e-5f));
}

TEST_CASE("dynamic quantization maps", "[training][optimizer][8bit]") {
    auto signed_map = optimizers::create_dynamic_quantization_map(true);
    auto unsigned_map = optimizers::create_dynamic_quantization_map(false);
    for (const auto& map : {signed_map, unsigned_map}) {
        REQUIRE(std::is_sorted(map.begin(), map.end()));
        REQUIRE(map.back() == 1.f);
        REQUIRE(std::find(map.begin(), map.end(), 0.f) != map.end());
    }
    REQUIRE(signed_map.front() < -0.9f);
    REQUIRE(signed_map.front() > -1.f);
    REQUIRE(unsigned_map.front() == 0.f);

    // one absmax per block; every value comes back within half a level of the top decade
    std::vector<float> values = testing_utils::uniform_host(300, -3.f, 3.f, 11);
    std::vector<std::uint8_t> codes(values.size());
    std::vector<float> absmax(2);
    optimizers::quantize_blockwise(values.data(), values.size(), signed_map, codes.data(), absmax.data());
    auto block_absmax = [&values](std::size_t begin, std::size_t end) {
        float result = 0.f;
        for (std::size_t i = begin; i < end; ++i) result = std::max(result, std::abs(values[i]));
        return result;
    };
    REQUIRE(absmax[0] == block_absmax(0, 256));
    REQUIRE(absmax[1] == block_absmax(256, 300));
    std::vector<float> restored(values.size());
    optimizers::dequantize_blockwise(codes.data(), absmax.data(), values.size(), signed_map, restored.data());
    for (std::size_t i = 0; i < values.size(); ++i) {
        REQUIRE(std::abs(restored[i] - values[i]) <= 0.01f * absmax[i / 256]);
    }
}

TEST_CASE("8-bit adamw tracks full-precision adamw", "[training][optimizer][8bit]") {
    // three blocks, the last one partial
    const std::size_t n = 600;
    const float lr = 1e-2f;
    const int steps = 5;
    std::vector<float> p32 = testing_utils::uniform_host(static_cast<long>(n), -1.f, 1.f, 7);
    std::vector<float> p8 = p32;
    std::vector<float> grad(n);

    auto cfg32 = optimizers::OptimizerConfig::adamw(lr, 0.9f, 0.999f, 1e-8f, 0.01f, 0.f);
    auto cfg8 = cfg32;
    cfg8.type = optimizers::OptimizerType::ADAMW_8BIT;
    optimizers::AdamW full({{p32.data(), grad.data(), n}}, cfg32);
    optimizers::AdamW8Bit quantized({{p8.data(), grad.data(), n}}, cfg8);
    REQUIRE_THROWS_AS(optimizers::AdamW8Bit({{p8.data(), grad.data(), n}}, cfg32), std::invalid_argument);

    // gradient magnitudes in [0.5, 1] keep the second moment away from the coarse low decades
    std::mt19937 rng(3);
    std::uniform_real_distribution<float> magnitude(0.5f, 1.f);
    std::bernoulli_distribution negative(0.5);
    for (int step = 1; step <= steps; ++step) {
        for (auto& g : grad) g = negative(rng) ? -magnitude(rng) : magnitude(rng);
        full.step(1.f);
        quantized.step(1.f);

        float max_diff = 0.f;
        for (std::size_t i = 0; i < n; ++i) max_diff = std::max(max_diff, std::abs(p32[i] - p8[i]));
        if (step == 1) {
            // the first update uses unquantized moments
            REQUIRE(max_diff <= 1e-6f);
        }
        REQUIRE(max_diff <= 0.1f * lr * static_cast<float>(step));
    }
    REQUIRE(quantized.step_count() == steps);
    REQUIRE(quantized.num_parameters() == n);
    REQUIRE(quantized.state_bytes() == 2 * n + 2 * 3 * sizeof(float));

    auto v = quantized.second_moment(0);
    REQUIRE(v.size() == n);
    REQUIRE(std::all_of(v.begin(), v.end(), [](float x) { return x > 0.f; }));
}

TEST_CASE("optimizer type selects the implementation", "[training][optimizer][8bit]") {
    REQUIRE(optimizers::optimizer_type_from_str("paged_adamw_8bit") == optimizers::OptimizerType::ADAMW_8BIT);
    REQUIRE(optimizers::optimizer_type_from_str("adamw_8bit") == optimizers::OptimizerType::ADAMW_8BIT);
    REQUIRE(optimizers::to_string(optimizers::OptimizerType::ADAMW_8BIT) == "adamw_8bit");
    REQUIRE_THROWS_AS(optimizers::optimizer_type_from_str("sgd"), std::invalid_argument);

    std::vector<float> param = {1.f, -1.f};
    std::vector<float> grad = {0.5f, -2.f};
    auto cfg = optimizers::OptimizerConfig::adamw(0.1f, 0.9f, 0.999f, 1e-8f, 0.f, 0.f);
    cfg.type = optimizers::OptimizerType::ADAMW_8BIT;
    auto optimizer = optimizers::make_optimizer({{param.data(), grad.data(), param.size()}}, cfg);
    REQUIRE(dynamic_cast<optimizers::AdamW8Bit*>(optimizer.get()) != nullptr);
    optimizer->step(1.f);
    REQUIRE_THAT(param[0], WithinAbs(0.9f, 1e-5));
    REQUIRE_THAT(param[1], WithinAbs(-0.9f, 1e-5));

    Groups g;
    g.Head.grad()[0] = 1.f;
    GradientStepper stepper({&g.Head}, cfg, 1, false);
    REQUIRE(stepper.step().Applied);
    REQUIRE(stepper.step_count() == 1);
    REQUIRE(g.Head.data()[0] < 0.f);
}
