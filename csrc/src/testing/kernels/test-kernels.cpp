// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <limits>
#include <vector>

#include "kernels/kernels.h"
#include "utilities/dtype.h"
#include "../utilities/test_utils.h"

using Catch::Matchers::WithinAbs;

namespace {

std::vector<float> reference_matmul(const std::vector<float>& a, const std::vector<float>& b, int M, int N, int K,
                                    EMMTranspose mode) {
    const bool ta = mode == EMMTranspose::TN || mode == EMMTranspose::TT;
    const bool tb = mode == EMMTranspose::NT || mode == EMMTranspose::TT;
    std::vector<float> c(static_cast<std::size_t>(M) * N, 0.f);
    for (int i = 0; i < M; ++i) {
        for (int j = 0; j < N; ++j) {
            double acc = 0.0;
            for (int k = 0; k < K; ++k) {
                float av = ta ? a[k * M + i] : a[i * K + k];
                float bv = tb ? b[j * K + k] : b[k * N + j];
                acc += static_cast<double>(av) * bv;
            }
            c[i * N + j] = static_cast<float>(acc);
        }
    }
    return c;
}

} // namespace

TEST_CASE("matmul matches the reference in every transpose mode", "[kernels][matmul]") {
    const int M = 3, N = 4, K = 5;
    auto a = testing_utils::uniform_host(M * K, -1.f, 1.f, 1);
    auto b = testing_utils::uniform_host(K * N, -1.f, 1.f, 2);

    for (auto mode : {EMMTranspose::NN, EMMTranspose::NT, EMMTranspose::TN, EMMTranspose::TT}) {
        std::vector<float> c(M * N, 0.f);
        matmul(c.data(), a.data(), b.data(), nullptr, M, N, K, mode, false);
        auto expected = reference_matmul(a, b, M, N, K, mode);
        for (int i = 0; i < M * N; ++i) {
            REQUIRE_THAT(c[i], WithinAbs(expected[i], 1e-5));
        }
    }
}

TEST_CASE("matmul adds bias and accumulates", "[kernels][matmul]") {
    std::vector<float> a = {1.f, 2.f};          // [1, 2]
    std::vector<float> b = {1.f, 0.f, 0.f, 1.f}; // [2, 2] identity
    std::vector<float> bias = {0.5f, -0.5f};
    std::vector<float> c = {10.f, 10.f};

    matmul(c.data(), a.data(), b.data(), bias.data(), 1, 2, 2, EMMTranspose::NN, true);
    REQUIRE_THAT(c[0], WithinAbs(11.5f, 1e-6));
    REQUIRE_THAT(c[1], WithinAbs(11.5f, 1e-6));

    matmul(c.data(), a.data(), b.data(), nullptr, 1, 2, 2, EMMTranspose::NN, false);
    REQUIRE_THAT(c[0], WithinAbs(1.f, 1e-6));
    REQUIRE_THAT(c[1], WithinAbs(2.f, 1e-6));
}

TEST_CASE("matmul propagates non-finite values through zero operands", "[kernels][matmul]") {
    const float inf = std::numeric_limits<float>::infinity();
    std::vector<float> a = {0.f, 1.f};            // [1, 2]
    std::vector<float> b = {inf, 1.f, 2.f, 3.f};  // [2, 2], row 0 multiplies a zero
    std::vector<float> c(2, 0.f);

    matmul(c.data(), a.data(), b.data(), nullptr, 1, 2, 2, EMMTranspose::NN, false);
    // 0 * inf is NaN, and must reach the output
    REQUIRE(std::isnan(c[0]));
    REQUIRE_THAT(c[1], WithinAbs(3.f, 1e-6));
    REQUIRE_FALSE(all_finite(c.data(), 2));
}

TEST_CASE("masked softmax ignores hidden columns", "[kernels][softmax]") {
    std::vector<float> scores = {1.f, 2.f, 100.f, 0.f, 0.f, 0.f};
    std::vector<std::uint8_t> visible = {1, 1, 0, 0, 0, 0};
    std::vector<float> probs(6, -1.f);
    masked_softmax_forward(probs.data(), scores.data(), visible.data(), 2, 3);

    const float e = std::exp(1.f);
    REQUIRE_THAT(probs[0], WithinAbs(1.f / (1.f + e), 1e-6));
    REQUIRE_THAT(probs[1], WithinAbs(e / (1.f + e), 1e-6));
    REQUIRE(probs[2] == 0.f);
    // fully masked row
    REQUIRE(probs[3] == 0.f);
    REQUIRE(probs[4] == 0.f);
    REQUIRE(probs[5] == 0.f);
}

TEST_CASE("cross entropy forward and backward", "[kernels][loss]") {
    std::vector<float> logits = {2.f, 0.f, 0.f, 0.f};
    std::vector<int> targets = {0, 1};
    std::vector<float> losses(2);
    float mean = cross_entropy_forward(logits.data(), targets.data(), losses.data(), 2, 2);

    const float l0 = std::log(1.f + std::exp(-2.f));
    const float l1 = std::log(2.f);
    REQUIRE_THAT(losses[0], WithinAbs(l0, 1e-6));
    REQUIRE_THAT(losses[1], WithinAbs(l1, 1e-6));
    REQUIRE_THAT(mean, WithinAbs((l0 + l1) / 2.f, 1e-6));

    std::vector<float> dlogits(4);
    cross_entropy_backward(dlogits.data(), logits.data(), targets.data(), 1.f, 2, 2);
    // each row's gradient sums to zero; the target entry is negative
    REQUIRE_THAT(dlogits[0] + dlogits[1], WithinAbs(0.f, 1e-6));
    REQUIRE_THAT(dlogits[2] + dlogits[3], WithinAbs(0.f, 1e-6));
    REQUIRE(dlogits[0] < 0.f);
    REQUIRE_THAT(dlogits[3], WithinAbs(-0.25f, 1e-6));

    std::vector<int> bad = {0, 2};
    REQUIRE_THROWS_AS(cross_entropy_forward(logits.data(), bad.data(), nullptr, 2, 2), std::out_of_range);
}

TEST_CASE("gelu backward matches finite differences", "[kernels][gelu]") {
    std::vector<float> x = {-2.f, -0.5f, 0.f, 0.7f, 3.f};
    std::vector<float> ones(x.size(), 1.f);
    std::vector<float> grad(x.size());
    gelu_backward(grad.data(), x.data(), ones.data(), static_cast<long>(x.size()));

    const float eps = 1e-3f;
    for (std::size_t i = 0; i < x.size(); ++i) {
        float plus = x[i] + eps, minus = x[i] - eps;
        float fp, fm;
        gelu_forward(&fp, &plus, 1);
        gelu_forward(&fm, &minus, 1);
        REQUIRE_THAT(grad[i], WithinAbs((fp - fm) / (2 * eps), 1e-3));
    }
}

TEST_CASE("norm and finiteness helpers", "[kernels]") {
    std::vector<float> v = {3.f, 4.f};
    REQUIRE(global_norm_squared(v.data(), v.size()) == 25.0);
    REQUIRE(all_finite(v.data(), v.size()));
    v.push_back(std::numeric_limits<float>::quiet_NaN());
    REQUIRE_FALSE(all_finite(v.data(), v.size()));
    v.back() = std::numeric_limits<float>::infinity();
    REQUIRE_FALSE(all_finite(v.data(), v.size()));
}

TEST_CASE("round_inplace emulates reduced precision", "[kernels][dtype]") {
    std::vector<float> v = {1.0f + 1e-4f, 3.14159265f};
    auto fp32 = v;
    round_inplace(fp32.data(), fp32.size(), ETensorDType::FP32);
    REQUIRE(fp32 == v);

    auto bf16 = v;
    round_inplace(bf16.data(), bf16.size(), ETensorDType::BF16);
    REQUIRE(bf16[0] == 1.0f);
    REQUIRE_THAT(bf16[1], WithinAbs(3.140625f, 1e-6));

    auto fp16 = v;
    round_inplace(fp16.data(), fp16.size(), ETensorDType::FP16);
    REQUIRE(fp16[0] == 1.0f);
    REQUIRE_THAT(fp16[1], WithinAbs(3.140625f, 1e-6));
}
