// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "kernels.h"

#include <cmath>
#include <limits>
#include <stdexcept>

#include <fmt/core.h>

#include "utilities/dtype.h"
#include "utilities/tensor.h"

namespace {

using ConstRowVectorMap = Eigen::Map<const Eigen::RowVectorXf>;

template<typename LHS, typename RHS>
void gemm(MatrixMap& c, const LHS& a, const RHS& b, bool accumulate) {
    if (accumulate) {
        c.noalias() += a * b;
    } else {
        c.noalias() = a * b;
    }
}

} // namespace

/**
 * @brief Row-major matrix multiplication on the host, dispatched to Eigen's GEMM.
 *
 * Computes c = op(a) @ op(b) + bias, or adds that product into c when @p accumulate is set.
 * Transposed operands are mapped with their stored shape and transposed as expressions, so no
 * copies are made.
 *
 * @param c Output [M, N].
 * @param a Left operand, [M, K] or [K, M] depending on @p mode.
 * @param b Right operand, [K, N] or [N, K] depending on @p mode.
 * @param bias Optional [N] bias added to every row; may be nullptr.
 */
void matmul(float* c, const float* a, const float* b, const float* bias,
            int M, int N, int K, EMMTranspose mode, bool accumulate) {
    if (M < 0 || N < 0 || K < 0) {
        throw std::invalid_argument(fmt::format("matmul: negative dimension M={} N={} K={}", M, N, K));
    }

    MatrixMap out(c, M, N);
    switch (mode) {
        case EMMTranspose::NN:
            gemm(out, ConstMatrixMap(a, M, K), ConstMatrixMap(b, K, N), accumulate);
            break;
        case EMMTranspose::TN:
            gemm(out, ConstMatrixMap(a, K, M).transpose(), ConstMatrixMap(b, K, N), accumulate);
            break;
        case EMMTranspose::NT:
            gemm(out, ConstMatrixMap(a, M, K), ConstMatrixMap(b, N, K).transpose(), accumulate);
            break;
        case EMMTranspose::TT:
            gemm(out, ConstMatrixMap(a, K, M).transpose(), ConstMatrixMap(b, N, K).transpose(), accumulate);
            break;
    }
    if (bias) {
        out.rowwise() += ConstRowVectorMap(bias, N);
    }
}

void matmul(Tensor& c, const Tensor& a, const Tensor& b, std::optional<Tensor> bias,
            int M, int N, int K, EMMTranspose mode, bool accumulate) {
    if (c.nelem() != static_cast<std::size_t>(M) * N || a.nelem() != static_cast<std::size_t>(M) * K ||
        b.nelem() != static_cast<std::size_t>(K) * N) {
        throw std::logic_error(fmt::format("matmul: tensor sizes do not match M={} N={} K={}", M, N, K));
    }
    matmul(c.get<float>(), a.get<float>(), b.get<float>(), bias ? bias->get<float>() : nullptr,
           M, N, K, mode, accumulate);
}

void bias_backward(float* dbias, const float* dout, int M, int N) {
    Eigen::Map<Eigen::RowVectorXf>(dbias, N) += ConstMatrixMap(dout, M, N).colwise().sum();
}

// exact (erf) formulation
void gelu_forward(float* out, const float* inp, long n) {
    constexpr float inv_sqrt2 = 0.70710678118654752f;
    ConstArrayMap x(inp, n);
    ArrayMap(out, n) = 0.5f * x * (1.f + x.unaryExpr([](float v) { return std::erf(v * inv_sqrt2); }));
}

void gelu_backward(float* dinp, const float* inp, const float* dout, long n) {
    constexpr float inv_sqrt2 = 0.70710678118654752f;
    constexpr float inv_sqrt2pi = 0.39894228040143268f;
    ConstArrayMap x(inp, n);
    Eigen::ArrayXf cdf = 0.5f * (1.f + x.unaryExpr([](float v) { return std::erf(v * inv_sqrt2); }));
    Eigen::ArrayXf pdf = inv_sqrt2pi * (-0.5f * x.square()).exp();
    ArrayMap(dinp, n) = ConstArrayMap(dout, n) * (cdf + x * pdf);
}

void tanh_forward(float* out, const float* inp, long n) {
    ArrayMap(out, n) = ConstArrayMap(inp, n).tanh();
}

void masked_softmax_forward(float* probs, const float* scores, const std::uint8_t* visible, int rows, int cols) {
    constexpr float neg_inf = -std::numeric_limits<float>::infinity();
    using MaskMap = Eigen::Map<const Eigen::Matrix<std::uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>;
    ConstMatrixMap s(scores, rows, cols);
    MaskMap vis(visible, rows, cols);
    MatrixMap p(probs, rows, cols);

    if (cols == 0) return;
    for (int r = 0; r < rows; ++r) {
        Eigen::Array<bool, 1, Eigen::Dynamic> keep = vis.row(r).array().cast<bool>();
        const float max_val = keep.select(s.row(r).array(), neg_inf).maxCoeff();
        if (max_val == neg_inf) {
            p.row(r).setZero();
            continue;
        }
        p.row(r) = keep.select((s.row(r).array() - max_val).exp(), 0.f).matrix();
        p.row(r) /= p.row(r).sum();
    }
}

void softmax_backward(float* dscores, const float* probs, const float* dprobs, int rows, int cols, float scale) {
    ConstMatrixMap p(probs, rows, cols);
    ConstMatrixMap dp(dprobs, rows, cols);
    Eigen::VectorXf dot = p.cwiseProduct(dp).rowwise().sum();
    MatrixMap(dscores, rows, cols) = scale * (p.array() * (dp.colwise() - dot).array()).matrix();
}

//! Row-wise log-sum-exp of `logits[B, V]`.
static Eigen::VectorXf row_logsumexp(const ConstMatrixMap& logits) {
    Eigen::VectorXf max_val = logits.rowwise().maxCoeff();
    Eigen::VectorXf sums = (logits.colwise() - max_val).array().exp().rowwise().sum();
    return (max_val.array() + sums.array().log()).matrix();
}

static void check_targets(const int* targets, int B, int V) {
    for (int b = 0; b < B; ++b) {
        if (targets[b] < 0 || targets[b] >= V) {
            throw std::out_of_range(fmt::format("cross_entropy: target {} out of range [0, {})", targets[b], V));
        }
    }
}

float cross_entropy_forward(const float* logits, const int* targets, float* losses, int B, int V) {
    if (B == 0) return 0.f;
    check_targets(targets, B, V);
    ConstMatrixMap l(logits, B, V);
    Eigen::VectorXf row_loss = row_logsumexp(l);
    for (int b = 0; b < B; ++b) {
        row_loss[b] -= l(b, targets[b]);
    }
    if (losses) {
        Eigen::Map<Eigen::VectorXf>(losses, B) = row_loss;
    }
    return static_cast<float>(row_loss.cast<double>().sum() / B);
}

void cross_entropy_backward(float* dlogits, const float* logits, const int* targets, float dloss, int B, int V) {
    if (B == 0) return;
    check_targets(targets, B, V);
    ConstMatrixMap l(logits, B, V);
    MatrixMap d(dlogits, B, V);
    d = (l.colwise() - row_logsumexp(l)).array().exp().matrix();
    for (int b = 0; b < B; ++b) {
        d(b, targets[b]) -= 1.f;
    }
    d *= dloss / static_cast<float>(B);
}

double global_norm_squared(const float* values, std::size_t count) {
    return ConstArrayMap(values, static_cast<Eigen::Index>(count)).cast<double>().square().sum();
}

bool all_finite(const float* values, std::size_t count) {
    return ConstArrayMap(values, static_cast<Eigen::Index>(count)).isFinite().all();
}

void add_inplace(float* dst, const float* src, long n) {
    ArrayMap(dst, n) += ConstArrayMap(src, n);
}

void scale_inplace(float* dst, float factor, long n) {
    ArrayMap(dst, n) *= factor;
}

void round_inplace(float* data, std::size_t count, ETensorDType dtype) {
    if (dtype == ETensorDType::FP32) return;
    ArrayMap values(data, static_cast<Eigen::Index>(count));
    values = values.unaryExpr([dtype](float v) { return round_to_dtype(v, dtype); });
}

void round_inplace(Tensor& data, ETensorDType dtype) {
    round_inplace(data.get<float>(), data.nelem(), dtype);
}
