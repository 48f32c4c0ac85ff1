// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_KERNELS_KERNELS_H
#define LOGSENTINEL_SRC_KERNELS_KERNELS_H

#include <cstddef>
#include <cstdint>
#include <optional>

#include <Eigen/Dense>

struct Tensor;
enum class ETensorDType: int;

//! Row-major views over host buffers. Every kernel below works on these.
using RowMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MatrixMap = Eigen::Map<RowMatrix>;
using ConstMatrixMap = Eigen::Map<const RowMatrix>;
using ArrayMap = Eigen::Map<Eigen::ArrayXf>;
using ConstArrayMap = Eigen::Map<const Eigen::ArrayXf>;

//! Transpose flags for matmul, first letter for `a`, second for `b`.
//! All matrices are row-major. With N, `a` is [M, K] and `b` is [K, N];
//! with T, `a` is stored as [K, M] and `b` as [N, K].
enum class EMMTranspose { TT, TN, NT, NN };

// c[M, N] (+)= op(a) @ op(b) (+ bias[N])
void matmul(float* c, const float* a, const float* b, const float* bias,
            int M, int N, int K, EMMTranspose mode, bool accumulate);
void matmul(Tensor& c, const Tensor& a, const Tensor& b, std::optional<Tensor> bias,
            int M, int N, int K, EMMTranspose mode, bool accumulate);

//! dbias[N] += sum over rows of dout[M, N]
void bias_backward(float* dbias, const float* dout, int M, int N);

void gelu_forward(float* out, const float* inp, long n);
void gelu_backward(float* dinp, const float* inp, const float* dout, long n);

void tanh_forward(float* out, const float* inp, long n);

//! Row-wise softmax of `scores[rows, cols]` restricted to positions where `visible` is non-zero.
//! A row without any visible position produces all zeros.
void masked_softmax_forward(float* probs, const float* scores, const std::uint8_t* visible, int rows, int cols);
//! dscores = scale * probs * (dprobs - sum_j(probs * dprobs))
void softmax_backward(float* dscores, const float* probs, const float* dprobs, int rows, int cols, float scale);

//! Mean cross entropy over `B` rows of `logits[B, V]`. Per-row losses go to `losses` when given.
float cross_entropy_forward(const float* logits, const int* targets, float* losses, int B, int V);
//! dlogits = dloss * (softmax(logits) - onehot(targets)) / B
void cross_entropy_backward(float* dlogits, const float* logits, const int* targets, float dloss, int B, int V);

double global_norm_squared(const float* values, std::size_t count);
bool all_finite(const float* values, std::size_t count);

void add_inplace(float* dst, const float* src, long n);
void scale_inplace(float* dst, float factor, long n);

//! Round every element to the nearest value representable in `dtype`. Identity for FP32.
void round_inplace(float* data, std::size_t count, ETensorDType dtype);
void round_inplace(Tensor& data, ETensorDType dtype);

#endif //LOGSENTINEL_SRC_KERNELS_KERNELS_H
