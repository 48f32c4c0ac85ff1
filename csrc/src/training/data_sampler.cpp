// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "training/data_sampler.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include <fmt/core.h>

#include "config/hyperparameters.h"
#include "training/dataset.h"

DataSampler::DataSampler(std::uint64_t seed) : mRng(seed) {
}

/**
 * @brief Minority samples needed to lift the minority fraction to @p portion.
 *
 * Computes `floor(portion * majority / (1 - portion)) - minority`. Oversampling only happens
 * when the minority class is present and its fraction is below @p portion.
 */
long DataSampler::oversample_count(std::size_t num_minority, std::size_t num_majority, float portion) {
    if (portion <= 0.f || num_minority == 0) return 0;
    if (portion >= 1.f) {
        throw std::invalid_argument(fmt::format("min_less_portion must be below 1, got {}", portion));
    }
    const double total = static_cast<double>(num_minority + num_majority);
    if (static_cast<double>(num_minority) / total >= portion) return 0;

    const double p = portion;
    long target = static_cast<long>(p * static_cast<double>(num_majority) / (1.0 - p));
    return std::max(0L, target - static_cast<long>(num_minority));
}

std::vector<long> DataSampler::build_index_set(const LogDataset& dataset, float min_less_portion, long* added) {
    std::vector<long> indices(dataset.size());
    std::iota(indices.begin(), indices.end(), 0L);

    long add_num = oversample_count(dataset.num_minority(), dataset.num_majority(), min_less_portion);
    if (add_num > 0) {
        auto minority = dataset.class_indices(dataset.minority_class());
        std::uniform_int_distribution<std::size_t> pick(0, minority.size() - 1);
        indices.reserve(indices.size() + add_num);
        for (long i = 0; i < add_num; ++i) {
            indices.push_back(minority[pick(mRng)]);
        }
    }
    if (added) *added = add_num;
    return indices;
}

void DataSampler::shuffle(std::vector<long>& indices) {
    std::shuffle(indices.begin(), indices.end(), mRng);
}

long DataSampler::total_training_steps(const Hyperparameters& hp, std::size_t index_count) {
    if (hp.MicroBatchSize <= 0) {
        throw std::invalid_argument(fmt::format("micro_batch_size must be positive, got {}", hp.MicroBatchSize));
    }
    const long batches_per_epoch = static_cast<long>(index_count) / hp.MicroBatchSize;
    long total = 0;
    for (const auto& phase : hp.Phases) {
        total += static_cast<long>(std::max(phase.Epochs, 0)) * batches_per_epoch;
    }
    return total;
}
