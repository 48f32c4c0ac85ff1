// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_DATA_SAMPLER_H
#define LOGSENTINEL_SRC_TRAINING_DATA_SAMPLER_H

#include <cstdint>
#include <random>
#include <vector>

class LogDataset;
struct Hyperparameters;

/**
 * @brief Produces the training index order.
 *
 * The index set is built once per run (all samples, plus minority samples drawn with
 * replacement when the minority fraction is too small) and shuffled at every epoch.
 * All randomness comes from one seeded generator so runs are reproducible.
 */
class DataSampler {
public:
    explicit DataSampler(std::uint64_t seed);

    //! Number of minority indices to add so the minority fraction reaches `portion`; 0 if none.
    static long oversample_count(std::size_t num_minority, std::size_t num_majority, float portion);

    //! `[0, size)` followed by the oversampled minority indices. `added` receives their count.
    std::vector<long> build_index_set(const LogDataset& dataset, float min_less_portion, long* added = nullptr);

    void shuffle(std::vector<long>& indices);

    //! Sum over phases of `epochs * floor(index_count / micro_batch_size)`.
    static long total_training_steps(const Hyperparameters& hp, std::size_t index_count);

private:
    std::mt19937_64 mRng;
};

#endif //LOGSENTINEL_SRC_TRAINING_DATA_SAMPLER_H
