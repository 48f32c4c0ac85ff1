// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_DATASET_H
#define LOGSENTINEL_SRC_TRAINING_DATASET_H

#include <cstddef>
#include <string>
#include <vector>

using LogSequence = std::vector<std::string>;

inline constexpr const char* NORMAL_LABEL = "normal";
inline constexpr const char* ANOMALOUS_LABEL = "anomalous";

//! "anomalous" is class 1, every other label is class 0.
int label_to_class(const std::string& label);

struct LogSample {
    LogSequence Lines;
    std::string Label;
};

//! A batch as handed to the model: parallel sequences and labels.
struct LogBatch {
    std::vector<LogSequence> Sequences;
    std::vector<std::string> Labels;
};

/**
 * @brief Ordered collection of labelled log-line sequences.
 *
 * Keeps the class partition so that the sampler can oversample the minority class.
 */
class LogDataset {
public:
    LogDataset() = default;
    explicit LogDataset(std::vector<LogSample> samples);

    void add(LogSample sample);

    [[nodiscard]] std::size_t size() const { return mSamples.size(); }
    [[nodiscard]] bool empty() const { return mSamples.empty(); }
    [[nodiscard]] const LogSample& at(std::size_t index) const;

    //! Samples at `indices`, in order. Indices may repeat.
    [[nodiscard]] LogBatch get_batch(const std::vector<long>& indices) const;
    //! Samples `[begin, end)`.
    [[nodiscard]] LogBatch get_range(std::size_t begin, std::size_t end) const;

    [[nodiscard]] std::vector<int> all_classes() const;
    [[nodiscard]] std::size_t count_class(int cls) const;

    //! The class with fewer samples; ties pick anomalous.
    [[nodiscard]] int minority_class() const;
    [[nodiscard]] std::vector<long> class_indices(int cls) const;
    [[nodiscard]] std::size_t num_minority() const { return count_class(minority_class()); }
    [[nodiscard]] std::size_t num_majority() const { return size() - num_minority(); }

private:
    std::vector<LogSample> mSamples;
};

#endif //LOGSENTINEL_SRC_TRAINING_DATASET_H
