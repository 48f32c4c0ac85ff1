// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "training/dataset.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

int label_to_class(const std::string& label) {
    return label == ANOMALOUS_LABEL ? 1 : 0;
}

LogDataset::LogDataset(std::vector<LogSample> samples) : mSamples(std::move(samples)) {
}

void LogDataset::add(LogSample sample) {
    mSamples.push_back(std::move(sample));
}

const LogSample& LogDataset::at(std::size_t index) const {
    if (index >= mSamples.size()) {
        throw std::out_of_range(fmt::format("LogDataset: index {} out of range for {} samples", index, mSamples.size()));
    }
    return mSamples[index];
}

LogBatch LogDataset::get_batch(const std::vector<long>& indices) const {
    LogBatch batch;
    batch.Sequences.reserve(indices.size());
    batch.Labels.reserve(indices.size());
    for (long idx : indices) {
        if (idx < 0) {
            throw std::out_of_range(fmt::format("LogDataset: negative index {}", idx));
        }
        const auto& sample = at(static_cast<std::size_t>(idx));
        batch.Sequences.push_back(sample.Lines);
        batch.Labels.push_back(sample.Label);
    }
    return batch;
}

LogBatch LogDataset::get_range(std::size_t begin, std::size_t end) const {
    end = std::min(end, mSamples.size());
    LogBatch batch;
    for (std::size_t i = begin; i < end; ++i) {
        batch.Sequences.push_back(mSamples[i].Lines);
        batch.Labels.push_back(mSamples[i].Label);
    }
    return batch;
}

std::vector<int> LogDataset::all_classes() const {
    std::vector<int> classes;
    classes.reserve(mSamples.size());
    for (const auto& sample : mSamples) {
        classes.push_back(label_to_class(sample.Label));
    }
    return classes;
}

std::size_t LogDataset::count_class(int cls) const {
    return std::count_if(mSamples.begin(), mSamples.end(),
                         [cls](const LogSample& s) { return label_to_class(s.Label) == cls; });
}

int LogDataset::minority_class() const {
    return count_class(1) <= count_class(0) ? 1 : 0;
}

std::vector<long> LogDataset::class_indices(int cls) const {
    std::vector<long> indices;
    for (std::size_t i = 0; i < mSamples.size(); ++i) {
        if (label_to_class(mSamples[i].Label) == cls) {
            indices.push_back(static_cast<long>(i));
        }
    }
    return indices;
}
