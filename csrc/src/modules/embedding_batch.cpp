// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/embedding_batch.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

#include "utilities/utils.h"

namespace modules {

MergedLines merge_lines(const std::vector<std::vector<std::string>>& sequences) {
    MergedLines merged;
    merged.StartPositions.reserve(sequences.size());
    for (const auto& seq : sequences) {
        merged.StartPositions.push_back(narrow<int>(merged.Lines.size()));
        merged.Lines.insert(merged.Lines.end(), seq.begin(), seq.end());
    }
    return merged;
}

/**
 * @brief Stack variable-length embedding sequences into one left-padded batch.
 *
 * @param sequences Per-sample buffers of (length, hidden) floats; each length must be positive.
 * @param hidden Embedding width.
 * @return Batch with T equal to the longest sequence. Row `b` holds its sequence in the last
 *         `Lengths[b]` columns.
 */
PaddedBatch stack_and_pad_left(const std::vector<std::vector<float>>& sequences, int hidden) {
    if (hidden <= 0) {
        throw std::invalid_argument(fmt::format("stack_and_pad_left: hidden size must be positive, got {}", hidden));
    }

    PaddedBatch batch;
    batch.B = narrow<int>(sequences.size());
    batch.H = hidden;
    batch.Lengths.reserve(sequences.size());
    for (const auto& seq : sequences) {
        if (seq.empty() || seq.size() % hidden != 0) {
            throw std::invalid_argument(fmt::format("stack_and_pad_left: sequence of {} floats is not a non-empty multiple of {}",
                                                    seq.size(), hidden));
        }
        batch.Lengths.push_back(narrow<int>(seq.size() / hidden));
        batch.T = std::max(batch.T, batch.Lengths.back());
    }

    batch.Embeds.assign(static_cast<std::size_t>(batch.B) * batch.T * hidden, 0.f);
    batch.Mask.assign(static_cast<std::size_t>(batch.B) * batch.T, 0);
    for (int b = 0; b < batch.B; ++b) {
        const int pad = batch.T - batch.Lengths[b];
        const long row = static_cast<long>(b) * batch.T;
        std::copy(sequences[b].begin(), sequences[b].end(), batch.Embeds.begin() + (row + pad) * hidden);
        std::fill(batch.Mask.begin() + row + pad, batch.Mask.begin() + row + batch.T, 1);
    }
    return batch;
}

int last_valid_position(const std::uint8_t* mask_row, int T) {
    int first_valid = -1;
    int count = 0;
    for (int t = 0; t < T; ++t) {
        if (mask_row[t]) {
            if (first_valid < 0) first_valid = t;
            ++count;
        }
    }
    if (count == 0) {
        throw std::logic_error("last_valid_position: mask row has no valid position");
    }
    return first_valid + count - 1;
}

} // namespace modules
