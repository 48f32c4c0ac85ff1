// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_MODULES_EMBEDDING_BATCH_H
#define LOGSENTINEL_SRC_MODULES_EMBEDDING_BATCH_H

#include <cstdint>
#include <string>
#include <vector>

namespace modules {

//! All log lines of a batch in one list. Sample `i` owns lines `[StartPositions[i], StartPositions[i+1])`.
struct MergedLines {
    std::vector<std::string> Lines;
    std::vector<int> StartPositions;

    [[nodiscard]] int sample_begin(int sample) const { return StartPositions.at(sample); }
    [[nodiscard]] int sample_end(int sample) const {
        return sample + 1 < static_cast<int>(StartPositions.size()) ? StartPositions.at(sample + 1)
                                                                     : static_cast<int>(Lines.size());
    }
};

MergedLines merge_lines(const std::vector<std::vector<std::string>>& sequences);

//! Left-padded batch of embedding sequences.
struct PaddedBatch {
    std::vector<float> Embeds;          ///< (B, T, H), zeros at padded positions
    std::vector<std::uint8_t> Mask;     ///< (B, T), 1 at valid positions
    std::vector<int> Lengths;           ///< valid length per row
    int B = 0;
    int T = 0;
    int H = 0;
};

//! Each sequence is a flat (length, hidden) row-major buffer.
PaddedBatch stack_and_pad_left(const std::vector<std::vector<float>>& sequences, int hidden);

/**
 * @brief Column of the last valid token in a mask row.
 *
 * Counts `sum(mask) - 1` from the first valid column, which addresses the final column of a
 * left-padded row and the last valid token of a right-padded one.
 *
 * @throws std::logic_error if the row has no valid position.
 */
int last_valid_position(const std::uint8_t* mask_row, int T);

} // namespace modules

#endif //LOGSENTINEL_SRC_MODULES_EMBEDDING_BATCH_H
