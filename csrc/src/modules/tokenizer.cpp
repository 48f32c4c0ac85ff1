// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/tokenizer.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <fmt/core.h>

namespace modules {

std::uint64_t fnv1a_hash(std::string_view data) {
    std::uint64_t hash = 14695981039346656037ull;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ull;
    }
    return hash;
}

HashingTokenizer::HashingTokenizer(int vocab_size, bool lowercase) :
    mVocabSize(vocab_size), mLowercase(lowercase) {
    if (vocab_size <= NUM_SPECIAL_TOKENS) {
        throw std::invalid_argument(fmt::format("HashingTokenizer: vocabulary size {} leaves no room for regular tokens", vocab_size));
    }
}

std::int32_t HashingTokenizer::token_id(std::string_view piece) const {
    if (piece.empty()) return UNK_TOKEN;
    const auto range = static_cast<std::uint64_t>(mVocabSize - NUM_SPECIAL_TOKENS);
    return NUM_SPECIAL_TOKENS + static_cast<std::int32_t>(fnv1a_hash(piece) % range);
}

std::vector<std::int32_t> HashingTokenizer::tokenize(std::string_view text) const {
    std::vector<std::int32_t> ids;
    std::string word;
    auto flush = [&]() {
        if (!word.empty()) {
            ids.push_back(token_id(word));
            word.clear();
        }
    };

    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            flush();
        } else if (std::isalnum(c) || c >= 0x80) {
            word.push_back(mLowercase ? static_cast<char>(std::tolower(c)) : ch);
        } else {
            flush();
            ids.push_back(token_id(std::string_view(&ch, 1)));
        }
    }
    flush();
    return ids;
}

/**
 * @brief Tokenize a batch of texts to `[CLS] tokens [SEP]` rows.
 *
 * Rows longer than @p max_length are truncated, keeping the leading tokens and the final
 * `[SEP]`. All rows are padded with PAD to the length of the longest row.
 *
 * @param texts Input texts, one row each.
 * @param max_length Maximum row length including special tokens; must be at least 2.
 */
TokenizedBatch HashingTokenizer::encode_batch(const std::vector<std::string>& texts, int max_length) const {
    if (max_length < 2) {
        throw std::invalid_argument(fmt::format("HashingTokenizer: max_length must be at least 2, got {}", max_length));
    }

    std::vector<std::vector<std::int32_t>> rows;
    rows.reserve(texts.size());
    int longest = 0;
    for (const auto& text : texts) {
        auto ids = tokenize(text);
        if (static_cast<int>(ids.size()) > max_length - 2) {
            ids.resize(max_length - 2);
        }
        std::vector<std::int32_t> row;
        row.reserve(ids.size() + 2);
        row.push_back(CLS_TOKEN);
        row.insert(row.end(), ids.begin(), ids.end());
        row.push_back(SEP_TOKEN);
        longest = std::max(longest, static_cast<int>(row.size()));
        rows.push_back(std::move(row));
    }

    TokenizedBatch batch;
    batch.Rows = static_cast<int>(rows.size());
    batch.Length = longest;
    batch.InputIds.assign(static_cast<std::size_t>(batch.Rows) * longest, PAD_TOKEN);
    batch.AttentionMask.assign(static_cast<std::size_t>(batch.Rows) * longest, 0);
    for (int r = 0; r < batch.Rows; ++r) {
        const auto& row = rows[r];
        std::copy(row.begin(), row.end(), batch.InputIds.begin() + static_cast<long>(r) * longest);
        std::fill_n(batch.AttentionMask.begin() + static_cast<long>(r) * longest, row.size(), 1);
    }
    return batch;
}

std::vector<std::int32_t> HashingTokenizer::encode_prompt(std::string_view text) const {
    std::vector<std::int32_t> ids{BOS_TOKEN};
    auto tokens = tokenize(text);
    ids.insert(ids.end(), tokens.begin(), tokens.end());
    return ids;
}

} // namespace modules
