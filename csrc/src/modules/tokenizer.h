// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_MODULES_TOKENIZER_H
#define LOGSENTINEL_SRC_MODULES_TOKENIZER_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace modules {

//! A batch of token ids padded on the right to a common length.
struct TokenizedBatch {
    std::vector<std::int32_t> InputIds;     ///< (Rows, Length)
    std::vector<std::uint8_t> AttentionMask; ///< (Rows, Length), 1 for real tokens
    int Rows = 0;
    int Length = 0;
};

class ITokenizer {
public:
    virtual ~ITokenizer() = default;

    [[nodiscard]] virtual int vocab_size() const = 0;
    //! Token ids of `text` without special tokens.
    [[nodiscard]] virtual std::vector<std::int32_t> tokenize(std::string_view text) const = 0;
    //! `[CLS] tokens [SEP]` per row, truncated to `max_length` and padded to the longest row.
    [[nodiscard]] virtual TokenizedBatch encode_batch(const std::vector<std::string>& texts, int max_length) const = 0;
    //! `[BOS] tokens`, as used for decoder prompts.
    [[nodiscard]] virtual std::vector<std::int32_t> encode_prompt(std::string_view text) const = 0;
};

/**
 * @brief Vocabulary-free tokenizer hashing word pieces into a fixed id range.
 *
 * Text is split into runs of alphanumeric characters; every other non-whitespace character
 * becomes a token of its own. Tokens are mapped with 64-bit FNV-1a into
 * `[NUM_SPECIAL_TOKENS, vocab_size)`.
 */
class HashingTokenizer final : public ITokenizer {
public:
    static constexpr std::int32_t PAD_TOKEN = 0;
    static constexpr std::int32_t UNK_TOKEN = 1;
    static constexpr std::int32_t CLS_TOKEN = 2;
    static constexpr std::int32_t BOS_TOKEN = 2;
    static constexpr std::int32_t SEP_TOKEN = 3;
    static constexpr int NUM_SPECIAL_TOKENS = 4;

    HashingTokenizer(int vocab_size, bool lowercase);

    [[nodiscard]] int vocab_size() const override { return mVocabSize; }
    [[nodiscard]] std::vector<std::int32_t> tokenize(std::string_view text) const override;
    [[nodiscard]] TokenizedBatch encode_batch(const std::vector<std::string>& texts, int max_length) const override;
    [[nodiscard]] std::vector<std::int32_t> encode_prompt(std::string_view text) const override;

    [[nodiscard]] std::int32_t token_id(std::string_view piece) const;

private:
    int mVocabSize;
    bool mLowercase;
};

std::uint64_t fnv1a_hash(std::string_view data);

} // namespace modules

#endif //LOGSENTINEL_SRC_MODULES_TOKENIZER_H
