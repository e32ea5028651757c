// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_DATA_TOKENIZER_H
#define HALO_SRC_DATA_TOKENIZER_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct PretrainedConfig;

constexpr std::int32_t IGNORE_LABEL = -100;

//! Tokens and labels of one prompt + response sequence; prompt positions are labelled IGNORE_LABEL.
struct TokenizedSequence {
    std::vector<std::int32_t> Tokens;
    std::vector<std::int32_t> Labels;
    int PromptLength = 0;
};

/**
 * @brief Byte-level tokenizer: every byte is its own token, plus PAD and EOS.
 */
class ByteTokenizer {
public:
    ByteTokenizer(std::int32_t pad_id, std::int32_t eos_id);
    explicit ByteTokenizer(const PretrainedConfig& config);

    [[nodiscard]] std::vector<std::int32_t> encode(std::string_view text) const;
    //! Decodes byte tokens; stops at the first EOS and skips PAD.
    [[nodiscard]] std::string decode(std::span<const std::int32_t> tokens) const;

    [[nodiscard]] std::int32_t pad_id() const { return mPadId; }
    [[nodiscard]] std::int32_t eos_id() const { return mEosId; }

private:
    std::int32_t mPadId;
    std::int32_t mEosId;
};

/**
 * @brief Builds a training sequence from already formatted prompt and response tokens.
 *
 * The prompt is truncated from the left to `max_prompt_length`, then the combined
 * sequence is truncated from the right to `max_length`.
 */
TokenizedSequence build_sequence(std::span<const std::int32_t> prompt, std::span<const std::int32_t> response,
                                 int max_length, int max_prompt_length);

#endif //HALO_SRC_DATA_TOKENIZER_H
