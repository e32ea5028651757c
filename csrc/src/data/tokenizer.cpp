// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "tokenizer.h"

#include <algorithm>

#include "config/pretrained_config.h"

ByteTokenizer::ByteTokenizer(std::int32_t pad_id, std::int32_t eos_id) : mPadId(pad_id), mEosId(eos_id) {
}

ByteTokenizer::ByteTokenizer(const PretrainedConfig& config) : ByteTokenizer(config.PadTokenId, config.EosTokenId) {
}

std::vector<std::int32_t> ByteTokenizer::encode(std::string_view text) const {
    std::vector<std::int32_t> tokens(text.size());
    std::transform(text.begin(), text.end(), tokens.begin(),
                   [](char c) { return static_cast<std::int32_t>(static_cast<unsigned char>(c)); });
    return tokens;
}

std::string ByteTokenizer::decode(std::span<const std::int32_t> tokens) const {
    std::string text;
    for (std::int32_t t : tokens) {
        if (t == mEosId) break;
        if (t >= 0 && t < 256) {
            text.push_back(static_cast<char>(t));
        }
    }
    return text;
}

TokenizedSequence build_sequence(std::span<const std::int32_t> prompt, std::span<const std::int32_t> response,
                                 int max_length, int max_prompt_length) {
    if (prompt.size() > static_cast<std::size_t>(max_prompt_length)) {
        prompt = prompt.subspan(prompt.size() - max_prompt_length);
    }

    TokenizedSequence seq;
    seq.PromptLength = static_cast<int>(prompt.size());
    seq.Tokens.reserve(prompt.size() + response.size());
    seq.Tokens.insert(seq.Tokens.end(), prompt.begin(), prompt.end());
    seq.Tokens.insert(seq.Tokens.end(), response.begin(), response.end());
    seq.Labels.assign(seq.Tokens.size(), IGNORE_LABEL);
    std::copy(seq.Tokens.begin() + seq.PromptLength, seq.Tokens.end(), seq.Labels.begin() + seq.PromptLength);

    if (seq.Tokens.size() > static_cast<std::size_t>(max_length)) {
        seq.Tokens.resize(max_length);
        seq.Labels.resize(max_length);
    }
    return seq;
}
