// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_CONFIG_PRETRAINED_CONFIG_H
#define HALO_SRC_CONFIG_PRETRAINED_CONFIG_H

#include <string>
#include <string_view>

#include "utilities/dtype.h"

/**
 * @brief Architecture of the causal language model, as stored in `config.json` next to its weights.
 *
 * The model embeds the current token, applies one tanh hidden layer and projects back to
 * the vocabulary to predict the next token.
 */
struct PretrainedConfig {
    std::string ModelTypeName = "halo-causal-lm";

    // Token IDs (byte-level vocabulary: 0..255 are bytes)
    int PadTokenId = 256;
    int EosTokenId = 257;

    // Model dimensions
    int VocabSize = 258;
    int HiddenSize = 64;

    //! standard deviation of the initial weights of a freshly created model
    float InitStd = 0.02f;

    // Compute data type
    ETensorDType DType = ETensorDType::FP32;

    //! Number of trainable elements, summed over all parameter tensors.
    [[nodiscard]] long num_parameters() const {
        long v = VocabSize;
        long h = HiddenSize;
        return v * h + h * h + h + v * h + v;
    }
};

PretrainedConfig load_pretrained_config(const char* file_name, ETensorDType dtype);
void save_pretrained_config(const PretrainedConfig& config, const char* file_name);
//! Built-in sizes ("halo-tiny", "halo-small", "halo-base") for runs without a config.json.
PretrainedConfig create_pretrained_config_from_name(std::string_view name, ETensorDType dtype);

#endif // HALO_SRC_CONFIG_PRETRAINED_CONFIG_H
