// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "config/pretrained_config.h"

class Philox4x32;

namespace models {

//! Name, shape and position of one parameter tensor inside the flat parameter vector.
struct ParameterEntry {
    std::string Name;
    std::vector<long> Shape;
    long Offset = 0;
    long NumElements = 0;
};

/**
 * @brief Flat layout of the causal LM parameters.
 *
 * Order: `embed [V, H]`, `hidden_w [H, H]`, `hidden_b [H]`, `out_w [V, H]`, `out_b [V]`.
 */
std::vector<ParameterEntry> parameter_layout(const PretrainedConfig& config);

//! Hidden activations of the positions that contribute to the log-probability, in position order.
struct ActivationCache {
    std::vector<float> Hidden;
};

/**
 * @brief Per-row log-probabilities of the labelled tokens.
 *
 * Token `t >= 1` with `labels[t] != -100` contributes `log p(labels[t] | ids[t-1])`.
 * `params` points at the full (gathered) flat parameter vector in the compute dtype.
 *
 * @param cache If not null, receives the hidden activations needed by the backward pass.
 */
template<typename floatX>
std::vector<float> sequence_logps(const PretrainedConfig& config, const floatX* params,
                                  std::span<const std::int32_t> ids, std::span<const std::int32_t> labels,
                                  int rows, int seq_len, ActivationCache* cache);

/**
 * @brief Accumulates `sum_r dlogps[r] * d logp_r / d params` into `grads` (FP32, full flat layout).
 *
 * If `cache` is null, the hidden activations are recomputed.
 */
template<typename floatX>
void sequence_logps_backward(const PretrainedConfig& config, const floatX* params,
                             std::span<const std::int32_t> ids, std::span<const std::int32_t> labels,
                             int rows, int seq_len, std::span<const float> dlogps,
                             const ActivationCache* cache, float* grads);

/**
 * @brief Nucleus sampling continuation of `prompt`.
 *
 * Stops at EOS or after `max_new_tokens` tokens. Draw `i` of the stream uses the counter
 * `(stream, i)` of `rng`, so a sample only depends on the seed and the stream id.
 */
template<typename floatX>
std::vector<std::int32_t> generate(const PretrainedConfig& config, const floatX* params,
                                   std::span<const std::int32_t> prompt, int max_new_tokens, float top_p,
                                   const Philox4x32& rng, std::uint32_t stream);

//! Random initialization of the full flat parameter vector; identical on every worker for a given seed.
void init_parameters(const PretrainedConfig& config, std::uint64_t seed, std::span<float> params);

} // namespace models
