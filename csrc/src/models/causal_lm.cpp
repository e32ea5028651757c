// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "causal_lm.h"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>
#include <stdexcept>

#include <fmt/core.h>

#include "data/tokenizer.h"
#include "utilities/dtype.h"
#include "utilities/philox.h"

namespace models {

namespace {

template<typename floatX>
struct WeightViews {
    const floatX* Embed;
    const floatX* HiddenW;
    const floatX* HiddenB;
    const floatX* OutW;
    const floatX* OutB;
};

template<typename floatX>
WeightViews<floatX> make_views(const PretrainedConfig& config, const floatX* params) {
    const long V = config.VocabSize;
    const long H = config.HiddenSize;
    WeightViews<floatX> w;
    w.Embed = params;
    w.HiddenW = w.Embed + V * H;
    w.HiddenB = w.HiddenW + H * H;
    w.OutW = w.HiddenB + H;
    w.OutB = w.OutW + V * H;
    return w;
}

void check_token(const PretrainedConfig& config, std::int32_t token) {
    if (token < 0 || token >= config.VocabSize) {
        throw std::out_of_range(fmt::format("token id {} outside of vocabulary of size {}", token, config.VocabSize));
    }
}

//! h = tanh(W_h e + b_h), rounded to the compute precision
template<typename floatX>
void hidden_forward(const WeightViews<floatX>& w, int H, std::int32_t token, float* h) {
    const floatX* e = w.Embed + static_cast<long>(token) * H;
    for (int i = 0; i < H; ++i) {
        float a = static_cast<float>(w.HiddenB[i]);
        const floatX* row = w.HiddenW + static_cast<long>(i) * H;
        for (int j = 0; j < H; ++j) {
            a += static_cast<float>(row[j]) * static_cast<float>(e[j]);
        }
        h[i] = round_to_dtype(std::tanh(a), dtype_from_type<floatX>);
    }
}

template<typename floatX>
void logits_forward(const WeightViews<floatX>& w, int V, int H, const float* h, float* z) {
    for (int v = 0; v < V; ++v) {
        float acc = static_cast<float>(w.OutB[v]);
        const floatX* row = w.OutW + static_cast<long>(v) * H;
        for (int j = 0; j < H; ++j) {
            acc += static_cast<float>(row[j]) * h[j];
        }
        z[v] = acc;
    }
}

//! turns logits into probabilities in place, returns log-sum-exp
float softmax_inplace(std::span<float> z) {
    float max = *std::max_element(z.begin(), z.end());
    double sum = 0.0;
    for (float& v : z) {
        v = std::exp(v - max);
        sum += v;
    }
    for (float& v : z) {
        v = static_cast<float>(v / sum);
    }
    return max + static_cast<float>(std::log(sum));
}

bool contributes(std::span<const std::int32_t> labels, long index) {
    return labels[index] != IGNORE_LABEL;
}

void check_batch_shape(std::span<const std::int32_t> ids, std::span<const std::int32_t> labels, int rows, int seq_len) {
    const std::size_t expected = static_cast<std::size_t>(rows) * seq_len;
    if (ids.size() != expected || labels.size() != expected) {
        throw std::logic_error(fmt::format("expected {} x {} tokens, got {} ids and {} labels",
                                           rows, seq_len, ids.size(), labels.size()));
    }
}

} // namespace

std::vector<ParameterEntry> parameter_layout(const PretrainedConfig& config) {
    const long V = config.VocabSize;
    const long H = config.HiddenSize;
    std::vector<ParameterEntry> layout = {
        {"embed", {V, H}, 0, V * H},
        {"hidden_w", {H, H}, 0, H * H},
        {"hidden_b", {H}, 0, H},
        {"out_w", {V, H}, 0, V * H},
        {"out_b", {V}, 0, V},
    };
    long offset = 0;
    for (auto& entry : layout) {
        entry.Offset = offset;
        offset += entry.NumElements;
    }
    return layout;
}

template<typename floatX>
std::vector<float> sequence_logps(const PretrainedConfig& config, const floatX* params,
                                  std::span<const std::int32_t> ids, std::span<const std::int32_t> labels,
                                  int rows, int seq_len, ActivationCache* cache) {
    check_batch_shape(ids, labels, rows, seq_len);
    const int V = config.VocabSize;
    const int H = config.HiddenSize;
    const auto w = make_views(config, params);

    std::vector<float> logps(rows, 0.f);
    std::vector<float> h(H);
    std::vector<float> z(V);
    if (cache) cache->Hidden.clear();

    for (int r = 0; r < rows; ++r) {
        double acc = 0.0;
        for (int t = 1; t < seq_len; ++t) {
            const long idx = static_cast<long>(r) * seq_len + t;
            if (!contributes(labels, idx)) continue;
            const std::int32_t x = ids[idx - 1];
            const std::int32_t y = labels[idx];
            check_token(config, x);
            check_token(config, y);

            hidden_forward(w, H, x, h.data());
            logits_forward(w, V, H, h.data(), z.data());
            float target = z[y];
            float lse = softmax_inplace(z);
            acc += target - lse;
            if (cache) cache->Hidden.insert(cache->Hidden.end(), h.begin(), h.end());
        }
        logps[r] = static_cast<float>(acc);
    }
    return logps;
}

template<typename floatX>
void sequence_logps_backward(const PretrainedConfig& config, const floatX* params,
                             std::span<const std::int32_t> ids, std::span<const std::int32_t> labels,
                             int rows, int seq_len, std::span<const float> dlogps,
                             const ActivationCache* cache, float* grads) {
    check_batch_shape(ids, labels, rows, seq_len);
    if (dlogps.size() != static_cast<std::size_t>(rows)) {
        throw std::logic_error(fmt::format("expected {} log-probability gradients, got {}", rows, dlogps.size()));
    }
    const int V = config.VocabSize;
    const int H = config.HiddenSize;
    const auto w = make_views(config, params);
    const long VH = static_cast<long>(V) * H;
    float* g_embed = grads;
    float* g_hidden_w = g_embed + VH;
    float* g_hidden_b = g_hidden_w + static_cast<long>(H) * H;
    float* g_out_w = g_hidden_b + H;
    float* g_out_b = g_out_w + VH;

    std::vector<float> recomputed(H);
    std::vector<float> p(V);
    std::vector<float> dh(H);
    std::vector<float> da(H);
    long position = 0;

    for (int r = 0; r < rows; ++r) {
        for (int t = 1; t < seq_len; ++t) {
            const long idx = static_cast<long>(r) * seq_len + t;
            if (!contributes(labels, idx)) continue;
            const std::int32_t x = ids[idx - 1];
            const std::int32_t y = labels[idx];
            const float g = dlogps[r];

            const float* h = nullptr;
            if (cache) {
                h = cache->Hidden.data() + position * H;
            } else {
                check_token(config, x);
                hidden_forward(w, H, x, recomputed.data());
                h = recomputed.data();
            }
            ++position;
            if (g == 0.f) continue;

            logits_forward(w, V, H, h, p.data());
            softmax_inplace(p);

            std::fill(dh.begin(), dh.end(), 0.f);
            for (int v = 0; v < V; ++v) {
                const float dz = g * ((v == y ? 1.f : 0.f) - p[v]);
                g_out_b[v] += dz;
                float* gw = g_out_w + static_cast<long>(v) * H;
                const floatX* ow = w.OutW + static_cast<long>(v) * H;
                for (int j = 0; j < H; ++j) {
                    gw[j] += dz * h[j];
                    dh[j] += dz * static_cast<float>(ow[j]);
                }
            }

            const floatX* e = w.Embed + static_cast<long>(x) * H;
            float* ge = g_embed + static_cast<long>(x) * H;
            for (int i = 0; i < H; ++i) {
                da[i] = dh[i] * (1.f - h[i] * h[i]);
                g_hidden_b[i] += da[i];
                float* gw = g_hidden_w + static_cast<long>(i) * H;
                const floatX* hw = w.HiddenW + static_cast<long>(i) * H;
                for (int j = 0; j < H; ++j) {
                    gw[j] += da[i] * static_cast<float>(e[j]);
                    ge[j] += da[i] * static_cast<float>(hw[j]);
                }
            }
        }
    }
}

template<typename floatX>
std::vector<std::int32_t> generate(const PretrainedConfig& config, const floatX* params,
                                   std::span<const std::int32_t> prompt, int max_new_tokens, float top_p,
                                   const Philox4x32& rng, std::uint32_t stream) {
    std::vector<std::int32_t> result;
    if (prompt.empty()) return result;

    const int V = config.VocabSize;
    const int H = config.HiddenSize;
    const auto w = make_views(config, params);
    std::vector<float> h(H);
    std::vector<float> p(V);
    std::vector<int> order(V);

    std::int32_t current = prompt.back();
    for (int i = 0; i < max_new_tokens; ++i) {
        check_token(config, current);
        hidden_forward(w, H, current, h.data());
        logits_forward(w, V, H, h.data(), p.data());
        softmax_inplace(p);

        // smallest set of most likely tokens whose mass reaches top_p
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](int a, int b) { return p[a] > p[b]; });
        double kept = 0.0;
        int n_kept = 0;
        while (n_kept < V && (n_kept == 0 || kept < top_p)) {
            kept += p[order[n_kept++]];
        }

        double u = static_cast<double>(rng.uniform(stream, static_cast<std::uint32_t>(i))) * kept;
        std::int32_t next = order[n_kept - 1];
        double cumulative = 0.0;
        for (int k = 0; k < n_kept; ++k) {
            cumulative += p[order[k]];
            if (u < cumulative) {
                next = order[k];
                break;
            }
        }

        if (next == config.EosTokenId) break;
        result.push_back(next);
        current = next;
    }
    return result;
}

void init_parameters(const PretrainedConfig& config, std::uint64_t seed, std::span<float> params) {
    if (params.size() < static_cast<std::size_t>(config.num_parameters())) {
        throw std::logic_error(fmt::format("parameter buffer of {} elements is too small for {} parameters",
                                           params.size(), config.num_parameters()));
    }
    Philox4x32 rng{seed};
    for (const auto& entry : parameter_layout(config)) {
        const bool bias = entry.Shape.size() == 1;
        for (long i = 0; i < entry.NumElements; ++i) {
            const long index = entry.Offset + i;
            if (bias) {
                params[index] = 0.f;
                continue;
            }
            // Box-Muller on two uniform draws of this element's counter
            auto bits = rng.generate(static_cast<std::uint32_t>(index), 0x696e6974u);
            double u1 = (static_cast<double>(bits[0] >> 8) + 1.0) / 16777217.0;
            double u2 = static_cast<double>(bits[1] >> 8) / 16777216.0;
            double normal = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
            params[index] = static_cast<float>(normal * config.InitStd);
        }
    }
}

template std::vector<float> sequence_logps<float>(const PretrainedConfig&, const float*, std::span<const std::int32_t>,
                                                  std::span<const std::int32_t>, int, int, ActivationCache*);
template std::vector<float> sequence_logps<bf16>(const PretrainedConfig&, const bf16*, std::span<const std::int32_t>,
                                                 std::span<const std::int32_t>, int, int, ActivationCache*);
template void sequence_logps_backward<float>(const PretrainedConfig&, const float*, std::span<const std::int32_t>,
                                             std::span<const std::int32_t>, int, int, std::span<const float>,
                                             const ActivationCache*, float*);
template void sequence_logps_backward<bf16>(const PretrainedConfig&, const bf16*, std::span<const std::int32_t>,
                                            std::span<const std::int32_t>, int, int, std::span<const float>,
                                            const ActivationCache*, float*);
template std::vector<std::int32_t> generate<float>(const PretrainedConfig&, const float*, std::span<const std::int32_t>,
                                                   int, float, const Philox4x32&, std::uint32_t);
template std::vector<std::int32_t> generate<bf16>(const PretrainedConfig&, const bf16*, std::span<const std::int32_t>,
                                                  int, float, const Philox4x32&, std::uint32_t);

} // namespace models
