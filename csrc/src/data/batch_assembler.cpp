// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "data/batch_assembler.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include "data/example_source.h"
#include "utilities/utils.h"

namespace {

//! ceil(frac * n), robust against float fractions like 0.3f that are slightly above their decimal value
long unique_count(float frac, long n) {
    if (n == 0) return 0;
    long k = static_cast<long>(std::ceil(static_cast<double>(frac) * static_cast<double>(n) - 1e-6));
    return std::clamp(k, 1L, n);
}

//! `n` slots filled cyclically with the first `k` entries of `pool`
std::vector<std::size_t> cyclic_slots(const std::vector<std::size_t>& pool, long k, long n) {
    std::vector<std::size_t> slots(n);
    for (long j = 0; j < n; ++j) {
        slots[j] = pool[j % k];
    }
    return slots;
}

void append_padded(std::vector<std::int32_t>& ids, std::vector<std::int32_t>& labels, const TokenizedSequence& seq,
                   int length, std::int32_t pad_id) {
    ids.insert(ids.end(), seq.Tokens.begin(), seq.Tokens.end());
    labels.insert(labels.end(), seq.Labels.begin(), seq.Labels.end());
    const std::size_t pad = length - seq.Tokens.size();
    ids.insert(ids.end(), pad, pad_id);
    labels.insert(labels.end(), pad, IGNORE_LABEL);
}

int max_length(const std::vector<TokenizedSequence>& seqs) {
    std::size_t len = 1;
    for (const auto& s : seqs) {
        len = std::max(len, s.Tokens.size());
    }
    return static_cast<int>(len);
}

} // namespace

BatchAssembler::BatchAssembler(const IExampleSource& source, ByteTokenizer tokenizer, BatchAssemblerOptions options)
    : mSource(source), mTokenizer(tokenizer), mOptions(std::move(options)), mShape(source.shape()) {
    if (mOptions.BatchSize % mOptions.WorldSize != 0 || mOptions.EvalBatchSize % mOptions.WorldSize != 0) {
        throw ConfigError(fmt::format("batch sizes ({}, {}) must be divisible by world size {}",
                                      mOptions.BatchSize, mOptions.EvalBatchSize, mOptions.WorldSize));
    }
}

/**
 * @brief Read epoch `epoch` of the train split and fix the composition of all its batches.
 *
 * @throws DataError if the source yields malformed records or an unpaired dataset lacks a class.
 */
void BatchAssembler::start_epoch(int epoch) {
    auto stream = mSource.open("train", epoch);
    mExamples.clear();
    while (auto ex = stream->next()) {
        mExamples.push_back(std::move(*ex));
    }
    mStats = {};
    mPlan = plan(mExamples, mOptions.BatchSize, mOptions.FracUniqueDesirable, mOptions.FracUniqueUndesirable, mStats);
    mEpoch = epoch;
    mNextBatch = 0;
}

bool BatchAssembler::has_next() const {
    return mNextBatch < static_cast<long>(mPlan.size());
}

Batch BatchAssembler::next() {
    if (!has_next()) {
        throw std::logic_error(fmt::format("No batches left in epoch {}", mEpoch));
    }
    long index = mNextBatch++;
    return build(mExamples, mPlan[index], index, mEpoch);
}

void BatchAssembler::set_state(int epoch, long batch_index) {
    start_epoch(epoch);
    if (batch_index < 0 || batch_index > num_batches()) {
        throw std::runtime_error(fmt::format("Cannot resume at batch {} of epoch {}: the epoch has {} batches",
                                             batch_index, epoch, num_batches()));
    }
    mNextBatch = batch_index;
}

std::vector<Batch> BatchAssembler::eval_batches(int n_examples) const {
    auto stream = mSource.open("test", 0);
    std::vector<Example> examples;
    while (static_cast<int>(examples.size()) < n_examples) {
        auto ex = stream->next();
        if (!ex) break;
        examples.push_back(std::move(*ex));
    }

    EpochPlanStats stats;
    auto eval_plan = plan(examples, mOptions.EvalBatchSize, 1.0f, 1.0f, stats);
    std::vector<Batch> batches;
    batches.reserve(eval_plan.size());
    for (std::size_t b = 0; b < eval_plan.size(); ++b) {
        batches.push_back(build(examples, eval_plan[b], static_cast<long>(b), 0));
    }
    return batches;
}

/**
 * @brief Assign example indices to batches.
 *
 * @param examples Examples in stream order; the first `ceil(frac * N)` of each class are the unique ones kept.
 * @param batch_size Number of examples per batch (all workers).
 * @return One index list per batch, laid out as `world_size` contiguous worker slices.
 */
std::vector<std::vector<std::size_t>> BatchAssembler::plan(const std::vector<Example>& examples, int batch_size,
                                                           float frac_desirable, float frac_undesirable,
                                                           EpochPlanStats& stats) const {
    std::vector<std::vector<std::size_t>> batches;

    if (mShape != EExampleShape::UNPAIRED) {
        std::vector<std::size_t> pool(examples.size());
        for (std::size_t i = 0; i < pool.size(); ++i) pool[i] = i;
        const long n = static_cast<long>(pool.size());
        const long k = unique_count(frac_desirable, n);
        stats.Desirable = n;
        stats.UniqueDesirable = k;
        if (mShape == EExampleShape::PAIRED) {
            stats.Undesirable = n;
            stats.UniqueUndesirable = k;
        }
        if (n == 0) return batches;

        auto slots = cyclic_slots(pool, k, n);
        for (long b = 0; b + batch_size <= n; b += batch_size) {
            batches.emplace_back(slots.begin() + b, slots.begin() + b + batch_size);
        }
        stats.Batches = static_cast<long>(batches.size());
        return batches;
    }

    std::vector<std::size_t> desirable;
    std::vector<std::size_t> undesirable;
    for (std::size_t i = 0; i < examples.size(); ++i) {
        (examples[i].Desirable ? desirable : undesirable).push_back(i);
    }
    const long nd = static_cast<long>(desirable.size());
    const long nu = static_cast<long>(undesirable.size());
    if (nd == 0 || nu == 0) {
        throw DataError(fmt::format("unpaired data needs both classes, got {} desirable and {} undesirable examples", nd, nu));
    }

    stats.Desirable = nd;
    stats.Undesirable = nu;
    stats.UniqueDesirable = unique_count(frac_desirable, nd);
    stats.UniqueUndesirable = unique_count(frac_undesirable, nu);
    const auto d_slots = cyclic_slots(desirable, stats.UniqueDesirable, nd);
    const auto u_slots = cyclic_slots(undesirable, stats.UniqueUndesirable, nu);

    const int world = mOptions.WorldSize;
    const int per_worker = batch_size / world;
    const long total = (nd + nu) / batch_size;
    long used_d = 0;
    long used_u = 0;
    for (long b = 0; b < total; ++b) {
        // keep the running share of desirable slots proportional to the class sizes
        long target = std::llround(static_cast<double>(b + 1) * batch_size * nd / static_cast<double>(nd + nu));
        long d_total = std::clamp(target - used_d, static_cast<long>(world), static_cast<long>(batch_size - world));
        long u_total = batch_size - d_total;
        if (used_d + d_total > nd || used_u + u_total > nu) {
            break;
        }

        std::vector<std::size_t> batch;
        batch.reserve(batch_size);
        for (int k = 0; k < world; ++k) {
            long dk = d_total / world + (k < d_total % world ? 1 : 0);
            for (long i = 0; i < dk; ++i) batch.push_back(d_slots[used_d++]);
            for (long i = dk; i < per_worker; ++i) batch.push_back(u_slots[used_u++]);
        }
        batches.push_back(std::move(batch));
    }
    stats.Batches = static_cast<long>(batches.size());
    return batches;
}

std::string BatchAssembler::format_prompt(const std::string& prompt) const {
    return mOptions.HumanPrefix + prompt + mOptions.HumanSuffix + mOptions.AssistantPrefix;
}

TokenizedSequence BatchAssembler::tokenize(const std::string& prompt, const std::string& response) const {
    auto prompt_tokens = mTokenizer.encode(format_prompt(prompt));
    auto response_tokens = mTokenizer.encode(response + mOptions.AssistantSuffix);
    response_tokens.push_back(mTokenizer.eos_id());
    return build_sequence(prompt_tokens, response_tokens, mOptions.MaxLength, mOptions.MaxPromptLength);
}

/**
 * @brief Tokenize, truncate and pad the examples of one batch.
 */
Batch BatchAssembler::build(const std::vector<Example>& examples, const std::vector<std::size_t>& indices,
                            long index, int epoch) const {
    Batch batch;
    batch.Index = index;
    batch.Epoch = epoch;
    batch.RowsPerItem = mShape == EExampleShape::PAIRED ? 2 : 1;

    std::vector<TokenizedSequence> rows;
    rows.reserve(indices.size() * batch.RowsPerItem);
    for (std::size_t idx : indices) {
        const Example& ex = examples[idx];
        rows.push_back(tokenize(ex.Prompt, ex.Chosen));
        if (mShape == EExampleShape::PAIRED) {
            rows.push_back(tokenize(ex.Prompt, ex.Rejected));
        }

        const TokenizedSequence& first = rows[rows.size() - batch.RowsPerItem];
        BatchItem item;
        item.Id = ex.Id;
        item.PairKey = ex.PairKey;
        item.Desirable = ex.Desirable;
        item.Prompt = format_prompt(ex.Prompt);
        item.Chosen = ex.Chosen;
        item.PromptTokens.assign(first.Tokens.begin(), first.Tokens.begin() + std::min<std::size_t>(first.PromptLength, first.Tokens.size()));
        batch.Items.push_back(std::move(item));
    }

    batch.SeqLen = max_length(rows);
    for (const auto& row : rows) {
        append_padded(batch.InputIds, batch.Labels, row, batch.SeqLen, mTokenizer.pad_id());
    }

    if (mOptions.KLCompanions && mShape == EExampleShape::UNPAIRED) {
        // within each worker slice, pair the prompt of item i with the response of item i + 1
        const int per_worker = static_cast<int>(indices.size()) / mOptions.WorldSize;
        std::vector<TokenizedSequence> kl_rows;
        kl_rows.reserve(indices.size());
        for (std::size_t i = 0; i < indices.size(); ++i) {
            std::size_t slice_begin = (i / per_worker) * per_worker;
            std::size_t companion = slice_begin + (i - slice_begin + 1) % per_worker;
            kl_rows.push_back(tokenize(examples[indices[i]].Prompt, examples[indices[companion]].Chosen));
        }
        batch.KLSeqLen = max_length(kl_rows);
        for (const auto& row : kl_rows) {
            append_padded(batch.KLInputIds, batch.KLLabels, row, batch.KLSeqLen, mTokenizer.pad_id());
        }
    }
    return batch;
}
