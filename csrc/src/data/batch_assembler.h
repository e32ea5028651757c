// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_DATA_BATCH_ASSEMBLER_H
#define HALO_SRC_DATA_BATCH_ASSEMBLER_H

#include <cstdint>
#include <string>
#include <vector>

#include "data/batch.h"
#include "data/example.h"
#include "data/tokenizer.h"

class IExampleSource;

struct BatchAssemblerOptions {
    int BatchSize = 32;
    int EvalBatchSize = 16;
    int WorldSize = 1;
    float FracUniqueDesirable = 1.0f;
    float FracUniqueUndesirable = 1.0f;
    int MaxLength = 2048;
    int MaxPromptLength = 1024;
    bool KLCompanions = false;
    std::uint64_t Seed = 0;
    std::string HumanPrefix;
    std::string HumanSuffix;
    std::string AssistantPrefix;
    std::string AssistantSuffix;
};

//! Composition of one planned epoch.
struct EpochPlanStats {
    long Desirable = 0;             ///< desirable slots (all examples for sft and paired)
    long Undesirable = 0;
    long UniqueDesirable = 0;       ///< distinct desirable examples kept after applying the fraction
    long UniqueUndesirable = 0;
    long Batches = 0;
};

/*!
 * \brief Turns the examples of a source into fixed-size, padded batches.
 * \details Each epoch is planned up front: every class keeps `ceil(frac * N)` unique examples,
 * which are repeated cyclically to fill the class's N slots. Paired examples are never split.
 * Unpaired batches consist of `world_size` worker slices that each hold at least one
 * desirable and one undesirable example; the tail that cannot form a full batch is dropped.
 *
 * The state needed for resuming is `(epoch, batch_index)`; the seed fixes everything else.
 */
class BatchAssembler {
public:
    BatchAssembler(const IExampleSource& source, ByteTokenizer tokenizer, BatchAssemblerOptions options);

    //! Read and plan epoch `epoch` of the train split; resets the batch index.
    void start_epoch(int epoch);
    [[nodiscard]] bool has_next() const;
    //! @throws std::logic_error if the epoch is exhausted.
    Batch next();

    //! Restore a position saved by a checkpoint.
    void set_state(int epoch, long batch_index);

    [[nodiscard]] int epoch() const { return mEpoch; }
    [[nodiscard]] long batch_index() const { return mNextBatch; }
    [[nodiscard]] long num_batches() const { return static_cast<long>(mPlan.size()); }
    [[nodiscard]] const EpochPlanStats& stats() const { return mStats; }
    [[nodiscard]] const BatchAssemblerOptions& options() const { return mOptions; }

    //! The first `n_examples` examples of the test split, in file order, batched by `EvalBatchSize`.
    std::vector<Batch> eval_batches(int n_examples) const;

private:
    std::vector<std::vector<std::size_t>> plan(const std::vector<Example>& examples, int batch_size,
                                               float frac_desirable, float frac_undesirable,
                                               EpochPlanStats& stats) const;
    Batch build(const std::vector<Example>& examples, const std::vector<std::size_t>& indices, long index, int epoch) const;
    TokenizedSequence tokenize(const std::string& prompt, const std::string& response) const;
    std::string format_prompt(const std::string& prompt) const;

    const IExampleSource& mSource;
    ByteTokenizer mTokenizer;
    BatchAssemblerOptions mOptions;
    EExampleShape mShape;

    int mEpoch = -1;
    long mNextBatch = 0;
    std::vector<Example> mExamples;
    std::vector<std::vector<std::size_t>> mPlan;
    EpochPlanStats mStats;
};

#endif //HALO_SRC_DATA_BATCH_ASSEMBLER_H
