// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_DATA_BATCH_H
#define HALO_SRC_DATA_BATCH_H

#include <cstdint>
#include <string>
#include <vector>

//! Bookkeeping for one example of a batch.
struct BatchItem {
    std::string Id;
    std::string PairKey;
    bool Desirable = true;
    //! formatted prompt text (with human/assistant markers) and the human-chosen response
    std::string Prompt;
    std::string Chosen;
    //! truncated prompt tokens, used as generation context
    std::vector<std::int32_t> PromptTokens;
};

/**
 * @brief A padded batch of token sequences.
 *
 * Rows are `RowsPerItem` consecutive sequences per item: one for sft and unpaired
 * batches, chosen followed by rejected for paired batches. `InputIds` and `Labels`
 * are row-major `num_rows() x SeqLen`; padding uses the PAD token and label -100.
 * If the loss needs KL companions, `KLInputIds`/`KLLabels` hold one mismatched
 * sequence per item (`num_items() x KLSeqLen`).
 */
struct Batch {
    long Index = 0;
    int Epoch = 0;
    int RowsPerItem = 1;
    int SeqLen = 0;
    int KLSeqLen = 0;
    std::vector<BatchItem> Items;
    std::vector<std::int32_t> InputIds;
    std::vector<std::int32_t> Labels;
    std::vector<std::int32_t> KLInputIds;
    std::vector<std::int32_t> KLLabels;

    [[nodiscard]] int num_items() const { return static_cast<int>(Items.size()); }
    [[nodiscard]] int num_rows() const { return num_items() * RowsPerItem; }
    [[nodiscard]] bool has_kl() const { return KLSeqLen > 0; }
    [[nodiscard]] int num_desirable() const;
    [[nodiscard]] int num_undesirable() const;

    //! Contiguous share of worker `rank`; keeps the padded length of the full batch.
    [[nodiscard]] Batch worker_slice(int rank, int world) const;

    //! "batch <index> of epoch <epoch> (ids ...)", for error messages.
    [[nodiscard]] std::string describe() const;
};

#endif //HALO_SRC_DATA_BATCH_H
