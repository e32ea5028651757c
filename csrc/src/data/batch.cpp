// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "data/batch.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

#include "utilities/utils.h"

int Batch::num_desirable() const {
    if (RowsPerItem == 2) return num_items();
    return static_cast<int>(std::count_if(Items.begin(), Items.end(), [](const BatchItem& i) { return i.Desirable; }));
}

int Batch::num_undesirable() const {
    if (RowsPerItem == 2) return num_items();
    return num_items() - num_desirable();
}

Batch Batch::worker_slice(int rank, int world) const {
    if (rank < 0 || rank >= world) {
        throw std::logic_error(fmt::format("Invalid rank {} for world size {}", rank, world));
    }
    const int per_worker = div_exact(num_items(), world);
    const int begin = rank * per_worker;
    const int end = begin + per_worker;

    Batch slice;
    slice.Index = Index;
    slice.Epoch = Epoch;
    slice.RowsPerItem = RowsPerItem;
    slice.SeqLen = SeqLen;
    slice.KLSeqLen = KLSeqLen;
    slice.Items.assign(Items.begin() + begin, Items.begin() + end);

    const long row_begin = static_cast<long>(begin) * RowsPerItem * SeqLen;
    const long row_end = static_cast<long>(end) * RowsPerItem * SeqLen;
    slice.InputIds.assign(InputIds.begin() + row_begin, InputIds.begin() + row_end);
    slice.Labels.assign(Labels.begin() + row_begin, Labels.begin() + row_end);
    if (has_kl()) {
        const long kl_begin = static_cast<long>(begin) * KLSeqLen;
        const long kl_end = static_cast<long>(end) * KLSeqLen;
        slice.KLInputIds.assign(KLInputIds.begin() + kl_begin, KLInputIds.begin() + kl_end);
        slice.KLLabels.assign(KLLabels.begin() + kl_begin, KLLabels.begin() + kl_end);
    }
    return slice;
}

std::string Batch::describe() const {
    std::string ids;
    for (int i = 0; i < num_items(); ++i) {
        if (i == 8) {
            ids += fmt::format(", ... ({} more)", num_items() - i);
            break;
        }
        ids += (i == 0 ? "" : ", ") + Items[i].Id;
    }
    return fmt::format("batch {} of epoch {} (ids: {})", Index, Epoch, ids);
}
