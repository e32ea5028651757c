// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "tensor.h"

/**
 * @brief Construct a shard wrapper that initially represents the full (unsharded) tensor.
 *
 * @param src Source tensor to wrap; shard metadata is initialized to a single shard.
 */
TensorShard::TensorShard(const Tensor& src) : Tensor(src), GlobalShape(src.Sizes), ShardIndex(0), NumShards(1) {
}

/**
 * @brief Compute the total number of elements in the global (pre-sharding) shape.
 *
 * @return Product of GlobalShape[0..Rank).
 */
std::size_t TensorShard::global_nelem() const {
    std::size_t sz = 1;
    for (int i = 0; i < Rank; ++i)
        sz *= GlobalShape[i];
    return sz;
}

/**
 * @brief View of the part of a flat buffer that worker @p idx of @p num owns.
 *
 * Parameter stores pad their flat buffers to a multiple of the worker count, so the
 * split along dimension 0 is always even.
 *
 * @throws std::logic_error if `src.Sizes[0]` is not a multiple of @p num.
 */
TensorShard shard_view(const Tensor& src, int idx, int num) {
    Tensor shard{src};
    shard.Sizes[0] = div_exact(src.Sizes[0], static_cast<long>(num));
    shard.Data = src.Data + div_exact(src.bytes(), static_cast<std::size_t>(num)) * idx;
    return TensorShard{shard, idx, num, src.Sizes};
}
