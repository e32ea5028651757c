// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "parameter_store.h"

#include <algorithm>
#include <cstring>

#include "utilities/comm.h"
#include "utilities/utils.h"

namespace models {

GatheredParameters::GatheredParameters(ParameterStore* owner, ETensorDType dtype, std::vector<std::byte> buffer)
    : mOwner(owner), mDType(dtype), mBuffer(std::move(buffer)) {
    mOwner->mGatheredBytes += mBuffer.size();
}

GatheredParameters::GatheredParameters(GatheredParameters&& other) noexcept
    : mOwner(other.mOwner), mDType(other.mDType), mBuffer(std::move(other.mBuffer)) {
    other.mOwner = nullptr;
    other.mBuffer.clear();
}

GatheredParameters::~GatheredParameters() {
    if (mOwner) {
        mOwner->mGatheredBytes -= mBuffer.size();
    }
}

ParameterStore::ParameterStore(const PretrainedConfig& config, ETensorDType compute_dtype, bool sharded, bool trainable,
                               Communicator& comm)
    : mConfig(config), mComputeDType(compute_dtype), mSharded(sharded), mTrainable(trainable), mComm(comm) {
    if (compute_dtype != ETensorDType::FP32 && compute_dtype != ETensorDType::BF16) {
        throw ConfigError(fmt::format("unsupported compute dtype {}", dtype_to_str(compute_dtype)));
    }
    mNumParameters = config.num_parameters();
    const int world = mSharded ? comm.world_size() : 1;
    mPaddedSize = div_ceil(mNumParameters, static_cast<long>(world)) * world;
    const long local = mPaddedSize / world;
    mLocalOffset = mSharded ? local * comm.rank() : 0;
    mMaster.assign(local, 0.f);
    if (mTrainable) {
        mGrads.assign(local, 0.f);
    }
}

void ParameterStore::assign_full(std::span<const float> full) {
    if (full.size() != static_cast<std::size_t>(mNumParameters)) {
        throw std::runtime_error(fmt::format("expected {} parameters, got {}", mNumParameters, full.size()));
    }
    mMaster = local_part(full);
}

std::vector<float> ParameterStore::local_part(std::span<const float> full) const {
    std::vector<float> local(mMaster.size(), 0.f);
    const long end = std::min(mLocalOffset + local_size(), static_cast<long>(full.size()));
    if (end > mLocalOffset) {
        std::copy(full.begin() + mLocalOffset, full.begin() + end, local.begin());
    }
    return local;
}

std::vector<float> ParameterStore::gather_full(std::span<const float> local) {
    std::vector<float> full;
    if (mSharded) {
        full = mComm.host_all_gather_vector(std::vector<float>(local.begin(), local.end()));
    } else {
        full.assign(local.begin(), local.end());
    }
    full.resize(mNumParameters);
    return full;
}

std::vector<float> ParameterStore::gather_full_master() {
    return gather_full(mMaster);
}

/**
 * @brief Convert the owned shard to the compute dtype and reconstruct the full parameter vector.
 *
 * The returned object owns the full buffer; it is released when the object goes out of scope,
 * including during stack unwinding.
 */
GatheredParameters ParameterStore::gather() {
    const std::size_t elem = get_dtype_size(mComputeDType);
    std::vector<std::byte> local(mMaster.size() * elem);
    if (mComputeDType == ETensorDType::BF16) {
        auto* dst = reinterpret_cast<bf16*>(local.data());
        for (std::size_t i = 0; i < mMaster.size(); ++i) {
            dst[i] = bf16(mMaster[i]);
        }
    } else {
        std::memcpy(local.data(), mMaster.data(), local.size());
    }

    if (!mSharded || mComm.world_size() == 1) {
        return GatheredParameters(this, mComputeDType, std::move(local));
    }

    std::vector<std::byte> full(mPaddedSize * elem);
    Tensor src = Tensor::from_pointer(local.data(), mComputeDType, std::array<long, 1>{local_size()});
    Tensor tgt = Tensor::from_pointer(full.data(), mComputeDType, std::array<long, 1>{mPaddedSize});
    TensorShard shard = shard_view(tgt, mComm.rank(), mComm.world_size());
    shard.Data = src.Data;
    mComm.all_gather(shard, tgt);
    return GatheredParameters(this, mComputeDType, std::move(full));
}

void ParameterStore::reduce_gradients(std::vector<float>& full_grads) {
    if (!mTrainable) {
        throw std::logic_error("cannot reduce gradients of a frozen model");
    }
    if (full_grads.size() != static_cast<std::size_t>(mPaddedSize)) {
        throw std::logic_error(fmt::format("gradient buffer has {} elements, expected {}", full_grads.size(), mPaddedSize));
    }

    if (mSharded) {
        Tensor full = Tensor::from_vector(full_grads);
        TensorShard shard = shard_view(full, mComm.rank(), mComm.world_size());
        shard.Data = reinterpret_cast<std::byte*>(mGrads.data());
        mComm.reduce_scatter_avg(full, shard, true);
        return;
    }

    const int world = mComm.world_size();
    if (world > 1) {
        mComm.all_reduce_sum(full_grads.data(), full_grads.size());
    }
    const float scale = 1.f / static_cast<float>(world);
    for (std::size_t i = 0; i < mGrads.size(); ++i) {
        mGrads[i] += full_grads[i] * scale;
    }
}

void ParameterStore::zero_grad() {
    std::fill(mGrads.begin(), mGrads.end(), 0.f);
}

double ParameterStore::local_grad_sq_norm() const {
    double sum = 0.0;
    for (float g : mGrads) {
        sum += static_cast<double>(g) * g;
    }
    return sum;
}

void ParameterStore::scale_gradients(float factor) {
    for (float& g : mGrads) {
        g *= factor;
    }
}

FlatParameterContainer::FlatParameterContainer(const PretrainedConfig& config, std::vector<float>& full)
    : mLayout(parameter_layout(config)), mFull(full) {
    if (mFull.size() < static_cast<std::size_t>(config.num_parameters())) {
        throw std::logic_error(fmt::format("parameter vector of {} elements is too small for {} parameters",
                                           mFull.size(), config.num_parameters()));
    }
}

void FlatParameterContainer::iterate_tensors(const std::function<void(std::string, const TensorShard&)>& callback) {
    for (const auto& entry : mLayout) {
        auto* ptr = reinterpret_cast<std::byte*>(mFull.data() + entry.Offset);
        callback(entry.Name, TensorShard(Tensor::from_pointer(ptr, ETensorDType::FP32, entry.Shape)));
    }
}

} // namespace models
