// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <atomic>
#include <cstddef>
#include <span>
#include <string>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>

#include "config/pretrained_config.h"
#include "models/causal_lm.h"
#include "utilities/tensor.h"
#include "utilities/tensor_container.h"

class Communicator;

namespace models {

class ParameterStore;

/*!
 * \brief Full parameters in the compute dtype, reconstructed from the shards of all workers.
 * \details The buffer lives exactly as long as this object. Creating one is a collective
 * operation when the store is sharded.
 */
class GatheredParameters {
public:
    GatheredParameters(GatheredParameters&& other) noexcept;
    GatheredParameters& operator=(GatheredParameters&&) = delete;
    GatheredParameters(const GatheredParameters&) = delete;
    ~GatheredParameters();

    [[nodiscard]] ETensorDType dtype() const { return mDType; }
    template<typename floatX>
    [[nodiscard]] const floatX* data() const {
        if (dtype_from_type<floatX> != mDType) {
            throw std::logic_error(fmt::format("gathered parameters are {}, requested {}",
                                               dtype_to_str(mDType), dtype_to_str(dtype_from_type<floatX>)));
        }
        return reinterpret_cast<const floatX*>(mBuffer.data());
    }

private:
    friend class ParameterStore;
    GatheredParameters(ParameterStore* owner, ETensorDType dtype, std::vector<std::byte> buffer);

    ParameterStore* mOwner;
    ETensorDType mDType;
    std::vector<std::byte> mBuffer;
};

/*!
 * \brief FP32 master copy of one model's flat parameters, optionally sharded across workers.
 * \details With sharding, the flat vector is padded to a multiple of the world size and every
 * worker owns one contiguous shard of parameters and gradients. Without sharding, every worker
 * holds a full replica. Gradients only exist for trainable stores.
 */
class ParameterStore {
public:
    ParameterStore(const PretrainedConfig& config, ETensorDType compute_dtype, bool sharded, bool trainable, Communicator& comm);
    ParameterStore(const ParameterStore&) = delete;
    ParameterStore& operator=(const ParameterStore&) = delete;

    //! Sets all parameters from a full (unpadded) flat vector; every worker keeps its shard.
    void assign_full(std::span<const float> full);
    //! Full (unpadded) FP32 parameters. Collective if sharded.
    std::vector<float> gather_full_master();
    //! Full (unpadded) vector from this worker's shard of some per-parameter state. Collective if sharded.
    std::vector<float> gather_full(std::span<const float> local);
    //! This worker's shard of a full (unpadded) vector.
    [[nodiscard]] std::vector<float> local_part(std::span<const float> full) const;

    //! Reconstructs the full parameters in the compute dtype. Collective if sharded.
    GatheredParameters gather();

    //! Averages `full_grads` (padded FP32 layout) over workers and adds the result to the local gradients.
    void reduce_gradients(std::vector<float>& full_grads);
    void zero_grad();
    //! Sum of squared local gradients of the elements this worker owns.
    [[nodiscard]] double local_grad_sq_norm() const;
    void scale_gradients(float factor);

    [[nodiscard]] std::span<float> master() { return mMaster; }
    [[nodiscard]] std::span<float> grads() { return mGrads; }
    [[nodiscard]] std::span<const float> grads() const { return mGrads; }

    [[nodiscard]] const PretrainedConfig& config() const { return mConfig; }
    [[nodiscard]] ETensorDType compute_dtype() const { return mComputeDType; }
    [[nodiscard]] bool is_sharded() const { return mSharded; }
    [[nodiscard]] bool is_trainable() const { return mTrainable; }
    [[nodiscard]] long num_parameters() const { return mNumParameters; }
    //! length of the flat vector after padding to a multiple of the world size
    [[nodiscard]] long padded_size() const { return mPaddedSize; }
    [[nodiscard]] long local_size() const { return static_cast<long>(mMaster.size()); }
    [[nodiscard]] long local_offset() const { return mLocalOffset; }
    //! bytes currently held by live GatheredParameters of this store
    [[nodiscard]] std::size_t gathered_bytes() const { return mGatheredBytes.load(); }

private:
    friend class GatheredParameters;

    PretrainedConfig mConfig;
    ETensorDType mComputeDType;
    bool mSharded;
    bool mTrainable;
    Communicator& mComm;

    long mNumParameters;
    long mPaddedSize;
    long mLocalOffset;
    std::vector<float> mMaster;
    std::vector<float> mGrads;
    std::atomic<std::size_t> mGatheredBytes = 0;
};

//! \brief Named views of a full flat parameter vector, for safetensors I/O.
class FlatParameterContainer : public ITensorContainer {
public:
    FlatParameterContainer(const PretrainedConfig& config, std::vector<float>& full);
    void iterate_tensors(const std::function<void(std::string, const TensorShard&)>& callback) override;

private:
    std::vector<ParameterEntry> mLayout;
    std::vector<float>& mFull;
};

} // namespace models
