// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "config/pretrained_config.h"
#include "models/causal_lm.h"
#include "models/parameter_store.h"

struct Batch;
class Communicator;

namespace optimizers {
class Optimizer;
}

namespace models {

struct ModelPairOptions {
    std::string NameOrPath;                 ///< directory with config.json, or a built-in size name
    std::optional<std::string> LoadFrom;    ///< weights only: checkpoint directory or safetensors file
    ETensorDType PolicyDType = ETensorDType::BF16;
    ETensorDType ReferenceDType = ETensorDType::BF16;
    bool UseReference = false;
    bool Sharded = true;
    bool ActivationCheckpointing = true;
    std::uint64_t Seed = 1;
};

//! Full policy weights and, optionally, optimizer state, gathered from all workers.
struct PolicySnapshot {
    std::vector<float> Weights;
    std::string OptimizerName;
    int OptimizerStep = 0;
    std::vector<std::pair<std::string, std::vector<float>>> OptimizerState;
};

//! Per-row log-probabilities of one worker's batch slice.
struct LogProbabilities {
    std::vector<float> Policy;
    std::optional<std::vector<float>> Reference;
    //! log-probabilities of the mismatched KL companion sequences; empty if the batch has none
    std::vector<float> PolicyKL;
    std::optional<std::vector<float>> ReferenceKL;
};

/*!
 * \brief Trainable policy and optional frozen reference model, sharded across workers.
 * \details All methods marked collective must be called by every worker in the same order.
 * Full parameters are only materialized inside forward, backward and sampling, through
 * `GatheredParameters` scopes.
 */
class ModelPair {
public:
    ModelPair(const ModelPairOptions& options, Communicator& comm);
    ~ModelPair();

    //! Collective. If `train`, keeps what backward() needs.
    LogProbabilities forward(const Batch& slice, bool train);
    //! Collective. Gradient of the loss w.r.t. the policy rows of the last training forward; accumulates.
    void backward(std::span<const float> dlogps);

    //! Collective. Clips to the global L2 norm `max_norm` and returns the norm before clipping.
    float clip_gradients(float max_norm);
    //! Same for the value-head parameter group; returns 0 when the model registers no value head.
    float clip_value_head_gradients(float max_norm);
    void zero_grad();
    void optimizer_step(optimizers::Optimizer& optimizer, float lr);

    //! Collective. Gathers the policy weights and, if `optimizer` is given, its state.
    PolicySnapshot snapshot(optimizers::Optimizer* optimizer);
    //! Writes `policy.safetensors`, `config.json` and, if present, `optimizer.safetensors` into `directory`.
    void write_snapshot(const PolicySnapshot& snapshot, const std::string& directory) const;

    //! Loads weights into the policy only; the reference keeps its initial weights.
    void load_policy_weights(const std::string& path);
    void load_optimizer_state(optimizers::Optimizer& optimizer, const std::string& file_name);

    //! Collective. Policy continuations for the prompts of `slice`, for all workers in rank order.
    std::vector<std::string> sample(const Batch& slice, int max_length, float top_p, std::uint64_t seed);

    [[nodiscard]] bool has_reference() const { return mReference != nullptr; }
    [[nodiscard]] const PretrainedConfig& config() const { return mConfig; }
    [[nodiscard]] ParameterStore& policy() { return *mPolicy; }
    [[nodiscard]] const ParameterStore* reference() const { return mReference.get(); }
    [[nodiscard]] long local_optimizer_size() const { return mPolicy->local_size(); }

private:
    std::vector<float> compute_logps(ParameterStore& store, std::span<const std::int32_t> ids,
                                     std::span<const std::int32_t> labels, int rows, int seq_len, ActivationCache* cache);

    ModelPairOptions mOptions;
    Communicator& mComm;
    PretrainedConfig mConfig;
    std::unique_ptr<ParameterStore> mPolicy;
    std::unique_ptr<ParameterStore> mReference;

    // state of the last training forward
    std::vector<std::int32_t> mLastIds;
    std::vector<std::int32_t> mLastLabels;
    int mLastRows = 0;
    int mLastSeqLen = 0;
    std::optional<ActivationCache> mLastActivations;
};

//! Resolves `name_or_path` to a model configuration: `config.json` of a directory or a built-in size.
PretrainedConfig resolve_model_config(const std::string& name_or_path, ETensorDType dtype);

} // namespace models
