// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "model_pair.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>

#include <fmt/core.h>

#include "data/batch.h"
#include "data/tokenizer.h"
#include "runtime/optimizers/optimizer.h"
#include "utilities/comm.h"
#include "utilities/philox.h"
#include "utilities/safetensors.h"
#include "utilities/utils.h"

namespace models {

namespace {

std::string weights_file(const std::string& path) {
    if (std::filesystem::is_directory(path)) {
        return (std::filesystem::path(path) / "policy.safetensors").string();
    }
    return path;
}

std::vector<float> read_weights(const PretrainedConfig& config, const std::string& file_name) {
    std::vector<float> full(config.num_parameters());
    FlatParameterContainer container(config, full);
    load_safetensors(file_name, container, true);
    return full;
}

} // namespace

PretrainedConfig resolve_model_config(const std::string& name_or_path, ETensorDType dtype) {
    if (name_or_path.empty()) {
        return create_pretrained_config_from_name("halo-small", dtype);
    }
    if (std::filesystem::is_directory(name_or_path)) {
        auto config_file = std::filesystem::path(name_or_path) / "config.json";
        if (!std::filesystem::exists(config_file)) {
            throw ConfigError(fmt::format("Model directory `{}` has no config.json", name_or_path));
        }
        return load_pretrained_config(config_file.string().c_str(), dtype);
    }
    return create_pretrained_config_from_name(name_or_path, dtype);
}

/**
 * @brief Build the policy and, if requested, the frozen reference model.
 *
 * Both start from the weights in `name_or_path` (or a seeded random initialization for a
 * built-in size), then from `load_from` if given. The reference is never constructed
 * when `UseReference` is false.
 *
 * @throws ConfigError if the model cannot be resolved or its weights cannot be loaded.
 */
ModelPair::ModelPair(const ModelPairOptions& options, Communicator& comm)
    : mOptions(options), mComm(comm), mConfig(resolve_model_config(options.NameOrPath, options.PolicyDType)) {
    mPolicy = std::make_unique<ParameterStore>(mConfig, mOptions.PolicyDType, mOptions.Sharded, true, mComm);
    if (mOptions.UseReference) {
        mReference = std::make_unique<ParameterStore>(mConfig, mOptions.ReferenceDType, mOptions.Sharded, false, mComm);
    }

    std::string source = options.LoadFrom.value_or(options.NameOrPath);
    try {
        std::vector<float> initial;
        if (options.LoadFrom) {
            initial = read_weights(mConfig, weights_file(*options.LoadFrom));
        } else if (std::filesystem::is_directory(options.NameOrPath) &&
                   std::filesystem::exists(weights_file(options.NameOrPath))) {
            initial = read_weights(mConfig, weights_file(options.NameOrPath));
        } else {
            initial.resize(mConfig.num_parameters());
            init_parameters(mConfig, mOptions.Seed, initial);
        }
        mPolicy->assign_full(initial);
        if (mReference) {
            mReference->assign_full(initial);
        }
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigError(fmt::format("Cannot load {} weights from `{}`: {}",
                                      mReference ? "policy and reference" : "policy", source, e.what()));
    }
}

ModelPair::~ModelPair() = default;

std::vector<float> ModelPair::compute_logps(ParameterStore& store, std::span<const std::int32_t> ids,
                                            std::span<const std::int32_t> labels, int rows, int seq_len,
                                            ActivationCache* cache) {
    auto params = store.gather();
    if (params.dtype() == ETensorDType::BF16) {
        return sequence_logps(mConfig, params.data<bf16>(), ids, labels, rows, seq_len, cache);
    }
    return sequence_logps(mConfig, params.data<float>(), ids, labels, rows, seq_len, cache);
}

LogProbabilities ModelPair::forward(const Batch& slice, bool train) {
    LogProbabilities result;
    ActivationCache cache;
    const bool keep_activations = train && !mOptions.ActivationCheckpointing;

    result.Policy = compute_logps(*mPolicy, slice.InputIds, slice.Labels, slice.num_rows(), slice.SeqLen,
                                  keep_activations ? &cache : nullptr);
    if (slice.has_kl()) {
        result.PolicyKL = compute_logps(*mPolicy, slice.KLInputIds, slice.KLLabels, slice.num_items(), slice.KLSeqLen, nullptr);
    }
    if (mReference) {
        result.Reference = compute_logps(*mReference, slice.InputIds, slice.Labels, slice.num_rows(), slice.SeqLen, nullptr);
        if (slice.has_kl()) {
            result.ReferenceKL = compute_logps(*mReference, slice.KLInputIds, slice.KLLabels, slice.num_items(),
                                               slice.KLSeqLen, nullptr);
        }
    }

    if (train) {
        mLastIds = slice.InputIds;
        mLastLabels = slice.Labels;
        mLastRows = slice.num_rows();
        mLastSeqLen = slice.SeqLen;
        if (keep_activations) {
            mLastActivations = std::move(cache);
        } else {
            mLastActivations.reset();
        }
    }
    return result;
}

/**
 * @brief Backpropagate `dlogps` through the policy and accumulate the averaged gradients into the owned shard.
 *
 * Without cached activations (activation checkpointing), the hidden layer is recomputed
 * from the re-gathered parameters.
 */
void ModelPair::backward(std::span<const float> dlogps) {
    if (mLastSeqLen == 0 && mLastRows == 0) {
        throw std::logic_error("ModelPair::backward called without a preceding training forward");
    }

    std::vector<float> grads(mPolicy->padded_size(), 0.f);
    {
        auto params = mPolicy->gather();
        const ActivationCache* cache = mLastActivations ? &*mLastActivations : nullptr;
        if (params.dtype() == ETensorDType::BF16) {
            sequence_logps_backward(mConfig, params.data<bf16>(), mLastIds, mLastLabels, mLastRows, mLastSeqLen,
                                    dlogps, cache, grads.data());
        } else {
            sequence_logps_backward(mConfig, params.data<float>(), mLastIds, mLastLabels, mLastRows, mLastSeqLen,
                                    dlogps, cache, grads.data());
        }
    }
    mPolicy->reduce_gradients(grads);

    mLastActivations.reset();
    mLastIds.clear();
    mLastLabels.clear();
    mLastRows = 0;
    mLastSeqLen = 0;
}

float ModelPair::clip_gradients(float max_norm) {
    double sq = mPolicy->local_grad_sq_norm();
    if (mPolicy->is_sharded() && mComm.world_size() > 1) {
        sq = mComm.all_reduce_sum(static_cast<float>(sq));
    }
    const float norm = static_cast<float>(std::sqrt(sq));
    if (std::isfinite(norm) && norm > max_norm) {
        mPolicy->scale_gradients(max_norm / (norm + 1e-6f));
    }
    return norm;
}

float ModelPair::clip_value_head_gradients(float /*max_norm*/) {
    // the causal LM has no value head
    return 0.f;
}

void ModelPair::zero_grad() {
    mPolicy->zero_grad();
}

void ModelPair::optimizer_step(optimizers::Optimizer& optimizer, float lr) {
    optimizer.step(mPolicy->master(), mPolicy->grads(), lr);
}

PolicySnapshot ModelPair::snapshot(optimizers::Optimizer* optimizer) {
    PolicySnapshot snap;
    snap.Weights = mPolicy->gather_full_master();
    if (optimizer) {
        snap.OptimizerName = std::string(optimizers::optimizer_type_to_str(optimizer->config().type));
        snap.OptimizerStep = optimizer->step_count();
        for (auto& [name, buffer] : optimizer->state_buffers()) {
            snap.OptimizerState.emplace_back(name, mPolicy->gather_full(*buffer));
        }
    }
    return snap;
}

/**
 * @brief Write a snapshot as weight artifact, model config and optimizer state.
 *
 * Every file is written through a temporary name, so a failure leaves no partial file behind.
 */
void ModelPair::write_snapshot(const PolicySnapshot& snapshot, const std::string& directory) const {
    std::filesystem::create_directories(directory);
    auto dir = std::filesystem::path(directory);

    std::vector<float> weights = snapshot.Weights;
    FlatParameterContainer container(mConfig, weights);
    write_safetensors((dir / "policy.safetensors").string(), container);
    save_pretrained_config(mConfig, (dir / "config.json").string().c_str());

    if (snapshot.OptimizerName.empty()) return;
    std::vector<std::vector<float>> state;
    for (const auto& [name, values] : snapshot.OptimizerState) {
        state.push_back(values);
    }
    SafeTensorWriter writer{(dir / "optimizer.safetensors").string()};
    for (std::size_t i = 0; i < state.size(); ++i) {
        writer.register_tensor(snapshot.OptimizerState[i].first, TensorShard(Tensor::from_vector(state[i])));
    }
    writer.set_metadata("optimizer", snapshot.OptimizerName);
    writer.set_metadata("step", std::to_string(snapshot.OptimizerStep));
    writer.prepare_metadata();
    for (std::size_t i = 0; i < state.size(); ++i) {
        writer.write_tensor(snapshot.OptimizerState[i].first, TensorShard(Tensor::from_vector(state[i])));
    }
    writer.finalize();
}

void ModelPair::load_policy_weights(const std::string& path) {
    mPolicy->assign_full(read_weights(mConfig, weights_file(path)));
}

/**
 * @brief Restore optimizer state written by save_optimizer_state; every worker keeps its shard.
 *
 * @throws std::runtime_error if the file was written by a different optimizer or for a different model size.
 */
void ModelPair::load_optimizer_state(optimizers::Optimizer& optimizer, const std::string& file_name) {
    SafeTensorsReader reader{file_name};
    const auto& meta = reader.metadata();
    auto expected = std::string(optimizers::optimizer_type_to_str(optimizer.config().type));
    auto found = meta.find("optimizer");
    if (found == meta.end() || found->second != expected) {
        throw std::runtime_error(fmt::format("Optimizer state in `{}` was not written by {}", file_name, expected));
    }

    for (auto& [name, buffer] : optimizer.state_buffers()) {
        std::vector<float> full(mPolicy->num_parameters());
        Tensor target = Tensor::from_vector(full);
        reader.find_entry(name).read_tensor(target, false);
        *buffer = mPolicy->local_part(full);
    }
    auto step = meta.find("step");
    optimizer.set_step_count(step == meta.end() ? 0 : std::stoi(step->second));
}

std::vector<std::string> ModelPair::sample(const Batch& slice, int max_length, float top_p, std::uint64_t seed) {
    Philox4x32 rng{seed};
    std::vector<std::int32_t> tokens;
    std::vector<std::int32_t> lengths;
    {
        auto params = mPolicy->gather();
        const auto first_stream = static_cast<std::uint32_t>(mComm.rank() * slice.num_items());
        for (int i = 0; i < slice.num_items(); ++i) {
            const auto& prompt = slice.Items[i].PromptTokens;
            const int max_new = std::max(0, max_length - static_cast<int>(prompt.size()));
            std::vector<std::int32_t> generated;
            if (params.dtype() == ETensorDType::BF16) {
                generated = generate(mConfig, params.data<bf16>(), prompt, max_new, top_p, rng, first_stream + i);
            } else {
                generated = generate(mConfig, params.data<float>(), prompt, max_new, top_p, rng, first_stream + i);
            }
            lengths.push_back(static_cast<std::int32_t>(generated.size()));
            tokens.insert(tokens.end(), generated.begin(), generated.end());
        }
    }

    auto all_tokens = mComm.host_all_gather_vector(tokens);
    auto all_lengths = mComm.host_all_gather_vector(lengths);
    ByteTokenizer tokenizer{mConfig};
    std::vector<std::string> texts;
    texts.reserve(all_lengths.size());
    std::size_t offset = 0;
    for (std::int32_t len : all_lengths) {
        texts.push_back(tokenizer.decode(std::span<const std::int32_t>(all_tokens.data() + offset, len)));
        offset += len;
    }
    return texts;
}

} // namespace models
