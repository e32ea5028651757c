// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "config/run_config.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "config/json_helpers.h"
#include "losses/loss.h"
#include "runtime/optimizers/optimizer_base.h"
#include "utilities/utils.h"

using config_json::get_opt;
using config_json::read_into;

namespace {

ETensorDType parse_compute_dtype(const nlohmann::json& obj, const char* key, ETensorDType fallback) {
    auto name = get_opt<std::string>(obj, key);
    if (!name) return fallback;
    ETensorDType dtype;
    try {
        dtype = dtype_from_str(*name);
    } catch (const std::runtime_error& e) {
        throw ConfigError(fmt::format("config key `{}`: {}", key, e.what()));
    }
    if (dtype != ETensorDType::FP32 && dtype != ETensorDType::BF16) {
        throw ConfigError(fmt::format("config key `{}`: only float32 and bfloat16 are supported, got {}", key, *name));
    }
    return dtype;
}

const char* compute_dtype_name(ETensorDType dtype) {
    return dtype == ETensorDType::BF16 ? "bfloat16" : "float32";
}

ModelConfig model_config_from_json(const nlohmann::json& obj) {
    ModelConfig cfg;
    read_into(obj, "name_or_path", cfg.NameOrPath);
    cfg.LoadFrom = get_opt<std::string>(obj, "load_from");
    cfg.PolicyDType = parse_compute_dtype(obj, "policy_dtype", cfg.PolicyDType);
    cfg.ReferenceDType = parse_compute_dtype(obj, "reference_dtype", cfg.ReferenceDType);
    read_into(obj, "max_grad_norm", cfg.MaxGradNorm);
    read_into(obj, "v_head_max_grad_norm", cfg.VHeadMaxGradNorm);
    read_into(obj, "max_length", cfg.MaxLength);
    read_into(obj, "max_prompt_length", cfg.MaxPromptLength);
    read_into(obj, "activation_checkpointing", cfg.ActivationCheckpointing);
    read_into(obj, "batch_size", cfg.BatchSize);
    read_into(obj, "gradient_accumulation_steps", cfg.GradientAccumulationSteps);
    read_into(obj, "eval_batch_size", cfg.EvalBatchSize);
    return cfg;
}

LossConfig loss_config_from_json(const nlohmann::json& obj) {
    LossConfig cfg;
    read_into(obj, "name", cfg.Name);
    read_into(obj, "trainer", cfg.Trainer);
    read_into(obj, "dataloader", cfg.Dataloader);
    cfg.UseReferenceModel = get_opt<bool>(obj, "use_reference_model");
    read_into(obj, "beta", cfg.Beta);
    read_into(obj, "desirable_weight", cfg.DesirableWeight);
    read_into(obj, "undesirable_weight", cfg.UndesirableWeight);
    read_into(obj, "lambda_coef", cfg.LambdaCoef);
    return cfg;
}

void check_fraction(float value, const char* key) {
    if (!(value > 0.f && value <= 1.f)) {
        throw ConfigError(fmt::format("`{}` must be in (0, 1], got {}", key, value));
    }
}

} // namespace

std::string RunConfig::run_dir() const {
    if (!LocalRunDir.empty()) {
        return LocalRunDir;
    }
    return (std::filesystem::path(CacheDir) / ExpName).string();
}

bool RunConfig::use_reference_model() const {
    if (Loss.UseReferenceModel) {
        return *Loss.UseReferenceModel;
    }
    return losses::loss_traits(Loss.Name).RequiresReference;
}

/**
 * @brief Build a RunConfig from a parsed JSON document.
 *
 * Unknown keys are ignored; missing keys keep their defaults.
 *
 * @throws ConfigError if a present key has the wrong type.
 */
RunConfig run_config_from_json(const nlohmann::json& config_json) {
    if (!config_json.is_object()) {
        throw ConfigError("run configuration must be a JSON object");
    }

    RunConfig cfg;
    read_into(config_json, "seed", cfg.Seed);
    read_into(config_json, "exp_name", cfg.ExpName);
    read_into(config_json, "datasets", cfg.Datasets);
    read_into(config_json, "data_dir", cfg.DataDir);
    read_into(config_json, "mode", cfg.Mode);
    read_into(config_json, "debug", cfg.Debug);
    read_into(config_json, "use_fsdp", cfg.UseFSDP);
    read_into(config_json, "fsdp_port", cfg.FSDPPort);
    read_into(config_json, "world_size", cfg.WorldSize);
    if (auto it = config_json.find("wandb"); it != config_json.end() && it->is_object()) {
        read_into(*it, "enabled", cfg.Wandb.Enabled);
        read_into(*it, "entity", cfg.Wandb.Entity);
        read_into(*it, "project", cfg.Wandb.Project);
    }
    read_into(config_json, "cache_dir", cfg.CacheDir);
    read_into(config_json, "local_run_dir", cfg.LocalRunDir);
    read_into(config_json, "do_first_eval", cfg.DoFirstEval);
    read_into(config_json, "minimum_log_interval_secs", cfg.MinimumLogIntervalSecs);
    read_into(config_json, "intermediate_checkpoints", cfg.IntermediateCheckpoints);
    read_into(config_json, "save_optimizer_state", cfg.SaveOptimizerState);
    read_into(config_json, "lr", cfg.LR);
    if (config_json.contains("n_epochs")) {
        cfg.NEpochs = get_opt<int>(config_json, "n_epochs");
    }
    cfg.NExamples = get_opt<long>(config_json, "n_examples");
    read_into(config_json, "optimizer", cfg.Optimizer);
    read_into(config_json, "warmup_steps", cfg.WarmupSteps);
    read_into(config_json, "eval_every", cfg.EvalEvery);
    read_into(config_json, "n_samples", cfg.NSamples);
    read_into(config_json, "samples_dir", cfg.SamplesDir);
    read_into(config_json, "n_eval_examples", cfg.NEvalExamples);
    read_into(config_json, "top_p", cfg.TopP);
    read_into(config_json, "human_prefix", cfg.HumanPrefix);
    read_into(config_json, "human_suffix", cfg.HumanSuffix);
    read_into(config_json, "assistant_prefix", cfg.AssistantPrefix);
    read_into(config_json, "assistant_suffix", cfg.AssistantSuffix);
    read_into(config_json, "frac_unique_desirable", cfg.FracUniqueDesirable);
    read_into(config_json, "frac_unique_undesirable", cfg.FracUniqueUndesirable);
    read_into(config_json, "max_nonfinite_skips", cfg.MaxNonfiniteSkips);
    read_into(config_json, "checkpoint_retry_backoff_ms", cfg.CheckpointRetryBackoffMs);
    read_into(config_json, "resume", cfg.Resume);

    if (auto it = config_json.find("model"); it != config_json.end()) {
        cfg.Model = model_config_from_json(*it);
    }
    if (auto it = config_json.find("loss"); it != config_json.end()) {
        cfg.Loss = loss_config_from_json(*it);
    }
    return cfg;
}

nlohmann::json run_config_to_json(const RunConfig& cfg) {
    nlohmann::json model = {
        {"name_or_path", cfg.Model.NameOrPath},
        {"load_from", cfg.Model.LoadFrom ? nlohmann::json(*cfg.Model.LoadFrom) : nlohmann::json(nullptr)},
        {"policy_dtype", compute_dtype_name(cfg.Model.PolicyDType)},
        {"reference_dtype", compute_dtype_name(cfg.Model.ReferenceDType)},
        {"max_grad_norm", cfg.Model.MaxGradNorm},
        {"v_head_max_grad_norm", cfg.Model.VHeadMaxGradNorm},
        {"max_length", cfg.Model.MaxLength},
        {"max_prompt_length", cfg.Model.MaxPromptLength},
        {"activation_checkpointing", cfg.Model.ActivationCheckpointing},
        {"batch_size", cfg.Model.BatchSize},
        {"gradient_accumulation_steps", cfg.Model.GradientAccumulationSteps},
        {"eval_batch_size", cfg.Model.EvalBatchSize},
    };
    nlohmann::json loss = {
        {"name", cfg.Loss.Name},
        {"trainer", cfg.Loss.Trainer},
        {"dataloader", cfg.Loss.Dataloader},
        {"use_reference_model", cfg.use_reference_model()},
        {"beta", cfg.Loss.Beta},
        {"desirable_weight", cfg.Loss.DesirableWeight},
        {"undesirable_weight", cfg.Loss.UndesirableWeight},
        {"lambda_coef", cfg.Loss.LambdaCoef},
    };
    return {
        {"seed", cfg.Seed},
        {"exp_name", cfg.ExpName},
        {"datasets", cfg.Datasets},
        {"data_dir", cfg.DataDir},
        {"mode", cfg.Mode},
        {"debug", cfg.Debug},
        {"use_fsdp", cfg.UseFSDP},
        {"fsdp_port", cfg.FSDPPort},
        {"world_size", cfg.WorldSize},
        {"wandb", {{"enabled", cfg.Wandb.Enabled}, {"entity", cfg.Wandb.Entity}, {"project", cfg.Wandb.Project}}},
        {"cache_dir", cfg.CacheDir},
        {"local_run_dir", cfg.run_dir()},
        {"do_first_eval", cfg.DoFirstEval},
        {"minimum_log_interval_secs", cfg.MinimumLogIntervalSecs},
        {"intermediate_checkpoints", cfg.IntermediateCheckpoints},
        {"save_optimizer_state", cfg.SaveOptimizerState},
        {"lr", cfg.LR},
        {"n_epochs", cfg.NEpochs ? nlohmann::json(*cfg.NEpochs) : nlohmann::json(nullptr)},
        {"n_examples", cfg.NExamples ? nlohmann::json(*cfg.NExamples) : nlohmann::json(nullptr)},
        {"optimizer", cfg.Optimizer},
        {"warmup_steps", cfg.WarmupSteps},
        {"eval_every", cfg.EvalEvery},
        {"n_samples", cfg.NSamples},
        {"samples_dir", cfg.SamplesDir},
        {"n_eval_examples", cfg.NEvalExamples},
        {"top_p", cfg.TopP},
        {"human_prefix", cfg.HumanPrefix},
        {"human_suffix", cfg.HumanSuffix},
        {"assistant_prefix", cfg.AssistantPrefix},
        {"assistant_suffix", cfg.AssistantSuffix},
        {"frac_unique_desirable", cfg.FracUniqueDesirable},
        {"frac_unique_undesirable", cfg.FracUniqueUndesirable},
        {"max_nonfinite_skips", cfg.MaxNonfiniteSkips},
        {"checkpoint_retry_backoff_ms", cfg.CheckpointRetryBackoffMs},
        {"resume", cfg.Resume},
        {"model", model},
        {"loss", loss},
    };
}

RunConfig load_run_config(const std::string& file_name) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw ConfigError(fmt::format("could not open config file {}", file_name));
    }
    nlohmann::json config_json;
    try {
        config_json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(fmt::format("could not parse config file {}: {}", file_name, e.what()));
    }
    return run_config_from_json(config_json);
}

void save_run_config(const RunConfig& config, const std::string& file_name) {
    std::ofstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open file {} for writing", file_name));
    }
    file << std::setw(2) << run_config_to_json(config);
}

void validate_run_config(const RunConfig& cfg) {
    if (cfg.Mode != "train" && cfg.Mode != "sample" && cfg.Mode != "eval") {
        throw ConfigError(fmt::format("Unknown mode `{}`; expected train, sample or eval", cfg.Mode));
    }
    optimizers::optimizer_type_from_str(cfg.Optimizer);

    const losses::LossTraits& traits = losses::loss_traits(cfg.Loss.Name);
    if (!cfg.Loss.Trainer.empty() && cfg.Loss.Trainer != traits.TrainerTag) {
        throw ConfigError(fmt::format("loss `{}` is trained by {}, but trainer `{}` is configured",
                                      cfg.Loss.Name, traits.TrainerTag, cfg.Loss.Trainer));
    }
    if (!cfg.Loss.Dataloader.empty() && cfg.Loss.Dataloader != traits.DataloaderTag) {
        throw ConfigError(fmt::format("loss `{}` needs {}, but dataloader `{}` is configured",
                                      cfg.Loss.Name, traits.DataloaderTag, cfg.Loss.Dataloader));
    }
    if (traits.RequiresReference && !cfg.use_reference_model()) {
        throw ConfigError(fmt::format("loss `{}` requires a reference model, but use_reference_model is false", cfg.Loss.Name));
    }

    check_fraction(cfg.FracUniqueDesirable, "frac_unique_desirable");
    check_fraction(cfg.FracUniqueUndesirable, "frac_unique_undesirable");
    if (traits.Shape == losses::ELossShape::PAIRED && cfg.FracUniqueDesirable != cfg.FracUniqueUndesirable) {
        throw ConfigError(fmt::format("paired loss `{}` keeps chosen and rejected together, so frac_unique_desirable ({}) "
                                      "must equal frac_unique_undesirable ({})",
                                      cfg.Loss.Name, cfg.FracUniqueDesirable, cfg.FracUniqueUndesirable));
    }

    if (cfg.Datasets.empty()) {
        throw ConfigError("no datasets configured");
    }
    if (cfg.WorldSize <= 0) {
        throw ConfigError(fmt::format("world_size must be positive, got {}", cfg.WorldSize));
    }
    if (cfg.Model.MaxLength <= 0 || cfg.Model.MaxPromptLength < 0 || cfg.Model.MaxPromptLength >= cfg.Model.MaxLength) {
        throw ConfigError(fmt::format("max_prompt_length ({}) must be smaller than max_length ({})",
                                      cfg.Model.MaxPromptLength, cfg.Model.MaxLength));
    }
    if (cfg.Model.BatchSize <= 0 || cfg.Model.BatchSize % cfg.WorldSize != 0) {
        throw ConfigError(fmt::format("batch_size ({}) must be a positive multiple of world_size ({})",
                                      cfg.Model.BatchSize, cfg.WorldSize));
    }
    if (cfg.Model.EvalBatchSize <= 0 || cfg.Model.EvalBatchSize % cfg.WorldSize != 0) {
        throw ConfigError(fmt::format("eval_batch_size ({}) must be a positive multiple of world_size ({})",
                                      cfg.Model.EvalBatchSize, cfg.WorldSize));
    }
    if (traits.Shape == losses::ELossShape::UNPAIRED) {
        if (cfg.Model.BatchSize / cfg.WorldSize < 2 || cfg.Model.EvalBatchSize / cfg.WorldSize < 2) {
            throw ConfigError(fmt::format("unpaired loss `{}` needs at least two examples per worker micro-batch "
                                          "(batch_size {}, eval_batch_size {}, world_size {})",
                                          cfg.Loss.Name, cfg.Model.BatchSize, cfg.Model.EvalBatchSize, cfg.WorldSize));
        }
    }
    if (cfg.EvalEvery <= 0) {
        throw ConfigError(fmt::format("eval_every must be positive, got {}", cfg.EvalEvery));
    }
    if (cfg.Model.GradientAccumulationSteps <= 0) {
        throw ConfigError(fmt::format("gradient_accumulation_steps must be positive, got {}", cfg.Model.GradientAccumulationSteps));
    }
    if (!cfg.NEpochs && !cfg.NExamples) {
        throw ConfigError("either n_epochs or n_examples must bound the run");
    }
    if (cfg.NEpochs && *cfg.NEpochs <= 0) {
        throw ConfigError(fmt::format("n_epochs must be positive, got {}", *cfg.NEpochs));
    }
    if (cfg.NExamples && *cfg.NExamples <= 0) {
        throw ConfigError(fmt::format("n_examples must be positive, got {}", *cfg.NExamples));
    }
    if (cfg.WarmupSteps < 0 || cfg.MaxNonfiniteSkips < 0 || cfg.CheckpointRetryBackoffMs < 0) {
        throw ConfigError("warmup_steps, max_nonfinite_skips and checkpoint_retry_backoff_ms must not be negative");
    }
    if (!(cfg.TopP > 0.f && cfg.TopP <= 1.f)) {
        throw ConfigError(fmt::format("top_p must be in (0, 1], got {}", cfg.TopP));
    }
}
