// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_CONFIG_RUN_CONFIG_H
#define HALO_SRC_CONFIG_RUN_CONFIG_H

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "utilities/dtype.h"

//! \brief The nested `model` block of the run configuration.
struct ModelConfig {
    std::string NameOrPath;                 ///< directory with config.json (+ policy.safetensors) or a built-in size; empty = halo-small
    std::optional<std::string> LoadFrom;    ///< checkpoint directory or safetensors file; weights only
    ETensorDType PolicyDType = ETensorDType::BF16;
    ETensorDType ReferenceDType = ETensorDType::BF16;
    float MaxGradNorm = 10.0f;
    float VHeadMaxGradNorm = 0.1f;
    int MaxLength = 2048;
    int MaxPromptLength = 1024;
    bool ActivationCheckpointing = true;
    int BatchSize = 32;
    int GradientAccumulationSteps = 1;
    int EvalBatchSize = 16;
};

//! \brief The nested `loss` block of the run configuration.
struct LossConfig {
    std::string Name = "sft";
    std::string Trainer;        ///< optional tag; must match the loss if given
    std::string Dataloader;     ///< optional tag; must match the loss if given
    std::optional<bool> UseReferenceModel;   ///< defaults to whether the loss needs one
    float Beta = 0.1f;
    float DesirableWeight = 1.0f;
    float UndesirableWeight = 1.0f;
    float LambdaCoef = 0.1f;
};

struct WandbConfig {
    bool Enabled = false;
    std::string Entity;
    std::string Project;
};

/**
 * @brief Complete configuration of one training / sampling / evaluation run.
 */
struct RunConfig {
    int Seed = 1;
    std::string ExpName = "halo";
    std::vector<std::string> Datasets;
    std::string DataDir = "data";
    std::string Mode = "train";
    bool Debug = false;
    bool UseFSDP = true;
    int FSDPPort = 0;
    int WorldSize = 1;
    WandbConfig Wandb;
    std::string CacheDir = "./cache";
    std::string LocalRunDir;            ///< defaults to <cache_dir>/<exp_name>
    bool DoFirstEval = true;
    float MinimumLogIntervalSecs = 1.0f;
    bool IntermediateCheckpoints = false;
    bool SaveOptimizerState = true;
    float LR = 5e-7f;
    std::optional<int> NEpochs = 1;     ///< null = bounded by n_examples only
    std::optional<long> NExamples;
    std::string Optimizer = "RMSprop";
    int WarmupSteps = 150;
    long EvalEvery = 20000;
    int NSamples = 128;
    std::string SamplesDir = "samples/";
    int NEvalExamples = 512;
    float TopP = 0.95f;
    std::string HumanPrefix = "\n<|user|>\n";
    std::string HumanSuffix;
    std::string AssistantPrefix = "\n<|assistant|>\n";
    std::string AssistantSuffix;
    float FracUniqueDesirable = 1.0f;
    float FracUniqueUndesirable = 1.0f;
    int MaxNonfiniteSkips = 10;
    int CheckpointRetryBackoffMs = 1000;
    bool Resume = false;

    ModelConfig Model;
    LossConfig Loss;

    //! The run directory (`local_run_dir`, or `<cache_dir>/<exp_name>`).
    [[nodiscard]] std::string run_dir() const;
    //! Whether the reference model is used, after applying the loss default.
    [[nodiscard]] bool use_reference_model() const;
};

RunConfig run_config_from_json(const nlohmann::json& config_json);
nlohmann::json run_config_to_json(const RunConfig& config);
RunConfig load_run_config(const std::string& file_name);
void save_run_config(const RunConfig& config, const std::string& file_name);

/**
 * @brief Check the configuration for consistency.
 * @throws ConfigError describing the first problem found.
 */
void validate_run_config(const RunConfig& config);

#endif //HALO_SRC_CONFIG_RUN_CONFIG_H
