// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include "config/run_config.h"
#include "losses/loss.h"
#include "training/logging.h"
#include "training/trainer.h"
#include "utilities/comm.h"
#include "utilities/dtype.h"
#include "utilities/utils.h"

/**
 * @brief CLI11 lexical cast hook for parsing ETensorDType options.
 *
 * @param input String value provided on the command line.
 * @param output Parsed tensor dtype.
 * @return Always true (parsing errors are handled by dtype_from_str).
 */
bool lexical_cast(const std::string& input, ETensorDType& output) {
    output = dtype_from_str(input);
    return true;
}

namespace CLI::detail {
    template<>
    constexpr const char* type_name<ETensorDType>() {
        return "DTYPE";
    }
}

namespace {

std::atomic<bool> gStopRequested{false};

extern "C" void handle_stop_signal(int) {
    gStopRequested.store(true);
}

} // namespace

/**
 * @brief Entry point state: the run configuration plus the command-line overrides applied to it.
 */
struct TrainingRunner {
    /// Run configuration file; built-in defaults if empty.
    std::string ConfigFile;
    /// Verbosity of the stdout log (-2 silent ... 1 verbose).
    int Verbosity = TrainingRunLogger::DEFAULT;
    /// JSON log file; defaults to `<run_dir>/log.json`.
    std::string LogFile;

    RunConfig Config;
    std::chrono::steady_clock::time_point BeginStartup;

    /**
     * @brief Parse command-line options, load the configuration file and apply overrides.
     * @throws ConfigError for an invalid configuration.
     */
    void load_training_config(int argc, const char** argv);

    /**
     * @brief Launch one worker thread per simulated device and run the configured mode (blocking).
     */
    void launch_training(int argc, const char** argv);

    /**
     * @brief Execute the configured mode on one worker.
     */
    void run_training(int argc, const char** argv, Communicator& comm);
};

void TrainingRunner::load_training_config(int argc, const char** argv) {
    BeginStartup = std::chrono::steady_clock::now();
    CLI::App app{"HALO alignment trainer"};

    std::string mode, loss, exp_name, run_dir, model;
    float lr = 0.f;
    int seed = 0, n_epochs = 0, world_size = 0;
    long n_examples = 0;
    ETensorDType policy_dtype = ETensorDType::BF16;
    ETensorDType reference_dtype = ETensorDType::BF16;

    app.add_option("--config", ConfigFile, "Run configuration (JSON)")->check(CLI::ExistingFile);
    auto* mode_opt = app.add_option("--mode", mode, "What to do: train, sample or eval")
        ->check(CLI::IsMember({"train", "sample", "eval"}));
    auto* loss_opt = app.add_option("--loss", loss, "Loss function")
        ->check(CLI::IsMember(losses::registered_losses()));
    auto* lr_opt = app.add_option("--lr", lr, "Peak learning rate")->check(CLI::PositiveNumber);
    auto* seed_opt = app.add_option("--seed", seed, "Random seed");
    auto* exp_name_opt = app.add_option("--exp-name", exp_name, "Experiment name");
    auto* model_opt = app.add_option("--model", model, "Model directory or built-in model size");
    auto* n_epochs_opt = app.add_option("--n-epochs", n_epochs, "Number of epochs")->check(CLI::PositiveNumber);
    auto* n_examples_opt = app.add_option("--n-examples", n_examples, "Number of training examples")->check(CLI::PositiveNumber);
    auto* world_size_opt = app.add_option("--world-size", world_size, "Number of workers")->check(CLI::PositiveNumber);
    auto* run_dir_opt = app.add_option("--run-dir", run_dir, "Run directory (checkpoints, logs, eval results)");
    auto* policy_dtype_opt = app.add_option("--policy-dtype", policy_dtype, "Compute dtype of the policy");
    auto* reference_dtype_opt = app.add_option("--reference-dtype", reference_dtype, "Compute dtype of the reference model");
    auto* resume_opt = app.add_flag("--resume", "Continue from the LATEST checkpoint of the run directory");
    auto* debug_opt = app.add_flag("--debug", "Do not write checkpoints");
    app.add_option("--verbosity", Verbosity, "Console verbosity: -2 silent, -1 quiet, 0 default, 1 verbose")
        ->check(CLI::Range(-2, 1));
    app.add_option("--log-file", LogFile, "Where to write the JSON log");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (!ConfigFile.empty()) {
        Config = load_run_config(ConfigFile);
    }
    if (mode_opt->count()) Config.Mode = mode;
    if (loss_opt->count()) Config.Loss.Name = loss;
    if (lr_opt->count()) Config.LR = lr;
    if (seed_opt->count()) Config.Seed = seed;
    if (exp_name_opt->count()) Config.ExpName = exp_name;
    if (model_opt->count()) Config.Model.NameOrPath = model;
    if (n_epochs_opt->count()) Config.NEpochs = n_epochs;
    if (n_examples_opt->count()) Config.NExamples = n_examples;
    if (world_size_opt->count()) Config.WorldSize = world_size;
    if (run_dir_opt->count()) Config.LocalRunDir = run_dir;
    if (policy_dtype_opt->count()) Config.Model.PolicyDType = policy_dtype;
    if (reference_dtype_opt->count()) Config.Model.ReferenceDType = reference_dtype;
    if (resume_opt->count()) Config.Resume = true;
    if (debug_opt->count()) Config.Debug = true;

    validate_run_config(Config);
    if (LogFile.empty()) {
        LogFile = (std::filesystem::path(Config.run_dir()) / "log.json").string();
    }
}

void TrainingRunner::launch_training(int argc, const char** argv) {
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    // Use the blocking runner so exceptions get rethrown from `join()` (not a noexcept destructor).
    Communicator::run_communicators(Config.WorldSize,
        [&](Communicator& comm) { run_training(argc, argv, comm); });
}

void TrainingRunner::run_training(int argc, const char** argv, Communicator& comm) {
    TrainingRunLogger logger(LogFile, comm.rank(), static_cast<TrainingRunLogger::EVerbosity>(Verbosity), Config.Resume);
    logger.log_cmd(argc, argv);
    logger.log_options({
        {"exp-name",            Config.ExpName},
        {"mode",                Config.Mode},
        {"loss",                Config.Loss.Name},
        {"model",               Config.Model.NameOrPath},
        {"policy-dtype",        std::string(dtype_to_str(Config.Model.PolicyDType))},
        {"reference-dtype",     std::string(dtype_to_str(Config.Model.ReferenceDType))},
        {"world-size",          static_cast<std::int64_t>(Config.WorldSize)},
        {"use-fsdp",            Config.UseFSDP},
        {"seed",                static_cast<std::int64_t>(Config.Seed)},
        {"lr",                  Config.LR},
        {"warmup-steps",        static_cast<std::int64_t>(Config.WarmupSteps)},
        {"optimizer",           Config.Optimizer},
        {"batch-size",          static_cast<std::int64_t>(Config.Model.BatchSize)},
        {"grad-accumulation",   static_cast<std::int64_t>(Config.Model.GradientAccumulationSteps)},
        {"max-length",          static_cast<std::int64_t>(Config.Model.MaxLength)},
        {"max-prompt-length",   static_cast<std::int64_t>(Config.Model.MaxPromptLength)},
        {"beta",                Config.Loss.Beta},
        {"eval-every",          static_cast<std::int64_t>(Config.EvalEvery)},
        {"run-dir",             Config.run_dir()},
        {"resume",              Config.Resume},
    });

    Trainer trainer(Config, comm, logger, &gStopRequested);
    auto setup = std::chrono::steady_clock::now() - BeginStartup;
    logger.log_message(0, fmt::format("setup took {} ms",
                                      std::chrono::duration_cast<std::chrono::milliseconds>(setup).count()));
    trainer.run();
    logger.log_message(trainer.counters().Updates, fmt::format("finished: {} examples, {} updates",
                                                               trainer.counters().Examples, trainer.counters().Updates));
}

int main(int argc, const char** argv) {
    try {
        TrainingRunner runner;
        runner.load_training_config(argc, argv);
        runner.launch_training(argc, argv);
        return 0;
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
