// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "trainer.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "data/batch_assembler.h"
#include "data/example_source.h"
#include "data/tokenizer.h"
#include "models/model_pair.h"
#include "runtime/optimizers/optimizer.h"
#include "utilities/comm.h"
#include "utilities/utils.h"

namespace {

EExampleShape example_shape(losses::ELossShape shape) {
    switch (shape) {
        case losses::ELossShape::SFT: return EExampleShape::SFT;
        case losses::ELossShape::PAIRED: return EExampleShape::PAIRED;
        case losses::ELossShape::UNPAIRED: return EExampleShape::UNPAIRED;
    }
    throw std::logic_error("invalid loss shape");
}

float mean_of(const std::vector<float>& values) {
    if (values.empty()) return 0.f;
    return std::accumulate(values.begin(), values.end(), 0.f) / static_cast<float>(values.size());
}

void write_json_file(const std::string& file_name, const nlohmann::json& doc) {
    auto parent = std::filesystem::path(file_name).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream file(file_name);
    file << std::setw(2) << doc;
    file.flush();
    if (!file) {
        throw std::runtime_error(fmt::format("Error writing {}", file_name));
    }
}

} // namespace

const char* trainer_state_to_str(ETrainerState state) {
    switch (state) {
        case ETrainerState::INIT: return "INIT";
        case ETrainerState::WARMUP: return "WARMUP";
        case ETrainerState::TRAIN_STEP: return "TRAIN_STEP";
        case ETrainerState::EVAL: return "EVAL";
        case ETrainerState::CHECKPOINT: return "CHECKPOINT";
        case ETrainerState::DONE: return "DONE";
        case ETrainerState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief Set up loss, data pipeline, model pair and optimizer for one worker.
 *
 * @throws ConfigError if the configuration is invalid, does not match the communicator,
 *         or the model (or a required reference model) cannot be loaded.
 */
Trainer::Trainer(RunConfig config, Communicator& comm, TrainingRunLogger& logger, const std::atomic<bool>* stop_requested)
    : mConfig(std::move(config)), mComm(comm), mLogger(logger), mStopRequested(stop_requested),
      mLoss(losses::make_loss(mConfig.Loss.Name, {mConfig.Loss.Beta, mConfig.Loss.DesirableWeight,
                                                  mConfig.Loss.UndesirableWeight, mConfig.Loss.LambdaCoef})),
      mTraits(&losses::loss_traits(mLoss)),
      mSchedule(mConfig.LR, mConfig.WarmupSteps) {
    validate_run_config(mConfig);
    if (mConfig.WorldSize != mComm.world_size()) {
        throw ConfigError(fmt::format("world_size is {}, but {} workers are running", mConfig.WorldSize, mComm.world_size()));
    }

    mSource = make_example_source(example_shape(mTraits->Shape),
                                  {mConfig.Datasets, mConfig.DataDir, static_cast<std::uint64_t>(mConfig.Seed)});

    models::ModelPairOptions model_options;
    model_options.NameOrPath = mConfig.Model.NameOrPath;
    model_options.LoadFrom = mConfig.Model.LoadFrom;
    model_options.PolicyDType = mConfig.Model.PolicyDType;
    model_options.ReferenceDType = mConfig.Model.ReferenceDType;
    model_options.UseReference = mConfig.use_reference_model();
    model_options.Sharded = mConfig.UseFSDP;
    model_options.ActivationCheckpointing = mConfig.Model.ActivationCheckpointing;
    model_options.Seed = static_cast<std::uint64_t>(mConfig.Seed);
    mModel = std::make_unique<models::ModelPair>(model_options, mComm);

    BatchAssemblerOptions batch_options;
    batch_options.BatchSize = mConfig.Model.BatchSize;
    batch_options.EvalBatchSize = mConfig.Model.EvalBatchSize;
    batch_options.WorldSize = mComm.world_size();
    batch_options.FracUniqueDesirable = mConfig.FracUniqueDesirable;
    batch_options.FracUniqueUndesirable = mConfig.FracUniqueUndesirable;
    batch_options.MaxLength = mConfig.Model.MaxLength;
    batch_options.MaxPromptLength = mConfig.Model.MaxPromptLength;
    batch_options.KLCompanions = mTraits->UsesKLCompanions;
    batch_options.Seed = static_cast<std::uint64_t>(mConfig.Seed);
    batch_options.HumanPrefix = mConfig.HumanPrefix;
    batch_options.HumanSuffix = mConfig.HumanSuffix;
    batch_options.AssistantPrefix = mConfig.AssistantPrefix;
    batch_options.AssistantSuffix = mConfig.AssistantSuffix;
    mAssembler = std::make_unique<BatchAssembler>(*mSource, ByteTokenizer{mModel->config()}, batch_options);

    auto optimizer_config = optimizers::OptimizerConfig::from_type(
        optimizers::optimizer_type_from_str(mConfig.Optimizer), mConfig.LR);
    mOptimizer = std::make_unique<optimizers::Optimizer>(optimizer_config, mModel->local_optimizer_size());

    mNextEvalAt = mConfig.DoFirstEval ? 0 : mConfig.EvalEvery;
    mStartTime = mLastLogTime = std::chrono::steady_clock::now();
}

Trainer::~Trainer() = default;

void Trainer::run() {
    if (mConfig.Mode == "train") {
        train();
    } else if (mConfig.Mode == "eval") {
        write_eval_results();
    } else if (mConfig.Mode == "sample") {
        write_samples();
    } else {
        throw ConfigError(fmt::format("Unknown mode `{}`", mConfig.Mode));
    }
}

/**
 * @brief Restore counters, data position, policy weights and optimizer state from `<run_dir>/LATEST`.
 */
void Trainer::restore() {
    if (!mConfig.Resume) return;
    auto directory = find_checkpoint(get_checkpoint_path(mConfig.run_dir(), "LATEST"));
    if (!directory) {
        mLogger.log_warning(0, fmt::format("resume requested, but {} has no checkpoint; starting from scratch", mConfig.run_dir()));
        return;
    }

    CheckpointState state = [&] {
        auto section = mLogger.log_section_start(0, fmt::format("loading checkpoint from `{}`", *directory));
        return load_checkpoint(*directory, *mModel, mOptimizer.get());
    }();
    if (state.Data.Seed != static_cast<std::uint64_t>(mConfig.Seed)) {
        mLogger.log_warning(state.Counters.Updates, fmt::format("checkpoint was written with seed {}, the run uses seed {}",
                                                                state.Data.Seed, mConfig.Seed));
    }
    mCounters = state.Counters;
    mLastTrainMetrics = state.Metrics;
    mAssembler->set_state(state.Data.Epoch, state.Data.BatchIndex);
    if (mCounters.Examples > 0) {
        mNextEvalAt = (mCounters.Examples / mConfig.EvalEvery + 1) * mConfig.EvalEvery;
    }
    mExamplesAtLastLog = mCounters.Examples;
    mResumed = true;
    mLogger.log_message(mCounters.Updates, fmt::format("resumed from {} after {} examples (epoch {}, batch {})", *directory,
                                                       mCounters.Examples, state.Data.Epoch, state.Data.BatchIndex));
}

/**
 * @brief The training loop.
 *
 * Gradients of `gradient_accumulation_steps` consecutive batches are accumulated into one
 * update; a window may span an epoch boundary. Before the first batch of a window,
 * evaluation runs if the example counter has reached the next multiple of `eval_every`
 * (or is 0 and `do_first_eval` is set). The example budget and stop requests are checked
 * at window boundaries only, so every checkpoint is taken between updates. Ends when the
 * example or epoch budget is used up or a stop is requested, and always writes the
 * `LATEST` checkpoint.
 */
void Trainer::train() {
    try {
        restore();
        if (!mResumed) {
            mAssembler->start_epoch(0);
        }
        const auto& eval = eval_batches();
        int eval_examples = 0;
        for (const auto& b : eval) eval_examples += b.num_items();
        mLogger.log_dataset(mAssembler->stats(), eval_examples, static_cast<int>(eval.size()));

        mState = mCounters.Updates < mConfig.WarmupSteps ? ETrainerState::WARMUP : ETrainerState::TRAIN_STEP;
        mStartTime = mLastLogTime = std::chrono::steady_clock::now();

        bool stop = false;
        int epoch = mAssembler->epoch();
        while (!stop) {
            while (mAssembler->has_next()) {
                // budget, evaluation and stop requests are only handled between accumulation windows
                if (mMicroBatchesInWindow == 0) {
                    if (mConfig.NExamples && mCounters.Examples >= *mConfig.NExamples) {
                        stop = true;
                        break;
                    }
                    maybe_evaluate();
                }
                Batch batch = mAssembler->next();
                train_batch(batch);
                maybe_log(false);
                if (mMicroBatchesInWindow == 0 && stop_requested()) {
                    mLogger.log_message(mCounters.Updates, "stop requested, finishing the run");
                    stop = true;
                    break;
                }
            }
            if (stop) break;
            if (mAssembler->num_batches() == 0) {
                throw DataError(fmt::format("epoch {} has no complete batch of {} examples", epoch, mConfig.Model.BatchSize));
            }
            ++epoch;
            if (mConfig.NEpochs && epoch >= *mConfig.NEpochs) break;
            mAssembler->start_epoch(epoch);
        }

        if (mMicroBatchesInWindow > 0) {
            // incomplete accumulation window at the end of the last epoch
            mModel->zero_grad();
            mMicroBatchesInWindow = 0;
        }
        maybe_log(true);
        save("LATEST");
        mState = ETrainerState::DONE;
    } catch (...) {
        mLogger.log_warning(mCounters.Updates, fmt::format("training failed in state {} after {} examples",
                                                           trainer_state_to_str(mState), mCounters.Examples));
        mState = ETrainerState::FAILED;
        throw;
    }
}

void Trainer::maybe_evaluate() {
    if (mCounters.Examples < mNextEvalAt) return;
    evaluate();
    if (mCounters.Examples > 0 && mConfig.IntermediateCheckpoints) {
        save(intermediate_checkpoint_name(mCounters.Examples));
    }
    mNextEvalAt = (mCounters.Examples / mConfig.EvalEvery + 1) * mConfig.EvalEvery;
}

/**
 * @brief Forward, loss and backward for one batch; applies the update once the accumulation window is full.
 *
 * @throws DataError (with batch index and example ids) if the loss rejects the batch.
 * @throws std::runtime_error after more than `max_nonfinite_skips` consecutive non-finite updates.
 */
void Trainer::train_batch(const Batch& batch) {
    mState = mCounters.Updates < mConfig.WarmupSteps ? ETrainerState::WARMUP : ETrainerState::TRAIN_STEP;
    Batch local = batch.worker_slice(mComm.rank(), mComm.world_size());
    models::LogProbabilities logps = mModel->forward(local, true);
    SplitInputs split = split_inputs(local, logps);
    losses::LossResult result = compute(batch, split.Inputs);

    mCounters.Examples += batch.num_items();
    ++mCounters.Batches;

    const float loss = mComm.all_reduce_mean(result.Loss);
    if (!std::isfinite(loss)) {
        skip_update("non-finite loss");
        return;
    }

    const float scale = 1.f / static_cast<float>(mConfig.Model.GradientAccumulationSteps);
    std::vector<float> dlogps(local.num_rows(), 0.f);
    for (std::size_t i = 0; i < split.ChosenRows.size(); ++i) {
        dlogps[split.ChosenRows[i]] = result.GradChosen[i] * scale;
    }
    for (std::size_t i = 0; i < split.RejectedRows.size(); ++i) {
        dlogps[split.RejectedRows[i]] = result.GradRejected[i] * scale;
    }
    mModel->backward(dlogps);
    add_metrics(mTrainMetrics, "train", split, result);

    if (++mMicroBatchesInWindow == mConfig.Model.GradientAccumulationSteps) {
        apply_update();
    }
}

void Trainer::apply_update() {
    mMicroBatchesInWindow = 0;
    const float norm = mModel->clip_gradients(mConfig.Model.MaxGradNorm);
    mModel->clip_value_head_gradients(mConfig.Model.VHeadMaxGradNorm);
    if (!std::isfinite(norm)) {
        skip_update("non-finite gradient norm");
        return;
    }

    const float lr = mSchedule.eval(mCounters.Updates);
    mModel->optimizer_step(*mOptimizer, lr);
    mModel->zero_grad();
    ++mCounters.Updates;
    mLastLR = lr;
    mConsecutiveNonfinite = 0;
    mTrainMetrics.add("grad_norm", norm);
}

void Trainer::skip_update(const std::string& reason) {
    mModel->zero_grad();
    mMicroBatchesInWindow = 0;
    ++mConsecutiveNonfinite;
    ++mTotalNonfiniteSkips;
    mLogger.log_warning(mCounters.Updates, fmt::format("{} after {} examples, skipping update ({} in a row)",
                                                       reason, mCounters.Examples, mConsecutiveNonfinite));
    if (mConsecutiveNonfinite > mConfig.MaxNonfiniteSkips) {
        throw std::runtime_error(fmt::format("{} consecutive non-finite updates (limit {})",
                                             mConsecutiveNonfinite, mConfig.MaxNonfiniteSkips));
    }
}

bool Trainer::stop_requested() {
    int local = (mStopRequested && mStopRequested->load()) ? 1 : 0;
    return mComm.all_reduce_max(local) != 0;
}

/**
 * @brief Log the accumulated train metrics if `minimum_log_interval_secs` has passed on rank 0.
 *
 * Rank 0 decides; the decision is shared so that all workers take part in the reduction.
 * Metrics keep accumulating while logging is rate-limited.
 */
void Trainer::maybe_log(bool force) {
    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - mLastLogTime).count();
    int due = (mComm.rank() == 0 && (force || elapsed >= mConfig.MinimumLogIntervalSecs)) ? 1 : 0;
    if (mComm.all_reduce_max(due) == 0) return;

    MetricsMap metrics = mTrainMetrics.reduce(mComm);
    const long examples = mCounters.Examples - mExamplesAtLastLog;
    metrics["examples_per_second"] = elapsed > 0 ? static_cast<float>(examples / elapsed) : 0.f;
    metrics["counters/examples"] = static_cast<float>(mCounters.Examples);
    metrics["counters/updates"] = static_cast<float>(mCounters.Updates);
    metrics["runtime_secs"] = std::chrono::duration<float>(now - mStartTime).count();
    metrics["lr"] = mLastLR;

    auto find = [&](const char* name) {
        auto it = metrics.find(name);
        return it == metrics.end() ? NAN : it->second;
    };
    mLogger.log_step(mCounters.Updates, epoch_progress(), examples, static_cast<int>(elapsed * 1000),
                     find("grad_norm"), find("loss/train"), mLastLR, metrics);
    mLastTrainMetrics = std::move(metrics);
    mLastLogTime = now;
    mExamplesAtLastLog = mCounters.Examples;
}

/**
 * @brief Run the loss pipeline over the eval split without touching gradients or optimizer state.
 */
MetricsMap Trainer::evaluate() {
    const ETrainerState previous = mState;
    mState = ETrainerState::EVAL;
    auto start = std::chrono::steady_clock::now();

    MetricsAccumulator accumulator;
    int eval_examples = 0;
    for (const auto& batch : eval_batches()) {
        Batch local = batch.worker_slice(mComm.rank(), mComm.world_size());
        models::LogProbabilities logps = mModel->forward(local, false);
        SplitInputs split = split_inputs(local, logps);
        losses::LossResult result = compute(batch, split.Inputs);
        add_metrics(accumulator, "eval", split, result);
        eval_examples += batch.num_items();
    }
    if (eval_examples == 0) {
        mLogger.log_warning(mCounters.Updates, "the eval split has no complete batch, eval metrics are empty");
    }

    MetricsMap metrics = accumulator.reduce(mComm);
    ++mNumEvals;
    auto duration = std::chrono::steady_clock::now() - start;
    auto loss = metrics.find("loss/eval");
    mLogger.log_eval(mCounters.Updates, epoch_progress(), eval_examples,
                     static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count()),
                     loss == metrics.end() ? NAN : loss->second, metrics);
    mState = previous;
    return metrics;
}

nlohmann::json Trainer::write_eval_results() {
    MetricsMap results = evaluate();
    nlohmann::json doc;
    doc["metadata"] = run_config_to_json(mConfig);
    doc["results"] = results;
    if (mComm.rank() == 0) {
        write_json_file(get_checkpoint_path(mConfig.run_dir(), "eval_results.json"), doc);
    }
    mComm.barrier();
    return doc;
}

/**
 * @brief Generate policy responses for the first `n_samples` eval prompts.
 *
 * Each entry holds the formatted prompt, the human-chosen response and the policy sample.
 */
nlohmann::json Trainer::write_samples() {
    nlohmann::json samples = nlohmann::json::array();
    int remaining = mConfig.NSamples;
    const auto& batches = eval_batches();
    for (std::size_t b = 0; b < batches.size() && remaining > 0; ++b) {
        const Batch& batch = batches[b];
        Batch local = batch.worker_slice(mComm.rank(), mComm.world_size());
        auto texts = mModel->sample(local, mConfig.Model.MaxLength, mConfig.TopP,
                                    static_cast<std::uint64_t>(mConfig.Seed) + b);
        for (std::size_t i = 0; i < texts.size() && remaining > 0; ++i, --remaining) {
            samples.push_back({{"prompt", batch.Items[i].Prompt},
                               {"chosen", batch.Items[i].Chosen},
                               {"policy", texts[i]}});
        }
    }

    if (mComm.rank() == 0) {
        auto file_name = (std::filesystem::path(mConfig.SamplesDir) / (mConfig.ExpName + ".json")).string();
        write_json_file(file_name, samples);
        mLogger.log_message(mCounters.Updates, fmt::format("wrote {} samples to {}", samples.size(), file_name));
    }
    mComm.barrier();
    return samples;
}

void Trainer::save(const std::string& name) {
    if (mConfig.Debug) {
        mLogger.log_message(mCounters.Updates, fmt::format("debug mode, not writing checkpoint {}", name));
        return;
    }
    const ETrainerState previous = mState;
    mState = ETrainerState::CHECKPOINT;
    std::string target = get_checkpoint_path(mConfig.run_dir(), name);
    {
        auto section = mLogger.log_section_start(mCounters.Updates, fmt::format("saving checkpoint to `{}`", target));
        save_checkpoint(target, *mModel, mConfig.SaveOptimizerState ? mOptimizer.get() : nullptr, checkpoint_state(),
                        mComm, mConfig.CheckpointRetryBackoffMs, &mLogger);
    }
    mLogger.log_checkpoint(mCounters.Updates, target);
    mState = previous;
}

/**
 * @brief Split the per-row log-probabilities of a worker slice into loss inputs.
 *
 * For losses with KL companions, also computes the KL reference point: the mean over
 * all workers of the local estimates, clamped at zero.
 */
Trainer::SplitInputs Trainer::split_inputs(const Batch& slice, const models::LogProbabilities& logps) {
    SplitInputs split;
    losses::LossInputs& in = split.Inputs;
    const bool has_reference = logps.Reference.has_value();
    if (has_reference) {
        in.ReferenceChosen.emplace();
        in.ReferenceRejected.emplace();
    }

    auto take = [&](int row, bool chosen) {
        (chosen ? in.PolicyChosen : in.PolicyRejected).push_back(logps.Policy[row]);
        if (has_reference) {
            (chosen ? *in.ReferenceChosen : *in.ReferenceRejected).push_back((*logps.Reference)[row]);
        }
        (chosen ? split.ChosenRows : split.RejectedRows).push_back(row);
    };

    switch (mTraits->Shape) {
        case losses::ELossShape::SFT:
            for (int r = 0; r < slice.num_rows(); ++r) take(r, true);
            break;
        case losses::ELossShape::PAIRED:
            for (int i = 0; i < slice.num_items(); ++i) {
                take(2 * i, true);
                take(2 * i + 1, false);
            }
            break;
        case losses::ELossShape::UNPAIRED:
            for (int i = 0; i < slice.num_items(); ++i) take(i, slice.Items[i].Desirable);
            break;
    }

    if (mTraits->UsesKLCompanions) {
        if (!logps.ReferenceKL) {
            throw std::logic_error(fmt::format("{} needs reference log-probabilities of the KL companions", mTraits->Name));
        }
        float local = losses::kl_local_estimate(logps.PolicyKL, *logps.ReferenceKL);
        in.KL = std::max(0.f, mComm.all_reduce_mean(local));
    }
    return split;
}

losses::LossResult Trainer::compute(const Batch& batch, const losses::LossInputs& inputs) {
    try {
        return losses::compute_loss(mLoss, inputs);
    } catch (const DataError& e) {
        throw DataError(fmt::format("{} in {}", e.what(), batch.describe()));
    }
}

void Trainer::add_metrics(MetricsAccumulator& metrics, const std::string& mode, const SplitInputs& split,
                          const losses::LossResult& result) {
    metrics.add("loss/" + mode, result.Loss);
    metrics.add("logps_" + mode + "/chosen", split.Inputs.PolicyChosen);
    if (!split.Inputs.PolicyRejected.empty()) {
        metrics.add("logps_" + mode + "/rejected", split.Inputs.PolicyRejected);
    }
    if (mTraits->Shape == losses::ELossShape::SFT) return;

    metrics.add("rewards_" + mode + "/chosen", result.ChosenRewards);
    metrics.add("rewards_" + mode + "/rejected", result.RejectedRewards);
    if (mTraits->Shape == losses::ELossShape::PAIRED) {
        std::vector<float> margins(result.ChosenRewards.size());
        for (std::size_t i = 0; i < margins.size(); ++i) {
            margins[i] = result.ChosenRewards[i] - result.RejectedRewards[i];
        }
        metrics.add("rewards_" + mode + "/margins", margins);
    } else {
        metrics.add("rewards_" + mode + "/margins", mean_of(result.ChosenRewards) - mean_of(result.RejectedRewards));
    }
    if (result.KLEstimate) {
        metrics.add("rewards_" + mode + "/KL_estimate", *result.KLEstimate);
    }
}

const std::vector<Batch>& Trainer::eval_batches() {
    if (!mEvalBatches) {
        mEvalBatches = mAssembler->eval_batches(mConfig.NEvalExamples);
    }
    return *mEvalBatches;
}

float Trainer::epoch_progress() const {
    const int epoch = std::max(mAssembler->epoch(), 0);
    const long batches = mAssembler->num_batches();
    if (batches == 0) return static_cast<float>(epoch);
    return static_cast<float>(epoch) + static_cast<float>(mAssembler->batch_index()) / static_cast<float>(batches);
}

CheckpointState Trainer::checkpoint_state() const {
    CheckpointState state;
    state.Counters = mCounters;
    state.Data.Seed = static_cast<std::uint64_t>(mConfig.Seed);
    state.Data.Epoch = std::max(mAssembler->epoch(), 0);
    state.Data.BatchIndex = mAssembler->batch_index();
    state.Metrics = mLastTrainMetrics;
    state.WorldSize = mComm.world_size();
    return state;
}
