// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_TRAINING_TRAINER_H
#define HALO_SRC_TRAINING_TRAINER_H

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "config/run_config.h"
#include "data/batch.h"
#include "losses/loss.h"
#include "training/checkpoint.h"
#include "training/logging.h"
#include "training/metrics.h"
#include "training/schedule.h"

class Communicator;
class IExampleSource;
class BatchAssembler;

namespace models {
class ModelPair;
struct LogProbabilities;
}

namespace optimizers {
class Optimizer;
}

enum class ETrainerState {
    INIT,
    WARMUP,
    TRAIN_STEP,
    EVAL,
    CHECKPOINT,
    DONE,
    FAILED
};

const char* trainer_state_to_str(ETrainerState state);

/*!
 * \brief The training control loop of one worker.
 * \details Every worker of a run constructs its own Trainer with the same configuration and
 * runs the same sequence of calls; the Trainer issues the collectives. The loss strategy is
 * selected once, from `loss.name`, when the Trainer is constructed.
 */
class Trainer {
public:
    /**
     * @param stop_requested Set from outside (e.g. a signal handler) to end training after the current step.
     * @throws ConfigError for an invalid configuration or a model that cannot be loaded.
     */
    Trainer(RunConfig config, Communicator& comm, TrainingRunLogger& logger,
            const std::atomic<bool>* stop_requested = nullptr);
    ~Trainer();

    //! Runs until the epoch or example budget is used up or a stop is requested; writes `LATEST`.
    void train();
    //! Mean metrics over the eval split; does not touch optimizer state.
    MetricsMap evaluate();
    //! `mode=eval`: evaluates and writes `<run_dir>/eval_results.json` (rank 0).
    nlohmann::json write_eval_results();
    //! `mode=sample`: writes `<samples_dir>/<exp_name>.json` (rank 0) and returns the samples.
    nlohmann::json write_samples();
    //! Dispatches on `mode`.
    void run();

    //! Collective. Writes the checkpoint `name` under the run directory, unless in debug mode.
    void save(const std::string& name);

    [[nodiscard]] ETrainerState state() const { return mState; }
    [[nodiscard]] const TrainerCounters& counters() const { return mCounters; }
    [[nodiscard]] int num_evals() const { return mNumEvals; }
    [[nodiscard]] long nonfinite_skips() const { return mTotalNonfiniteSkips; }
    [[nodiscard]] const MetricsMap& last_train_metrics() const { return mLastTrainMetrics; }
    [[nodiscard]] const RunConfig& config() const { return mConfig; }
    [[nodiscard]] const losses::LossTraits& loss_traits() const { return *mTraits; }
    [[nodiscard]] models::ModelPair& model() { return *mModel; }
    [[nodiscard]] BatchAssembler& assembler() { return *mAssembler; }

private:
    void restore();
    void train_batch(const Batch& batch);
    void apply_update();
    void skip_update(const std::string& reason);
    void maybe_log(bool force);
    bool stop_requested();
    void maybe_evaluate();

    //! Loss inputs of a worker slice, and where each input row came from.
    struct SplitInputs {
        losses::LossInputs Inputs;
        std::vector<int> ChosenRows;
        std::vector<int> RejectedRows;
    };
    SplitInputs split_inputs(const Batch& slice, const models::LogProbabilities& logps);
    losses::LossResult compute(const Batch& batch, const losses::LossInputs& inputs);
    void add_metrics(MetricsAccumulator& metrics, const std::string& mode, const SplitInputs& split,
                     const losses::LossResult& result);
    const std::vector<Batch>& eval_batches();
    [[nodiscard]] float epoch_progress() const;
    [[nodiscard]] CheckpointState checkpoint_state() const;

    RunConfig mConfig;
    Communicator& mComm;
    TrainingRunLogger& mLogger;
    const std::atomic<bool>* mStopRequested;

    losses::LossStrategy mLoss;
    const losses::LossTraits* mTraits;
    std::unique_ptr<IExampleSource> mSource;
    std::unique_ptr<BatchAssembler> mAssembler;
    std::unique_ptr<models::ModelPair> mModel;
    std::unique_ptr<optimizers::Optimizer> mOptimizer;
    WarmupSchedule mSchedule;

    ETrainerState mState = ETrainerState::INIT;
    TrainerCounters mCounters;
    long mNextEvalAt = 0;
    int mNumEvals = 0;
    int mMicroBatchesInWindow = 0;
    int mConsecutiveNonfinite = 0;
    long mTotalNonfiniteSkips = 0;
    float mLastLR = 0.f;
    bool mResumed = false;

    MetricsAccumulator mTrainMetrics;
    MetricsMap mLastTrainMetrics;
    std::optional<std::vector<Batch>> mEvalBatches;

    std::chrono::steady_clock::time_point mStartTime;
    std::chrono::steady_clock::time_point mLastLogTime;
    long mExamplesAtLastLog = 0;
};

#endif //HALO_SRC_TRAINING_TRAINER_H
