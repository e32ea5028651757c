// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_TRAINING_CHECKPOINT_H
#define HALO_SRC_TRAINING_CHECKPOINT_H

#include <cstdint>
#include <optional>
#include <string>

#include "training/logging.h"

class Communicator;

namespace models {
class ModelPair;
}

namespace optimizers {
class Optimizer;
}

struct TrainerCounters {
    long Examples = 0;      ///< examples consumed, over all workers
    long Batches = 0;       ///< batches consumed
    long Updates = 0;       ///< optimizer updates applied
};

//! Position of the batch assembler: the next batch is `BatchIndex` of epoch `Epoch`.
struct DataSourceState {
    std::uint64_t Seed = 0;
    int Epoch = 0;
    long BatchIndex = 0;
};

struct CheckpointState {
    TrainerCounters Counters;
    DataSourceState Data;
    MetricsMap Metrics;
    int WorldSize = 1;
};

//! Constructs full path for the checkpoint `name` (e.g. "LATEST") of a run
std::string get_checkpoint_path(const std::string& run_dir, const std::string& name);

//! Name of the intermediate checkpoint after `examples` examples
std::string intermediate_checkpoint_name(long examples);

//! Collective. Writes policy weights, optional optimizer state and `checkpoint.json`; returns `target`.
std::string save_checkpoint(const std::string& target, models::ModelPair& model, optimizers::Optimizer* optimizer,
                            const CheckpointState& state, Communicator& comm, int retry_backoff_ms,
                            TrainingRunLogger* logger);

//! The complete checkpoint at `target`, or the `.old` copy left by an interrupted update.
std::optional<std::string> find_checkpoint(const std::string& target);

//! Parses `checkpoint.json` of a checkpoint directory.
CheckpointState read_checkpoint_state(const std::string& directory);

//! Restores policy weights and, if the checkpoint has it, optimizer state.
CheckpointState load_checkpoint(const std::string& directory, models::ModelPair& model, optimizers::Optimizer* optimizer);

#endif //HALO_SRC_TRAINING_CHECKPOINT_H
