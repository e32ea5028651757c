// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <thread>

#include <nlohmann/json.hpp>
#include <fmt/core.h>

#include "models/model_pair.h"
#include "runtime/optimizers/optimizer.h"
#include "utilities/comm.h"

namespace {

/**
 * @brief Write a checkpoint next to `target` and swap it into place.
 *
 * The files go to `<target>.tmp`. An existing checkpoint is moved to `<target>.old`
 * before the new one is renamed to `<target>`, and only removed afterwards, so at
 * every point in time either `<target>` or `<target>.old` is complete.
 */
void write_checkpoint_files(const std::string& target, const models::ModelPair& model,
                            const models::PolicySnapshot& snapshot, const CheckpointState& state) {
    namespace fs = std::filesystem;
    const fs::path dst{target};
    const fs::path tmp{target + ".tmp"};
    const fs::path old{target + ".old"};

    fs::remove_all(tmp);
    model.write_snapshot(snapshot, tmp.string());

    nlohmann::json meta_data;
    meta_data["counters"] = nlohmann::json::object({
        {"examples", state.Counters.Examples},
        {"batches", state.Counters.Batches},
        {"updates", state.Counters.Updates},
    });
    meta_data["data-loader"] = nlohmann::json::object({
        {"seed", state.Data.Seed},
        {"epoch", state.Data.Epoch},
        {"batch_index", state.Data.BatchIndex},
    });
    meta_data["metrics"] = state.Metrics;
    meta_data["distributed"] = nlohmann::json::object({{"world", state.WorldSize}});

    {
        std::ofstream file(tmp / "checkpoint.json");
        file << std::setw(2) << meta_data;
        file.flush();
        if (!file) {
            throw std::runtime_error(fmt::format("Error writing {}", (tmp / "checkpoint.json").string()));
        }
    }

    if (fs::exists(dst)) {
        fs::remove_all(old);
        fs::rename(dst, old);
    }
    fs::rename(tmp, dst);
    fs::remove_all(old);
}

} // namespace

std::string get_checkpoint_path(const std::string& run_dir, const std::string& name) {
    return (std::filesystem::path(run_dir) / name).string();
}

std::string intermediate_checkpoint_name(long examples) {
    return fmt::format("step-{}", examples);
}

/**
 * @brief Save a checkpoint of the policy, written by rank 0.
 *
 * All workers take part in gathering the weights and optimizer state; rank 0 then writes
 * them and the training state. A failed write is retried once after @p retry_backoff_ms.
 * All workers wait at a barrier until the checkpoint is in place.
 *
 * @param target Checkpoint directory, e.g. `<run_dir>/LATEST`.
 * @param optimizer Optimizer whose state is saved, or null for a weights-only checkpoint.
 * @throws std::runtime_error if the second attempt fails as well.
 */
std::string save_checkpoint(const std::string& target, models::ModelPair& model, optimizers::Optimizer* optimizer,
                            const CheckpointState& state, Communicator& comm, int retry_backoff_ms,
                            TrainingRunLogger* logger) {
    models::PolicySnapshot snapshot = model.snapshot(optimizer);

    if (comm.rank() == 0) {
        for (int attempt = 1;; ++attempt) {
            try {
                write_checkpoint_files(target, model, snapshot, state);
                break;
            } catch (const std::exception& e) {
                if (attempt >= 2) {
                    throw std::runtime_error(fmt::format("Failed to write checkpoint {}: {}", target, e.what()));
                }
                if (logger) {
                    logger->log_warning(state.Counters.Updates,
                                        fmt::format("writing checkpoint {} failed ({}), retrying in {} ms", target, e.what(), retry_backoff_ms));
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(retry_backoff_ms));
            }
        }
    }

    comm.barrier();
    return target;
}

std::optional<std::string> find_checkpoint(const std::string& target) {
    namespace fs = std::filesystem;
    if (fs::exists(fs::path(target) / "checkpoint.json")) {
        return target;
    }
    std::string old = target + ".old";
    if (fs::exists(fs::path(old) / "checkpoint.json")) {
        return old;
    }
    return std::nullopt;
}

/**
 * @brief Read the training state of a checkpoint.
 *
 * @throws std::runtime_error if `checkpoint.json` is missing, cannot be parsed or lacks a field.
 */
CheckpointState read_checkpoint_state(const std::string& directory) {
    std::string file_name = (std::filesystem::path(directory) / "checkpoint.json").string();
    std::ifstream file(file_name);
    if(!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open checkpoint file {}", file_name));
    }

    CheckpointState state;
    try {
        nlohmann::json meta_data = nlohmann::json::parse(file);

        const auto& counters = meta_data.at("counters");
        state.Counters.Examples = counters.at("examples").get<long>();
        state.Counters.Batches = counters.at("batches").get<long>();
        state.Counters.Updates = counters.at("updates").get<long>();

        const auto& loader = meta_data.at("data-loader");
        state.Data.Seed = loader.at("seed").get<std::uint64_t>();
        state.Data.Epoch = loader.at("epoch").get<int>();
        state.Data.BatchIndex = loader.at("batch_index").get<long>();

        const nlohmann::json metrics = meta_data.value("metrics", nlohmann::json::object());
        for (const auto& [name, value] : metrics.items()) {
            if (value.is_number()) {
                state.Metrics[name] = value.get<float>();
            }
        }
        state.WorldSize = meta_data.at("distributed").at("world").get<int>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("invalid checkpoint file {}: {}", file_name, e.what()));
    }
    return state;
}

CheckpointState load_checkpoint(const std::string& directory, models::ModelPair& model, optimizers::Optimizer* optimizer) {
    CheckpointState state = read_checkpoint_state(directory);
    model.load_policy_weights(directory);

    auto optimizer_file = std::filesystem::path(directory) / "optimizer.safetensors";
    if (optimizer && std::filesystem::exists(optimizer_file)) {
        model.load_optimizer_state(*optimizer, optimizer_file.string());
    }
    return state;
}
