// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/run_config.h"
#include "models/model_pair.h"
#include "training/checkpoint.h"
#include "training/logging.h"
#include "training/trainer.h"
#include "utilities/comm.h"
#include "utilities/utils.h"
#include "../utilities/test_utils.h"

using Catch::Approx;
using testing_utils::TempDir;

namespace {

void write_toy_data(const TempDir& dir) {
    testing_utils::write_dataset(dir, "toy", testing_utils::paired_records(16), testing_utils::paired_records(8, "t"));
}

//! Log lines of rank 0, in order.
struct CapturedLog {
    std::vector<std::string> Lines;

    [[nodiscard]] long count(const std::string& kind) const {
        long n = 0;
        for (const auto& l : Lines) {
            if (l.find("\"log\": \"" + kind + "\"") != std::string::npos) ++n;
        }
        return n;
    }
    [[nodiscard]] long first(const std::string& kind) const {
        for (std::size_t i = 0; i < Lines.size(); ++i) {
            if (Lines[i].find("\"log\": \"" + kind + "\"") != std::string::npos) return static_cast<long>(i);
        }
        return -1;
    }
};

//! Runs `fn` with a single-worker Trainer for `cfg`.
void with_trainer(const RunConfig& cfg, const std::function<void(Trainer&)>& fn, CapturedLog* log = nullptr,
                  const std::atomic<bool>* stop = nullptr) {
    Communicator::run_communicators(1, [&](Communicator& comm) {
        TrainingRunLogger logger("", comm.rank(), TrainingRunLogger::SILENT);
        if (log) {
            logger.set_callback([log](std::string_view line) { log->Lines.emplace_back(line); });
        }
        Trainer trainer(cfg, comm, logger, stop);
        fn(trainer);
    });
}

std::vector<float> train_and_get_weights(const RunConfig& cfg) {
    std::vector<float> weights;
    with_trainer(cfg, [&](Trainer& trainer) {
        trainer.train();
        weights = trainer.model().snapshot(nullptr).Weights;
    });
    return weights;
}

void check_same_weights(const std::vector<float>& a, const std::vector<float>& b) {
    REQUIRE(a.size() == b.size());
    int mismatches = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] != Approx(b[i]).margin(1e-5)) ++mismatches;
    }
    CHECK(mismatches == 0);
}

} // namespace

TEST_CASE("trainer: an epoch ends with the LATEST checkpoint", "[trainer]") {
    TempDir dir("trainer-basic");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "sft");

    with_trainer(cfg, [&](Trainer& trainer) {
        CHECK(trainer.state() == ETrainerState::INIT);
        trainer.train();
        CHECK(trainer.state() == ETrainerState::DONE);
        CHECK(trainer.counters().Examples == 16);
        CHECK(trainer.counters().Batches == 4);
        CHECK(trainer.counters().Updates == 4);
        CHECK(trainer.num_evals() == 0);
    });

    auto latest = find_checkpoint(get_checkpoint_path(cfg.run_dir(), "LATEST"));
    REQUIRE(latest.has_value());
    CheckpointState state = read_checkpoint_state(*latest);
    CHECK(state.Counters.Updates == 4);
    CHECK(state.Data.BatchIndex == 4);
    CHECK(std::filesystem::exists(std::filesystem::path(*latest) / "optimizer.safetensors"));
}

TEST_CASE("trainer: the first evaluation runs before any update", "[trainer]") {
    TempDir dir("trainer-first-eval");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "sft");
    cfg.DoFirstEval = true;
    cfg.NExamples = 4;

    CapturedLog log;
    with_trainer(cfg, [&](Trainer& trainer) {
        trainer.train();
        CHECK(trainer.num_evals() == 1);
        CHECK(trainer.counters().Updates == 1);
    }, &log);

    REQUIRE(log.count("eval") == 1);
    REQUIRE(log.count("step") >= 1);
    CHECK(log.first("eval") < log.first("step"));
    CHECK(log.Lines[log.first("eval")].find("\"step\": 0,") != std::string::npos);
}

TEST_CASE("trainer: evaluation follows eval_every", "[trainer]") {
    TempDir dir("trainer-eval-every");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "dpo");
    cfg.EvalEvery = 8;

    SECTION("without a first evaluation") {
        cfg.DoFirstEval = false;
        with_trainer(cfg, [](Trainer& trainer) {
            trainer.train();
            // at 8 examples; the epoch ends with 16
            CHECK(trainer.num_evals() == 1);
        });
    }
    SECTION("with a first evaluation") {
        cfg.DoFirstEval = true;
        with_trainer(cfg, [](Trainer& trainer) {
            trainer.train();
            CHECK(trainer.num_evals() == 2);
        });
    }
    SECTION("with intermediate checkpoints") {
        cfg.DoFirstEval = false;
        cfg.IntermediateCheckpoints = true;
        with_trainer(cfg, [](Trainer& trainer) { trainer.train(); });
        CHECK(find_checkpoint(get_checkpoint_path(cfg.run_dir(), intermediate_checkpoint_name(8))).has_value());
    }
}

TEST_CASE("trainer: gradient accumulation matches a larger batch", "[trainer]") {
    TempDir dir("trainer-accumulation");
    write_toy_data(dir);

    RunConfig large = testing_utils::small_run_config(dir, "sft");
    large.Optimizer = "SGD";
    large.LR = 0.1f;
    large.Model.BatchSize = 8;
    large.Model.GradientAccumulationSteps = 1;
    large.LocalRunDir = dir / "large";

    RunConfig accumulated = large;
    accumulated.Model.BatchSize = 4;
    accumulated.Model.GradientAccumulationSteps = 2;
    accumulated.LocalRunDir = dir / "accumulated";

    check_same_weights(train_and_get_weights(large), train_and_get_weights(accumulated));
}

TEST_CASE("trainer: an incomplete accumulation window is dropped", "[trainer]") {
    TempDir dir("trainer-partial-window");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "sft");
    cfg.Model.GradientAccumulationSteps = 3;

    with_trainer(cfg, [](Trainer& trainer) {
        trainer.train();
        CHECK(trainer.counters().Batches == 4);
        CHECK(trainer.counters().Updates == 1);
    });
}

TEST_CASE("trainer: a resumed run ends with the weights of an uninterrupted run", "[trainer]") {
    TempDir dir("trainer-resume");
    write_toy_data(dir);

    RunConfig full = testing_utils::small_run_config(dir, "dpo");
    full.LocalRunDir = dir / "full";
    auto expected = train_and_get_weights(full);

    RunConfig first = full;
    first.LocalRunDir = dir / "interrupted";
    first.NExamples = 8;
    with_trainer(first, [](Trainer& trainer) {
        trainer.train();
        CHECK(trainer.counters().Examples == 8);
    });

    RunConfig second = full;
    second.LocalRunDir = first.LocalRunDir;
    second.Resume = true;
    std::vector<float> resumed;
    with_trainer(second, [&](Trainer& trainer) {
        trainer.train();
        CHECK(trainer.counters().Examples == 16);
        CHECK(trainer.counters().Updates == 4);
        resumed = trainer.model().snapshot(nullptr).Weights;
    });

    check_same_weights(expected, resumed);
}

TEST_CASE("trainer: resuming without a checkpoint starts from scratch", "[trainer]") {
    TempDir dir("trainer-resume-empty");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "sft");
    cfg.Resume = true;

    CapturedLog log;
    with_trainer(cfg, [](Trainer& trainer) {
        trainer.train();
        CHECK(trainer.counters().Examples == 16);
    }, &log);
    CHECK(log.count("warning") >= 1);
}

TEST_CASE("trainer: the reference model follows use_reference_model", "[trainer]") {
    TempDir dir("trainer-reference");
    write_toy_data(dir);

    SECTION("sft") {
        RunConfig cfg = testing_utils::small_run_config(dir, "sft");
        with_trainer(cfg, [](Trainer& trainer) { CHECK_FALSE(trainer.model().has_reference()); });
    }
    SECTION("slic") {
        RunConfig cfg = testing_utils::small_run_config(dir, "slic");
        cfg.MinimumLogIntervalSecs = 1e6f;
        with_trainer(cfg, [](Trainer& trainer) {
            CHECK_FALSE(trainer.model().has_reference());
            trainer.train();
            CHECK(trainer.last_train_metrics().count("rewards_train/margins") == 1);
        });
    }
    SECTION("dpo") {
        RunConfig cfg = testing_utils::small_run_config(dir, "dpo");
        with_trainer(cfg, [](Trainer& trainer) { CHECK(trainer.model().has_reference()); });
    }
    SECTION("sft with an explicit reference") {
        RunConfig cfg = testing_utils::small_run_config(dir, "sft");
        cfg.Loss.UseReferenceModel = true;
        with_trainer(cfg, [](Trainer& trainer) { CHECK(trainer.model().has_reference()); });
    }
}

TEST_CASE("trainer: configurations it cannot run are rejected", "[trainer]") {
    TempDir dir("trainer-config");
    write_toy_data(dir);

    SECTION("dpo without a reference model") {
        RunConfig cfg = testing_utils::small_run_config(dir, "dpo");
        cfg.Loss.UseReferenceModel = false;
        CHECK_THROWS_AS(with_trainer(cfg, [](Trainer&) {}), ConfigError);
    }
    SECTION("world size does not match the workers") {
        RunConfig cfg = testing_utils::small_run_config(dir, "sft");
        cfg.WorldSize = 2;
        CHECK_THROWS_AS(with_trainer(cfg, [](Trainer&) {}), ConfigError);
    }
    SECTION("unknown model") {
        RunConfig cfg = testing_utils::small_run_config(dir, "sft");
        cfg.Model.NameOrPath = "halo-enormous";
        CHECK_THROWS_AS(with_trainer(cfg, [](Trainer&) {}), ConfigError);
    }
}

TEST_CASE("trainer: data errors fail the run", "[trainer]") {
    TempDir dir("trainer-data-error");
    testing_utils::write_dataset(dir, "toy", testing_utils::unpaired_records(12, 0), testing_utils::unpaired_records(4, 4));
    RunConfig cfg = testing_utils::small_run_config(dir, "kto-zero");

    CapturedLog log;
    ETrainerState state = ETrainerState::INIT;
    CHECK_THROWS_AS(with_trainer(cfg, [&](Trainer& trainer) {
        try {
            trainer.train();
        } catch (...) {
            state = trainer.state();
            throw;
        }
    }, &log), DataError);
    CHECK(state == ETrainerState::FAILED);
    REQUIRE(log.count("warning") >= 1);
    CHECK(log.Lines.back().find("training failed in state") != std::string::npos);
}

TEST_CASE("trainer: a stop request ends training after the current batch", "[trainer]") {
    TempDir dir("trainer-stop");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "sft");

    std::atomic<bool> stop{true};
    with_trainer(cfg, [](Trainer& trainer) {
        trainer.train();
        CHECK(trainer.state() == ETrainerState::DONE);
        CHECK(trainer.counters().Batches == 1);
    }, nullptr, &stop);
    CHECK(find_checkpoint(get_checkpoint_path(cfg.run_dir(), "LATEST")).has_value());
}

TEST_CASE("trainer: a stop request completes the accumulation window", "[trainer]") {
    TempDir dir("trainer-stop-window");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "sft");
    cfg.Model.GradientAccumulationSteps = 2;

    std::atomic<bool> stop{true};
    with_trainer(cfg, [](Trainer& trainer) {
        trainer.train();
        CHECK(trainer.state() == ETrainerState::DONE);
        CHECK(trainer.counters().Batches == 2);
        CHECK(trainer.counters().Updates == 1);
    }, nullptr, &stop);

    auto latest = find_checkpoint(get_checkpoint_path(cfg.run_dir(), "LATEST"));
    REQUIRE(latest.has_value());
    CheckpointState state = read_checkpoint_state(*latest);
    CHECK(state.Counters.Updates == 1);
    CHECK(state.Data.BatchIndex == 2);
}

TEST_CASE("trainer: an example budget inside an accumulation window resumes like an uninterrupted run", "[trainer]") {
    TempDir dir("trainer-resume-window");
    write_toy_data(dir);

    RunConfig full = testing_utils::small_run_config(dir, "sft");
    full.Optimizer = "SGD";
    full.LR = 0.1f;
    full.Model.GradientAccumulationSteps = 2;
    full.LocalRunDir = dir / "full";
    std::vector<float> expected;
    with_trainer(full, [&](Trainer& trainer) {
        trainer.train();
        CHECK(trainer.counters().Updates == 2);
        expected = trainer.model().snapshot(nullptr).Weights;
    });

    // the budget is reached after the first batch; the window still completes
    RunConfig first = full;
    first.LocalRunDir = dir / "interrupted";
    first.NExamples = 4;
    with_trainer(first, [](Trainer& trainer) {
        trainer.train();
        CHECK(trainer.counters().Examples == 8);
        CHECK(trainer.counters().Batches == 2);
        CHECK(trainer.counters().Updates == 1);
    });

    RunConfig second = full;
    second.LocalRunDir = first.LocalRunDir;
    second.Resume = true;
    std::vector<float> resumed;
    with_trainer(second, [&](Trainer& trainer) {
        trainer.train();
        CHECK(trainer.counters().Examples == 16);
        CHECK(trainer.counters().Updates == 2);
        resumed = trainer.model().snapshot(nullptr).Weights;
    });

    check_same_weights(expected, resumed);
}

TEST_CASE("trainer: non-finite updates are skipped up to max_nonfinite_skips", "[trainer]") {
    TempDir dir("trainer-nonfinite");
    write_toy_data(dir);

    // a policy whose weights are all NaN produces a NaN loss on every batch
    const std::string nan_weights = dir / "nan-weights";
    Communicator::run_communicators(1, [&](Communicator& comm) {
        models::ModelPairOptions opt;
        opt.NameOrPath = "halo-tiny";
        opt.PolicyDType = ETensorDType::FP32;
        opt.ReferenceDType = ETensorDType::FP32;
        opt.Sharded = false;
        opt.ActivationCheckpointing = false;
        models::ModelPair pair(opt, comm);
        auto snap = pair.snapshot(nullptr);
        std::fill(snap.Weights.begin(), snap.Weights.end(), std::numeric_limits<float>::quiet_NaN());
        pair.write_snapshot(snap, nan_weights);
    });

    RunConfig cfg = testing_utils::small_run_config(dir, "sft");
    cfg.Model.LoadFrom = nan_weights;

    SECTION("within the limit") {
        cfg.MaxNonfiniteSkips = 10;
        CapturedLog log;
        with_trainer(cfg, [](Trainer& trainer) {
            trainer.train();
            CHECK(trainer.state() == ETrainerState::DONE);
            CHECK(trainer.nonfinite_skips() == 4);
            CHECK(trainer.counters().Batches == 4);
            CHECK(trainer.counters().Updates == 0);
        }, &log);
        CHECK(log.count("warning") == 4);
        CHECK(log.Lines[log.first("warning")].find("non-finite loss") != std::string::npos);
    }
    SECTION("beyond the limit") {
        cfg.MaxNonfiniteSkips = 2;
        CapturedLog log;
        long skips = 0;
        ETrainerState state = ETrainerState::INIT;
        CHECK_THROWS_AS(with_trainer(cfg, [&](Trainer& trainer) {
            try {
                trainer.train();
            } catch (...) {
                skips = trainer.nonfinite_skips();
                state = trainer.state();
                throw;
            }
        }, &log), std::runtime_error);
        CHECK(skips == 3);
        CHECK(state == ETrainerState::FAILED);
        // three skip warnings and the failure
        CHECK(log.count("warning") == 4);
        CHECK(log.Lines.back().find("training failed in state TRAIN_STEP") != std::string::npos);
        CHECK_FALSE(find_checkpoint(get_checkpoint_path(cfg.run_dir(), "LATEST")).has_value());
    }
}

TEST_CASE("trainer: debug runs write no checkpoint", "[trainer]") {
    TempDir dir("trainer-debug");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "sft");
    cfg.Debug = true;

    with_trainer(cfg, [](Trainer& trainer) { trainer.train(); });
    CHECK_FALSE(find_checkpoint(get_checkpoint_path(cfg.run_dir(), "LATEST")).has_value());
}

TEST_CASE("trainer: step lines reach the logger callback", "[trainer]") {
    TempDir dir("trainer-log");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "dpo");

    CapturedLog log;
    with_trainer(cfg, [](Trainer& trainer) { trainer.train(); }, &log);

    CHECK(log.count("dataset") == 2);
    CHECK(log.count("step") >= 4);
    CHECK(log.count("checkpoint") == 1);
    CHECK(log.Lines[log.first("step")].find("rewards_train/margins") != std::string::npos);

    // the checkpoint write is a timed section that closes before the checkpoint line
    const long checkpoint = log.first("checkpoint");
    REQUIRE(checkpoint > 0);
    const std::string& section = log.Lines[checkpoint - 1];
    CHECK(section.find("\"duration_ms\"") != std::string::npos);
    CHECK(section.find("saving checkpoint to") != std::string::npos);
}

TEST_CASE("trainer: kto trains with a KL estimate", "[trainer]") {
    TempDir dir("trainer-kto");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "kto");
    cfg.MinimumLogIntervalSecs = 1e6f;

    with_trainer(cfg, [](Trainer& trainer) {
        trainer.train();
        // paired records give 16 desirable and 16 undesirable examples
        CHECK(trainer.counters().Examples == 32);
        const auto& metrics = trainer.last_train_metrics();
        REQUIRE(metrics.count("rewards_train/KL_estimate") == 1);
        CHECK(metrics.at("rewards_train/KL_estimate") >= 0.f);
        CHECK(metrics.count("logps_train/rejected") == 1);
    });
}

TEST_CASE("trainer: eval mode writes the results with the configuration", "[trainer]") {
    TempDir dir("trainer-eval-mode");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "dpo");
    cfg.Mode = "eval";

    with_trainer(cfg, [](Trainer& trainer) {
        trainer.run();
        CHECK(trainer.counters().Updates == 0);
        CHECK(trainer.num_evals() == 1);
    });

    std::ifstream file(std::filesystem::path(cfg.run_dir()) / "eval_results.json");
    REQUIRE(file.is_open());
    nlohmann::json doc = nlohmann::json::parse(file);
    CHECK(doc["metadata"]["loss"]["name"] == "dpo");
    CHECK(doc["results"].contains("loss/eval"));
    CHECK(doc["results"].contains("rewards_eval/margins"));
}

TEST_CASE("trainer: sample mode writes policy samples for eval prompts", "[trainer]") {
    TempDir dir("trainer-sample-mode");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "sft");
    cfg.Mode = "sample";
    cfg.NSamples = 3;
    cfg.Model.MaxLength = 32;

    with_trainer(cfg, [](Trainer& trainer) { trainer.run(); });

    std::ifstream file(std::filesystem::path(cfg.SamplesDir) / "test.json");
    REQUIRE(file.is_open());
    nlohmann::json samples = nlohmann::json::parse(file);
    REQUIRE(samples.size() == 3);
    for (const auto& s : samples) {
        CHECK(s.contains("prompt"));
        CHECK(s.contains("chosen"));
        CHECK(s["policy"].is_string());
    }
    CHECK(samples[0]["prompt"].get<std::string>().find("question 0?") != std::string::npos);
    CHECK(samples[0]["chosen"] == "good answer 0");
}

TEST_CASE("trainer: workers train together", "[trainer][multi]") {
    const int world = testing_config::get_test_config().Workers;
    TempDir dir("trainer-workers");
    write_toy_data(dir);
    RunConfig cfg = testing_utils::small_run_config(dir, "dpo");
    cfg.WorldSize = world;
    cfg.Model.BatchSize = 2 * world;
    cfg.Model.EvalBatchSize = 2 * world;
    cfg.EvalEvery = 8;
    cfg.DoFirstEval = true;

    std::vector<long> updates(world, -1);
    std::vector<int> evals(world, -1);
    std::vector<int> done(world, 0);
    Communicator::run_communicators(world, [&](Communicator& comm) {
        TrainingRunLogger logger("", comm.rank(), TrainingRunLogger::SILENT);
        Trainer trainer(cfg, comm, logger);
        trainer.train();
        updates[comm.rank()] = trainer.counters().Updates;
        evals[comm.rank()] = trainer.num_evals();
        done[comm.rank()] = trainer.state() == ETrainerState::DONE ? 1 : 0;
    });

    for (int r = 0; r < world; ++r) {
        CHECK(updates[r] == 16 / (2 * world));
        CHECK(evals[r] >= 1);
        CHECK(evals[r] == evals[0]);
        CHECK(done[r] == 1);
    }
    CHECK(find_checkpoint(get_checkpoint_path(cfg.run_dir(), "LATEST")).has_value());
}
