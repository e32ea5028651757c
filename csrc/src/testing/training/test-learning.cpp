// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests to verify that the policy actually learns during training.
// The eval split repeats prompts and responses of the train split, so eval
// metrics move in the direction the loss pushes the train examples.

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <string>

#include "config/run_config.h"
#include "training/logging.h"
#include "training/trainer.h"
#include "utilities/comm.h"
#include "../utilities/test_utils.h"

using testing_utils::TempDir;

namespace {

struct EvalBeforeAfter {
    MetricsMap Before;
    MetricsMap After;
};

EvalBeforeAfter train_and_evaluate(const RunConfig& cfg) {
    EvalBeforeAfter result;
    Communicator::run_communicators(1, [&](Communicator& comm) {
        TrainingRunLogger logger("", comm.rank(), TrainingRunLogger::SILENT);
        Trainer trainer(cfg, comm, logger);
        result.Before = trainer.evaluate();
        trainer.train();
        result.After = trainer.evaluate();
    });
    return result;
}

RunConfig learning_config(const TempDir& dir, const std::string& loss) {
    testing_utils::write_dataset(dir, "toy", testing_utils::paired_records(16), testing_utils::paired_records(8, "t"));
    RunConfig cfg = testing_utils::small_run_config(dir, loss);
    cfg.Optimizer = "AdamW";
    cfg.LR = 1e-2f;
    cfg.NEpochs = 6;
    cfg.Debug = true;
    return cfg;
}

} // namespace

TEST_CASE("learning: sft lowers the eval loss", "[learning]") {
    TempDir dir("learn-sft");
    auto eval = train_and_evaluate(learning_config(dir, "sft"));

    float before = eval.Before.at("loss/eval");
    float after = eval.After.at("loss/eval");
    INFO("eval loss " << before << " -> " << after);
    REQUIRE(std::isfinite(after));
    CHECK(after < 0.9f * before);
    CHECK(eval.After.at("logps_eval/chosen") > eval.Before.at("logps_eval/chosen"));
}

TEST_CASE("learning: dpo separates chosen from rejected", "[learning]") {
    TempDir dir("learn-dpo");
    auto eval = train_and_evaluate(learning_config(dir, "dpo"));

    // the policy starts as a copy of the reference, so all rewards are zero
    CHECK(std::abs(eval.Before.at("rewards_eval/margins")) < 1e-4f);
    CHECK(eval.After.at("rewards_eval/margins") > 0.f);
    CHECK(eval.After.at("loss/eval") < eval.Before.at("loss/eval"));
}

TEST_CASE("learning: slic widens the log-probability gap", "[learning]") {
    TempDir dir("learn-slic");
    auto eval = train_and_evaluate(learning_config(dir, "slic"));

    float gap_before = eval.Before.at("logps_eval/chosen") - eval.Before.at("logps_eval/rejected");
    float gap_after = eval.After.at("logps_eval/chosen") - eval.After.at("logps_eval/rejected");
    CHECK(gap_after > gap_before);
}

TEST_CASE("learning: kto-zero rewards desirable over undesirable completions", "[learning]") {
    TempDir dir("learn-kto-zero");
    auto eval = train_and_evaluate(learning_config(dir, "kto-zero"));

    CHECK(eval.After.at("rewards_eval/margins") > eval.Before.at("rewards_eval/margins"));
}
