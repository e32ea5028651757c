// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <nlohmann/json.hpp>

#include "config/run_config.h"
#include "utilities/utils.h"
#include "../utilities/test_utils.h"

using Catch::Approx;

namespace {

RunConfig valid_config(const std::string& loss) {
    RunConfig cfg;
    cfg.Datasets = {"toy"};
    cfg.Loss.Name = loss;
    cfg.Model.BatchSize = 8;
    cfg.Model.EvalBatchSize = 8;
    return cfg;
}

} // namespace

TEST_CASE("run config: nested json with defaults for missing keys", "[config]") {
    nlohmann::json j = {
        {"seed", 3},
        {"exp_name", "demo"},
        {"datasets", {"shp", "hh"}},
        {"n_epochs", nullptr},
        {"n_examples", 1000},
        {"model", {{"batch_size", 16}, {"policy_dtype", "float32"}, {"max_length", 512}, {"max_prompt_length", 256}}},
        {"loss", {{"name", "kto"}, {"beta", 0.2}, {"desirable_weight", 1.33}}},
    };
    RunConfig cfg = run_config_from_json(j);
    CHECK(cfg.Seed == 3);
    CHECK(cfg.Datasets.size() == 2);
    CHECK_FALSE(cfg.NEpochs.has_value());
    CHECK(cfg.NExamples == 1000);
    CHECK(cfg.Model.BatchSize == 16);
    CHECK(cfg.Model.PolicyDType == ETensorDType::FP32);
    CHECK(cfg.Model.ReferenceDType == ETensorDType::BF16);
    CHECK(cfg.Loss.Beta == Approx(0.2f));
    CHECK(cfg.Loss.DesirableWeight == Approx(1.33f));
    CHECK(cfg.Loss.UndesirableWeight == 1.0f);
    CHECK(cfg.LR == Approx(5e-7f));
    CHECK(cfg.run_dir() == "./cache/demo");
    CHECK(cfg.use_reference_model());
    CHECK_NOTHROW(validate_run_config(cfg));
}

TEST_CASE("run config: json round trip", "[config]") {
    RunConfig cfg = valid_config("dpo");
    cfg.Model.LoadFrom = "/tmp/weights";
    cfg.NEpochs.reset();
    RunConfig back = run_config_from_json(run_config_to_json(cfg));
    CHECK(back.Loss.Name == "dpo");
    CHECK(back.Model.LoadFrom == cfg.Model.LoadFrom);
    CHECK_FALSE(back.NEpochs.has_value());
    CHECK(back.Model.BatchSize == 8);
}

TEST_CASE("run config: reference model defaults to what the loss needs", "[config]") {
    CHECK_FALSE(valid_config("sft").use_reference_model());
    CHECK_FALSE(valid_config("slic").use_reference_model());
    CHECK(valid_config("dpo").use_reference_model());

    RunConfig cfg = valid_config("dpo");
    cfg.Loss.UseReferenceModel = false;
    CHECK_THROWS_AS(validate_run_config(cfg), ConfigError);
}

TEST_CASE("run config: inconsistent settings are rejected", "[config]") {
    RunConfig cfg = valid_config("sft");
    SECTION("unknown loss") { cfg.Loss.Name = "ppo"; }
    SECTION("unknown mode") { cfg.Mode = "serve"; }
    SECTION("unknown optimizer") { cfg.Optimizer = "lion"; }
    SECTION("trainer tag of another loss") { cfg.Loss.Trainer = "DPOTrainer"; }
    SECTION("batch size not divisible by workers") { cfg.WorldSize = 3; }
    SECTION("prompt longer than sequence") { cfg.Model.MaxPromptLength = cfg.Model.MaxLength; }
    SECTION("fraction outside (0, 1]") { cfg.FracUniqueDesirable = 0.f; }
    SECTION("no datasets") { cfg.Datasets.clear(); }
    SECTION("paired loss with different fractions") {
        cfg.Loss.Name = "dpo";
        cfg.FracUniqueUndesirable = 0.5f;
    }
    SECTION("unpaired loss with one example per worker") {
        cfg.Loss.Name = "kto";
        cfg.WorldSize = 8;
    }
    CHECK_THROWS_AS(validate_run_config(cfg), ConfigError);
}

TEST_CASE("run config: load from file", "[config]") {
    testing_utils::TempDir dir("run-config");
    RunConfig cfg = valid_config("slic");
    save_run_config(cfg, dir / "run.json");
    CHECK(load_run_config(dir / "run.json").Loss.Name == "slic");
    CHECK_THROWS_AS(load_run_config(dir / "missing.json"), ConfigError);
}
