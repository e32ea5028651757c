// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "config/pretrained_config.h"
#include "models/model_pair.h"
#include "utilities/utils.h"
#include "../utilities/test_utils.h"

namespace {

std::filesystem::path write_temp_json(const testing_utils::TempDir& dir, const nlohmann::json& j, const std::string& name) {
    auto path = dir.path() / name;
    std::ofstream f(path);
    REQUIRE(f.is_open());
    f << j.dump(2);
    return path;
}

} // namespace

TEST_CASE("load_pretrained_config: parses sizes and special tokens", "[models][config]") {
    testing_utils::TempDir dir("config");
    nlohmann::json j;
    j["model_type"] = "halo-causal-lm";
    j["pad_token_id"] = 300;
    j["eos_token_id"] = 301;
    j["vocab_size"] = 320;
    j["hidden_size"] = 24;
    j["initializer_range"] = 0.05;

    auto path = write_temp_json(dir, j, "config.json");
    auto cfg = load_pretrained_config(path.c_str(), ETensorDType::BF16);
    REQUIRE(cfg.HiddenSize == 24);
    REQUIRE(cfg.VocabSize == 320);
    REQUIRE(cfg.PadTokenId == 300);
    REQUIRE(cfg.EosTokenId == 301);
    REQUIRE(cfg.DType == ETensorDType::BF16);
    REQUIRE(cfg.num_parameters() == 320L * 24 * 2 + 24 * 24 + 24 + 320);
}

TEST_CASE("load_pretrained_config: save and load agree", "[models][config]") {
    testing_utils::TempDir dir("config");
    PretrainedConfig cfg = create_pretrained_config_from_name("halo-base", ETensorDType::FP32);
    auto path = (dir.path() / "config.json").string();
    save_pretrained_config(cfg, path.c_str());
    auto loaded = load_pretrained_config(path.c_str(), ETensorDType::FP32);
    REQUIRE(loaded.HiddenSize == 256);
    REQUIRE(loaded.VocabSize == cfg.VocabSize);
}

TEST_CASE("load_pretrained_config: rejects special tokens inside the byte range", "[models][config]") {
    testing_utils::TempDir dir("config");
    nlohmann::json j = {{"vocab_size", 258}, {"hidden_size", 8}, {"pad_token_id", 10}, {"eos_token_id", 257}};
    auto path = write_temp_json(dir, j, "config.json");
    REQUIRE_THROWS_AS(load_pretrained_config(path.c_str(), ETensorDType::FP32), ConfigError);
}

TEST_CASE("resolve_model_config: built-in names, directories and failures", "[models][config]") {
    testing_utils::TempDir dir("config");
    REQUIRE(models::resolve_model_config("", ETensorDType::FP32).HiddenSize == 64);
    REQUIRE(models::resolve_model_config("halo-tiny", ETensorDType::FP32).HiddenSize == 16);
    REQUIRE_THROWS_AS(models::resolve_model_config("no-such-model", ETensorDType::FP32), ConfigError);
    // a directory without config.json
    REQUIRE_THROWS_AS(models::resolve_model_config(dir.str(), ETensorDType::FP32), ConfigError);

    write_temp_json(dir, {{"hidden_size", 12}}, "config.json");
    REQUIRE(models::resolve_model_config(dir.str(), ETensorDType::FP32).HiddenSize == 12);
}
