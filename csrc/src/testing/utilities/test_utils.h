// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "config/pretrained_config.h"
#include "config/run_config.h"
#include "test_config.h"

namespace testing_utils {

//! Fresh directory below the system temp directory; removed with its contents on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        mPath = std::filesystem::temp_directory_path() / fmt::format("halo-{}-{}-{}", tag, stamp, counter++);
        std::filesystem::create_directories(mPath);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(mPath, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return mPath; }
    [[nodiscard]] std::string str() const { return mPath.string(); }
    [[nodiscard]] std::string operator/(const std::string& name) const { return (mPath / name).string(); }

private:
    std::filesystem::path mPath;
};

inline void write_jsonl(const std::string& file_name, const std::vector<nlohmann::json>& records) {
    std::filesystem::create_directories(std::filesystem::path(file_name).parent_path());
    std::ofstream file(file_name);
    for (const auto& r : records) {
        file << r.dump() << "\n";
    }
}

//! `n` paired records `p<i>` with short, distinct prompts and responses.
inline std::vector<nlohmann::json> paired_records(int n, const std::string& tag = "p") {
    std::vector<nlohmann::json> records;
    for (int i = 0; i < n; ++i) {
        records.push_back({{"id", fmt::format("{}{}", tag, i)},
                           {"prompt", fmt::format("question {}?", i)},
                           {"chosen", fmt::format("good answer {}", i)},
                           {"rejected", fmt::format("bad {}", i)}});
    }
    return records;
}

//! `desirable` labelled-good and `undesirable` labelled-bad completion records.
inline std::vector<nlohmann::json> unpaired_records(int desirable, int undesirable) {
    std::vector<nlohmann::json> records;
    for (int i = 0; i < desirable; ++i) {
        records.push_back({{"id", fmt::format("d{}", i)}, {"prompt", fmt::format("ask {}", i)},
                           {"completion", fmt::format("yes {}", i)}, {"label", true}});
    }
    for (int i = 0; i < undesirable; ++i) {
        records.push_back({{"id", fmt::format("u{}", i)}, {"prompt", fmt::format("ask {}", i)},
                           {"completion", fmt::format("no {}", i)}, {"label", false}});
    }
    return records;
}

//! Writes `<dir>/<dataset>/{train,test}.jsonl`.
inline void write_dataset(const TempDir& dir, const std::string& dataset, const std::vector<nlohmann::json>& train,
                          const std::vector<nlohmann::json>& test) {
    write_jsonl(dir / (dataset + "/train.jsonl"), train);
    write_jsonl(dir / (dataset + "/test.jsonl"), test);
}

inline PretrainedConfig tiny_model_config(ETensorDType dtype = ETensorDType::FP32) {
    PretrainedConfig config = create_pretrained_config_from_name("halo-tiny", dtype);
    config.HiddenSize = testing_config::get_test_config().Hidden;
    config.InitStd = 0.2f;
    return config;
}

//! A quick run over the dataset `toy` in `dir`: small model, short sequences, no warmup.
inline RunConfig small_run_config(const TempDir& dir, const std::string& loss) {
    RunConfig cfg;
    cfg.ExpName = "test";
    cfg.Datasets = {"toy"};
    cfg.DataDir = dir.str();
    cfg.LocalRunDir = dir / "run";
    cfg.SamplesDir = dir / "samples";
    cfg.Loss.Name = loss;
    cfg.Model.NameOrPath = "halo-tiny";
    cfg.Model.PolicyDType = ETensorDType::FP32;
    cfg.Model.ReferenceDType = ETensorDType::FP32;
    cfg.Model.MaxLength = 48;
    cfg.Model.MaxPromptLength = 24;
    cfg.Model.BatchSize = 4;
    cfg.Model.EvalBatchSize = 4;
    cfg.Model.ActivationCheckpointing = false;
    cfg.LR = 1e-2f;
    cfg.WarmupSteps = 0;
    cfg.EvalEvery = 1000000;
    cfg.DoFirstEval = false;
    cfg.NEvalExamples = 8;
    cfg.MinimumLogIntervalSecs = 0.f;
    cfg.CheckpointRetryBackoffMs = 1;
    return cfg;
}

} // namespace testing_utils
