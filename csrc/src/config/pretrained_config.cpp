// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "config/pretrained_config.h"

#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "config/json_helpers.h"
#include "utilities/utils.h"

using config_json::get_opt;
using config_json::read_into;

namespace {

void check_config(const PretrainedConfig& cfg, std::string_view source) {
    if (cfg.HiddenSize <= 0) {
        throw ConfigError(fmt::format("{}: hidden_size must be positive, got {}", source, cfg.HiddenSize));
    }
    // 256 byte tokens plus the special tokens
    if (cfg.VocabSize < 258) {
        throw ConfigError(fmt::format("{}: vocab_size must be at least 258, got {}", source, cfg.VocabSize));
    }
    for (int id : {cfg.PadTokenId, cfg.EosTokenId}) {
        if (id < 256 || id >= cfg.VocabSize) {
            throw ConfigError(fmt::format("{}: special token id {} outside of [256, {})", source, id, cfg.VocabSize));
        }
    }
    if (cfg.PadTokenId == cfg.EosTokenId) {
        throw ConfigError(fmt::format("{}: pad and eos token must differ", source));
    }
}

} // namespace

/**
 * @brief Load the model architecture from a `config.json` file.
 *
 * @param file_name Path to the json file.
 * @param dtype Compute dtype of the model that will be built from this config.
 * @throws ConfigError if the file cannot be read or describes an invalid model.
 */
PretrainedConfig load_pretrained_config(const char* file_name, ETensorDType dtype) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw ConfigError(fmt::format("could not open config file {}", file_name));
    }

    nlohmann::json config_json;
    try {
        config_json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(fmt::format("could not parse config file {}: {}", file_name, e.what()));
    }

    PretrainedConfig cfg;
    cfg.DType = dtype;
    read_into(config_json, "model_type", cfg.ModelTypeName);
    read_into(config_json, "pad_token_id", cfg.PadTokenId);
    read_into(config_json, "eos_token_id", cfg.EosTokenId);
    read_into(config_json, "vocab_size", cfg.VocabSize);
    read_into(config_json, "hidden_size", cfg.HiddenSize);
    read_into(config_json, "initializer_range", cfg.InitStd);
    check_config(cfg, file_name);
    return cfg;
}

void save_pretrained_config(const PretrainedConfig& config, const char* file_name) {
    std::ofstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open file for writing {}", file_name));
    }

    nlohmann::json config_json;
    config_json["model_type"] = config.ModelTypeName;
    config_json["pad_token_id"] = config.PadTokenId;
    config_json["eos_token_id"] = config.EosTokenId;
    config_json["vocab_size"] = config.VocabSize;
    config_json["hidden_size"] = config.HiddenSize;
    config_json["initializer_range"] = config.InitStd;
    config_json["torch_dtype"] = config.DType == ETensorDType::BF16 ? "bfloat16" : "float32";
    file << std::setw(2) << config_json;
}

PretrainedConfig create_pretrained_config_from_name(std::string_view name, ETensorDType dtype) {
    PretrainedConfig cfg;
    cfg.DType = dtype;
    if (name == "halo-tiny") {
        cfg.HiddenSize = 16;
    } else if (name == "halo-small") {
        cfg.HiddenSize = 64;
    } else if (name == "halo-base") {
        cfg.HiddenSize = 256;
    } else {
        throw ConfigError(fmt::format("Unknown model `{}`: not a built-in size and no config.json found", name));
    }
    return cfg;
}
