// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_CONFIG_JSON_HELPERS_H
#define HALO_SRC_CONFIG_JSON_HELPERS_H

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "utilities/utils.h"

namespace config_json {

/**
 * @brief Read an optional typed value from a JSON object.
 *
 * Missing keys and explicit `null` yield std::nullopt.
 * @throws ConfigError if the value is present but has the wrong type.
 */
template<typename T>
std::optional<T> get_opt(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;

    auto type_error = [&](const char* expected) {
        return ConfigError(fmt::format("config key `{}`: expected {}, got {}", key, expected, it->dump()));
    };

    if constexpr (std::is_same_v<T, bool>) {
        if (!it->is_boolean()) throw type_error("a boolean");
        return it->get<bool>();
    } else if constexpr (std::is_integral_v<T>) {
        if (it->is_number_integer() || it->is_number_unsigned()) return static_cast<T>(it->get<std::int64_t>());
        if (it->is_number_float()) {
            double v = it->get<double>();
            if (std::floor(v) == v) return static_cast<T>(v);
        }
        throw type_error("an integer");
    } else if constexpr (std::is_floating_point_v<T>) {
        if (!it->is_number()) throw type_error("a number");
        return static_cast<T>(it->get<double>());
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (!it->is_string()) throw type_error("a string");
        return it->get<std::string>();
    } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
        if (it->is_string()) return std::vector<std::string>{it->get<std::string>()};
        if (!it->is_array()) throw type_error("a list of strings");
        std::vector<std::string> result;
        for (const auto& el : *it) {
            if (!el.is_string()) throw type_error("a list of strings");
            result.push_back(el.get<std::string>());
        }
        return result;
    } else {
        static_assert(std::is_same_v<T, void>, "unsupported config value type");
    }
}

//! Overwrites `target` if `key` is present.
template<typename T>
void read_into(const nlohmann::json& obj, const char* key, T& target) {
    if (auto v = get_opt<T>(obj, key)) target = *v;
}

} // namespace config_json

#endif //HALO_SRC_CONFIG_JSON_HELPERS_H
