// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ranges>

#include <fmt/core.h>

/**
 * @brief Case-insensitive ASCII string comparison.
 *
 * @param lhs First string.
 * @param rhs Second string.
 * @return True if both strings have the same length and compare equal ignoring case.
 */
bool iequals(std::string_view lhs, std::string_view rhs) {
    return std::ranges::equal(
        lhs, rhs, [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
    });
}

/**
 * @brief Throws a std::runtime_error indicating a non-divisible division attempt.
 *
 * @param dividend The dividend that could not be evenly divided.
 * @param divisor The divisor used in the attempted division.
 *
 * @throws std::runtime_error Always throws with a formatted error message.
 */
[[noreturn]] void throw_not_divisible(long long dividend, long long divisor) {
    throw std::runtime_error(fmt::format("Cannot divide {} by {}", dividend, divisor));
}

/**
 * @brief Replace all occurrences of a substring within a string.
 *
 * @param haystack Input string to search/modify (copied by value).
 * @param needle Substring to replace.
 * @param replacement Replacement substring.
 * @return Modified string with all replacements applied.
 */
std::string replace(std::string haystack, const std::string& needle, const std::string& replacement) {
    if (needle.empty()) {
        return haystack;
    }
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        haystack.replace(pos, needle.size(), replacement);
        pos = haystack.find(needle, pos + replacement.size());
    }
    return haystack;
}

float log_sigmoid(float x) {
    // log(sigmoid(x)) = -log1p(exp(-x)), rearranged so exp never overflows
    if (x >= 0.f) {
        return -std::log1p(std::exp(-x));
    }
    return x - std::log1p(std::exp(x));
}

float sigmoid(float x) {
    if (x >= 0.f) {
        return 1.f / (1.f + std::exp(-x));
    }
    float e = std::exp(x);
    return e / (1.f + e);
}
