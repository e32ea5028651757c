// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_UTILS_UTILS_H
#define HALO_SRC_UTILS_UTILS_H

#include <concepts>
#include <cstdint>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

/// Invalid or inconsistent run configuration; always fatal at startup.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// An example or batch that cannot be used with the configured loss.
class DataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A worker failed to reach a collective; the whole group is aborted.
class CommunicationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template<std::integral T>
constexpr T div_ceil(T dividend, T divisor) {
    return (dividend + divisor - 1) / divisor;
}

[[noreturn]] void throw_not_divisible(long long dividend, long long divisor);

template<std::integral T>
constexpr T div_exact(T dividend, T divisor) {
    if(dividend % divisor != 0) {
        throw_not_divisible(dividend, divisor);
    }
    return dividend / divisor;
}

template<std::integral Dst, std::integral Src>
constexpr Dst narrow(Src input) {
    if constexpr (std::is_signed_v<Src>) {
        if (std::is_unsigned_v<Dst> && input < 0) {
            throw std::out_of_range("Cannot convert negative number to unsigned");
        }
        if (std::is_signed_v<Dst> && input < std::numeric_limits<Dst>::min())
        {
            throw std::out_of_range("Out of range in integer conversion: underflow");
        }
    }

    if (input > std::numeric_limits<Dst>::max())
    {
        throw std::out_of_range("Out of range in integer conversion: overflow");
    }

    return static_cast<Dst>(input);
}

// ----------------------------------------------------------------------------
bool iequals(std::string_view lhs, std::string_view rhs);

//! Replaces every occurrence of `needle` in `haystack`.
std::string replace(std::string haystack, const std::string& needle, const std::string& replacement);

//! Numerically stable log(sigmoid(x)).
float log_sigmoid(float x);
float sigmoid(float x);

#endif //HALO_SRC_UTILS_UTILS_H
