// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_UTILS_DTYPE_H
#define HALO_SRC_UTILS_DTYPE_H

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string_view>

enum class ETensorDType : int {
    FP32,
    BF16,
    INT32,
    BYTE
};

//! \brief Storage type for bfloat16 values (upper half of an IEEE float).
struct bf16 {
    std::uint16_t Bits = 0;

    bf16() = default;
    explicit bf16(float value) : Bits(round_bits(value)) {}

    explicit operator float() const {
        return std::bit_cast<float>(static_cast<std::uint32_t>(Bits) << 16);
    }

    //! round-to-nearest-even; NaN stays NaN
    static std::uint16_t round_bits(float value) {
        std::uint32_t bits = std::bit_cast<std::uint32_t>(value);
        if ((bits & 0x7f800000u) == 0x7f800000u && (bits & 0x007fffffu) != 0) {
            return static_cast<std::uint16_t>((bits >> 16) | 0x0040u);
        }
        std::uint32_t lsb = (bits >> 16) & 1u;
        bits += 0x7fffu + lsb;
        return static_cast<std::uint16_t>(bits >> 16);
    }
};

static_assert(sizeof(bf16) == 2, "bf16 must be two bytes");

//! Rounds `value` to the precision of `dtype` and returns it as float.
float round_to_dtype(float value, ETensorDType dtype);

std::size_t get_dtype_size(ETensorDType dtype);
const char* dtype_to_str(ETensorDType dtype);
//! accepts safetensors names (F32, BF16, I32, U8) and config names (float32, bfloat16, fp32, bf16)
ETensorDType dtype_from_str(std::string_view name);

template<typename T>
inline constexpr ETensorDType dtype_from_type = ETensorDType::BYTE;

template<> inline constexpr ETensorDType dtype_from_type<float> = ETensorDType::FP32;
template<> inline constexpr ETensorDType dtype_from_type<bf16> = ETensorDType::BF16;
template<> inline constexpr ETensorDType dtype_from_type<std::int32_t> = ETensorDType::INT32;
template<> inline constexpr ETensorDType dtype_from_type<std::byte> = ETensorDType::BYTE;

#endif //HALO_SRC_UTILS_DTYPE_H
