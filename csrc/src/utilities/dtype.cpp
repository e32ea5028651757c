// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "dtype.h"

#include <stdexcept>
#include <string>

#include "utils.h"

float round_to_dtype(float value, ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32:
            return value;
        case ETensorDType::BF16:
            return static_cast<float>(bf16(value));
        default:
            throw std::logic_error(std::string("Cannot round floating point value to ") + dtype_to_str(dtype));
    }
}

std::size_t get_dtype_size(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return 4;
        case ETensorDType::BF16: return 2;
        case ETensorDType::INT32: return 4;
        case ETensorDType::BYTE: return 1;
    }
    throw std::logic_error("Invalid dtype");
}

const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "F32";
        case ETensorDType::BF16: return "BF16";
        case ETensorDType::INT32: return "I32";
        case ETensorDType::BYTE: return "U8";
    }
    return "unknown";
}

/**
 * @brief Parse a dtype name.
 *
 * @param name SafeTensors dtype string or a human-readable alias.
 * @return Matching ETensorDType.
 *
 * @throws std::runtime_error If @p name is not a known dtype.
 */
ETensorDType dtype_from_str(std::string_view name) {
    if (iequals(name, "F32") || iequals(name, "fp32") || iequals(name, "float32") || iequals(name, "float")) {
        return ETensorDType::FP32;
    }
    if (iequals(name, "BF16") || iequals(name, "bfloat16")) {
        return ETensorDType::BF16;
    }
    if (iequals(name, "I32") || iequals(name, "int32")) {
        return ETensorDType::INT32;
    }
    if (iequals(name, "U8") || iequals(name, "byte")) {
        return ETensorDType::BYTE;
    }
    throw std::runtime_error("Unknown dtype: " + std::string(name));
}
