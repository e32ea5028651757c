// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_BASE_H
#define HALO_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_BASE_H

#include <string>
#include <string_view>

#include "utilities/utils.h"

namespace optimizers {

/**
 * @brief Supported optimizer types
 */
enum class OptimizerType {
    RMSPROP,        // RMSprop without momentum (default)
    ADAMW,          // full-precision AdamW
    SGD             // SGD with optional momentum
};

/**
 * @brief Convert string to OptimizerType (case-insensitive, e.g. "RMSprop", "AdamW")
 * @throws ConfigError for unknown names.
 */
inline OptimizerType optimizer_type_from_str(std::string_view str) {
    if (iequals(str, "rmsprop")) {
        return OptimizerType::RMSPROP;
    } else if (iequals(str, "adamw") || iequals(str, "adam")) {
        return OptimizerType::ADAMW;
    } else if (iequals(str, "sgd")) {
        return OptimizerType::SGD;
    }
    throw ConfigError("Unknown optimizer type: " + std::string(str));
}

/**
 * @brief Convert OptimizerType to string
 */
inline std::string_view optimizer_type_to_str(OptimizerType type) {
    switch (type) {
        case OptimizerType::RMSPROP: return "RMSprop";
        case OptimizerType::ADAMW: return "AdamW";
        case OptimizerType::SGD: return "SGD";
    }
    return "unknown";
}

// Alias for consistency with other to_string functions in the codebase
inline std::string to_string(OptimizerType type) {
    return std::string(optimizer_type_to_str(type));
}

} // namespace optimizers

#endif // HALO_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_BASE_H
