// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_CONFIG_H
#define HALO_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_CONFIG_H

#include "optimizer_base.h"

namespace optimizers {

/**
 * @brief Configuration for optimizers
 *
 * Contains all hyperparameters for supported optimizers.
 * Parameters for unused optimizers are ignored.
 */
struct OptimizerConfig {
    OptimizerType type = OptimizerType::RMSPROP;

    // Common parameters
    float learning_rate = 5e-7f;
    float weight_decay = 0.0f;

    // RMSprop-specific parameters
    float rmsprop_alpha = 0.99f;
    float rmsprop_epsilon = 1e-8f;

    // AdamW-specific parameters
    float adamw_beta1 = 0.9f;
    float adamw_beta2 = 0.999f;
    float adamw_epsilon = 1e-8f;

    // SGD-specific parameters
    float sgd_momentum = 0.0f;

    static OptimizerConfig rmsprop(float lr, float alpha = 0.99f, float epsilon = 1e-8f) {
        OptimizerConfig config;
        config.type = OptimizerType::RMSPROP;
        config.learning_rate = lr;
        config.rmsprop_alpha = alpha;
        config.rmsprop_epsilon = epsilon;
        return config;
    }

    static OptimizerConfig adamw(float lr, float beta1 = 0.9f, float beta2 = 0.999f,
                                 float epsilon = 1e-8f, float weight_decay = 0.01f) {
        OptimizerConfig config;
        config.type = OptimizerType::ADAMW;
        config.learning_rate = lr;
        config.adamw_beta1 = beta1;
        config.adamw_beta2 = beta2;
        config.adamw_epsilon = epsilon;
        config.weight_decay = weight_decay;
        return config;
    }

    static OptimizerConfig sgd(float lr, float momentum = 0.0f) {
        OptimizerConfig config;
        config.type = OptimizerType::SGD;
        config.learning_rate = lr;
        config.sgd_momentum = momentum;
        return config;
    }

    //! Defaults of the named optimizer with the given learning rate.
    static OptimizerConfig from_type(OptimizerType type, float lr) {
        switch (type) {
            case OptimizerType::RMSPROP: return rmsprop(lr);
            case OptimizerType::ADAMW: return adamw(lr);
            case OptimizerType::SGD: return sgd(lr);
        }
        return rmsprop(lr);
    }
};

} // namespace optimizers

#endif // HALO_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_CONFIG_H
