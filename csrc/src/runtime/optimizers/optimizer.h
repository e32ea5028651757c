// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_H
#define HALO_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_H

#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "optimizer_config.h"

namespace optimizers {

/**
 * @brief Element-wise optimizer over one shard of the flattened FP32 master parameters.
 *
 * Every worker runs its own instance on the shard it owns; the state buffers have
 * the size of that shard.
 */
class Optimizer {
public:
    Optimizer(const OptimizerConfig& config, std::size_t num_params);

    //! Applies one update with learning rate `lr` (the scheduled rate, not the base rate).
    void step(std::span<float> params, std::span<const float> grads, float lr);

    [[nodiscard]] const OptimizerConfig& config() const { return mConfig; }
    [[nodiscard]] int step_count() const { return mStepCount; }
    void set_step_count(int steps) { mStepCount = steps; }

    //! Named state buffers (e.g. "exp_avg"); empty for stateless SGD.
    std::vector<std::pair<std::string, std::vector<float>*>> state_buffers();

private:
    void rmsprop_update(std::span<float> params, std::span<const float> grads, float lr);
    void adamw_update(std::span<float> params, std::span<const float> grads, float lr);
    void sgd_update(std::span<float> params, std::span<const float> grads, float lr);

    OptimizerConfig mConfig;
    int mStepCount = 0;
    std::vector<float> mFirstMoment;
    std::vector<float> mSecondMoment;
};

} // namespace optimizers

#endif // HALO_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_H
