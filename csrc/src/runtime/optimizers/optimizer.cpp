// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizer.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

namespace optimizers {

Optimizer::Optimizer(const OptimizerConfig& config, std::size_t num_params) : mConfig(config) {
    switch (mConfig.type) {
        case OptimizerType::RMSPROP:
            mSecondMoment.assign(num_params, 0.f);
            break;
        case OptimizerType::ADAMW:
            mFirstMoment.assign(num_params, 0.f);
            mSecondMoment.assign(num_params, 0.f);
            break;
        case OptimizerType::SGD:
            if (mConfig.sgd_momentum != 0.f) {
                mFirstMoment.assign(num_params, 0.f);
            }
            break;
    }
}

/**
 * @brief Apply one optimizer update to a parameter shard.
 *
 * @param params FP32 master parameters, updated in place.
 * @param grads Gradients of the same shard (already averaged over workers and clipped).
 * @param lr Learning rate for this step.
 * @throws std::logic_error if the spans do not match the optimizer state size.
 */
void Optimizer::step(std::span<float> params, std::span<const float> grads, float lr) {
    if (params.size() != grads.size()) {
        throw std::logic_error(fmt::format("Optimizer: {} parameters but {} gradients", params.size(), grads.size()));
    }
    std::size_t expected = std::max(mFirstMoment.size(), mSecondMoment.size());
    if (expected != 0 && expected != params.size()) {
        throw std::logic_error(fmt::format("Optimizer: state has {} elements, shard has {}", expected, params.size()));
    }

    ++mStepCount;
    switch (mConfig.type) {
        case OptimizerType::RMSPROP: rmsprop_update(params, grads, lr); break;
        case OptimizerType::ADAMW: adamw_update(params, grads, lr); break;
        case OptimizerType::SGD: sgd_update(params, grads, lr); break;
    }
}

void Optimizer::rmsprop_update(std::span<float> params, std::span<const float> grads, float lr) {
    const float alpha = mConfig.rmsprop_alpha;
    for (std::size_t i = 0; i < params.size(); ++i) {
        float g = grads[i];
        if (mConfig.weight_decay != 0.f) {
            g += mConfig.weight_decay * params[i];
        }
        float& v = mSecondMoment[i];
        v = alpha * v + (1.f - alpha) * g * g;
        params[i] -= lr * g / (std::sqrt(v) + mConfig.rmsprop_epsilon);
    }
}

void Optimizer::adamw_update(std::span<float> params, std::span<const float> grads, float lr) {
    const float beta1 = mConfig.adamw_beta1;
    const float beta2 = mConfig.adamw_beta2;
    const float beta1_correction = 1.f - std::pow(beta1, static_cast<float>(mStepCount));
    const float beta2_correction = 1.f - std::pow(beta2, static_cast<float>(mStepCount));
    for (std::size_t i = 0; i < params.size(); ++i) {
        params[i] *= 1.f - lr * mConfig.weight_decay;
        float& m = mFirstMoment[i];
        float& v = mSecondMoment[i];
        m = beta1 * m + (1.f - beta1) * grads[i];
        v = beta2 * v + (1.f - beta2) * grads[i] * grads[i];
        float m_hat = m / beta1_correction;
        float v_hat = v / beta2_correction;
        params[i] -= lr * m_hat / (std::sqrt(v_hat) + mConfig.adamw_epsilon);
    }
}

void Optimizer::sgd_update(std::span<float> params, std::span<const float> grads, float lr) {
    for (std::size_t i = 0; i < params.size(); ++i) {
        float g = grads[i];
        if (mConfig.weight_decay != 0.f) {
            g += mConfig.weight_decay * params[i];
        }
        if (!mFirstMoment.empty()) {
            float& buf = mFirstMoment[i];
            buf = mStepCount == 1 ? g : mConfig.sgd_momentum * buf + g;
            g = buf;
        }
        params[i] -= lr * g;
    }
}

std::vector<std::pair<std::string, std::vector<float>*>> Optimizer::state_buffers() {
    std::vector<std::pair<std::string, std::vector<float>*>> result;
    switch (mConfig.type) {
        case OptimizerType::RMSPROP:
            result.emplace_back("square_avg", &mSecondMoment);
            break;
        case OptimizerType::ADAMW:
            result.emplace_back("exp_avg", &mFirstMoment);
            result.emplace_back("exp_avg_sq", &mSecondMoment);
            break;
        case OptimizerType::SGD:
            if (!mFirstMoment.empty()) {
                result.emplace_back("momentum_buffer", &mFirstMoment);
            }
            break;
    }
    return result;
}

} // namespace optimizers
