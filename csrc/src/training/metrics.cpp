// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "metrics.h"

#include <vector>

#include "utilities/comm.h"

void MetricsAccumulator::add(const std::string& name, std::span<const float> values) {
    auto& [sum, count] = mSums[name];
    for (float v : values) {
        sum += v;
    }
    count += static_cast<double>(values.size());
}

void MetricsAccumulator::add(const std::string& name, float value) {
    auto& [sum, count] = mSums[name];
    sum += value;
    count += 1.0;
}

MetricsMap MetricsAccumulator::reduce(Communicator& comm) {
    std::vector<float> packed;
    packed.reserve(2 * mSums.size());
    for (const auto& [name, entry] : mSums) {
        packed.push_back(static_cast<float>(entry.first));
        packed.push_back(static_cast<float>(entry.second));
    }
    if (comm.world_size() > 1) {
        comm.all_reduce_sum(packed.data(), packed.size());
    }

    MetricsMap result;
    std::size_t i = 0;
    for (const auto& [name, entry] : mSums) {
        float sum = packed[i++];
        float count = packed[i++];
        if (count > 0) {
            result[name] = sum / count;
        }
    }
    mSums.clear();
    return result;
}
