// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_TRAINING_METRICS_H
#define HALO_SRC_TRAINING_METRICS_H

#include <map>
#include <span>
#include <string>
#include <utility>

#include "training/logging.h"

class Communicator;

/*!
 * \brief Running sums of named metrics between two log lines.
 * \details Every added value counts once; reduce() returns the mean over all values added
 * by all workers. All workers must have added the same set of metric names.
 */
class MetricsAccumulator {
public:
    void add(const std::string& name, std::span<const float> values);
    void add(const std::string& name, float value);

    //! Collective. Means over workers and added values; clears the accumulator.
    MetricsMap reduce(Communicator& comm);

    [[nodiscard]] bool empty() const { return mSums.empty(); }
    void clear() { mSums.clear(); }

private:
    // name -> (sum, count)
    std::map<std::string, std::pair<double, double>> mSums;
};

#endif //HALO_SRC_TRAINING_METRICS_H
