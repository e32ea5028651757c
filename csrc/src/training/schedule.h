// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_TRAINING_SCHEDULE_H
#define HALO_SRC_TRAINING_SCHEDULE_H

#include <algorithm> // std::min

/**
 * @brief Interface for scalar schedules evaluated per training step.
 *
 * A schedule maps an integer step index (typically starting at 0) to a float
 * value (e.g., learning rate).
 */
class ISchedule {
public:
    /** @brief Virtual destructor. */
    virtual ~ISchedule() = default;

    /**
     * @brief Evaluate the schedule at a given step.
     * @param step Current step index (typically >= 0).
     * @return Scheduled value for the given step.
     */
    virtual float eval(long step) const = 0;
};

/**
 * @brief Linear warmup to a constant rate.
 *
 * Step `s` (number of optimizer updates already applied) gets
 * `peak * min(1, (s + 1) / (warmup + 1))`, so the first update already uses a
 * non-zero rate and the peak is reached after `warmup` updates.
 */
class WarmupSchedule : public ISchedule {
public:
    WarmupSchedule(float peak_rate, int warmup)
        : mPeakRate(peak_rate), mWarmupSteps(warmup) {}

    float eval(long step) const override {
        double frac = static_cast<double>(step + 1) / static_cast<double>(mWarmupSteps + 1);
        return static_cast<float>(mPeakRate * std::min(1.0, frac));
    }

    [[nodiscard]] float peak_rate() const { return mPeakRate; }

private:
    float mPeakRate;
    int mWarmupSteps;
};

#endif //HALO_SRC_TRAINING_SCHEDULE_H
