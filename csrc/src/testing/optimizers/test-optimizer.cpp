// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "runtime/optimizers/optimizer.h"
#include "training/schedule.h"
#include "utilities/utils.h"

using Catch::Approx;
using namespace optimizers;

TEST_CASE("optimizer: names are case-insensitive", "[optimizer]") {
    CHECK(optimizer_type_from_str("RMSprop") == OptimizerType::RMSPROP);
    CHECK(optimizer_type_from_str("adamw") == OptimizerType::ADAMW);
    CHECK(optimizer_type_from_str("SGD") == OptimizerType::SGD);
    CHECK_THROWS_AS(optimizer_type_from_str("lion"), ConfigError);
}

TEST_CASE("optimizer: rmsprop first step scales by the root of the squared gradient", "[optimizer]") {
    Optimizer opt(OptimizerConfig::rmsprop(0.1f), 2);
    std::vector<float> params = {1.f, -1.f};
    std::vector<float> grads = {2.f, -0.5f};
    opt.step(params, grads, 0.1f);
    // v = 0.01 g^2, so each parameter moves by lr * sign(g) / sqrt(0.01)
    CHECK(params[0] == Approx(0.f).margin(1e-6));
    CHECK(params[1] == Approx(0.f).margin(1e-6));
    CHECK(opt.step_count() == 1);
    REQUIRE(opt.state_buffers().size() == 1);
    CHECK(opt.state_buffers()[0].first == "square_avg");
}

TEST_CASE("optimizer: adamw first step moves each parameter by the learning rate", "[optimizer]") {
    Optimizer opt(OptimizerConfig::adamw(0.01f, 0.9f, 0.999f, 1e-8f, 0.f), 3);
    std::vector<float> params = {0.f, 0.f, 0.f};
    std::vector<float> grads = {3.f, -0.1f, 0.f};
    opt.step(params, grads, 0.01f);
    CHECK(params[0] == Approx(-0.01f));
    CHECK(params[1] == Approx(0.01f));
    CHECK(params[2] == 0.f);
    CHECK(opt.state_buffers().size() == 2);
}

TEST_CASE("optimizer: sgd without momentum keeps no state", "[optimizer]") {
    Optimizer opt(OptimizerConfig::sgd(0.5f), 1);
    std::vector<float> params = {1.f};
    std::vector<float> grads = {1.f};
    opt.step(params, grads, 0.5f);
    CHECK(params[0] == Approx(0.5f));
    CHECK(opt.state_buffers().empty());
}

TEST_CASE("optimizer: shard size mismatches are programming errors", "[optimizer]") {
    Optimizer opt(OptimizerConfig::rmsprop(0.1f), 4);
    std::vector<float> params(3), grads(3);
    CHECK_THROWS_AS(opt.step(params, grads, 0.1f), std::logic_error);
}

TEST_CASE("schedule: linear warmup to the peak rate", "[optimizer]") {
    WarmupSchedule schedule(1e-3f, 4);
    CHECK(schedule.eval(0) == Approx(1e-3f / 5));
    CHECK(schedule.eval(3) == Approx(1e-3f * 4 / 5));
    CHECK(schedule.eval(4) == Approx(1e-3f));
    CHECK(schedule.eval(100) == Approx(1e-3f));

    WarmupSchedule none(2e-4f, 0);
    CHECK(none.eval(0) == Approx(2e-4f));
}
