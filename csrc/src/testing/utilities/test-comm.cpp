// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include "utilities/comm.h"
#include "utilities/utils.h"
#include "test_config.h"

using Catch::Approx;

TEST_CASE("comm: reductions agree on every worker", "[comm]") {
    const int world = testing_config::get_test_config().Workers;
    std::vector<float> sums(world), means(world);
    std::vector<int> maxima(world);
    Communicator::run_communicators(world, [&](Communicator& comm) {
        sums[comm.rank()] = comm.all_reduce_sum(static_cast<float>(comm.rank() + 1));
        means[comm.rank()] = comm.all_reduce_mean(static_cast<float>(comm.rank()));
        maxima[comm.rank()] = comm.all_reduce_max(comm.rank() == world - 1 ? 7 : 0);
    });
    for (int r = 0; r < world; ++r) {
        CHECK(sums[r] == Approx(world * (world + 1) / 2.0));
        CHECK(means[r] == Approx((world - 1) / 2.0));
        CHECK(maxima[r] == 7);
    }
}

TEST_CASE("comm: variable-length gather concatenates in rank order", "[comm]") {
    const int world = testing_config::get_test_config().Workers;
    std::vector<std::vector<int>> results(world);
    Communicator::run_communicators(world, [&](Communicator& comm) {
        std::vector<int> mine(comm.rank() + 1, comm.rank());
        results[comm.rank()] = comm.host_all_gather_vector(mine);
    });
    std::vector<int> expected;
    for (int r = 0; r < world; ++r) expected.insert(expected.end(), r + 1, r);
    for (const auto& r : results) CHECK(r == expected);
}

TEST_CASE("comm: a failing worker releases its peers instead of hanging", "[comm]") {
    const int world = std::max(2, testing_config::get_test_config().Workers);
    std::atomic<int> aborted{0};
    try {
        Communicator::run_communicators(world, [&](Communicator& comm) {
            if (comm.rank() == 1) {
                throw std::runtime_error("worker 1 failed");
            }
            try {
                comm.barrier();
                comm.barrier();
            } catch (const CommunicationError&) {
                ++aborted;
                throw;
            }
        });
        FAIL("expected an exception");
    } catch (const CommunicationError&) {
        FAIL("the root cause should be reported, not the abort of a peer");
    } catch (const std::runtime_error& e) {
        CHECK(std::string(e.what()) == "worker 1 failed");
    }
    CHECK(aborted == world - 1);
}
