// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio>
#include <cstdlib>

namespace testing_config {

struct TestSizeConfig {
    int Workers = 2;
    int Hidden = 8;
    int Examples = 16;
};

inline TestSizeConfig& mutable_cfg() {
    static TestSizeConfig cfg{};
    return cfg;
}

inline void set_test_config(const TestSizeConfig& cfg) {
    if(cfg.Workers < 1 || cfg.Hidden < 1 || cfg.Examples < 8) {
        fprintf(stderr, "ERROR: need at least one worker, a positive hidden size and eight examples\n");
        exit(EXIT_FAILURE);
    }
    mutable_cfg() = cfg;
}

inline const TestSizeConfig& get_test_config() {
    return mutable_cfg();
}

} // namespace testing_config
