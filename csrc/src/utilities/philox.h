// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_UTILS_PHILOX_H
#define HALO_SRC_UTILS_PHILOX_H

#include <array>
#include <cstdint>

//! \brief Counter-based Philox-4x32-10 generator.
//! \details The output is a pure function of (key, counter), so any shuffle or sample
//! can be regenerated from the seed and a position, which is what makes data order and
//! initialization reproducible after a restart.
class Philox4x32 {
public:
    explicit Philox4x32(std::uint64_t seed) :
        mKey{static_cast<std::uint32_t>(seed), static_cast<std::uint32_t>(seed >> 32)} {
    }

    [[nodiscard]] std::array<std::uint32_t, 4> generate(std::uint32_t x, std::uint32_t y,
                                                        std::uint32_t z = 0, std::uint32_t w = 0) const {
        std::array<std::uint32_t, 4> ctr{x, y, z, w};
        std::array<std::uint32_t, 2> key = mKey;
        for (int round = 0; round < 10; ++round) {
            ctr = single_round(ctr, key);
            key[0] += 0x9E3779B9u;
            key[1] += 0xBB67AE85u;
        }
        return ctr;
    }

    //! uniform float in [0, 1) derived from the first output word
    [[nodiscard]] float uniform(std::uint32_t x, std::uint32_t y) const {
        return static_cast<float>(generate(x, y)[0] >> 8) * (1.f / 16777216.f);
    }

private:
    static std::array<std::uint32_t, 4> single_round(const std::array<std::uint32_t, 4>& ctr,
                                                     const std::array<std::uint32_t, 2>& key) {
        const std::uint64_t p0 = static_cast<std::uint64_t>(0xD2511F53u) * ctr[0];
        const std::uint64_t p1 = static_cast<std::uint64_t>(0xCD9E8D57u) * ctr[2];
        const auto hi0 = static_cast<std::uint32_t>(p0 >> 32);
        const auto lo0 = static_cast<std::uint32_t>(p0);
        const auto hi1 = static_cast<std::uint32_t>(p1 >> 32);
        const auto lo1 = static_cast<std::uint32_t>(p1);
        return {hi1 ^ ctr[1] ^ key[0], lo1, hi0 ^ ctr[3] ^ key[1], lo0};
    }

    std::array<std::uint32_t, 2> mKey;
};

#endif //HALO_SRC_UTILS_PHILOX_H
