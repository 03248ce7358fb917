// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Random.hpp
 * @brief Seed-scoped random source for measurement sampling
 *
 * An Rng is created once per execution (or supplied by the caller) and
 * passed by reference to every sampling call. There is no process-wide
 * random state.
 */

#pragma once

#include <cstdint>
#include <random>

namespace qsim::sim {

/**
 * @brief Reproducible uniform random source.
 *
 * Two Rng instances built from the same seed produce the same sequence.
 */
class Rng {
public:
    explicit Rng(std::uint64_t seed)
        : engine_(seed)
        , dist_(0.0, 1.0)
        , seed_(seed)
    {}

    /// @brief Creates an Rng seeded from std::random_device.
    [[nodiscard]] static Rng fromEntropy() {
        std::random_device device;
        const std::uint64_t seed =
            (static_cast<std::uint64_t>(device()) << 32) ^ device();
        return Rng(seed);
    }

    /// @brief Uniform sample in [0, 1).
    [[nodiscard]] double uniform() { return dist_(engine_); }

    /// @brief Returns true with probability p.
    [[nodiscard]] bool bernoulli(double p) { return uniform() < p; }

    /// @brief The seed this generator started from.
    [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_;
    std::uint64_t seed_;
};

}  // namespace qsim::sim
