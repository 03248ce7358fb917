// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file SimulatorConfig.hpp
 * @brief Run configuration and its translation into engine types
 *
 * @see ConfigLoader.hpp for reading configurations from text and the
 *      environment
 */

#pragma once

#include "../backends/BackendSelector.hpp"
#include "../logging/Logger.hpp"
#include "../noise/NoiseChannel.hpp"
#include "../sim/ExecutionResult.hpp"
#include "../sim/SimulationError.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace qsim::config {

/// @brief One noise channel attached to a qubit.
struct NoiseSpec {
    QubitIndex qubit = 0;
    std::string channel;
    double parameter = 0.0;
};

/**
 * @brief Everything needed to select a backend and run a circuit.
 */
struct SimulatorConfig {
    std::string backend{"auto"};  ///< "auto" or a name from availableBackends()
    std::size_t shots{1};
    std::optional<std::uint64_t> seed;
    bool record_history{false};
    sim::ShotMode shot_mode{sim::ShotMode::ReuseCollapsed};
    bool use_noise{false};
    bool debug{false};
    std::vector<NoiseSpec> noise;
};

/**
 * @brief Checks backend name, shot count and every noise entry.
 * @return Error messages; empty if the configuration is usable
 */
[[nodiscard]] inline std::vector<std::string> validate(const SimulatorConfig& cfg) {
    std::vector<std::string> errs;

    const auto names = backends::BackendSelector::availableBackends();
    if (cfg.backend != "auto" &&
        std::find(names.begin(), names.end(), cfg.backend) == names.end()) {
        errs.push_back(fmt::format("unknown backend '{}'", cfg.backend));
    }
    if (cfg.shots == 0) {
        errs.push_back("shots must be at least 1");
    }
    for (const auto& spec : cfg.noise) {
        try {
            (void)noise::NoiseChannel::fromName(spec.channel, spec.parameter);
        } catch (const sim::SimulationError& ex) {
            errs.push_back(fmt::format("noise on qubit {}: {}", spec.qubit, ex.what()));
        } catch (const std::invalid_argument& ex) {
            errs.push_back(fmt::format("noise on qubit {}: {}", spec.qubit, ex.what()));
        }
    }
    return errs;
}

/**
 * @brief Builds the per-qubit noise model, preserving entry order.
 * @throws std::invalid_argument for unknown channel names
 * @throws sim::InvalidChannelParameterError for out-of-range parameters
 */
[[nodiscard]] inline noise::NoiseModel buildNoiseModel(const SimulatorConfig& cfg) {
    noise::NoiseModel model;
    for (const auto& spec : cfg.noise) {
        model[spec.qubit].push_back(noise::NoiseChannel::fromName(spec.channel, spec.parameter));
    }
    return model;
}

[[nodiscard]] inline sim::ExecutionOptions toExecutionOptions(const SimulatorConfig& cfg) {
    sim::ExecutionOptions options;
    options.shots = cfg.shots;
    options.record_history = cfg.record_history;
    options.shot_mode = cfg.shot_mode;
    return options;
}

/**
 * @brief Translates into selector inputs.
 * @throws as buildNoiseModel()
 */
[[nodiscard]] inline backends::SelectionOptions toSelectionOptions(
    const SimulatorConfig& cfg,
    std::shared_ptr<logging::Logger> logger = nullptr) {
    backends::SelectionOptions options;
    if (cfg.backend != "auto") {
        options.preferred_backend = cfg.backend;
    }
    options.use_noise = cfg.use_noise;
    options.noise_model = buildNoiseModel(cfg);
    options.seed = cfg.seed;
    options.logger = std::move(logger);
    return options;
}

}  // namespace qsim::config
