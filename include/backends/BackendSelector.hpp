// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file BackendSelector.hpp
 * @brief Chooses a backend for a circuit
 *
 * Selection priority:
 * 1. An explicit backend name, if given
 * 2. The stabilizer backend for all-Clifford circuits
 * 3. The statevector backend otherwise, whatever the register size
 *
 * When noise is requested the chosen backend is wrapped in a NoisyBackend.
 */

#pragma once

#include "Backend.hpp"
#include "DensityMatrixBackend.hpp"
#include "NoisyBackend.hpp"
#include "StabilizerBackend.hpp"
#include "StatevectorBackend.hpp"
#include "../logging/Logger.hpp"
#include "../noise/NoiseChannel.hpp"

#include <fmt/core.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qsim::backends {

/// @brief Static description of a backend.
struct BackendInfo {
    std::string name;
    std::string description;
    std::string memory_scaling;
};

/// @brief Inputs to backend selection.
struct SelectionOptions {
    std::optional<std::string> preferred_backend;
    bool use_noise = false;
    noise::NoiseModel noise_model;
    std::optional<std::uint64_t> seed;
    std::shared_ptr<logging::Logger> logger;
};

/// @brief A ready-to-run backend and why it was chosen.
struct Selection {
    std::unique_ptr<Backend> backend;
    std::string explanation;
};

class BackendSelector {
public:
    /// @brief Names accepted as an explicit preference.
    [[nodiscard]] static std::vector<std::string> availableBackends() {
        return {"statevector", "density_matrix", "stabilizer"};
    }

    /**
     * @brief Describes a backend.
     * @throws sim::UnknownBackendError for unrecognized names
     */
    [[nodiscard]] static BackendInfo info(const std::string& name) {
        if (name == "statevector") {
            return {name, "Full statevector simulation. Supports any circuit.", "2^n"};
        }
        if (name == "density_matrix") {
            return {name, "Density matrix simulation. Supports mixed states and noise.", "4^n"};
        }
        if (name == "stabilizer") {
            return {name,
                    "Clifford-only backend. Rejects non-Clifford gates and simulates "
                    "accepted circuits with full statevector evolution.",
                    "2^n"};
        }
        throw sim::UnknownBackendError(unknownMessage(name));
    }

    /**
     * @brief Creates a backend by name.
     * @throws sim::UnknownBackendError for unrecognized names
     */
    [[nodiscard]] static std::unique_ptr<Backend> create(const std::string& name,
                                                         std::optional<std::uint64_t> seed = std::nullopt) {
        if (name == "statevector") return std::make_unique<StatevectorBackend>(seed);
        if (name == "density_matrix") return std::make_unique<DensityMatrixBackend>(seed);
        if (name == "stabilizer") return std::make_unique<StabilizerBackend>(seed);
        throw sim::UnknownBackendError(unknownMessage(name));
    }

    /**
     * @brief Picks a backend for a circuit.
     * @throws sim::UnknownBackendError if the preferred name is unrecognized
     */
    [[nodiscard]] static Selection select(const ir::Circuit& circuit,
                                          const SelectionOptions& options = {}) {
        Selection selection;

        if (options.preferred_backend.has_value()) {
            selection.backend = create(*options.preferred_backend, options.seed);
            selection.explanation = "Using user-specified backend: " + *options.preferred_backend;
        } else if (detectCliffordCircuit(circuit).supported) {
            selection.backend = std::make_unique<StabilizerBackend>(options.seed);
            selection.explanation =
                "Circuit is Clifford - using Stabilizer backend (efficient for Clifford circuits)";
        } else {
            const double gib = Backend::estimateMemoryBytes(circuit.numQubits(), false) /
                               (1024.0 * 1024.0 * 1024.0);
            selection.backend = std::make_unique<StatevectorBackend>(options.seed);
            selection.explanation =
                gib < 0.1
                    ? fmt::format("Using Statevector backend (circuit requires ~{:.2f}GB memory)", gib)
                    : fmt::format("Using Statevector backend (circuit requires ~{:.2f}GB memory - "
                                  "consider optimizations)", gib);
        }

        if (options.use_noise) {
            selection.backend = std::make_unique<NoisyBackend>(
                std::move(selection.backend), options.noise_model, options.seed);
            selection.explanation += " with noise model";
        }

        if (options.logger) {
            selection.backend->setLogger(options.logger);
            options.logger->info(selection.explanation);
        }
        return selection;
    }

private:
    static std::string unknownMessage(const std::string& name) {
        std::string message = "Unknown backend: " + name + ". Available:";
        for (const auto& known : availableBackends()) {
            message += " " + known;
        }
        return message;
    }
};

}  // namespace qsim::backends
