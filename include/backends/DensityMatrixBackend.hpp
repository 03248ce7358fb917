// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file DensityMatrixBackend.hpp
 * @brief Mixed-state simulation: rho' = U rho U^dagger per gate
 *
 * Memory scales as 4^n entries. Pure initial states are converted to
 * density matrices before the first gate.
 */

#pragma once

#include "Backend.hpp"

#include <string>

namespace qsim::backends {

class DensityMatrixBackend : public Backend {
public:
    explicit DensityMatrixBackend(std::optional<std::uint64_t> seed = std::nullopt)
        : Backend(seed)
    {}

    [[nodiscard]] std::string name() const override { return "density_matrix"; }

    [[nodiscard]] Capability canExecute(const ir::Circuit& circuit) const noexcept override {
        return Capability{true, memoryWarning(circuit.numQubits(), true)};
    }

    [[nodiscard]] sim::ExecutionResult run(const ir::Circuit& circuit,
                                           const sim::ExecutionOptions& options,
                                           sim::Rng& rng) override {
        validateCircuit(circuit);
        return simulate(circuit, initialState(circuit, options, true), options, rng);
    }
};

}  // namespace qsim::backends
