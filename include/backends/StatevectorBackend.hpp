// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file StatevectorBackend.hpp
 * @brief Pure-state simulation: |psi'> = U |psi> per gate
 *
 * Memory scales as 2^n amplitudes. Accepts every circuit; very large
 * registers only produce a resource warning.
 */

#pragma once

#include "Backend.hpp"
#include "../ir/Qubit.hpp"

#include <map>
#include <string>

namespace qsim::backends {

class StatevectorBackend : public Backend {
public:
    explicit StatevectorBackend(std::optional<std::uint64_t> seed = std::nullopt)
        : Backend(seed)
    {}

    [[nodiscard]] std::string name() const override { return "statevector"; }

    [[nodiscard]] Capability canExecute(const ir::Circuit& circuit) const noexcept override {
        return Capability{true, memoryWarning(circuit.numQubits(), false)};
    }

    /**
     * @throws sim::DimensionMismatchError if the initial state is a density
     *         matrix or has the wrong qubit count
     */
    [[nodiscard]] sim::ExecutionResult run(const ir::Circuit& circuit,
                                           const sim::ExecutionOptions& options,
                                           sim::Rng& rng) override {
        validateCircuit(circuit);
        return simulate(circuit, initialState(circuit, options, false), options, rng);
    }

    /**
     * @brief Amplitude of every basis state keyed by its bit string.
     * @throws std::invalid_argument if the result holds a density matrix
     */
    [[nodiscard]] static std::map<std::string, Complex> amplitudes(const sim::ExecutionResult& result) {
        std::map<std::string, Complex> out;
        const auto& state = result.state;
        for (std::size_t i = 0; i < state.dimension(); ++i) {
            out.emplace(ir::basisLabel(i, state.numQubits()), state.amplitude(i));
        }
        return out;
    }
};

}  // namespace qsim::backends
