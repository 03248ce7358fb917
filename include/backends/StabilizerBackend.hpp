// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file StabilizerBackend.hpp
 * @brief Clifford-only backend
 *
 * Accepts circuits built from {H, S, CNOT, CZ, X, Y, Z, SWAP} and rejects
 * everything else. Accepted circuits are simulated with full statevector
 * evolution; there is no stabilizer tableau.
 */

#pragma once

#include "Backend.hpp"
#include "StatevectorBackend.hpp"

#include <string>

namespace qsim::backends {

/**
 * @brief Checks whether every gate of a circuit is in the Clifford set.
 * @return supported == false with the offending gate named in reason
 */
[[nodiscard]] inline Capability detectCliffordCircuit(const ir::Circuit& circuit) noexcept {
    for (const auto& inst : circuit) {
        if (!inst.gate.isClifford()) {
            return Capability{false,
                              "Non-Clifford gate '" + inst.gate.name() +
                              "' detected. Stabilizer backend only supports Clifford gates."};
        }
    }
    return Capability{true, std::nullopt};
}

class StabilizerBackend : public Backend {
public:
    explicit StabilizerBackend(std::optional<std::uint64_t> seed = std::nullopt)
        : Backend(seed)
    {}

    [[nodiscard]] std::string name() const override { return "stabilizer"; }

    [[nodiscard]] Capability canExecute(const ir::Circuit& circuit) const noexcept override {
        Capability clifford = detectCliffordCircuit(circuit);
        if (!clifford.supported) {
            return clifford;
        }
        return Capability{true, memoryWarning(circuit.numQubits(), false)};
    }

    /**
     * @throws sim::NonCliffordGateError naming the first non-Clifford gate
     */
    void validateCircuit(const ir::Circuit& circuit) const override {
        Backend::validateCircuit(circuit);
        for (const auto& inst : circuit) {
            if (!inst.gate.isClifford()) {
                throw sim::NonCliffordGateError(
                    "Instruction " + inst.toString() +
                    " is not in the Clifford set {H, S, CNOT, CZ, X, Y, Z, SWAP}");
            }
        }
    }

    [[nodiscard]] sim::ExecutionResult run(const ir::Circuit& circuit,
                                           const sim::ExecutionOptions& options,
                                           sim::Rng& rng) override {
        validateCircuit(circuit);

        StatevectorBackend delegate(seed());
        delegate.setLogger(logger());
        sim::ExecutionResult result = delegate.run(circuit, options, rng);
        result.metadata.backend = name();
        result.metadata.notes.push_back(
            "Clifford circuit simulated with full statevector evolution (no stabilizer tableau)");
        return result;
    }
};

}  // namespace qsim::backends
