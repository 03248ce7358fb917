// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the quantum circuit simulator
 *
 * Demonstrates:
 * - Building circuits with the chainable API
 * - Running them on explicit backends and through the selector
 * - Reading counts, amplitudes and history
 * - Entanglement metrics on the results
 */

#include "backends/BackendSelector.hpp"
#include "backends/DensityMatrixBackend.hpp"
#include "backends/StatevectorBackend.hpp"
#include "ir/Circuit.hpp"
#include "metrics/Entanglement.hpp"
#include "metrics/Fidelity.hpp"

#include <fmt/core.h>

#include <vector>

using namespace qsim;

int main() {
    fmt::print("=== Quantum Circuit Simulator - Basic Usage ===\n\n");

    // =========================================================================
    // 1. Building a circuit
    // =========================================================================
    fmt::print("1. Building a Bell state circuit:\n");

    ir::Circuit bell(2);
    bell.h(0).cnot(0, 1);

    fmt::print("   Gates: {}\n", bell.numGates());
    fmt::print("   Depth: {}\n\n", bell.depth());

    // =========================================================================
    // 2. Statevector simulation
    // =========================================================================
    fmt::print("2. Statevector amplitudes:\n");

    backends::StatevectorBackend sv(42);
    auto pure = sv.execute(bell);
    for (const auto& [label, amp] : backends::StatevectorBackend::amplitudes(pure)) {
        fmt::print("   |{}>  {:+.4f}{:+.4f}i\n", label, amp.real(), amp.imag());
    }
    fmt::print("\n");

    // =========================================================================
    // 3. Sampling shots
    // =========================================================================
    fmt::print("3. Sampling 1000 independent shots:\n");

    ir::Circuit measured = bell.clone();
    measured.measureAll();

    sim::ExecutionOptions options;
    options.shots = 1000;
    options.shot_mode = sim::ShotMode::Independent;
    auto sampled = sv.execute(measured, options);
    for (const auto& [key, count] : sampled.counts()) {
        fmt::print("   {}: {}\n", key, count);
    }
    fmt::print("\n");

    // =========================================================================
    // 4. Density matrix simulation and history
    // =========================================================================
    fmt::print("4. Entanglement entropy of qubit 0 after each gate:\n");

    ir::Circuit ghz(3);
    ghz.h(0).cnot(0, 1).cnot(1, 2);

    backends::DensityMatrixBackend dm(7);
    sim::ExecutionOptions history_options;
    history_options.record_history = true;
    auto mixed = dm.execute(ghz, history_options);

    auto entropies = metrics::entropyEvolution(mixed.history, {0});
    for (std::size_t step = 0; step < entropies.size(); ++step) {
        fmt::print("   step {}: S = {:.4f}\n", step, entropies[step]);
    }
    fmt::print("   fidelity with statevector result: {:.6f}\n\n",
               metrics::stateFidelity(mixed.state, sv.execute(ghz).state));

    // =========================================================================
    // 5. Automatic backend selection
    // =========================================================================
    fmt::print("5. Automatic backend selection:\n");

    ir::Circuit non_clifford(2);
    non_clifford.h(0).t(0).cnot(0, 1);

    for (const ir::Circuit* circuit : {&ghz, &non_clifford}) {
        auto selection = backends::BackendSelector::select(*circuit);
        fmt::print("   {} -> {}\n", selection.backend->name(), selection.explanation);
    }

    fmt::print("\nDone.\n");
    return 0;
}
