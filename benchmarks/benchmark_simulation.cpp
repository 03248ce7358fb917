// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file benchmark_simulation.cpp
 * @brief Benchmark suite for statevector, density matrix and noisy simulation
 *
 * Benchmarks the backends with standard circuit patterns:
 * - QFT (Quantum Fourier Transform)
 * - Random circuits
 * - GHZ preparation
 * - QAOA-style circuits
 */

#include "backends/DensityMatrixBackend.hpp"
#include "backends/NoisyBackend.hpp"
#include "backends/StatevectorBackend.hpp"
#include "ir/Circuit.hpp"
#include "noise/NoiseChannel.hpp"

#include <fmt/core.h>

#include <chrono>
#include <cmath>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace qsim;

// ============================================================================
// Circuit Generators
// ============================================================================

/**
 * @brief Generates a Quantum Fourier Transform circuit.
 *
 * Controlled phases are decomposed as CNOT + Rz + CNOT + Rz, so the
 * circuit has n Hadamards and 4 * n(n-1)/2 further gates.
 */
ir::Circuit generateQFT(std::size_t n) {
    ir::Circuit circuit(n);

    for (QubitIndex i = 0; i < n; ++i) {
        circuit.h(i);
        for (QubitIndex j = i + 1; j < n; ++j) {
            const double angle = constants::PI / std::pow(2.0, static_cast<double>(j - i));
            circuit.cnot(j, i).rz(i, -angle / 2).cnot(j, i).rz(i, angle / 2);
        }
    }
    return circuit;
}

/**
 * @brief Generates a random circuit with mixed gate types.
 */
ir::Circuit generateRandom(std::size_t n_qubits, std::size_t n_gates, unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<QubitIndex> qubit_dist(0, static_cast<QubitIndex>(n_qubits - 1));
    std::uniform_int_distribution<int> gate_dist(0, 5);
    std::uniform_real_distribution<double> angle_dist(0.0, 2 * constants::PI);

    ir::Circuit circuit(n_qubits);

    for (std::size_t i = 0; i < n_gates; ++i) {
        const int gate_type = gate_dist(rng);
        const QubitIndex q0 = qubit_dist(rng);
        switch (gate_type) {
            case 0:
                circuit.h(q0);
                break;
            case 1:
                circuit.t(q0);
                break;
            case 2:
                circuit.rz(q0, angle_dist(rng));
                break;
            default: {
                QubitIndex q1 = qubit_dist(rng);
                if (q1 == q0) {
                    q1 = static_cast<QubitIndex>((q0 + 1) % n_qubits);
                }
                if (gate_type == 3) {
                    circuit.cnot(q0, q1);
                } else if (gate_type == 4) {
                    circuit.cz(q0, q1);
                } else {
                    circuit.swap(q0, q1);
                }
                break;
            }
        }
    }
    return circuit;
}

ir::Circuit generateGHZ(std::size_t n) {
    ir::Circuit circuit(n);
    circuit.h(0);
    for (QubitIndex q = 1; q < n; ++q) {
        circuit.cnot(q - 1, q);
    }
    return circuit;
}

/**
 * @brief Generates a QAOA-style circuit on a ring graph.
 */
ir::Circuit generateQAOA(std::size_t n_qubits, std::size_t p_layers) {
    ir::Circuit circuit(n_qubits);

    for (QubitIndex i = 0; i < n_qubits; ++i) {
        circuit.h(i);
    }

    for (std::size_t layer = 0; layer < p_layers; ++layer) {
        const double gamma = constants::PI / (4.0 * static_cast<double>(layer + 1));
        const double beta = constants::PI / (2.0 * static_cast<double>(layer + 1));

        for (QubitIndex i = 0; i < n_qubits; ++i) {
            const auto j = static_cast<QubitIndex>((i + 1) % n_qubits);
            circuit.cnot(i, j).rz(j, gamma).cnot(i, j);
        }
        for (QubitIndex i = 0; i < n_qubits; ++i) {
            circuit.rx(i, beta);
        }
    }
    return circuit;
}

// ============================================================================
// Benchmarking Infrastructure
// ============================================================================

struct BenchmarkResult {
    std::string name;
    std::string backend;
    std::size_t n_qubits;
    std::size_t n_gates;
    std::size_t depth;
    double time_ms;
    double us_per_gate;
};

BenchmarkResult runBenchmark(const std::string& name,
                             const ir::Circuit& circuit,
                             backends::Backend& backend) {
    BenchmarkResult result;
    result.name = name;
    result.backend = backend.name();
    result.n_qubits = circuit.numQubits();
    result.n_gates = circuit.numGates();
    result.depth = circuit.depth();

    const auto start = std::chrono::high_resolution_clock::now();
    const auto executed = backend.execute(circuit);
    const auto end = std::chrono::high_resolution_clock::now();

    result.time_ms = std::chrono::duration<double, std::milli>(end - start).count();
    result.us_per_gate = result.n_gates > 0
                             ? 1000.0 * result.time_ms / static_cast<double>(result.n_gates)
                             : 0.0;
    if (std::abs(executed.state.norm() - 1.0) > 1e-6) {
        fmt::print(stderr, "warning: {} on {} lost normalization\n", name, result.backend);
    }
    return result;
}

void printResults(const std::vector<BenchmarkResult>& results) {
    fmt::print("\n");
    fmt::print("================================================================================\n");
    fmt::print("                      QUANTUM CIRCUIT SIMULATOR BENCHMARKS                      \n");
    fmt::print("================================================================================\n\n");

    fmt::print("{:<18}{:<16}{:>8}{:>8}{:>8}{:>14}{:>12}\n",
               "Circuit", "Backend", "Qubits", "Gates", "Depth", "Time (ms)", "us/gate");
    fmt::print("{}\n", std::string(84, '-'));

    double total = 0.0;
    for (const auto& r : results) {
        fmt::print("{:<18}{:<16}{:>8}{:>8}{:>8}{:>14.2f}{:>12.2f}\n",
                   r.name, r.backend, r.n_qubits, r.n_gates, r.depth, r.time_ms, r.us_per_gate);
        total += r.time_ms;
    }

    fmt::print("{}\n", std::string(84, '-'));
    fmt::print("{:<58}{:>14.2f}\n\n", "TOTAL", total);
}

// ============================================================================
// Main
// ============================================================================

int main() {
    fmt::print("Generating benchmark circuits...\n");

    std::vector<BenchmarkResult> results;
    backends::StatevectorBackend sv(42);
    backends::DensityMatrixBackend dm(42);

    // Statevector scaling
    for (std::size_t n : {8UL, 12UL, 16UL, 20UL}) {
        results.push_back(runBenchmark("QFT-" + std::to_string(n), generateQFT(n), sv));
    }
    for (std::size_t n : {10UL, 16UL, 20UL}) {
        results.push_back(runBenchmark("GHZ-" + std::to_string(n), generateGHZ(n), sv));
    }
    results.push_back(runBenchmark("Random-16x500", generateRandom(16, 500), sv));
    results.push_back(runBenchmark("QAOA-16-p2", generateQAOA(16, 2), sv));

    // Density matrix scaling
    for (std::size_t n : {4UL, 6UL, 8UL, 10UL}) {
        results.push_back(runBenchmark("QFT-" + std::to_string(n), generateQFT(n), dm));
    }
    results.push_back(runBenchmark("Random-8x200", generateRandom(8, 200), dm));

    // Noise overhead: one depolarizing channel on every qubit
    for (std::size_t n : {4UL, 6UL, 8UL}) {
        noise::NoiseModel model;
        for (QubitIndex q = 0; q < n; ++q) {
            model[q].push_back(noise::NoiseChannel::depolarizing(0.01));
        }
        backends::NoisyBackend noisy(nullptr, std::move(model), 42);
        results.push_back(runBenchmark("QAOA-" + std::to_string(n) + "-p2",
                                       generateQAOA(n, 2), noisy));
    }

    printResults(results);
    return 0;
}
