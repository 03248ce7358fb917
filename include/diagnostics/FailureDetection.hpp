// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file FailureDetection.hpp
 * @brief Post-run failure detection and reporting
 *
 * Inspects execution results for:
 * - Noise dominance (final noisy state far from the ideal one)
 * - Noise accumulation (per-step fidelity drops)
 * - Precision errors (trace or norm drift, negative eigenvalues)
 * - Entanglement bottlenecks (large entropy jumps between snapshots)
 * - Backend limitations (memory, non-Clifford gates on the stabilizer backend)
 *
 * Steps are history indices: 0 is the initial state, k the state after
 * gate k - 1. Whole-circuit findings carry no step.
 */

#pragma once

#include "../backends/Backend.hpp"
#include "../backends/StabilizerBackend.hpp"
#include "../ir/Circuit.hpp"
#include "../metrics/Entanglement.hpp"
#include "../metrics/Fidelity.hpp"
#include "../sim/ExecutionResult.hpp"
#include "../sim/QuantumState.hpp"

#include <Eigen/Eigenvalues>
#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qsim::diagnostics {

enum class Severity { Low, Medium, High, Critical };

enum class FailureType {
    NoiseDominance,
    NoiseAccumulation,
    PrecisionError,
    EntanglementBottleneck,
    MemoryLimitation,
    BackendLimitation
};

[[nodiscard]] constexpr std::string_view severityName(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:      return "low";
        case Severity::Medium:   return "medium";
        case Severity::High:     return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view failureTypeName(FailureType type) noexcept {
    switch (type) {
        case FailureType::NoiseDominance:         return "noise_dominance";
        case FailureType::NoiseAccumulation:      return "noise_accumulation";
        case FailureType::PrecisionError:         return "precision_error";
        case FailureType::EntanglementBottleneck: return "entanglement_bottleneck";
        case FailureType::MemoryLimitation:       return "memory_limitation";
        case FailureType::BackendLimitation:      return "backend_limitation";
    }
    return "unknown";
}

/**
 * @brief One detected failure.
 */
struct FailureDiagnostic {
    FailureType type;
    std::optional<std::size_t> step;
    Severity severity;
    std::string description;
    std::optional<std::string> mitigation;

    [[nodiscard]] std::string toString() const {
        std::string result = fmt::format("[{}] {}", severityName(severity), failureTypeName(type));
        if (step) {
            result += fmt::format(" at step {}", *step);
        }
        result += ": " + description;
        if (mitigation) {
            result += " (" + *mitigation + ")";
        }
        return result;
    }
};

/**
 * @brief Limits used by the detectors.
 */
struct DetectionThresholds {
    /// Fidelity below which noise is reported.
    double fidelity = 0.9;

    /// Fidelity below which noise dominance is high severity.
    double severe_fidelity = 0.5;

    /// Largest allowed jump in mean single-qubit entropy (bits) between snapshots.
    double entropy_jump = 0.5;

    /// Allowed deviation of trace (mixed) or squared norm (pure) from 1.
    double trace_tolerance = 1e-6;

    /// Eigenvalues below -tolerance count as negative.
    double eigenvalue_tolerance = constants::EIGENVALUE_TOLERANCE;

    /// Estimated state memory above which a limitation is reported.
    double memory_bytes = 1024.0 * 1024.0 * 1024.0;
};

// -----------------------------------------------------------------------------
// Detectors
// -----------------------------------------------------------------------------

/**
 * @brief Compares a noisy run against an ideal run of the same circuit.
 *
 * The final comparison uses the pre-measurement states. Per-step fidelities
 * are checked when both runs recorded histories of equal length.
 *
 * @throws sim::DimensionMismatchError if the runs have different qubit counts
 */
[[nodiscard]] inline std::vector<FailureDiagnostic> detectNoiseFailures(
        const sim::ExecutionResult& ideal,
        const sim::ExecutionResult& noisy,
        const DetectionThresholds& thresholds = {}) {
    std::vector<FailureDiagnostic> failures;

    const double fidelity = metrics::stateFidelity(ideal.preMeasurementState(),
                                                   noisy.preMeasurementState());
    if (fidelity < thresholds.fidelity) {
        failures.push_back(FailureDiagnostic{
            FailureType::NoiseDominance,
            std::nullopt,
            fidelity < thresholds.severe_fidelity ? Severity::High : Severity::Medium,
            fmt::format("Noise significantly degrades state fidelity: {:.4f}", fidelity),
            "Reduce noise strength or use error correction"});
    }

    if (!ideal.history.empty() && ideal.history.size() == noisy.history.size()) {
        for (std::size_t step = 0; step < ideal.history.size(); ++step) {
            const double f = metrics::stateFidelity(ideal.history[step], noisy.history[step]);
            if (f < thresholds.fidelity) {
                failures.push_back(FailureDiagnostic{
                    FailureType::NoiseAccumulation,
                    step,
                    Severity::Medium,
                    fmt::format("Fidelity drops to {:.4f} at step {}", f, step),
                    "Consider error correction or noise reduction"});
            }
        }
    }
    return failures;
}

/**
 * @brief Checks every snapshot for normalization drift and, for density
 *        matrices, negative eigenvalues.
 */
[[nodiscard]] inline std::vector<FailureDiagnostic> detectPrecisionFailures(
        const std::vector<sim::QuantumState>& history,
        const DetectionThresholds& thresholds = {}) {
    std::vector<FailureDiagnostic> failures;

    for (std::size_t step = 0; step < history.size(); ++step) {
        const auto& state = history[step];
        const double trace = state.trace();
        if (std::abs(trace - 1.0) > thresholds.trace_tolerance) {
            failures.push_back(FailureDiagnostic{
                FailureType::PrecisionError,
                step,
                Severity::Medium,
                state.isDensityMatrix()
                    ? fmt::format("Density matrix trace = {:.6f} (should be 1.0)", trace)
                    : fmt::format("Statevector squared norm = {:.6f} (should be 1.0)", trace),
                "Renormalize state or use higher precision"});
        }

        if (!state.isDensityMatrix()) {
            continue;
        }
        const Eigen::MatrixXcd rho = state.densityMatrix();
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> solver(rho, Eigen::EigenvaluesOnly);
        const double min_eigenvalue = solver.eigenvalues().minCoeff();
        if (min_eigenvalue < -thresholds.eigenvalue_tolerance) {
            failures.push_back(FailureDiagnostic{
                FailureType::PrecisionError,
                step,
                Severity::High,
                fmt::format("Negative eigenvalues detected: min = {:.6f}", min_eigenvalue),
                "Use higher numerical precision or a different backend"});
        }
    }
    return failures;
}

/// @brief Mean von Neumann entropy (bits) of every single-qubit reduced state.
[[nodiscard]] inline double meanQubitEntropy(const sim::QuantumState& state) {
    double total = 0.0;
    for (QubitIndex q = 0; q < state.numQubits(); ++q) {
        total += metrics::vonNeumannEntropy(state, std::vector<QubitIndex>{q});
    }
    return total / static_cast<double>(state.numQubits());
}

/**
 * @brief Reports the largest rise in mean single-qubit entropy between
 *        consecutive snapshots when it exceeds the threshold.
 */
[[nodiscard]] inline std::vector<FailureDiagnostic> detectEntanglementBottleneck(
        const std::vector<sim::QuantumState>& history,
        const DetectionThresholds& thresholds = {}) {
    std::vector<FailureDiagnostic> failures;
    if (history.size() < 2) {
        return failures;
    }

    std::vector<double> entropies;
    entropies.reserve(history.size());
    for (const auto& state : history) {
        entropies.push_back(meanQubitEntropy(state));
    }

    std::size_t worst = 1;
    for (std::size_t k = 2; k < entropies.size(); ++k) {
        if (entropies[k] - entropies[k - 1] > entropies[worst] - entropies[worst - 1]) {
            worst = k;
        }
    }
    const double growth = entropies[worst] - entropies[worst - 1];
    if (growth > thresholds.entropy_jump) {
        failures.push_back(FailureDiagnostic{
            FailureType::EntanglementBottleneck,
            worst,
            Severity::Low,
            fmt::format("Large entropy increase at step {}: {:.4f} bits", worst, growth),
            "Consider circuit optimization or a different entanglement structure"});
    }
    return failures;
}

/**
 * @brief Runs the noise, precision and entanglement detectors.
 *
 * Snapshot checks use the noisy history when a noisy run is given, the
 * ideal history otherwise.
 */
[[nodiscard]] inline std::vector<FailureDiagnostic> detectFailures(
        const sim::ExecutionResult& ideal,
        const sim::ExecutionResult* noisy = nullptr,
        const DetectionThresholds& thresholds = {}) {
    std::vector<FailureDiagnostic> failures;
    if (noisy != nullptr) {
        failures = detectNoiseFailures(ideal, *noisy, thresholds);
    }

    const auto& history = noisy != nullptr ? noisy->history : ideal.history;
    auto precision = detectPrecisionFailures(history, thresholds);
    failures.insert(failures.end(), precision.begin(), precision.end());
    auto bottleneck = detectEntanglementBottleneck(history, thresholds);
    failures.insert(failures.end(), bottleneck.begin(), bottleneck.end());
    return failures;
}

/**
 * @brief Limitations of running a circuit on the named backend.
 *
 * Memory is estimated for a density matrix on density_matrix and noisy
 * backends, for a statevector otherwise.
 */
[[nodiscard]] inline std::vector<FailureDiagnostic> detectBackendLimitations(
        const ir::Circuit& circuit,
        std::string_view backend_name,
        const DetectionThresholds& thresholds = {}) {
    std::vector<FailureDiagnostic> failures;

    const bool mixed = backend_name == "density_matrix" || backend_name == "noisy";
    const double bytes = backends::Backend::estimateMemoryBytes(circuit.numQubits(), mixed);
    if (bytes > thresholds.memory_bytes) {
        failures.push_back(FailureDiagnostic{
            FailureType::MemoryLimitation,
            std::nullopt,
            Severity::Medium,
            fmt::format("Circuit requires ~{:.2f}GB memory for {} qubits",
                        bytes / (1024.0 * 1024.0 * 1024.0), circuit.numQubits()),
            "Consider the stabilizer backend for Clifford circuits, or fewer qubits"});
    }

    if (backend_name == "stabilizer") {
        const auto clifford = backends::detectCliffordCircuit(circuit);
        if (!clifford.supported) {
            failures.push_back(FailureDiagnostic{
                FailureType::BackendLimitation,
                std::nullopt,
                Severity::High,
                "Stabilizer backend cannot execute non-Clifford circuit: " +
                    clifford.reason.value_or("unknown gate"),
                "Use the statevector or density_matrix backend"});
        }
    }
    return failures;
}

// -----------------------------------------------------------------------------
// Report
// -----------------------------------------------------------------------------

/**
 * @brief Aggregated view over a list of failures.
 *
 * Example:
 * @code
 * auto ideal = StatevectorBackend(1).execute(circuit, options);
 * auto noisy = noisy_backend.execute(circuit, options);
 * DiagnosticReport report{detectFailures(ideal, &noisy)};
 * fmt::print("{}", report.toString());
 * @endcode
 */
struct DiagnosticReport {
    std::vector<FailureDiagnostic> failures;

    [[nodiscard]] std::size_t count(Severity severity) const noexcept {
        return static_cast<std::size_t>(std::count_if(
            failures.begin(), failures.end(),
            [severity](const FailureDiagnostic& f) { return f.severity == severity; }));
    }

    [[nodiscard]] std::size_t count(FailureType type) const noexcept {
        return static_cast<std::size_t>(std::count_if(
            failures.begin(), failures.end(),
            [type](const FailureDiagnostic& f) { return f.type == type; }));
    }

    /**
     * @brief Most frequent failure type; ties go to the one reported first.
     */
    [[nodiscard]] std::optional<FailureType> dominantSource() const noexcept {
        std::optional<FailureType> best;
        std::size_t best_count = 0;
        for (const auto& f : failures) {
            const std::size_t n = count(f.type);
            if (n > best_count) {
                best = f.type;
                best_count = n;
            }
        }
        return best;
    }

    [[nodiscard]] std::string summary() const {
        if (failures.empty()) {
            return "No failures detected. Circuit executed successfully.";
        }
        std::vector<std::string> parts;
        if (const auto critical = count(Severity::Critical); critical > 0) {
            parts.push_back(fmt::format("{} critical issue(s) detected", critical));
        }
        if (const auto high = count(Severity::High); high > 0) {
            parts.push_back(fmt::format("{} high-severity issue(s) detected", high));
        }
        if (parts.empty()) {
            return fmt::format("{} minor issue(s) detected.", failures.size());
        }
        std::string result = parts[0];
        for (std::size_t k = 1; k < parts.size(); ++k) {
            result += ". " + parts[k];
        }
        return result + ".";
    }

    [[nodiscard]] std::string toString() const {
        std::string result = "Diagnostic Report:\n";
        result += "  Total failures: " + std::to_string(failures.size()) + "\n";
        if (const auto dominant = dominantSource()) {
            result += "  Dominant source: " + std::string(failureTypeName(*dominant)) + "\n";
        }
        result += "  Summary: " + summary() + "\n";
        for (const auto& f : failures) {
            result += "    " + f.toString() + "\n";
        }
        return result;
    }
};

}  // namespace qsim::diagnostics
