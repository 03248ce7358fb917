// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Sensitivity.hpp
 * @brief Noise-parameter sweeps, backend comparison and parameter sweeps
 */

#pragma once

#include "../backends/Backend.hpp"
#include "../backends/NoisyBackend.hpp"
#include "../backends/StatevectorBackend.hpp"
#include "../ir/Circuit.hpp"
#include "../metrics/Entanglement.hpp"
#include "../metrics/Fidelity.hpp"
#include "../noise/NoiseChannel.hpp"
#include "../sim/ExecutionResult.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace qsim::diagnostics {

using ChannelFactory = std::function<noise::NoiseChannel(double)>;
using BackendFactory = std::function<std::unique_ptr<backends::Backend>()>;

/**
 * @brief Derivative of sampled values with respect to their sample points.
 *
 * Second-order central differences inside (valid for uneven spacing),
 * one-sided differences at both ends. A single sample has slope 0.
 *
 * @throws std::invalid_argument if the sizes differ or two neighbouring
 *         points coincide
 */
[[nodiscard]] inline std::vector<double> gradient(const std::vector<double>& values,
                                                  const std::vector<double>& points) {
    if (values.size() != points.size()) {
        throw std::invalid_argument("gradient needs one value per sample point");
    }
    const std::size_t n = values.size();
    if (n < 2) {
        return std::vector<double>(n, 0.0);
    }
    for (std::size_t i = 1; i < n; ++i) {
        if (points[i] == points[i - 1]) {
            throw std::invalid_argument("gradient sample points must be distinct");
        }
    }

    std::vector<double> slope(n);
    slope[0] = (values[1] - values[0]) / (points[1] - points[0]);
    slope[n - 1] = (values[n - 1] - values[n - 2]) / (points[n - 1] - points[n - 2]);
    for (std::size_t i = 1; i + 1 < n; ++i) {
        const double hs = points[i] - points[i - 1];
        const double hd = points[i + 1] - points[i];
        slope[i] = (hs * hs * values[i + 1] + (hd * hd - hs * hs) * values[i] -
                    hd * hd * values[i - 1]) /
                   (hs * hd * (hd + hs));
    }
    return slope;
}

// -----------------------------------------------------------------------------
// Noise Sensitivity
// -----------------------------------------------------------------------------

struct NoiseSensitivity {
    std::vector<double> parameters;
    std::vector<double> fidelities;   ///< F(ideal, noisy) per parameter
    std::vector<double> entropies;    ///< Entropy (bits) of the noisy state
    std::vector<double> sensitivity;  ///< dF/dp
};

/**
 * @brief Runs the circuit once ideally and once per noise parameter with a
 *        single channel on one qubit, comparing pre-measurement states.
 *
 * @param base Makes the capability-gating base backend for each noisy run;
 *        DensityMatrixBackend when empty
 * @throws sim::SimulationError subclasses from execution
 */
[[nodiscard]] inline NoiseSensitivity analyzeNoiseSensitivity(
        const ir::Circuit& circuit,
        const std::vector<double>& parameters,
        const ChannelFactory& make_channel,
        QubitIndex qubit = 0,
        std::optional<std::uint64_t> seed = std::nullopt,
        const BackendFactory& base = {}) {
    sim::ExecutionOptions options;
    options.record_history = true;

    const auto ideal = backends::StatevectorBackend(seed).execute(circuit, options);

    NoiseSensitivity result;
    result.parameters = parameters;
    for (double p : parameters) {
        noise::NoiseModel model;
        model[qubit].push_back(make_channel(p));
        backends::NoisyBackend noisy(base ? base() : nullptr, std::move(model), seed);
        const auto run = noisy.execute(circuit, options);

        result.fidelities.push_back(metrics::stateFidelity(ideal.preMeasurementState(),
                                                           run.preMeasurementState()));
        result.entropies.push_back(metrics::vonNeumannEntropy(run.preMeasurementState()));
    }
    result.sensitivity = gradient(result.fidelities, parameters);
    return result;
}

// -----------------------------------------------------------------------------
// Backend Comparison
// -----------------------------------------------------------------------------

struct BackendComparison {
    std::string backend;
    double time_ms;
    double memory_mb;  ///< Estimated state storage
    sim::ExecutionResult result;
};

/**
 * @brief Runs the same circuit on each backend and times it.
 */
[[nodiscard]] inline std::vector<BackendComparison> compareBackends(
        const ir::Circuit& circuit,
        const std::vector<backends::Backend*>& candidates,
        const sim::ExecutionOptions& options = {}) {
    std::vector<BackendComparison> comparisons;
    comparisons.reserve(candidates.size());
    for (auto* backend : candidates) {
        const auto start = std::chrono::high_resolution_clock::now();
        auto result = backend->execute(circuit, options);
        const auto end = std::chrono::high_resolution_clock::now();

        const double bytes = backends::Backend::estimateMemoryBytes(
            circuit.numQubits(), result.state.isDensityMatrix());
        comparisons.push_back(BackendComparison{
            backend->name(),
            std::chrono::duration<double, std::milli>(end - start).count(),
            bytes / (1024.0 * 1024.0),
            std::move(result)});
    }
    return comparisons;
}

/**
 * @brief Evaluates a metric on circuits built from each parameter value.
 */
[[nodiscard]] inline std::vector<double> parameterSweep(
        backends::Backend& backend,
        const std::function<ir::Circuit(double)>& make_circuit,
        const std::vector<double>& values,
        const std::function<double(const sim::ExecutionResult&)>& metric,
        const sim::ExecutionOptions& options = {}) {
    std::vector<double> results;
    results.reserve(values.size());
    for (double v : values) {
        results.push_back(metric(backend.execute(make_circuit(v), options)));
    }
    return results;
}

}  // namespace qsim::diagnostics
