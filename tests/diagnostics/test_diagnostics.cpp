// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file test_diagnostics.cpp
 * @brief Unit tests for failure detection, reports and sensitivity sweeps
 */

#include "diagnostics/FailureDetection.hpp"
#include "diagnostics/Sensitivity.hpp"

#include "backends/DensityMatrixBackend.hpp"
#include "backends/NoisyBackend.hpp"
#include "backends/StabilizerBackend.hpp"
#include "backends/StatevectorBackend.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace qsim::diagnostics {
namespace {

using ir::Circuit;

constexpr double kTol = 1e-9;

Circuit bellCircuit() {
    Circuit c(2);
    c.h(0).cnot(0, 1);
    return c;
}

sim::ExecutionOptions withHistory() {
    sim::ExecutionOptions options;
    options.record_history = true;
    return options;
}

// =============================================================================
// Noise Detection Tests
// =============================================================================

TEST(FailureDetectionTest, IdenticalRunsReportNoNoiseFailures) {
    auto ideal = backends::StatevectorBackend(1).execute(bellCircuit(), withHistory());
    auto again = backends::DensityMatrixBackend(1).execute(bellCircuit(), withHistory());
    EXPECT_TRUE(detectNoiseFailures(ideal, again).empty());
}

TEST(FailureDetectionTest, FullBitFlipDominatesAndAccumulates) {
    auto ideal = backends::StatevectorBackend(1).execute(bellCircuit(), withHistory());

    backends::NoisyBackend noisy(nullptr, {}, 1);
    noisy.addNoise(1, noise::NoiseChannel::bitFlip(1.0));
    auto run = noisy.execute(bellCircuit(), withHistory());

    auto failures = detectNoiseFailures(ideal, run);
    ASSERT_EQ(failures.size(), 2u);

    EXPECT_EQ(failures[0].type, FailureType::NoiseDominance);
    EXPECT_EQ(failures[0].severity, Severity::High);
    EXPECT_FALSE(failures[0].step.has_value());

    // Only the CNOT touches qubit 1, so the drop appears after gate 1
    EXPECT_EQ(failures[1].type, FailureType::NoiseAccumulation);
    EXPECT_EQ(failures[1].step, std::optional<std::size_t>{2});
}

TEST(FailureDetectionTest, QubitCountMismatchThrows) {
    auto two = backends::StatevectorBackend(1).execute(bellCircuit());
    Circuit single(1);
    single.h(0);
    auto one = backends::StatevectorBackend(1).execute(single);
    EXPECT_THROW((void)detectNoiseFailures(two, one), sim::DimensionMismatchError);
}

// =============================================================================
// Precision Detection Tests
// =============================================================================

TEST(FailureDetectionTest, FlagsTraceDriftAndNegativeEigenvalues) {
    CMatrix leaky = CMatrix::Zero(2, 2);
    leaky(0, 0) = 0.5;
    leaky(1, 1) = 0.2;

    CMatrix negative = CMatrix::Zero(2, 2);
    negative(0, 0) = 1.2;
    negative(1, 1) = -0.2;

    std::vector<sim::QuantumState> history{
        sim::QuantumState::zero(1, true),
        sim::QuantumState::fromDensityMatrix(leaky),
        sim::QuantumState::fromDensityMatrix(negative),
        sim::QuantumState::fromAmplitudes(std::vector<Complex>{1.0, 1.0}),
    };

    auto failures = detectPrecisionFailures(history);
    ASSERT_EQ(failures.size(), 3u);

    EXPECT_EQ(failures[0].step, std::optional<std::size_t>{1});
    EXPECT_EQ(failures[0].severity, Severity::Medium);
    EXPECT_EQ(failures[0].description, "Density matrix trace = 0.700000 (should be 1.0)");

    EXPECT_EQ(failures[1].step, std::optional<std::size_t>{2});
    EXPECT_EQ(failures[1].severity, Severity::High);
    EXPECT_EQ(failures[1].description, "Negative eigenvalues detected: min = -0.200000");

    EXPECT_EQ(failures[2].step, std::optional<std::size_t>{3});
    EXPECT_EQ(failures[2].description, "Statevector squared norm = 2.000000 (should be 1.0)");
}

TEST(FailureDetectionTest, NoisyHistoryHasNoPrecisionErrors) {
    backends::NoisyBackend noisy(nullptr, {}, 2);
    noisy.addNoise(0, noise::NoiseChannel::amplitudeDamping(0.3));
    noisy.addNoise(1, noise::NoiseChannel::depolarizing(0.2));
    Circuit c(2);
    c.h(0).cnot(0, 1).t(1).rx(0, 0.4);
    auto run = noisy.execute(c, withHistory());
    EXPECT_TRUE(detectPrecisionFailures(run.history).empty());
}

// =============================================================================
// Entanglement Bottleneck Tests
// =============================================================================

TEST(FailureDetectionTest, EntanglingGateIsABottleneck) {
    auto result = backends::StatevectorBackend(1).execute(bellCircuit(), withHistory());

    EXPECT_NEAR(meanQubitEntropy(result.history[1]), 0.0, kTol);
    EXPECT_NEAR(meanQubitEntropy(result.history[2]), 1.0, kTol);

    auto failures = detectEntanglementBottleneck(result.history);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].type, FailureType::EntanglementBottleneck);
    EXPECT_EQ(failures[0].step, std::optional<std::size_t>{2});
    EXPECT_EQ(failures[0].severity, Severity::Low);
}

TEST(FailureDetectionTest, ProductStatesHaveNoBottleneck) {
    Circuit c(3);
    c.h(0).h(1).ry(2, 1.2).t(0);
    auto result = backends::StatevectorBackend(1).execute(c, withHistory());
    EXPECT_TRUE(detectEntanglementBottleneck(result.history).empty());
    EXPECT_TRUE(detectEntanglementBottleneck({}).empty());
}

TEST(FailureDetectionTest, CombinedDetectionUsesNoisyHistory) {
    auto ideal = backends::StatevectorBackend(1).execute(bellCircuit(), withHistory());
    EXPECT_EQ(detectFailures(ideal).size(), 1u);  // the CNOT entropy jump

    backends::NoisyBackend noisy(nullptr, {}, 1);
    noisy.addNoise(1, noise::NoiseChannel::bitFlip(1.0));
    auto run = noisy.execute(bellCircuit(), withHistory());

    DiagnosticReport report{detectFailures(ideal, &run)};
    EXPECT_EQ(report.count(FailureType::NoiseDominance), 1u);
    EXPECT_EQ(report.count(FailureType::NoiseAccumulation), 1u);
    EXPECT_EQ(report.count(FailureType::PrecisionError), 0u);
}

// =============================================================================
// Backend Limitation Tests
// =============================================================================

TEST(FailureDetectionTest, BackendLimitations) {
    Circuit wide(16);
    wide.h(0).t(3);

    EXPECT_TRUE(detectBackendLimitations(wide, "statevector").empty());

    auto dm = detectBackendLimitations(wide, "density_matrix");
    ASSERT_EQ(dm.size(), 1u);
    EXPECT_EQ(dm[0].type, FailureType::MemoryLimitation);
    EXPECT_EQ(dm[0].description, "Circuit requires ~64.00GB memory for 16 qubits");

    auto stab = detectBackendLimitations(wide, "stabilizer");
    ASSERT_EQ(stab.size(), 1u);
    EXPECT_EQ(stab[0].type, FailureType::BackendLimitation);
    EXPECT_EQ(stab[0].severity, Severity::High);
    EXPECT_NE(stab[0].description.find("'T'"), std::string::npos);
}

// =============================================================================
// Report Tests
// =============================================================================

TEST(DiagnosticReportTest, EmptyReport) {
    DiagnosticReport report;
    EXPECT_EQ(report.summary(), "No failures detected. Circuit executed successfully.");
    EXPECT_FALSE(report.dominantSource().has_value());
}

TEST(DiagnosticReportTest, CountsSummaryAndDominantSource) {
    DiagnosticReport report{{
        {FailureType::EntanglementBottleneck, 2, Severity::Low, "jump", std::nullopt},
        {FailureType::NoiseAccumulation, 1, Severity::Medium, "drop", std::nullopt},
        {FailureType::NoiseAccumulation, 2, Severity::Medium, "drop", std::nullopt},
        {FailureType::NoiseDominance, std::nullopt, Severity::High, "bad", "fix it"},
    }};

    EXPECT_EQ(report.count(Severity::Medium), 2u);
    EXPECT_EQ(report.count(FailureType::NoiseAccumulation), 2u);
    EXPECT_EQ(report.dominantSource(), std::optional<FailureType>{FailureType::NoiseAccumulation});
    EXPECT_EQ(report.summary(), "1 high-severity issue(s) detected.");
    EXPECT_EQ(report.failures[3].toString(), "[high] noise_dominance: bad (fix it)");
    EXPECT_NE(report.toString().find("Dominant source: noise_accumulation"), std::string::npos);
}

TEST(DiagnosticReportTest, MinorIssuesSummary) {
    DiagnosticReport report{{
        {FailureType::PrecisionError, 0, Severity::Medium, "trace", std::nullopt},
        {FailureType::EntanglementBottleneck, 1, Severity::Low, "jump", std::nullopt},
    }};
    EXPECT_EQ(report.summary(), "2 minor issue(s) detected.");
    EXPECT_EQ(report.dominantSource(), std::optional<FailureType>{FailureType::PrecisionError});
}

// =============================================================================
// Sensitivity Tests
// =============================================================================

TEST(SensitivityTest, GradientHandlesUnevenSpacing) {
    // f(x) = x^2 sampled at 0, 1, 3
    auto slope = gradient({0.0, 1.0, 9.0}, {0.0, 1.0, 3.0});
    ASSERT_EQ(slope.size(), 3u);
    EXPECT_NEAR(slope[0], 1.0, kTol);
    EXPECT_NEAR(slope[1], 2.0, kTol);
    EXPECT_NEAR(slope[2], 4.0, kTol);

    EXPECT_EQ(gradient({0.3}, {1.0}), std::vector<double>{0.0});
    EXPECT_THROW((void)gradient({1.0, 2.0}, {0.5, 0.5}), std::invalid_argument);
    EXPECT_THROW((void)gradient({1.0}, {0.5, 0.6}), std::invalid_argument);
}

TEST(SensitivityTest, BitFlipFidelityFallsLinearly) {
    const auto sweep = analyzeNoiseSensitivity(
        bellCircuit(), {0.0, 0.5, 1.0},
        [](double p) { return noise::NoiseChannel::bitFlip(p); }, 1, 5);

    ASSERT_EQ(sweep.fidelities.size(), 3u);
    EXPECT_NEAR(sweep.fidelities[0], 1.0, 1e-6);
    EXPECT_NEAR(sweep.fidelities[1], 0.5, 1e-6);
    EXPECT_NEAR(sweep.fidelities[2], 0.0, 1e-6);

    EXPECT_NEAR(sweep.entropies[0], 0.0, 1e-6);
    EXPECT_NEAR(sweep.entropies[1], 1.0, 1e-6);
    EXPECT_NEAR(sweep.entropies[2], 0.0, 1e-6);

    for (double s : sweep.sensitivity) {
        EXPECT_NEAR(s, -1.0, 1e-6);
    }
}

TEST(SensitivityTest, BaseBackendFactoryGatesNoisyRuns) {
    Circuit c(1);
    c.t(0);
    EXPECT_THROW((void)analyzeNoiseSensitivity(
                     c, {0.1}, [](double p) { return noise::NoiseChannel::depolarizing(p); }, 0,
                     1, [] { return std::make_unique<backends::StabilizerBackend>(); }),
                 sim::NonCliffordGateError);
}

TEST(SensitivityTest, CompareBackendsRunsEach) {
    backends::StatevectorBackend sv(1);
    backends::DensityMatrixBackend dm(1);
    auto comparisons = compareBackends(bellCircuit(), {&sv, &dm});

    ASSERT_EQ(comparisons.size(), 2u);
    EXPECT_EQ(comparisons[0].backend, "statevector");
    EXPECT_EQ(comparisons[1].backend, "density_matrix");
    EXPECT_NEAR(comparisons[0].memory_mb * 4.0, comparisons[1].memory_mb, 1e-12);
    for (const auto& c : comparisons) {
        EXPECT_GE(c.time_ms, 0.0);
        EXPECT_NEAR(c.result.probabilities()[3], 0.5, kTol);
    }
}

TEST(SensitivityTest, ParameterSweepEvaluatesMetric) {
    backends::StatevectorBackend backend(1);
    const std::vector<double> angles{0.0, constants::PI_2, constants::PI};
    auto excited = parameterSweep(
        backend,
        [](double theta) {
            Circuit c(1);
            c.ry(0, theta);
            return c;
        },
        angles,
        [](const sim::ExecutionResult& r) { return r.probabilities()[1]; });

    ASSERT_EQ(excited.size(), 3u);
    EXPECT_NEAR(excited[0], 0.0, kTol);
    EXPECT_NEAR(excited[1], 0.5, kTol);
    EXPECT_NEAR(excited[2], 1.0, kTol);
}

}  // namespace
}  // namespace qsim::diagnostics
