// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file test_noise.cpp
 * @brief Unit tests for Kraus utilities and noise channels
 */

#include "noise/Kraus.hpp"
#include "noise/NoiseChannel.hpp"
#include "metrics/Observables.hpp"
#include "sim/TensorContraction.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace qsim::noise {
namespace {

constexpr double kTol = 1e-10;

std::vector<NoiseChannel> builtInChannels(double parameter) {
    return {NoiseChannel::depolarizing(parameter), NoiseChannel::amplitudeDamping(parameter),
            NoiseChannel::phaseDamping(parameter), NoiseChannel::bitFlip(parameter),
            NoiseChannel::phaseFlip(parameter)};
}

/// |+> tensored with R_y(0.6)|0>, as a density matrix
sim::QuantumState sampleDensity() {
    auto psi = sim::QuantumState::zero(2);
    sim::applyGate(psi, ir::Gate::h(), {0});
    sim::applyGate(psi, ir::Gate::ry(0.6), {1});
    sim::applyGate(psi, ir::Gate::t(), {0});
    return psi.toDensityMatrix();
}

// =============================================================================
// Kraus Utility Tests
// =============================================================================

TEST(KrausTest, EmbedPlacesQubitZeroLeftmost) {
    CMatrix x = metrics::pauliMatrix('X');
    CMatrix embedded = embedOperator(x, 0, 2);
    // X (x) I maps |00> to |10>
    EXPECT_NEAR(std::abs(embedded(2, 0)), 1.0, kTol);
    EXPECT_NEAR(std::abs(embedded(1, 0)), 0.0, kTol);
}

TEST(KrausTest, EmbedRejectsBadInput) {
    EXPECT_THROW((void)embedOperator(CMatrix::Identity(4, 4), 0, 2), sim::DimensionMismatchError);
    EXPECT_THROW((void)embedOperator(CMatrix::Identity(2, 2), 2, 2), sim::QubitIndexError);
}

TEST(KrausTest, VerifyCompleteness) {
    EXPECT_TRUE(verifyCompleteness(NoiseChannel::amplitudeDamping(0.3).krausOperators()));
    EXPECT_FALSE(verifyCompleteness({}));
    EXPECT_FALSE(verifyCompleteness({CMatrix::Identity(2, 2) * 0.5}));
    EXPECT_FALSE(verifyCompleteness({CMatrix::Identity(2, 2), CMatrix::Zero(4, 4)}));
}

TEST(KrausTest, LocalApplicationMatchesEmbeddedForm) {
    for (const auto& channel : builtInChannels(0.27)) {
        for (QubitIndex q = 0; q < 2; ++q) {
            auto state = sampleDensity();
            const CMatrix rho = state.densityMatrix();

            KrausSet embedded;
            for (const auto& k : channel.krausOperators()) {
                embedded.push_back(embedOperator(k, q, 2));
            }
            const CMatrix expected = applyKraus(rho, embedded);

            channel.apply(state, q);
            EXPECT_TRUE(state.densityMatrix().isApprox(expected, 1e-12))
                << channel.toString() << " on qubit " << q;
        }
    }
}

TEST(KrausTest, FullSpaceFormRejectsSizeMismatch) {
    EXPECT_THROW((void)applyKraus(CMatrix::Identity(4, 4), KrausSet{CMatrix::Identity(2, 2)}),
                 sim::DimensionMismatchError);
}

TEST(KrausTest, LocalFormRequiresDensityMatrix) {
    auto psi = sim::QuantumState::zero(1);
    EXPECT_THROW(NoiseChannel::bitFlip(0.1).apply(psi, 0), std::invalid_argument);
}

// =============================================================================
// Channel Property Tests
// =============================================================================

TEST(NoiseChannelTest, EveryBuiltInChannelIsComplete) {
    for (double p : {0.0, 0.01, 0.5, 1.0}) {
        for (const auto& channel : builtInChannels(p)) {
            EXPECT_TRUE(verifyCompleteness(channel.krausOperators())) << channel.toString();
        }
    }
}

TEST(NoiseChannelTest, PreservesTraceAndHermiticity) {
    for (double p : {0.0, 0.01, 0.4, 0.5, 1.0}) {
        for (const auto& channel : builtInChannels(p)) {
            for (QubitIndex q = 0; q < 2; ++q) {
                auto state = sampleDensity();
                channel.apply(state, q);
                EXPECT_NEAR(state.trace(), 1.0, kTol) << channel.toString() << " on qubit " << q;
                EXPECT_TRUE(state.isHermitian()) << channel.toString() << " on qubit " << q;
                EXPECT_LE(state.purity(), 1.0 + kTol);
            }
        }
    }
}

TEST(KrausTest, FullSpaceFormPreservesTrace) {
    const CMatrix rho = sampleDensity().densityMatrix();
    for (double p : {0.0, 0.01, 0.5, 1.0}) {
        for (const auto& channel : builtInChannels(p)) {
            KrausSet embedded;
            for (const auto& k : channel.krausOperators()) {
                embedded.push_back(embedOperator(k, 1, 2));
            }
            EXPECT_NEAR(applyKraus(rho, embedded).trace().real(), 1.0, kTol)
                << channel.toString();
        }
    }
}

TEST(NoiseChannelTest, ZeroParameterIsIdentity) {
    for (const auto& channel : builtInChannels(0.0)) {
        auto state = sampleDensity();
        const CMatrix before = state.densityMatrix();
        channel.apply(state, 0);
        EXPECT_TRUE(state.densityMatrix().isApprox(before, 1e-12)) << channel.toString();
    }
}

TEST(NoiseChannelTest, FullDepolarizingShrinksBlochVector) {
    auto psi = sim::QuantumState::zero(1);
    sim::applyGate(psi, ir::Gate::ry(1.1), {0});
    sim::applyGate(psi, ir::Gate::rz(0.4), {0});
    auto rho = psi.toDensityMatrix();
    const auto before = metrics::blochVector(rho, 0);

    NoiseChannel::depolarizing(1.0).apply(rho, 0);
    const auto after = metrics::blochVector(rho, 0);
    for (std::size_t k = 0; k < 3; ++k) {
        EXPECT_NEAR(after[k], -before[k] / 3.0, 1e-10);
    }
    EXPECT_LT(rho.purity(), 1.0);
}

TEST(NoiseChannelTest, FullAmplitudeDampingRelaxesToGround) {
    auto rho = sim::QuantumState::zero(1, true);
    sim::applyGate(rho, ir::Gate::x(), {0});
    NoiseChannel::amplitudeDamping(1.0).apply(rho, 0);
    EXPECT_NEAR(rho.element(0, 0).real(), 1.0, kTol);
    EXPECT_NEAR(rho.element(1, 1).real(), 0.0, kTol);
}

TEST(NoiseChannelTest, PhaseFlipRemovesCoherence) {
    auto rho = sim::QuantumState::zero(1, true);
    sim::applyGate(rho, ir::Gate::h(), {0});
    NoiseChannel::phaseFlip(0.5).apply(rho, 0);
    EXPECT_NEAR(std::abs(rho.element(0, 1)), 0.0, kTol);
    EXPECT_NEAR(rho.element(0, 0).real(), 0.5, kTol);
}

// =============================================================================
// Parameter and Construction Tests
// =============================================================================

TEST(NoiseChannelTest, RejectsOutOfRangeParameters) {
    EXPECT_THROW((void)NoiseChannel::depolarizing(-0.1), sim::InvalidChannelParameterError);
    EXPECT_THROW((void)NoiseChannel::amplitudeDamping(1.5), sim::InvalidChannelParameterError);
    EXPECT_THROW((void)NoiseChannel::phaseDamping(2.0), sim::InvalidChannelParameterError);
    EXPECT_THROW((void)NoiseChannel::bitFlip(std::numeric_limits<double>::quiet_NaN()),
                 sim::InvalidChannelParameterError);
    EXPECT_THROW((void)NoiseChannel::phaseFlip(-1e-9), sim::InvalidChannelParameterError);
}

TEST(NoiseChannelTest, CustomChannelValidation) {
    const double g = 0.2;
    CMatrix k0 = CMatrix::Zero(2, 2);
    k0(0, 0) = 1.0;
    k0(1, 1) = std::sqrt(1.0 - g);
    CMatrix k1 = CMatrix::Zero(2, 2);
    k1(0, 1) = std::sqrt(g);

    auto channel = NoiseChannel::custom("decay", {k0, k1});
    EXPECT_EQ(channel.kind(), ChannelKind::Custom);
    EXPECT_EQ(channel.name(), "decay");
    EXPECT_TRUE(channel.params().empty());

    EXPECT_THROW((void)NoiseChannel::custom("half", {k0}), sim::IncompleteChannelError);
    EXPECT_THROW((void)NoiseChannel::custom("empty", {}), sim::DimensionMismatchError);
    EXPECT_THROW((void)NoiseChannel::custom("wide", {CMatrix::Identity(4, 4)}),
                 sim::DimensionMismatchError);
}

TEST(NoiseChannelTest, FromNameResolvesConfigurationNames) {
    EXPECT_EQ(NoiseChannel::fromName("depolarizing", 0.1).kind(), ChannelKind::Depolarizing);
    EXPECT_EQ(NoiseChannel::fromName("Amplitude_Damping", 0.1).kind(), ChannelKind::AmplitudeDamping);
    EXPECT_EQ(NoiseChannel::fromName("phase_damping", 0.1).kind(), ChannelKind::PhaseDamping);
    EXPECT_EQ(NoiseChannel::fromName("bit_flip", 0.1).kind(), ChannelKind::BitFlip);
    EXPECT_EQ(NoiseChannel::fromName("phase_flip", 0.1).kind(), ChannelKind::PhaseFlip);
    EXPECT_THROW((void)NoiseChannel::fromName("thermal", 0.1), std::invalid_argument);
    EXPECT_THROW((void)NoiseChannel::fromName("bit_flip", 3.0), sim::InvalidChannelParameterError);
}

TEST(NoiseChannelTest, NameAndParameters) {
    auto channel = NoiseChannel::amplitudeDamping(0.05);
    EXPECT_EQ(channel.name(), "AmplitudeDamping");
    EXPECT_DOUBLE_EQ(channel.params().at("gamma"), 0.05);
    EXPECT_EQ(channel.krausOperators().size(), 2u);
    EXPECT_EQ(NoiseChannel::depolarizing(0.25).toString(), "Depolarizing(p=0.25)");
}

}  // namespace
}  // namespace qsim::noise
