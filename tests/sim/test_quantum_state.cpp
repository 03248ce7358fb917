// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file test_quantum_state.cpp
 * @brief Unit tests for QuantumState construction, measurement and conversion
 */

#include "sim/QuantumState.hpp"
#include "sim/TensorContraction.hpp"

#include <gtest/gtest.h>

#include <cmath>

namespace qsim::sim {
namespace {

constexpr double kTol = 1e-9;

QuantumState bellState() {
    auto psi = QuantumState::zero(2);
    applyGate(psi, ir::Gate::h(), {0});
    applyGate(psi, ir::Gate::cnot(), {0, 1});
    return psi;
}

// =============================================================================
// Construction Tests
// =============================================================================

TEST(QuantumStateConstructionTest, ZeroStatevector) {
    auto psi = QuantumState::zero(3);
    EXPECT_EQ(psi.numQubits(), 3u);
    EXPECT_FALSE(psi.isDensityMatrix());
    EXPECT_EQ(psi.tensor().size(), 8);
    EXPECT_NEAR(std::abs(psi.amplitude(0)), 1.0, kTol);
    EXPECT_TRUE(psi.isNormalized());
}

TEST(QuantumStateConstructionTest, ZeroDensityMatrix) {
    auto rho = QuantumState::zero(2, true);
    EXPECT_TRUE(rho.isDensityMatrix());
    EXPECT_EQ(rho.tensor().size(), 16);
    EXPECT_NEAR(rho.element(0, 0).real(), 1.0, kTol);
    EXPECT_NEAR(rho.trace(), 1.0, kTol);
    EXPECT_NEAR(rho.purity(), 1.0, kTol);
}

TEST(QuantumStateConstructionTest, FromAmplitudesInfersQubitCount) {
    const double r = constants::INV_SQRT2;
    auto psi = QuantumState::fromAmplitudes(std::vector<Complex>{r, 0.0, 0.0, r});
    EXPECT_EQ(psi.numQubits(), 2u);
    EXPECT_NEAR(psi.amplitude(3).real(), r, kTol);
}

TEST(QuantumStateConstructionTest, RejectsBadShapes) {
    EXPECT_THROW(QuantumState::fromAmplitudes(std::vector<Complex>{1.0, 0.0, 0.0}),
                 DimensionMismatchError);
    EXPECT_THROW(QuantumState::fromAmplitudes(std::vector<Complex>{1.0}), DimensionMismatchError);
    EXPECT_THROW(QuantumState::fromDensityMatrix(CMatrix::Identity(2, 4)), DimensionMismatchError);
    EXPECT_THROW(QuantumState::fromDensityMatrix(CMatrix::Identity(3, 3)), DimensionMismatchError);
    EXPECT_THROW(QuantumState(CVector::Zero(4), 2, true), DimensionMismatchError);
    EXPECT_THROW(QuantumState(CVector::Zero(4), 0, false), DimensionMismatchError);
}

// =============================================================================
// Conversion Tests
// =============================================================================

TEST(QuantumStateConversionTest, ToDensityMatrixIsOuterProduct) {
    auto psi = bellState();
    auto rho = psi.toDensityMatrix();
    ASSERT_TRUE(rho.isDensityMatrix());
    EXPECT_NEAR(rho.element(0, 0).real(), 0.5, kTol);
    EXPECT_NEAR(rho.element(0, 3).real(), 0.5, kTol);
    EXPECT_NEAR(rho.element(3, 0).real(), 0.5, kTol);
    EXPECT_NEAR(std::abs(rho.element(1, 1)), 0.0, kTol);
    EXPECT_TRUE(rho.isHermitian());
}

TEST(QuantumStateConversionTest, ToDensityMatrixOnMixedIsCopy) {
    auto rho = QuantumState::zero(1, true);
    auto again = rho.toDensityMatrix();
    EXPECT_TRUE(again.tensor().isApprox(rho.tensor()));
}

TEST(QuantumStateConversionTest, RoundTripRecoversVectorUpToPhase) {
    auto psi = QuantumState::zero(2);
    applyGate(psi, ir::Gate::ry(0.8), {0});
    applyGate(psi, ir::Gate::rz(1.3), {1});
    applyGate(psi, ir::Gate::cnot(), {0, 1});
    applyGate(psi, ir::Gate::t(), {1});

    auto recovered = psi.toDensityMatrix().toStatevector();
    ASSERT_FALSE(recovered.isDensityMatrix());
    const double overlap = std::abs(psi.tensor().dot(recovered.tensor()));
    EXPECT_NEAR(overlap, 1.0, 1e-9);
}

TEST(QuantumStateConversionTest, ToStatevectorRejectsMixedState) {
    CMatrix maximally_mixed = CMatrix::Identity(2, 2) * 0.5;
    auto rho = QuantumState::fromDensityMatrix(maximally_mixed);
    EXPECT_THROW((void)rho.toStatevector(), MixedStateExtractionError);
}

TEST(QuantumStateConversionTest, ToStatevectorIsIdentityOnPure) {
    auto psi = bellState();
    auto same = psi.toStatevector();
    EXPECT_TRUE(same.tensor().isApprox(psi.tensor()));
}

// =============================================================================
// Measurement Tests
// =============================================================================

TEST(QuantumStateMeasurementTest, DeterministicOutcomeOnBasisState) {
    auto psi = QuantumState::zero(2);
    applyGate(psi, ir::Gate::x(), {1});
    Rng rng(7);
    EXPECT_EQ(psi.measure(0, rng), 0);
    EXPECT_EQ(psi.measure(1, rng, 4), 1);
    ASSERT_TRUE(psi.classicalBit(4).has_value());
    EXPECT_EQ(*psi.classicalBit(4), 1);
    EXPECT_FALSE(psi.classicalBit(0).has_value());
}

TEST(QuantumStateMeasurementTest, BellMeasurementsAreCorrelated) {
    for (std::uint64_t seed = 0; seed < 20; ++seed) {
        auto psi = bellState();
        Rng rng(seed);
        const int first = psi.measure(0, rng);
        const int second = psi.measure(1, rng);
        EXPECT_EQ(first, second);
        EXPECT_TRUE(psi.isNormalized());
    }
}

TEST(QuantumStateMeasurementTest, CollapseRenormalizesDensityMatrix) {
    auto rho = bellState().toDensityMatrix();
    Rng rng(3);
    const int outcome = rho.measure(0, rng);
    const std::size_t index = outcome == 0 ? 0 : 3;
    EXPECT_NEAR(rho.trace(), 1.0, kTol);
    EXPECT_NEAR(rho.element(index, index).real(), 1.0, kTol);
    EXPECT_NEAR(rho.purity(), 1.0, kTol);
}

TEST(QuantumStateMeasurementTest, ProbabilityZeroOfSuperposition) {
    auto psi = QuantumState::zero(1);
    applyGate(psi, ir::Gate::h(), {0});
    EXPECT_NEAR(psi.probabilityZero(0), 0.5, kTol);
    EXPECT_NEAR(psi.toDensityMatrix().probabilityZero(0), 0.5, kTol);
    EXPECT_THROW((void)psi.probabilityZero(1), QubitIndexError);
}

TEST(QuantumStateMeasurementTest, SameSeedSameOutcomes) {
    auto run = [](std::uint64_t seed) {
        std::vector<int> outcomes;
        for (int k = 0; k < 32; ++k) {
            auto psi = QuantumState::zero(1);
            applyGate(psi, ir::Gate::h(), {0});
            Rng rng(seed + static_cast<std::uint64_t>(k));
            outcomes.push_back(psi.measure(0, rng));
        }
        return outcomes;
    };
    EXPECT_EQ(run(99), run(99));
}

TEST(QuantumStateMeasurementTest, OutcomeFollowsBernoulliDraw) {
    for (std::uint64_t seed = 0; seed < 20; ++seed) {
        Rng draw(seed);
        const int expected = draw.bernoulli(0.3) ? 0 : 1;

        auto psi = QuantumState::fromAmplitudes(std::vector<Complex>{
            Complex(std::sqrt(0.3), 0.0), Complex(std::sqrt(0.7), 0.0)});
        Rng rng(seed);
        EXPECT_EQ(psi.measure(0, rng), expected) << "seed " << seed;
    }
}

TEST(QuantumStateMeasurementTest, BernoulliExtremesAreDeterministic) {
    Rng rng(3);
    for (int k = 0; k < 50; ++k) {
        EXPECT_FALSE(rng.bernoulli(0.0));
        EXPECT_TRUE(rng.bernoulli(1.0));
    }
}

// =============================================================================
// Property Tests
// =============================================================================

TEST(QuantumStatePropertyTest, ProbabilitiesMatchAmplitudes) {
    auto probs = bellState().probabilities();
    ASSERT_EQ(probs.size(), 4u);
    EXPECT_NEAR(probs[0], 0.5, kTol);
    EXPECT_NEAR(probs[1], 0.0, kTol);
    EXPECT_NEAR(probs[2], 0.0, kTol);
    EXPECT_NEAR(probs[3], 0.5, kTol);
}

TEST(QuantumStatePropertyTest, PurityOfMixedStateBelowOne) {
    auto rho = QuantumState::fromDensityMatrix(CMatrix::Identity(4, 4) * 0.25);
    EXPECT_NEAR(rho.purity(), 0.25, kTol);
    EXPECT_GE(rho.purity(), 0.0);
    EXPECT_LE(rho.purity(), 1.0);
}

TEST(QuantumStatePropertyTest, ExpectationValueOfZ) {
    CMatrix z = ir::Gate::z().matrix();
    auto psi = QuantumState::zero(1);
    EXPECT_NEAR(psi.expectationValue(z), 1.0, kTol);
    applyGate(psi, ir::Gate::x(), {0});
    EXPECT_NEAR(psi.expectationValue(z), -1.0, kTol);
    EXPECT_NEAR(psi.toDensityMatrix().expectationValue(z), -1.0, kTol);
    EXPECT_THROW((void)psi.expectationValue(CMatrix::Identity(4, 4)), DimensionMismatchError);
}

TEST(QuantumStatePropertyTest, CopyIsIndependent) {
    auto psi = QuantumState::zero(1);
    auto copy = psi.copy();
    applyGate(copy, ir::Gate::x(), {0});
    EXPECT_NEAR(std::abs(psi.amplitude(0)), 1.0, kTol);
    EXPECT_NEAR(std::abs(copy.amplitude(1)), 1.0, kTol);
}

TEST(QuantumStatePropertyTest, ToStringListsBasisStates) {
    auto s = bellState().toString();
    EXPECT_NE(s.find("|00>"), std::string::npos);
    EXPECT_NE(s.find("|11>"), std::string::npos);
    EXPECT_EQ(s.find("|01>"), std::string::npos);
}

}  // namespace
}  // namespace qsim::sim
