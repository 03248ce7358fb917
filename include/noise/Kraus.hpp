// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Kraus.hpp
 * @brief Kraus-operator utilities for quantum channels
 *
 * A channel with Kraus operators {K_i} maps rho to sum_i K_i rho K_i^dagger
 * and is trace preserving iff sum_i K_i^dagger K_i = I.
 *
 * Two equivalent forms are provided: full-space application on a
 * 2^n x 2^n matrix with operators embedded by Kronecker products, and
 * local application that contracts the 2x2 operators directly with the
 * state tensor.
 */

#pragma once

#include "../ir/Types.hpp"
#include "../sim/QuantumState.hpp"
#include "../sim/SimulationError.hpp"
#include "../sim/TensorContraction.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace qsim::noise {

/// @brief Ordered set of Kraus operators.
using KrausSet = std::vector<CMatrix>;

/**
 * @brief Embeds a single-qubit operator into the n-qubit space.
 *
 * Builds I (x) ... (x) K (x) ... (x) I with K at position qubit, qubit 0
 * leftmost.
 *
 * @throws sim::DimensionMismatchError if K is not 2x2
 * @throws sim::QubitIndexError if qubit >= num_qubits
 */
[[nodiscard]] inline CMatrix embedOperator(const CMatrix& op,
                                           QubitIndex qubit,
                                           std::size_t num_qubits) {
    if (op.rows() != 2 || op.cols() != 2) {
        throw sim::DimensionMismatchError(
            "Embedded operator must be 2x2, got " + std::to_string(op.rows()) +
            "x" + std::to_string(op.cols()));
    }
    if (qubit >= num_qubits) {
        throw sim::QubitIndexError(
            "Qubit " + std::to_string(qubit) + " out of range [0, " +
            std::to_string(num_qubits) + ")");
    }

    CMatrix result = CMatrix::Identity(1, 1);
    for (std::size_t q = 0; q < num_qubits; ++q) {
        const CMatrix factor = (q == qubit) ? op : CMatrix(CMatrix::Identity(2, 2));
        CMatrix next(result.rows() * 2, result.cols() * 2);
        for (Eigen::Index r = 0; r < result.rows(); ++r) {
            for (Eigen::Index c = 0; c < result.cols(); ++c) {
                next.block(2 * r, 2 * c, 2, 2) = result(r, c) * factor;
            }
        }
        result = std::move(next);
    }
    return result;
}

/**
 * @brief sum_i K_i rho K_i^dagger for full-space operators.
 * @throws sim::DimensionMismatchError if an operator doesn't match rho
 */
[[nodiscard]] inline CMatrix applyKraus(const CMatrix& rho, const KrausSet& ops) {
    CMatrix result = CMatrix::Zero(rho.rows(), rho.cols());
    for (const auto& k : ops) {
        if (k.rows() != rho.rows() || k.cols() != rho.rows()) {
            throw sim::DimensionMismatchError(
                "Kraus operator of size " + std::to_string(k.rows()) + "x" +
                std::to_string(k.cols()) + " doesn't match density matrix of size " +
                std::to_string(rho.rows()));
        }
        result.noalias() += k * rho * k.adjoint();
    }
    return result;
}

/**
 * @brief Checks sum_i K_i^dagger K_i = I within tolerance.
 * @return false for an empty set or operators of mixed sizes
 */
[[nodiscard]] inline bool verifyCompleteness(const KrausSet& ops,
                                             double tolerance = constants::COMPLETENESS_TOLERANCE) {
    if (ops.empty()) {
        return false;
    }
    const Eigen::Index dim = ops.front().rows();
    CMatrix sum = CMatrix::Zero(dim, dim);
    for (const auto& k : ops) {
        if (k.rows() != dim || k.cols() != dim) {
            return false;
        }
        sum.noalias() += k.adjoint() * k;
    }
    return (sum - CMatrix::Identity(dim, dim)).cwiseAbs().maxCoeff() <= tolerance;
}

/**
 * @brief Applies single-qubit Kraus operators to one qubit of a density
 *        matrix by local contraction.
 *
 * Numerically equal to applyKraus() with embedOperator()-ed operators.
 *
 * @throws std::invalid_argument if the state is not a density matrix
 */
inline void applyKraus(sim::QuantumState& state, const KrausSet& ops, QubitIndex qubit) {
    if (!state.isDensityMatrix()) {
        throw std::invalid_argument("Kraus channels require a density-matrix state");
    }
    CVector accumulated = CVector::Zero(state.tensor().size());
    for (const auto& k : ops) {
        sim::QuantumState term = state.copy();
        sim::applyOperator(term, k, {qubit});
        accumulated += term.tensor();
    }
    state.tensor() = std::move(accumulated);
}

}  // namespace qsim::noise
