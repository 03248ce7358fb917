// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file TensorContraction.hpp
 * @brief Generic k-qubit operator application by tensor contraction
 *
 * A state of n qubits is viewed as a tensor with one binary axis per
 * qubit (2n axes for a density matrix). Applying a 2^k x 2^k matrix to k
 * target axes contracts the matrix input indices with those axes and
 * writes the outputs back in place. The same routine serves every gate
 * arity, custom unitaries and non-unitary Kraus operators.
 *
 * For a density matrix the operator is applied to the row axes and its
 * complex conjugate to the column axes (q + n), giving U rho U^dagger.
 */

#pragma once

#include "../ir/Gate.hpp"
#include "../ir/Qubit.hpp"
#include "../ir/Types.hpp"
#include "QuantumState.hpp"
#include "SimulationError.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace qsim::sim {

namespace detail {

/// @brief Inserts a zero bit at each of the given ascending bit positions.
[[nodiscard]] inline std::size_t insertZeroBits(std::size_t value,
                                                const std::vector<std::size_t>& positions) noexcept {
    for (auto p : positions) {
        const std::size_t low = value & ((std::size_t{1} << p) - 1);
        value = ((value >> p) << (p + 1)) | low;
    }
    return value;
}

}  // namespace detail

/**
 * @brief Contracts a matrix with selected axes of a flat tensor, in place.
 *
 * Axis a of an N-axis tensor is bit (N - 1 - a) of the flat index. The
 * first listed axis is the most significant bit of the matrix index.
 *
 * @param data Flat tensor storage of 2^num_axes entries
 * @param num_axes Number of binary axes
 * @param matrix 2^k x 2^k operator, k = axes.size()
 * @param axes Distinct target axes
 * @param conjugate Apply the complex conjugate of matrix instead
 */
inline void applyMatrixToAxes(Complex* data,
                              std::size_t num_axes,
                              const CMatrix& matrix,
                              const std::vector<std::size_t>& axes,
                              bool conjugate = false) {
    const std::size_t k = axes.size();
    const std::size_t local_dim = std::size_t{1} << k;

    // Flat offset of every local basis index relative to a base index
    std::vector<std::size_t> offsets(local_dim, 0);
    for (std::size_t l = 0; l < local_dim; ++l) {
        for (std::size_t j = 0; j < k; ++j) {
            if ((l >> (k - 1 - j)) & 1U) {
                offsets[l] |= ir::axisMask(axes[j], num_axes);
            }
        }
    }

    std::vector<std::size_t> positions;
    positions.reserve(k);
    for (auto a : axes) {
        positions.push_back(num_axes - 1 - a);
    }
    std::sort(positions.begin(), positions.end());

    const CMatrix op = conjugate ? CMatrix(matrix.conjugate()) : matrix;
    CVector in(static_cast<Eigen::Index>(local_dim));
    CVector out(static_cast<Eigen::Index>(local_dim));

    const std::size_t num_bases = std::size_t{1} << (num_axes - k);
    for (std::size_t b = 0; b < num_bases; ++b) {
        const std::size_t base = detail::insertZeroBits(b, positions);
        for (std::size_t l = 0; l < local_dim; ++l) {
            in(static_cast<Eigen::Index>(l)) = data[base + offsets[l]];
        }
        out.noalias() = op * in;
        for (std::size_t l = 0; l < local_dim; ++l) {
            data[base + offsets[l]] = out(static_cast<Eigen::Index>(l));
        }
    }
}

/**
 * @brief Checks that a local operator fits the target qubits of an
 *        n-qubit state.
 * @throws DimensionMismatchError if the operator is not 2^k x 2^k
 * @throws QubitIndexError if a qubit is out of range or repeated
 */
inline void checkOperatorTargets(const CMatrix& op,
                                 const std::vector<QubitIndex>& qubits,
                                 std::size_t n) {
    const auto expected = static_cast<Eigen::Index>(std::size_t{1} << qubits.size());
    if (qubits.empty() || op.rows() != expected || op.cols() != expected) {
        throw DimensionMismatchError(
            "Operator of size " + std::to_string(op.rows()) + "x" +
            std::to_string(op.cols()) + " cannot act on " +
            std::to_string(qubits.size()) + " qubit(s)");
    }

    for (std::size_t k = 0; k < qubits.size(); ++k) {
        if (!ir::isValidQubit(qubits[k], n)) {
            throw QubitIndexError(
                "Qubit " + std::to_string(qubits[k]) + " out of range [0, " +
                std::to_string(n) + ")");
        }
        if (std::find(qubits.begin(), qubits.begin() + static_cast<std::ptrdiff_t>(k),
                      qubits[k]) != qubits.begin() + static_cast<std::ptrdiff_t>(k)) {
            throw QubitIndexError("Qubit " + std::to_string(qubits[k]) + " repeated");
        }
    }
}

/**
 * @brief Applies a local operator to the given qubits of a state.
 *
 * Pure states get one contraction. Mixed states get the operator on the
 * row axes and its conjugate on the column axes, so any operator K maps
 * rho to K rho K^dagger.
 *
 * @throws DimensionMismatchError if the operator is not 2^k x 2^k
 * @throws QubitIndexError if a qubit is out of range or repeated
 */
inline void applyOperator(QuantumState& state,
                          const CMatrix& op,
                          const std::vector<QubitIndex>& qubits) {
    const std::size_t n = state.numQubits();
    checkOperatorTargets(op, qubits, n);

    Complex* data = state.tensor().data();
    if (!state.isDensityMatrix()) {
        applyMatrixToAxes(data, n, op, qubits);
        return;
    }

    applyMatrixToAxes(data, 2 * n, op, qubits);
    std::vector<std::size_t> column_axes;
    column_axes.reserve(qubits.size());
    for (auto q : qubits) {
        column_axes.push_back(q + n);
    }
    applyMatrixToAxes(data, 2 * n, op, column_axes, true);
}

/**
 * @brief Applies a gate to the given qubits of a state in place.
 * @throws GateArityError if qubits.size() != gate.numQubits()
 * @throws QubitIndexError if a qubit is out of range or repeated
 */
inline void applyGate(QuantumState& state,
                      const ir::Gate& gate,
                      const std::vector<QubitIndex>& qubits) {
    if (qubits.size() != gate.numQubits()) {
        throw GateArityError(
            "Gate " + gate.name() + " acts on " + std::to_string(gate.numQubits()) +
            " qubit(s) but " + std::to_string(qubits.size()) + " were given");
    }
    applyOperator(state, gate.matrix(), qubits);
}

}  // namespace qsim::sim
