// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Observables.hpp
 * @brief Expectation values, Pauli strings and Bloch vectors
 */

#pragma once

#include "../ir/Types.hpp"
#include "../sim/QuantumState.hpp"
#include "../sim/SimulationError.hpp"
#include "../sim/TensorContraction.hpp"

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace qsim::metrics {

/**
 * @brief <O> for an observable acting on the listed qubits.
 *
 * Without qubits the observable must span the full space. With qubits it
 * is 2^k x 2^k and the first listed qubit is its most significant bit.
 *
 * @throws sim::DimensionMismatchError if the observable size doesn't fit
 * @throws sim::QubitIndexError if a qubit is out of range or repeated
 */
[[nodiscard]] inline double expectationValue(const sim::QuantumState& state,
                                             const CMatrix& observable,
                                             const std::optional<std::vector<QubitIndex>>& qubits = std::nullopt) {
    if (!qubits.has_value()) {
        return state.expectationValue(observable);
    }

    if (!state.isDensityMatrix()) {
        sim::QuantumState applied = state.copy();
        sim::applyOperator(applied, observable, *qubits);
        return state.tensor().dot(applied.tensor()).real();
    }

    // Tr(O rho): apply O to the row axes only, then trace
    sim::checkOperatorTargets(observable, *qubits, state.numQubits());
    CVector rows = state.tensor();
    sim::applyMatrixToAxes(rows.data(), 2 * state.numQubits(), observable, *qubits);
    const std::size_t dim = state.dimension();
    Complex tr = 0.0;
    for (std::size_t i = 0; i < dim; ++i) {
        tr += rows(static_cast<Eigen::Index>(i * dim + i));
    }
    return tr.real();
}

/**
 * @brief 2x2 Pauli matrix for 'I', 'X', 'Y' or 'Z' (case-insensitive).
 * @throws std::invalid_argument for any other character
 */
[[nodiscard]] inline CMatrix pauliMatrix(char label) {
    const Complex i(0.0, 1.0);
    CMatrix m(2, 2);
    switch (label) {
        case 'I': case 'i':
            m << 1.0, 0.0,
                 0.0, 1.0;
            break;
        case 'X': case 'x':
            m << 0.0, 1.0,
                 1.0, 0.0;
            break;
        case 'Y': case 'y':
            m << 0.0, -i,
                 i, 0.0;
            break;
        case 'Z': case 'z':
            m << 1.0, 0.0,
                 0.0, -1.0;
            break;
        default:
            throw std::invalid_argument(std::string("Unknown Pauli label '") + label + "'");
    }
    return m;
}

/**
 * @brief Expectation of a Pauli string such as "XZ".
 *
 * Character k acts on qubits[k]; without qubits, on qubit k.
 *
 * @throws std::invalid_argument for bad labels or a length mismatch
 */
[[nodiscard]] inline double pauliExpectation(const sim::QuantumState& state,
                                             std::string_view paulis,
                                             std::optional<std::vector<QubitIndex>> qubits = std::nullopt) {
    if (paulis.empty()) {
        throw std::invalid_argument("Pauli string must not be empty");
    }
    if (!qubits.has_value()) {
        qubits.emplace();
        for (QubitIndex q = 0; q < paulis.size(); ++q) {
            qubits->push_back(q);
        }
    }
    if (qubits->size() != paulis.size()) {
        throw std::invalid_argument(
            "Pauli string of length " + std::to_string(paulis.size()) +
            " needs as many qubits, got " + std::to_string(qubits->size()));
    }

    CMatrix op = CMatrix::Identity(1, 1);
    for (char label : paulis) {
        const CMatrix p = pauliMatrix(label);
        CMatrix next(op.rows() * 2, op.cols() * 2);
        for (Eigen::Index r = 0; r < op.rows(); ++r) {
            for (Eigen::Index c = 0; c < op.cols(); ++c) {
                next.block(2 * r, 2 * c, 2, 2) = op(r, c) * p;
            }
        }
        op = std::move(next);
    }
    return expectationValue(state, op, qubits);
}

/// @brief (<X>, <Y>, <Z>) of one qubit.
[[nodiscard]] inline std::array<double, 3> blochVector(const sim::QuantumState& state,
                                                       QubitIndex qubit) {
    const std::vector<QubitIndex> target{qubit};
    return {pauliExpectation(state, "X", target),
            pauliExpectation(state, "Y", target),
            pauliExpectation(state, "Z", target)};
}

}  // namespace qsim::metrics
