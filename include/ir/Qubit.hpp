// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Qubit.hpp
 * @brief Qubit and basis-index utilities
 *
 * Qubit 0 is the most-significant bit of a flattened basis index: for n
 * qubits, basis index i reads as the n-bit binary string of i, left to
 * right as qubit 0..n-1.
 *
 * @see Types.hpp for QubitIndex definition
 * @see Circuit.hpp for qubit register management
 */

#pragma once

#include "Types.hpp"

#include <string>

namespace qsim::ir {

/**
 * @brief Validates that a qubit index is within bounds.
 * @param qubit The qubit index to validate
 * @param num_qubits Total number of qubits in the circuit
 * @return true if the qubit index is valid
 */
[[nodiscard]] constexpr bool isValidQubit(QubitIndex qubit,
                                           std::size_t num_qubits) noexcept {
    return qubit < num_qubits;
}

/**
 * @brief Bit mask selecting a qubit (axis) inside a flattened index.
 * @param axis Axis position (0 is the most significant)
 * @param num_axes Total number of axes in the index
 */
[[nodiscard]] constexpr std::size_t axisMask(std::size_t axis,
                                             std::size_t num_axes) noexcept {
    return std::size_t{1} << (num_axes - 1 - axis);
}

/// @brief Value (0 or 1) of a qubit in a basis index.
[[nodiscard]] constexpr int qubitValue(std::size_t basis_index,
                                       QubitIndex qubit,
                                       std::size_t num_qubits) noexcept {
    return (basis_index & axisMask(qubit, num_qubits)) != 0 ? 1 : 0;
}

/// @brief Binary string of a basis index, qubit 0 first.
[[nodiscard]] inline std::string basisLabel(std::size_t basis_index,
                                            std::size_t num_qubits) {
    std::string label(num_qubits, '0');
    for (std::size_t q = 0; q < num_qubits; ++q) {
        if (qubitValue(basis_index, q, num_qubits) == 1) {
            label[q] = '1';
        }
    }
    return label;
}

}  // namespace qsim::ir
