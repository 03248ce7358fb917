// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Types.hpp
 * @brief Common type aliases and constants for the quantum circuit simulator
 *
 * Provides foundational types used throughout the qsim library including
 * qubit indices, complex scalars, dense matrix types, and the numerical
 * tolerances the engine checks its invariants against.
 */

#pragma once

#include <Eigen/Dense>

#include <complex>
#include <cstddef>
#include <cstdint>

namespace qsim {

/// @brief Type alias for qubit indices
using QubitIndex = std::size_t;

/// @brief Type alias for classical bit indices
using ClassicalBitIndex = std::size_t;

/// @brief Type alias for rotation angles (in radians)
using Angle = double;

/// @brief Complex amplitude type
using Complex = std::complex<double>;

/// @brief Dense complex matrix (row-major, matching flattened state layout)
using CMatrix = Eigen::Matrix<Complex, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// @brief Dense complex column vector
using CVector = Eigen::Matrix<Complex, Eigen::Dynamic, 1>;

namespace constants {

/// @brief Maximum number of qubits supported (practical limit for simulation)
inline constexpr std::size_t MAX_QUBITS = 30;

/// @brief Tolerance on the L2 norm of a pure state
inline constexpr double NORM_TOLERANCE = 1e-6;

/// @brief Tolerance for U U^dagger = I on custom gates
inline constexpr double UNITARITY_TOLERANCE = 1e-8;

/// @brief Tolerance for sum K^dagger K = I on Kraus sets
inline constexpr double COMPLETENESS_TOLERANCE = 1e-8;

/// @brief Tolerance on Tr(rho^2) = 1 when extracting a statevector
inline constexpr double PURITY_TOLERANCE = 1e-6;

/// @brief Eigenvalues at or below this are treated as numerical zeros
inline constexpr double EIGENVALUE_TOLERANCE = 1e-10;

/// @brief Memory estimate above which backends emit a warning (10 GiB)
inline constexpr double MEMORY_WARNING_BYTES = 10.0 * 1024.0 * 1024.0 * 1024.0;

/// @brief Bytes per stored complex amplitude
inline constexpr double BYTES_PER_AMPLITUDE = 16.0;

/// @brief Pi constant for rotation gates
inline constexpr double PI = 3.14159265358979323846;

/// @brief Pi/2 for common rotations
inline constexpr double PI_2 = PI / 2.0;

/// @brief Pi/4 for T gate
inline constexpr double PI_4 = PI / 4.0;

/// @brief 1/sqrt(2)
inline constexpr double INV_SQRT2 = 0.70710678118654752440;

}  // namespace constants

}  // namespace qsim
