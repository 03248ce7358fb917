// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Fidelity.hpp
 * @brief State fidelity between pure and mixed states
 *
 * F(psi, phi) = |<psi|phi>|^2 for pure pairs, psi^dagger sigma psi when
 * one side is pure, and the Uhlmann form Tr(sqrt(sqrt(rho) sigma sqrt(rho)))^2
 * otherwise. Results are clamped to [0, 1].
 */

#pragma once

#include "../ir/Types.hpp"
#include "../sim/QuantumState.hpp"
#include "../sim/SimulationError.hpp"

#include <Eigen/Eigenvalues>

#include <algorithm>
#include <cmath>
#include <string>

namespace qsim::metrics {

namespace detail {

/// @brief Tolerance for rho^2 = rho when detecting pure density matrices.
inline constexpr double PURE_STATE_TOLERANCE = 1e-8;

[[nodiscard]] inline double clampUnit(double value) noexcept {
    return std::clamp(value, 0.0, 1.0);
}

}  // namespace detail

/**
 * @brief Principal square root of a positive semidefinite Hermitian matrix.
 *
 * Negative eigenvalues from round-off are clamped to zero.
 */
[[nodiscard]] inline CMatrix matrixSqrt(const CMatrix& matrix) {
    const Eigen::MatrixXcd m = matrix;
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> solver(m);
    const Eigen::VectorXd roots = solver.eigenvalues().cwiseMax(0.0).cwiseSqrt();
    const Eigen::MatrixXcd& v = solver.eigenvectors();
    return v * roots.cast<Complex>().asDiagonal() * v.adjoint();
}

/// @brief True if rho^2 equals rho within tolerance.
[[nodiscard]] inline bool isPureDensityMatrix(const CMatrix& rho,
                                              double tolerance = detail::PURE_STATE_TOLERANCE) {
    return (rho * rho - rho).cwiseAbs().maxCoeff() <= tolerance;
}

/// @brief Eigenvector of the largest eigenvalue of a Hermitian matrix.
[[nodiscard]] inline CVector leadingEigenvector(const CMatrix& rho) {
    const Eigen::MatrixXcd m = rho;
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> solver(m);
    return solver.eigenvectors().col(solver.eigenvalues().size() - 1);
}

/**
 * @brief Fidelity between two density matrices.
 * @throws sim::DimensionMismatchError if the shapes differ
 */
[[nodiscard]] inline double densityMatrixFidelity(const CMatrix& rho, const CMatrix& sigma) {
    if (rho.rows() != sigma.rows() || rho.cols() != sigma.cols() || rho.rows() != rho.cols()) {
        throw sim::DimensionMismatchError(
            "Cannot compare density matrices of size " + std::to_string(rho.rows()) +
            "x" + std::to_string(rho.cols()) + " and " + std::to_string(sigma.rows()) +
            "x" + std::to_string(sigma.cols()));
    }

    const bool rho_pure = isPureDensityMatrix(rho);
    const bool sigma_pure = isPureDensityMatrix(sigma);

    if (rho_pure && sigma_pure) {
        const CVector psi = leadingEigenvector(rho);
        const CVector phi = leadingEigenvector(sigma);
        return detail::clampUnit(std::norm(psi.dot(phi)));
    }
    if (rho_pure) {
        const CVector psi = leadingEigenvector(rho);
        return detail::clampUnit(psi.dot(sigma * psi).real());
    }
    if (sigma_pure) {
        const CVector phi = leadingEigenvector(sigma);
        return detail::clampUnit(phi.dot(rho * phi).real());
    }

    const CMatrix sqrt_rho = matrixSqrt(rho);
    const CMatrix product = sqrt_rho * sigma * sqrt_rho;
    const double root_trace = matrixSqrt(product).trace().real();
    return detail::clampUnit(root_trace * root_trace);
}

/**
 * @brief Fidelity between two states of the same qubit count.
 * @throws sim::DimensionMismatchError if the qubit counts differ
 */
[[nodiscard]] inline double stateFidelity(const sim::QuantumState& a, const sim::QuantumState& b) {
    if (a.numQubits() != b.numQubits()) {
        throw sim::DimensionMismatchError(
            "Cannot compare a " + std::to_string(a.numQubits()) + "-qubit state with a " +
            std::to_string(b.numQubits()) + "-qubit state");
    }
    if (!a.isDensityMatrix() && !b.isDensityMatrix()) {
        return detail::clampUnit(std::norm(a.tensor().dot(b.tensor())));
    }
    if (!a.isDensityMatrix()) {
        return detail::clampUnit(a.tensor().dot(b.densityMatrix() * a.tensor()).real());
    }
    if (!b.isDensityMatrix()) {
        return detail::clampUnit(b.tensor().dot(a.densityMatrix() * b.tensor()).real());
    }
    return densityMatrixFidelity(a.densityMatrix(), b.densityMatrix());
}

}  // namespace qsim::metrics
