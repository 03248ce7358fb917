// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Entanglement.hpp
 * @brief Reduced density matrices and entanglement measures
 *
 * Entropies are in bits. Eigenvalues at or below 1e-10 are treated as
 * numerical zeros.
 *
 * @see Fidelity.hpp
 */

#pragma once

#include "Fidelity.hpp"
#include "../ir/Qubit.hpp"
#include "../ir/Types.hpp"
#include "../sim/QuantumState.hpp"
#include "../sim/SimulationError.hpp"

#include <Eigen/Eigenvalues>
#include <Eigen/SVD>

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace qsim::metrics {

namespace detail {

inline void checkQubits(const std::vector<QubitIndex>& qubits, std::size_t num_qubits) {
    for (std::size_t k = 0; k < qubits.size(); ++k) {
        if (!ir::isValidQubit(qubits[k], num_qubits)) {
            throw sim::QubitIndexError(
                "Qubit " + std::to_string(qubits[k]) + " out of range [0, " +
                std::to_string(num_qubits) + ")");
        }
        for (std::size_t j = 0; j < k; ++j) {
            if (qubits[j] == qubits[k]) {
                throw sim::QubitIndexError("Qubit " + std::to_string(qubits[k]) + " repeated");
            }
        }
    }
}

/// @brief Flat offsets of every local index over the listed qubits (first listed = MSB).
[[nodiscard]] inline std::vector<std::size_t> subsystemOffsets(const std::vector<QubitIndex>& qubits,
                                                               std::size_t num_qubits) {
    const std::size_t k = qubits.size();
    std::vector<std::size_t> offsets(std::size_t{1} << k, 0);
    for (std::size_t l = 0; l < offsets.size(); ++l) {
        for (std::size_t j = 0; j < k; ++j) {
            if ((l >> (k - 1 - j)) & 1U) {
                offsets[l] |= ir::axisMask(qubits[j], num_qubits);
            }
        }
    }
    return offsets;
}

[[nodiscard]] inline std::vector<QubitIndex> complement(const std::vector<QubitIndex>& qubits,
                                                        std::size_t num_qubits) {
    std::vector<QubitIndex> rest;
    for (QubitIndex q = 0; q < num_qubits; ++q) {
        if (std::find(qubits.begin(), qubits.end(), q) == qubits.end()) {
            rest.push_back(q);
        }
    }
    return rest;
}

}  // namespace detail

/**
 * @brief Partial trace over every qubit not in keep.
 *
 * The kept qubits are sorted; the lowest index becomes the most
 * significant bit of the reduced state.
 *
 * @throws std::invalid_argument if keep is empty
 * @throws sim::QubitIndexError if a qubit is out of range or repeated
 */
[[nodiscard]] inline CMatrix reducedDensityMatrix(const sim::QuantumState& state,
                                                  std::vector<QubitIndex> keep) {
    if (keep.empty()) {
        throw std::invalid_argument("Reduced density matrix needs at least one qubit");
    }
    const std::size_t n = state.numQubits();
    detail::checkQubits(keep, n);
    std::sort(keep.begin(), keep.end());

    const auto traced = detail::complement(keep, n);
    const auto keep_offsets = detail::subsystemOffsets(keep, n);
    const auto trace_offsets = detail::subsystemOffsets(traced, n);
    const auto dim_a = static_cast<Eigen::Index>(keep_offsets.size());
    const std::size_t dim = state.dimension();
    const CVector& t = state.tensor();

    CMatrix reduced = CMatrix::Zero(dim_a, dim_a);
    for (Eigen::Index i = 0; i < dim_a; ++i) {
        for (Eigen::Index j = 0; j < dim_a; ++j) {
            Complex sum = 0.0;
            for (auto e : trace_offsets) {
                const std::size_t row = keep_offsets[static_cast<std::size_t>(i)] | e;
                const std::size_t col = keep_offsets[static_cast<std::size_t>(j)] | e;
                if (state.isDensityMatrix()) {
                    sum += t(static_cast<Eigen::Index>(row * dim + col));
                } else {
                    sum += t(static_cast<Eigen::Index>(row)) *
                           std::conj(t(static_cast<Eigen::Index>(col)));
                }
            }
            reduced(i, j) = sum;
        }
    }
    return reduced;
}

/// @brief Tr(rho^2) of a density matrix.
[[nodiscard]] inline double purity(const CMatrix& rho) {
    return (rho * rho).trace().real();
}

/// @brief Tr(rho^2) of a state; 1 for normalized statevectors.
[[nodiscard]] inline double purity(const sim::QuantumState& state) {
    return state.purity();
}

/// @brief -sum lambda log2 lambda over the eigenvalues of rho.
[[nodiscard]] inline double vonNeumannEntropy(const CMatrix& rho) {
    const Eigen::MatrixXcd m = rho;
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> solver(m, Eigen::EigenvaluesOnly);
    double entropy = 0.0;
    for (Eigen::Index k = 0; k < solver.eigenvalues().size(); ++k) {
        const double lambda = solver.eigenvalues()(k);
        if (lambda > constants::EIGENVALUE_TOLERANCE) {
            entropy -= lambda * std::log2(lambda);
        }
    }
    return entropy;
}

/**
 * @brief Entropy of the whole state, or of the reduced state on qubits.
 */
[[nodiscard]] inline double vonNeumannEntropy(const sim::QuantumState& state,
                                              const std::optional<std::vector<QubitIndex>>& qubits = std::nullopt) {
    if (qubits.has_value()) {
        return vonNeumannEntropy(reducedDensityMatrix(state, *qubits));
    }
    if (!state.isDensityMatrix()) {
        return 0.0;
    }
    return vonNeumannEntropy(state.densityMatrix());
}

/**
 * @brief I(A:B) = S(A) + S(B) - S(AB).
 * @throws std::invalid_argument if A and B overlap
 */
[[nodiscard]] inline double mutualInformation(const sim::QuantumState& state,
                                              const std::vector<QubitIndex>& qubits_a,
                                              const std::vector<QubitIndex>& qubits_b) {
    for (auto q : qubits_a) {
        if (std::find(qubits_b.begin(), qubits_b.end(), q) != qubits_b.end()) {
            throw std::invalid_argument("Subsystems A and B must be disjoint");
        }
    }
    std::vector<QubitIndex> joint = qubits_a;
    joint.insert(joint.end(), qubits_b.begin(), qubits_b.end());
    return vonNeumannEntropy(reducedDensityMatrix(state, qubits_a)) +
           vonNeumannEntropy(reducedDensityMatrix(state, qubits_b)) -
           vonNeumannEntropy(reducedDensityMatrix(state, joint));
}

/**
 * @brief Schmidt decomposition |psi> = sum_i s_i |a_i>|b_i>.
 */
struct SchmidtDecomposition {
    std::vector<double> coefficients;  ///< Singular values, descending
    Eigen::MatrixXcd basis_a;          ///< Columns are |a_i>
    Eigen::MatrixXcd basis_b;          ///< Columns are |b_i>
};

/**
 * @brief Schmidt decomposition of a pure state across the A|B cut.
 *
 * A and B must be disjoint and together cover every qubit.
 *
 * @throws std::invalid_argument if A and B overlap or leave a qubit out
 * @throws sim::MixedStateExtractionError if the state is mixed
 */
[[nodiscard]] inline SchmidtDecomposition schmidtDecomposition(const sim::QuantumState& state,
                                                               const std::vector<QubitIndex>& qubits_a,
                                                               const std::vector<QubitIndex>& qubits_b) {
    const std::size_t n = state.numQubits();
    for (auto q : qubits_a) {
        if (std::find(qubits_b.begin(), qubits_b.end(), q) != qubits_b.end()) {
            throw std::invalid_argument("Subsystems A and B must be disjoint");
        }
    }
    detail::checkQubits(qubits_a, n);
    detail::checkQubits(qubits_b, n);
    if (qubits_a.empty() || qubits_b.empty() || qubits_a.size() + qubits_b.size() != n) {
        throw std::invalid_argument("Subsystems A and B must partition all qubits");
    }

    const sim::QuantumState pure = state.toStatevector();
    const auto offsets_a = detail::subsystemOffsets(qubits_a, n);
    const auto offsets_b = detail::subsystemOffsets(qubits_b, n);

    Eigen::MatrixXcd m(static_cast<Eigen::Index>(offsets_a.size()),
                       static_cast<Eigen::Index>(offsets_b.size()));
    for (std::size_t i = 0; i < offsets_a.size(); ++i) {
        for (std::size_t j = 0; j < offsets_b.size(); ++j) {
            m(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                pure.tensor()(static_cast<Eigen::Index>(offsets_a[i] | offsets_b[j]));
        }
    }

    Eigen::JacobiSVD<Eigen::MatrixXcd> svd(m, Eigen::ComputeThinU | Eigen::ComputeThinV);
    SchmidtDecomposition result;
    const auto& values = svd.singularValues();
    result.coefficients.assign(values.data(), values.data() + values.size());
    result.basis_a = svd.matrixU();
    result.basis_b = svd.matrixV();
    return result;
}

/// @brief Schmidt coefficients of a pure state across the A|B cut.
[[nodiscard]] inline std::vector<double> schmidtCoefficients(const sim::QuantumState& state,
                                                             const std::vector<QubitIndex>& qubits_a,
                                                             const std::vector<QubitIndex>& qubits_b) {
    return schmidtDecomposition(state, qubits_a, qubits_b).coefficients;
}

/// @brief Number of Schmidt coefficients above 1e-10.
[[nodiscard]] inline std::size_t schmidtNumber(const sim::QuantumState& state,
                                               const std::vector<QubitIndex>& qubits_a,
                                               const std::vector<QubitIndex>& qubits_b) {
    const auto coeffs = schmidtCoefficients(state, qubits_a, qubits_b);
    return static_cast<std::size_t>(
        std::count_if(coeffs.begin(), coeffs.end(),
                      [](double s) { return s > constants::EIGENVALUE_TOLERANCE; }));
}

/**
 * @brief Wootters concurrence of the two-qubit reduced state.
 *
 * C = max(0, l1 - l2 - l3 - l4) over the descending eigenvalues of
 * sqrt(sqrt(rho) rho~ sqrt(rho)), rho~ = (Y (x) Y) rho* (Y (x) Y).
 */
[[nodiscard]] inline double concurrence(const sim::QuantumState& state,
                                        QubitIndex qubit1,
                                        QubitIndex qubit2) {
    const CMatrix rho = reducedDensityMatrix(state, {qubit1, qubit2});
    CMatrix yy = CMatrix::Zero(4, 4);
    yy(0, 3) = -1.0;
    yy(1, 2) = 1.0;
    yy(2, 1) = 1.0;
    yy(3, 0) = -1.0;
    const CMatrix rho_tilde = yy * rho.conjugate() * yy;
    const CMatrix sqrt_rho = matrixSqrt(rho);
    const Eigen::MatrixXcd r = matrixSqrt(sqrt_rho * rho_tilde * sqrt_rho);
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> solver(r, Eigen::EigenvaluesOnly);
    const auto& l = solver.eigenvalues();  // ascending
    return std::max(0.0, l(3) - l(2) - l(1) - l(0));
}

/// @brief Entropy of the reduced state on qubits at every history step.
[[nodiscard]] inline std::vector<double> entropyEvolution(const std::vector<sim::QuantumState>& history,
                                                          const std::vector<QubitIndex>& qubits) {
    std::vector<double> entropies;
    entropies.reserve(history.size());
    for (const auto& state : history) {
        entropies.push_back(vonNeumannEntropy(state, qubits));
    }
    return entropies;
}

/// @brief Symmetric matrix of I(q_i : q_j), zero diagonal.
[[nodiscard]] inline Eigen::MatrixXd pairwiseMutualInformation(const sim::QuantumState& state) {
    const auto n = static_cast<Eigen::Index>(state.numQubits());
    Eigen::MatrixXd mi = Eigen::MatrixXd::Zero(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = i + 1; j < n; ++j) {
            const double value = mutualInformation(state,
                                                   {static_cast<QubitIndex>(i)},
                                                   {static_cast<QubitIndex>(j)});
            mi(i, j) = value;
            mi(j, i) = value;
        }
    }
    return mi;
}

}  // namespace qsim::metrics
