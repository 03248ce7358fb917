// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file QuantumState.hpp
 * @brief Pure and mixed quantum state representation
 *
 * A QuantumState stores either 2^n complex amplitudes (pure) or the 4^n
 * entries of a row-major 2^n x 2^n density matrix (mixed). The mixed
 * storage doubles as a rank-2n tensor: axes [0, n) index row qubits and
 * axes [n, 2n) index column qubits, qubit 0 most significant in each half.
 *
 * @see TensorContraction.hpp for gate application
 * @see Kraus.hpp for noise application
 */

#pragma once

#include "../ir/Qubit.hpp"
#include "../ir/Types.hpp"
#include "Random.hpp"
#include "SimulationError.hpp"

#include <Eigen/Eigenvalues>

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace qsim::sim {

/**
 * @brief Numerical quantum state of n qubits.
 *
 * Example:
 * @code
 * auto psi = QuantumState::zero(2);
 * auto rho = psi.toDensityMatrix();
 * Rng rng(42);
 * int outcome = rho.measure(0, rng, 0);
 * @endcode
 */
class QuantumState {
public:
    /**
     * @brief Constructs a state from flat storage, validating its shape.
     * @param tensor 2^n amplitudes or 4^n row-major density entries
     * @param num_qubits Number of qubits n (>= 1)
     * @param is_density_matrix Whether the storage is a density matrix
     * @throws DimensionMismatchError if the size doesn't match n
     */
    QuantumState(CVector tensor, std::size_t num_qubits, bool is_density_matrix)
        : tensor_(std::move(tensor))
        , num_qubits_(num_qubits)
        , is_density_(is_density_matrix)
    {
        if (num_qubits == 0 || num_qubits > constants::MAX_QUBITS) {
            throw DimensionMismatchError(
                "State must have 1.." + std::to_string(constants::MAX_QUBITS) +
                " qubits, got " + std::to_string(num_qubits));
        }
        const std::size_t dim = std::size_t{1} << num_qubits;
        const std::size_t expected = is_density_ ? dim * dim : dim;
        if (static_cast<std::size_t>(tensor_.size()) != expected) {
            throw DimensionMismatchError(
                std::string(is_density_ ? "Density matrix" : "Statevector") +
                " for " + std::to_string(num_qubits) + " qubits needs " +
                std::to_string(expected) + " entries, got " +
                std::to_string(tensor_.size()));
        }
    }

    // -------------------------------------------------------------------------
    // Factory Methods
    // -------------------------------------------------------------------------

    /// @brief |0...0> as a statevector, or |0...0><0...0| when mixed.
    [[nodiscard]] static QuantumState zero(std::size_t num_qubits, bool mixed = false) {
        if (num_qubits == 0 || num_qubits > constants::MAX_QUBITS) {
            throw DimensionMismatchError(
                "State must have 1.." + std::to_string(constants::MAX_QUBITS) +
                " qubits, got " + std::to_string(num_qubits));
        }
        const std::size_t dim = std::size_t{1} << num_qubits;
        CVector tensor = CVector::Zero(static_cast<Eigen::Index>(mixed ? dim * dim : dim));
        tensor(0) = 1.0;
        return QuantumState(std::move(tensor), num_qubits, mixed);
    }

    /**
     * @brief Builds a pure state from an amplitude vector.
     * @throws DimensionMismatchError unless the size is a power of two >= 2
     */
    [[nodiscard]] static QuantumState fromAmplitudes(const CVector& amplitudes) {
        const auto n = log2Exact(static_cast<std::size_t>(amplitudes.size()));
        if (!n.has_value()) {
            throw DimensionMismatchError(
                "Amplitude vector size " + std::to_string(amplitudes.size()) +
                " is not a power of two >= 2");
        }
        return QuantumState(amplitudes, *n, false);
    }

    /// @overload
    [[nodiscard]] static QuantumState fromAmplitudes(const std::vector<Complex>& amplitudes) {
        return fromAmplitudes(CVector(Eigen::Map<const CVector>(
            amplitudes.data(), static_cast<Eigen::Index>(amplitudes.size()))));
    }

    /**
     * @brief Builds a mixed state from a density matrix.
     * @throws DimensionMismatchError unless the matrix is square with a
     *         power-of-two dimension >= 2
     */
    [[nodiscard]] static QuantumState fromDensityMatrix(const CMatrix& rho) {
        if (rho.rows() != rho.cols()) {
            throw DimensionMismatchError(
                "Density matrix must be square, got " + std::to_string(rho.rows()) +
                "x" + std::to_string(rho.cols()));
        }
        const auto n = log2Exact(static_cast<std::size_t>(rho.rows()));
        if (!n.has_value()) {
            throw DimensionMismatchError(
                "Density matrix dimension " + std::to_string(rho.rows()) +
                " is not a power of two >= 2");
        }
        // CMatrix is row-major, so its storage is already the flat tensor
        CVector tensor = Eigen::Map<const CVector>(rho.data(), rho.size());
        return QuantumState(std::move(tensor), *n, true);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] std::size_t numQubits() const noexcept { return num_qubits_; }

    [[nodiscard]] bool isDensityMatrix() const noexcept { return is_density_; }

    /// @brief Hilbert-space dimension 2^n.
    [[nodiscard]] std::size_t dimension() const noexcept {
        return std::size_t{1} << num_qubits_;
    }

    /// @brief Flat storage.
    [[nodiscard]] const CVector& tensor() const noexcept { return tensor_; }

    /// @brief Mutable flat storage, used by the contraction engine.
    [[nodiscard]] CVector& tensor() noexcept { return tensor_; }

    /**
     * @brief Amplitude of a basis state.
     * @throws std::invalid_argument on a density matrix
     * @throws std::out_of_range if index >= dimension()
     */
    [[nodiscard]] Complex amplitude(std::size_t index) const {
        if (is_density_) {
            throw std::invalid_argument("amplitude() requires a statevector");
        }
        checkIndex(index);
        return tensor_(static_cast<Eigen::Index>(index));
    }

    /// @brief Density matrix element rho(row, col); computed for pure states.
    [[nodiscard]] Complex element(std::size_t row, std::size_t col) const {
        checkIndex(row);
        checkIndex(col);
        if (is_density_) {
            return tensor_(static_cast<Eigen::Index>(row * dimension() + col));
        }
        return tensor_(static_cast<Eigen::Index>(row)) *
               std::conj(tensor_(static_cast<Eigen::Index>(col)));
    }

    /// @brief The 2^n x 2^n density matrix (outer product for pure states).
    [[nodiscard]] CMatrix densityMatrix() const {
        const auto dim = static_cast<Eigen::Index>(dimension());
        if (is_density_) {
            return Eigen::Map<const CMatrix>(tensor_.data(), dim, dim);
        }
        return tensor_ * tensor_.adjoint();
    }

    /// @brief Last outcome written to a classical bit, if any.
    [[nodiscard]] std::optional<int> classicalBit(ClassicalBitIndex bit) const {
        auto it = classical_bits_.find(bit);
        if (it == classical_bits_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // -------------------------------------------------------------------------
    // Measurement
    // -------------------------------------------------------------------------

    /**
     * @brief Probability that a qubit reads 0, clamped to [0, 1].
     * @throws QubitIndexError if qubit >= numQubits()
     */
    [[nodiscard]] double probabilityZero(QubitIndex qubit) const {
        checkQubit(qubit);
        const std::size_t dim = dimension();
        const std::size_t mask = ir::axisMask(qubit, num_qubits_);
        double p0 = 0.0;
        for (std::size_t i = 0; i < dim; ++i) {
            if ((i & mask) != 0) continue;
            if (is_density_) {
                p0 += tensor_(static_cast<Eigen::Index>(i * dim + i)).real();
            } else {
                p0 += std::norm(tensor_(static_cast<Eigen::Index>(i)));
            }
        }
        return std::clamp(p0, 0.0, 1.0);
    }

    /**
     * @brief Projectively measures one qubit and collapses the state in place.
     *
     * Outcome 0 iff a uniform draw is below P(0). Entries inconsistent
     * with the outcome are zeroed, then the state is divided by its
     * remaining norm (pure) or trace (mixed) when that is positive.
     *
     * @param qubit Qubit to measure
     * @param rng Random source
     * @param classical_bit Where to record the outcome, if given
     * @return 0 or 1
     * @throws QubitIndexError if qubit >= numQubits()
     */
    int measure(QubitIndex qubit, Rng& rng,
                std::optional<ClassicalBitIndex> classical_bit = std::nullopt) {
        const double p0 = probabilityZero(qubit);
        const int outcome = rng.bernoulli(p0) ? 0 : 1;
        collapse(qubit, outcome);
        if (classical_bit.has_value()) {
            classical_bits_[*classical_bit] = outcome;
        }
        return outcome;
    }

    /**
     * @brief Projects a qubit onto a fixed outcome without sampling.
     * @throws QubitIndexError if qubit >= numQubits()
     */
    void collapse(QubitIndex qubit, int outcome) {
        checkQubit(qubit);
        const std::size_t dim = dimension();
        const std::size_t mask = ir::axisMask(qubit, num_qubits_);
        const auto consistent = [&](std::size_t i) {
            return ((i & mask) != 0) == (outcome == 1);
        };

        if (is_density_) {
            for (std::size_t r = 0; r < dim; ++r) {
                for (std::size_t c = 0; c < dim; ++c) {
                    if (!consistent(r) || !consistent(c)) {
                        tensor_(static_cast<Eigen::Index>(r * dim + c)) = 0.0;
                    }
                }
            }
            const double tr = trace();
            if (tr > 0.0) {
                tensor_ /= tr;
            }
        } else {
            for (std::size_t i = 0; i < dim; ++i) {
                if (!consistent(i)) {
                    tensor_(static_cast<Eigen::Index>(i)) = 0.0;
                }
            }
            const double nrm = tensor_.norm();
            if (nrm > 0.0) {
                tensor_ /= nrm;
            }
        }
    }

    // -------------------------------------------------------------------------
    // Conversion
    // -------------------------------------------------------------------------

    /// @brief rho = |psi><psi|; an equal copy if already mixed.
    [[nodiscard]] QuantumState toDensityMatrix() const {
        if (is_density_) {
            return copy();
        }
        QuantumState result = fromDensityMatrix(densityMatrix());
        result.classical_bits_ = classical_bits_;
        return result;
    }

    /**
     * @brief Extracts |psi> from a pure density matrix.
     *
     * Returns the eigenvector of the largest eigenvalue. Identity on
     * statevectors.
     *
     * @throws MixedStateExtractionError if |Tr(rho^2) - 1| > 1e-6
     */
    [[nodiscard]] QuantumState toStatevector() const {
        if (!is_density_) {
            return copy();
        }
        const double p = purity();
        if (std::abs(p - 1.0) > constants::PURITY_TOLERANCE) {
            throw MixedStateExtractionError(
                "Cannot extract statevector from mixed state (purity " +
                std::to_string(p) + ")");
        }
        const Eigen::MatrixXcd rho = densityMatrix();
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> solver(rho);
        // Eigenvalues are sorted in increasing order
        const Eigen::Index top = solver.eigenvalues().size() - 1;
        CVector psi = solver.eigenvectors().col(top);
        QuantumState result(std::move(psi), num_qubits_, false);
        result.classical_bits_ = classical_bits_;
        return result;
    }

    /// @brief Deep copy.
    [[nodiscard]] QuantumState copy() const { return *this; }

    // -------------------------------------------------------------------------
    // Properties
    // -------------------------------------------------------------------------

    /// @brief Basis-state probabilities, indexed by basis index.
    [[nodiscard]] std::vector<double> probabilities() const {
        const std::size_t dim = dimension();
        std::vector<double> probs(dim);
        for (std::size_t i = 0; i < dim; ++i) {
            probs[i] = is_density_
                ? tensor_(static_cast<Eigen::Index>(i * dim + i)).real()
                : std::norm(tensor_(static_cast<Eigen::Index>(i)));
        }
        return probs;
    }

    /// @brief L2 norm of the amplitudes, or sqrt of the trace when mixed.
    [[nodiscard]] double norm() const {
        return is_density_ ? std::sqrt(std::max(trace(), 0.0)) : tensor_.norm();
    }

    /// @brief Real part of Tr(rho); squared norm for statevectors.
    [[nodiscard]] double trace() const {
        if (!is_density_) {
            return tensor_.squaredNorm();
        }
        const std::size_t dim = dimension();
        double tr = 0.0;
        for (std::size_t i = 0; i < dim; ++i) {
            tr += tensor_(static_cast<Eigen::Index>(i * dim + i)).real();
        }
        return tr;
    }

    /// @brief Tr(rho^2); 1 for normalized statevectors.
    [[nodiscard]] double purity() const {
        if (!is_density_) {
            const double n2 = tensor_.squaredNorm();
            return n2 * n2;
        }
        // Tr(rho^2) = sum |rho_ij|^2 for Hermitian rho
        return tensor_.squaredNorm();
    }

    [[nodiscard]] bool isNormalized(double tolerance = constants::NORM_TOLERANCE) const {
        return std::abs(is_density_ ? trace() - 1.0 : norm() - 1.0) <= tolerance;
    }

    [[nodiscard]] bool isHermitian(double tolerance = 1e-9) const {
        if (!is_density_) {
            return true;
        }
        const CMatrix rho = densityMatrix();
        return (rho - rho.adjoint()).cwiseAbs().maxCoeff() <= tolerance;
    }

    /**
     * @brief <psi|O|psi> or Tr(O rho) for a full-space observable.
     * @throws DimensionMismatchError if O is not dimension() x dimension()
     */
    [[nodiscard]] double expectationValue(const CMatrix& observable) const {
        const auto dim = static_cast<Eigen::Index>(dimension());
        if (observable.rows() != dim || observable.cols() != dim) {
            throw DimensionMismatchError(
                "Observable is " + std::to_string(observable.rows()) + "x" +
                std::to_string(observable.cols()) + " but state dimension is " +
                std::to_string(dim));
        }
        if (!is_density_) {
            return tensor_.dot(observable * tensor_).real();
        }
        return (observable * densityMatrix()).trace().real();
    }

    [[nodiscard]] std::string toString() const {
        std::ostringstream os;
        os << (is_density_ ? "DensityMatrix(" : "Statevector(") << num_qubits_
           << " qubits";
        if (is_density_) {
            os << ", trace " << trace() << ", purity " << purity() << ")";
        } else {
            os << ", norm " << norm() << "):";
            for (std::size_t i = 0; i < dimension(); ++i) {
                const Complex a = tensor_(static_cast<Eigen::Index>(i));
                if (std::abs(a) > 1e-12) {
                    os << " " << a << "|" << ir::basisLabel(i, num_qubits_) << ">";
                }
            }
        }
        return os.str();
    }

private:
    CVector tensor_;
    std::size_t num_qubits_;
    bool is_density_;
    std::map<ClassicalBitIndex, int> classical_bits_;

    static std::optional<std::size_t> log2Exact(std::size_t size) noexcept {
        if (size < 2 || (size & (size - 1)) != 0) {
            return std::nullopt;
        }
        std::size_t n = 0;
        while ((std::size_t{1} << n) < size) {
            ++n;
        }
        return n;
    }

    void checkQubit(QubitIndex qubit) const {
        if (!ir::isValidQubit(qubit, num_qubits_)) {
            throw QubitIndexError(
                "Qubit " + std::to_string(qubit) + " out of range [0, " +
                std::to_string(num_qubits_) + ")");
        }
    }

    void checkIndex(std::size_t index) const {
        if (index >= dimension()) {
            throw std::out_of_range(
                "Basis index " + std::to_string(index) + " out of range [0, " +
                std::to_string(dimension()) + ")");
        }
    }
};

}  // namespace qsim::sim
