// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Gate.hpp
 * @brief Quantum gate representation and factory methods
 *
 * Provides the Gate class: an immutable unitary operator with a declared
 * qubit arity and its matrix. Gates do not know which qubits they act on;
 * a Circuit pairs each gate with its qubit list.
 *
 * @see Circuit.hpp for circuit-level operations
 * @see TensorContraction.hpp for applying gates to states
 */

#pragma once

#include "Types.hpp"
#include "../sim/SimulationError.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qsim::ir {

/**
 * @brief Enumeration of supported quantum gate types.
 *
 * Single-qubit gates: H, X, Y, Z, S, Sdg, T, Tdg, Rx, Ry, Rz
 * Two-qubit gates: CNOT, CZ, SWAP
 * Three-qubit gates: Toffoli
 * Custom: arbitrary validated unitary of any arity
 */
enum class GateType {
    // Single-qubit Clifford gates
    H,      ///< Hadamard gate
    X,      ///< Pauli-X (NOT) gate
    Y,      ///< Pauli-Y gate
    Z,      ///< Pauli-Z gate
    S,      ///< S gate (sqrt(Z))
    Sdg,    ///< S-dagger gate
    T,      ///< T gate (sqrt(S))
    Tdg,    ///< T-dagger gate

    // Single-qubit rotation gates (parameterized)
    Rx,     ///< Rotation around X-axis
    Ry,     ///< Rotation around Y-axis
    Rz,     ///< Rotation around Z-axis

    // Two-qubit gates
    CNOT,   ///< Controlled-NOT (CX) gate
    CZ,     ///< Controlled-Z gate
    SWAP,   ///< SWAP gate

    // Three-qubit gates
    Toffoli,  ///< Doubly-controlled NOT (CCX)

    Custom    ///< User-supplied unitary matrix
};

/**
 * @brief Returns the name of a gate type as a string.
 * @param type The gate type
 * @return String representation of the gate type
 */
[[nodiscard]] constexpr std::string_view gateTypeName(GateType type) noexcept {
    switch (type) {
        case GateType::H:       return "H";
        case GateType::X:       return "X";
        case GateType::Y:       return "Y";
        case GateType::Z:       return "Z";
        case GateType::S:       return "S";
        case GateType::Sdg:     return "Sdg";
        case GateType::T:       return "T";
        case GateType::Tdg:     return "Tdg";
        case GateType::Rx:      return "RX";
        case GateType::Ry:      return "RY";
        case GateType::Rz:      return "RZ";
        case GateType::CNOT:    return "CNOT";
        case GateType::CZ:      return "CZ";
        case GateType::SWAP:    return "SWAP";
        case GateType::Toffoli: return "Toffoli";
        case GateType::Custom:  return "Custom";
    }
    return "Unknown";
}

/**
 * @brief Returns the number of qubits a built-in gate type acts on.
 * @param type The gate type
 * @return Number of qubits (1, 2 or 3), or 0 for Custom (set by its matrix)
 */
[[nodiscard]] constexpr std::size_t numQubitsFor(GateType type) noexcept {
    switch (type) {
        case GateType::CNOT:
        case GateType::CZ:
        case GateType::SWAP:
            return 2;
        case GateType::Toffoli:
            return 3;
        case GateType::Custom:
            return 0;
        default:
            return 1;
    }
}

/**
 * @brief Returns whether a gate type is parameterized.
 * @param type The gate type
 * @return true if the gate requires a rotation angle parameter
 */
[[nodiscard]] constexpr bool isParameterized(GateType type) noexcept {
    switch (type) {
        case GateType::Rx:
        case GateType::Ry:
        case GateType::Rz:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Returns whether a gate type belongs to the Clifford set
 *        {H, S, CNOT, CZ, X, Y, Z, SWAP} accepted by the stabilizer backend.
 */
[[nodiscard]] constexpr bool isClifford(GateType type) noexcept {
    switch (type) {
        case GateType::H:
        case GateType::S:
        case GateType::CNOT:
        case GateType::CZ:
        case GateType::X:
        case GateType::Y:
        case GateType::Z:
        case GateType::SWAP:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Checks U U^dagger = I within a tolerance.
 * @param matrix Square matrix to check
 * @param tolerance Maximum absolute deviation per entry
 */
[[nodiscard]] inline bool isUnitary(const CMatrix& matrix,
                                    double tolerance = constants::UNITARITY_TOLERANCE) {
    if (matrix.rows() != matrix.cols() || matrix.rows() == 0) {
        return false;
    }
    const CMatrix product = matrix * matrix.adjoint();
    const CMatrix identity = CMatrix::Identity(matrix.rows(), matrix.cols());
    return (product - identity).cwiseAbs().maxCoeff() <= tolerance;
}

/**
 * @brief Represents a quantum gate operator.
 *
 * A Gate consists of a type, a display name, an arity, optional rotation
 * parameters and (for custom gates) a stored matrix. Gates are immutable
 * value types and can be copied/moved freely.
 *
 * Example:
 * @code
 * auto h = Gate::h();                 // Hadamard
 * auto rz = Gate::rz(PI / 4);         // Rz(pi/4)
 * auto cx = Gate::fromName("cx", {}); // CNOT from its boundary name
 * CMatrix u = cx.matrix();            // 4x4 unitary, control is the MSB
 * @endcode
 */
class Gate {
public:
    // Default special members
    ~Gate() noexcept = default;
    Gate(const Gate&) = default;
    Gate& operator=(const Gate&) = default;
    Gate(Gate&&) noexcept = default;
    Gate& operator=(Gate&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Factory Methods
    // -------------------------------------------------------------------------

    /// @brief Creates a Hadamard gate.
    [[nodiscard]] static Gate h() { return Gate(GateType::H); }

    /// @brief Creates a Pauli-X gate.
    [[nodiscard]] static Gate x() { return Gate(GateType::X); }

    /// @brief Creates a Pauli-Y gate.
    [[nodiscard]] static Gate y() { return Gate(GateType::Y); }

    /// @brief Creates a Pauli-Z gate.
    [[nodiscard]] static Gate z() { return Gate(GateType::Z); }

    /// @brief Creates an S gate.
    [[nodiscard]] static Gate s() { return Gate(GateType::S); }

    /// @brief Creates an S-dagger gate.
    [[nodiscard]] static Gate sdg() { return Gate(GateType::Sdg); }

    /// @brief Creates a T gate.
    [[nodiscard]] static Gate t() { return Gate(GateType::T); }

    /// @brief Creates a T-dagger gate.
    [[nodiscard]] static Gate tdg() { return Gate(GateType::Tdg); }

    /// @brief Creates an Rx rotation gate.
    [[nodiscard]] static Gate rx(Angle theta) { return Gate(GateType::Rx, {theta}); }

    /// @brief Creates an Ry rotation gate.
    [[nodiscard]] static Gate ry(Angle theta) { return Gate(GateType::Ry, {theta}); }

    /// @brief Creates an Rz rotation gate.
    [[nodiscard]] static Gate rz(Angle theta) { return Gate(GateType::Rz, {theta}); }

    /// @brief Creates a CNOT gate (first qubit control, second target).
    [[nodiscard]] static Gate cnot() { return Gate(GateType::CNOT); }

    /// @brief Creates a CZ gate.
    [[nodiscard]] static Gate cz() { return Gate(GateType::CZ); }

    /// @brief Creates a SWAP gate.
    [[nodiscard]] static Gate swap() { return Gate(GateType::SWAP); }

    /// @brief Creates a Toffoli gate (two controls, then target).
    [[nodiscard]] static Gate toffoli() { return Gate(GateType::Toffoli); }

    /**
     * @brief Creates a gate from an arbitrary unitary matrix.
     * @param name Display name
     * @param matrix 2^k x 2^k unitary
     * @param num_qubits Arity k (>= 1)
     * @throws sim::DimensionMismatchError if the matrix is not 2^k x 2^k
     * @throws sim::NonUnitaryGateError if U U^dagger != I within 1e-8
     */
    [[nodiscard]] static Gate custom(std::string name,
                                     CMatrix matrix,
                                     std::size_t num_qubits) {
        if (num_qubits == 0 || num_qubits > constants::MAX_QUBITS) {
            throw sim::DimensionMismatchError(
                "Custom gate " + name + " must act on 1.." +
                std::to_string(constants::MAX_QUBITS) + " qubits");
        }
        const auto expected = static_cast<Eigen::Index>(std::size_t{1} << num_qubits);
        if (matrix.rows() != matrix.cols()) {
            throw sim::DimensionMismatchError(
                "Custom gate " + name + " matrix must be square, got " +
                std::to_string(matrix.rows()) + "x" + std::to_string(matrix.cols()));
        }
        if (matrix.rows() != expected) {
            throw sim::DimensionMismatchError(
                "Custom gate " + name + " matrix dimension " +
                std::to_string(matrix.rows()) + " doesn't match " +
                std::to_string(num_qubits) + " qubit(s)");
        }
        if (!isUnitary(matrix)) {
            throw sim::NonUnitaryGateError("Custom gate " + name + " matrix must be unitary");
        }
        Gate gate(GateType::Custom);
        gate.name_ = std::move(name);
        gate.num_qubits_ = num_qubits;
        gate.custom_matrix_ = std::move(matrix);
        return gate;
    }

    /**
     * @brief Creates a built-in gate from its boundary-contract name.
     *
     * Names are case-insensitive. Accepted: h, x, y, z, s, sdg, t, tdg,
     * rx, ry, rz, cnot/cx, cz, swap, toffoli/ccx.
     *
     * @param name Gate name
     * @param params Rotation angle for rx/ry/rz, empty otherwise
     * @throws std::invalid_argument on unknown names or wrong parameter count
     */
    [[nodiscard]] static Gate fromName(std::string_view name,
                                       const std::vector<Angle>& params = {}) {
        std::string key(name);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        GateType type;
        if (key == "h") type = GateType::H;
        else if (key == "x") type = GateType::X;
        else if (key == "y") type = GateType::Y;
        else if (key == "z") type = GateType::Z;
        else if (key == "s") type = GateType::S;
        else if (key == "sdg") type = GateType::Sdg;
        else if (key == "t") type = GateType::T;
        else if (key == "tdg") type = GateType::Tdg;
        else if (key == "rx") type = GateType::Rx;
        else if (key == "ry") type = GateType::Ry;
        else if (key == "rz") type = GateType::Rz;
        else if (key == "cnot" || key == "cx") type = GateType::CNOT;
        else if (key == "cz") type = GateType::CZ;
        else if (key == "swap") type = GateType::SWAP;
        else if (key == "toffoli" || key == "ccx") type = GateType::Toffoli;
        else {
            throw std::invalid_argument("Unknown gate name '" + std::string(name) + "'");
        }

        const std::size_t expected = ir::isParameterized(type) ? 1 : 0;
        if (params.size() != expected) {
            throw std::invalid_argument(
                "Gate " + std::string(gateTypeName(type)) + " takes " +
                std::to_string(expected) + " parameter(s), got " +
                std::to_string(params.size()));
        }
        return Gate(type, params);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    /// @brief Returns the gate type.
    [[nodiscard]] GateType type() const noexcept { return type_; }

    /// @brief Returns the display name.
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// @brief Returns the number of qubits this gate acts on.
    [[nodiscard]] std::size_t numQubits() const noexcept { return num_qubits_; }

    /// @brief Returns the gate parameters (rotation angle for Rx/Ry/Rz).
    [[nodiscard]] const std::vector<Angle>& params() const noexcept { return params_; }

    /// @brief Returns whether this gate is parameterized.
    [[nodiscard]] bool isParameterized() const noexcept { return !params_.empty(); }

    /// @brief Returns whether this gate is in the Clifford set.
    [[nodiscard]] bool isClifford() const noexcept { return ir::isClifford(type_); }

    /// @brief Returns the dimension 2^k of the gate matrix.
    [[nodiscard]] std::size_t dimension() const noexcept {
        return std::size_t{1} << num_qubits_;
    }

    /**
     * @brief Returns the 2^k x 2^k unitary matrix.
     *
     * The first qubit in an instruction's qubit list is the most
     * significant bit of the matrix index.
     */
    [[nodiscard]] CMatrix matrix() const {
        const Complex i(0.0, 1.0);
        CMatrix m = CMatrix::Zero(static_cast<Eigen::Index>(dimension()),
                                  static_cast<Eigen::Index>(dimension()));
        switch (type_) {
            case GateType::H: {
                const double r = constants::INV_SQRT2;
                m << r, r,
                     r, -r;
                break;
            }
            case GateType::X:
                m << 0.0, 1.0,
                     1.0, 0.0;
                break;
            case GateType::Y:
                m << 0.0, -i,
                     i, 0.0;
                break;
            case GateType::Z:
                m << 1.0, 0.0,
                     0.0, -1.0;
                break;
            case GateType::S:
                m << 1.0, 0.0,
                     0.0, i;
                break;
            case GateType::Sdg:
                m << 1.0, 0.0,
                     0.0, -i;
                break;
            case GateType::T:
                m << 1.0, 0.0,
                     0.0, std::polar(1.0, constants::PI_4);
                break;
            case GateType::Tdg:
                m << 1.0, 0.0,
                     0.0, std::polar(1.0, -constants::PI_4);
                break;
            case GateType::Rx: {
                const double c = std::cos(params_[0] / 2.0);
                const double s = std::sin(params_[0] / 2.0);
                m << c, -i * s,
                     -i * s, c;
                break;
            }
            case GateType::Ry: {
                const double c = std::cos(params_[0] / 2.0);
                const double s = std::sin(params_[0] / 2.0);
                m << c, -s,
                     s, c;
                break;
            }
            case GateType::Rz:
                m << std::polar(1.0, -params_[0] / 2.0), 0.0,
                     0.0, std::polar(1.0, params_[0] / 2.0);
                break;
            case GateType::CNOT:
                m(0, 0) = 1.0;
                m(1, 1) = 1.0;
                m(2, 3) = 1.0;
                m(3, 2) = 1.0;
                break;
            case GateType::CZ:
                m(0, 0) = 1.0;
                m(1, 1) = 1.0;
                m(2, 2) = 1.0;
                m(3, 3) = -1.0;
                break;
            case GateType::SWAP:
                m(0, 0) = 1.0;
                m(1, 2) = 1.0;
                m(2, 1) = 1.0;
                m(3, 3) = 1.0;
                break;
            case GateType::Toffoli:
                // Identity except |110> <-> |111>
                m.setIdentity();
                m(6, 6) = 0.0;
                m(7, 7) = 0.0;
                m(6, 7) = 1.0;
                m(7, 6) = 1.0;
                break;
            case GateType::Custom:
                m = custom_matrix_;
                break;
        }
        return m;
    }

    // -------------------------------------------------------------------------
    // Operators
    // -------------------------------------------------------------------------

    /// @brief Equality comparison.
    [[nodiscard]] bool operator==(const Gate& other) const {
        if (type_ != other.type_ || name_ != other.name_ ||
            num_qubits_ != other.num_qubits_ || params_ != other.params_) {
            return false;
        }
        return type_ != GateType::Custom || custom_matrix_ == other.custom_matrix_;
    }

    /// @brief Inequality comparison.
    [[nodiscard]] bool operator!=(const Gate& other) const {
        return !(*this == other);
    }

    /// @brief Returns a string representation, e.g. "RZ(0.785398)".
    [[nodiscard]] std::string toString() const {
        std::string result = name_;
        if (!params_.empty()) {
            result += "(";
            for (std::size_t k = 0; k < params_.size(); ++k) {
                if (k > 0) result += ", ";
                result += std::to_string(params_[k]);
            }
            result += ")";
        }
        return result;
    }

private:
    GateType type_;
    std::string name_;
    std::size_t num_qubits_;
    std::vector<Angle> params_;
    CMatrix custom_matrix_;

    explicit Gate(GateType type, std::vector<Angle> params = {})
        : type_(type)
        , name_(gateTypeName(type))
        , num_qubits_(numQubitsFor(type))
        , params_(std::move(params))
    {}
};

}  // namespace qsim::ir
