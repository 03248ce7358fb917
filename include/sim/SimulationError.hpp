// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file SimulationError.hpp
 * @brief Error taxonomy for the simulation engine
 *
 * Every engine failure is a SimulationError carrying an ErrorKind. Concrete
 * subclasses exist per kind so callers can catch exactly what they handle.
 * Construction-time violations (unitarity, completeness, parameter range)
 * are raised immediately and never corrected silently.
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace qsim::sim {

/**
 * @brief Category of simulation error.
 */
enum class ErrorKind {
    QubitIndex,               ///< Qubit outside [0, n) or repeated in one gate
    GateArity,                ///< Qubit list length differs from gate arity
    NonUnitaryGate,           ///< Custom gate matrix is not unitary
    InvalidChannelParameter,  ///< Channel probability outside [0, 1]
    IncompleteChannel,        ///< Kraus set violates completeness
    DimensionMismatch,        ///< State or matrix shape does not fit
    NonCliffordGate,          ///< Stabilizer backend got a non-Clifford gate
    MixedStateExtraction,     ///< Statevector requested from a mixed state
    UnknownBackend,           ///< Backend name not recognized
    ClassicalBitIndex,        ///< Classical bit outside the register
};

/**
 * @brief Get string representation of error kind.
 */
[[nodiscard]] constexpr std::string_view errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::QubitIndex:              return "qubit index error";
        case ErrorKind::GateArity:               return "gate arity error";
        case ErrorKind::NonUnitaryGate:          return "non-unitary gate error";
        case ErrorKind::InvalidChannelParameter: return "invalid channel parameter error";
        case ErrorKind::IncompleteChannel:       return "incomplete channel error";
        case ErrorKind::DimensionMismatch:       return "dimension mismatch error";
        case ErrorKind::NonCliffordGate:         return "non-Clifford gate error";
        case ErrorKind::MixedStateExtraction:    return "mixed state extraction error";
        case ErrorKind::UnknownBackend:          return "unknown backend error";
        case ErrorKind::ClassicalBitIndex:       return "classical bit index error";
    }
    return "error";
}

/**
 * @brief Base exception for all engine errors.
 *
 * Inherits from std::runtime_error for compatibility with standard
 * exception handling. what() is formatted as "kind: message".
 */
class SimulationError : public std::runtime_error {
public:
    SimulationError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(errorKindName(kind)) + ": " + message)
        , kind_(kind)
        , message_(message) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    /// @brief Message without the kind prefix.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    ErrorKind kind_;
    std::string message_;
};

class QubitIndexError : public SimulationError {
public:
    explicit QubitIndexError(const std::string& message)
        : SimulationError(ErrorKind::QubitIndex, message) {}
};

class GateArityError : public SimulationError {
public:
    explicit GateArityError(const std::string& message)
        : SimulationError(ErrorKind::GateArity, message) {}
};

class NonUnitaryGateError : public SimulationError {
public:
    explicit NonUnitaryGateError(const std::string& message)
        : SimulationError(ErrorKind::NonUnitaryGate, message) {}
};

class InvalidChannelParameterError : public SimulationError {
public:
    explicit InvalidChannelParameterError(const std::string& message)
        : SimulationError(ErrorKind::InvalidChannelParameter, message) {}
};

class IncompleteChannelError : public SimulationError {
public:
    explicit IncompleteChannelError(const std::string& message)
        : SimulationError(ErrorKind::IncompleteChannel, message) {}
};

class DimensionMismatchError : public SimulationError {
public:
    explicit DimensionMismatchError(const std::string& message)
        : SimulationError(ErrorKind::DimensionMismatch, message) {}
};

class NonCliffordGateError : public SimulationError {
public:
    explicit NonCliffordGateError(const std::string& message)
        : SimulationError(ErrorKind::NonCliffordGate, message) {}
};

class MixedStateExtractionError : public SimulationError {
public:
    explicit MixedStateExtractionError(const std::string& message)
        : SimulationError(ErrorKind::MixedStateExtraction, message) {}
};

class UnknownBackendError : public SimulationError {
public:
    explicit UnknownBackendError(const std::string& message)
        : SimulationError(ErrorKind::UnknownBackend, message) {}
};

class ClassicalBitIndexError : public SimulationError {
public:
    explicit ClassicalBitIndexError(const std::string& message)
        : SimulationError(ErrorKind::ClassicalBitIndex, message) {}
};

}  // namespace qsim::sim
