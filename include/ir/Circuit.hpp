// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Circuit.hpp
 * @brief Quantum circuit container and operations
 *
 * Provides the Circuit class for building quantum circuits to simulate.
 * A circuit is a fixed-size qubit register, a classical register, an
 * ordered list of instructions (gate + target qubits) and an ordered list
 * of measurement requests. Every instruction is validated on insertion.
 *
 * @see Gate.hpp for gate representation
 * @see Backend.hpp for execution
 */

#pragma once

#include "Gate.hpp"
#include "Qubit.hpp"
#include "Types.hpp"
#include "../sim/SimulationError.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace qsim::ir {

/**
 * @brief A gate bound to the qubits it acts on.
 *
 * The first qubit in the list is the most significant bit of the gate's
 * local index (for CNOT: control, then target).
 */
struct Instruction {
    Gate gate;
    std::vector<QubitIndex> qubits;

    [[nodiscard]] std::string toString() const {
        std::string result = gate.toString() + " q[";
        for (std::size_t k = 0; k < qubits.size(); ++k) {
            if (k > 0) result += ", ";
            result += std::to_string(qubits[k]);
        }
        return result + "]";
    }
};

/// @brief Request to measure a qubit into a classical bit.
struct MeasurementRequest {
    QubitIndex qubit;
    ClassicalBitIndex classical_bit;

    [[nodiscard]] bool operator==(const MeasurementRequest& other) const noexcept {
        return qubit == other.qubit && classical_bit == other.classical_bit;
    }
};

/**
 * @brief A quantum circuit consisting of qubits, instructions and measurements.
 *
 * Instructions are stored in application order and can be iterated.
 *
 * Example:
 * @code
 * Circuit circuit(2);
 * circuit.h(0).cnot(0, 1);
 * circuit.measureAll();
 *
 * for (const auto& inst : circuit) {
 *     std::cout << inst.toString() << "\n";
 * }
 * @endcode
 */
class Circuit {
public:
    using iterator = std::vector<Instruction>::iterator;
    using const_iterator = std::vector<Instruction>::const_iterator;

    /**
     * @brief Constructs an empty circuit.
     * @param num_qubits Number of qubits in the register
     * @param num_classical_bits Initial size of the classical register
     * @throws std::invalid_argument if num_qubits is 0 or exceeds MAX_QUBITS
     */
    explicit Circuit(std::size_t num_qubits, std::size_t num_classical_bits = 0)
        : num_qubits_(num_qubits)
        , num_classical_bits_(num_classical_bits)
    {
        if (num_qubits == 0) {
            throw std::invalid_argument("Circuit must have at least 1 qubit");
        }
        if (num_qubits > constants::MAX_QUBITS) {
            throw std::invalid_argument(
                "Circuit exceeds maximum qubit count of " +
                std::to_string(constants::MAX_QUBITS));
        }
    }

    // Move semantics (circuits can be large)
    Circuit(Circuit&&) noexcept = default;
    Circuit& operator=(Circuit&&) noexcept = default;

    // Delete copy (use clone() if needed)
    Circuit(const Circuit&) = delete;
    Circuit& operator=(const Circuit&) = delete;

    ~Circuit() noexcept = default;

    // -------------------------------------------------------------------------
    // Instruction Management
    // -------------------------------------------------------------------------

    /**
     * @brief Appends a gate acting on the given qubits.
     * @param gate The gate to add
     * @param qubits Target qubits, length equal to the gate arity
     * @throws sim::GateArityError if qubits.size() != gate.numQubits()
     * @throws sim::QubitIndexError if a qubit is out of range or repeated
     */
    Circuit& addGate(Gate gate, std::vector<QubitIndex> qubits) {
        validateInstruction(gate, qubits);
        instructions_.push_back(Instruction{std::move(gate), std::move(qubits)});
        return *this;
    }

    /**
     * @brief Appends a built-in gate by name (the external circuit contract).
     * @param name Gate name, see Gate::fromName
     * @param params Gate parameters
     * @param qubits Target qubits
     * @throws std::invalid_argument for unknown names or parameter counts
     */
    Circuit& addGate(std::string_view name,
                     const std::vector<Angle>& params,
                     std::vector<QubitIndex> qubits) {
        return addGate(Gate::fromName(name, params), std::move(qubits));
    }

    /**
     * @brief Requests a measurement of a qubit.
     *
     * Without an explicit classical bit, the bit index is the number of
     * previous measurement requests; the classical register grows to fit.
     *
     * @param qubit Qubit to measure
     * @param classical_bit Target classical bit
     * @throws sim::QubitIndexError if qubit is out of range
     * @throws sim::ClassicalBitIndexError if an explicit bit is out of range
     */
    Circuit& measure(QubitIndex qubit,
                     std::optional<ClassicalBitIndex> classical_bit = std::nullopt) {
        if (!isValidQubit(qubit, num_qubits_)) {
            throw sim::QubitIndexError(
                "Measurement references qubit " + std::to_string(qubit) +
                " but circuit only has " + std::to_string(num_qubits_) + " qubits");
        }
        ClassicalBitIndex bit;
        if (classical_bit.has_value()) {
            bit = *classical_bit;
            if (bit >= num_classical_bits_) {
                throw sim::ClassicalBitIndexError(
                    "Classical bit " + std::to_string(bit) +
                    " out of range [0, " + std::to_string(num_classical_bits_) + ")");
            }
        } else {
            bit = measurements_.size();
            num_classical_bits_ = std::max(num_classical_bits_, bit + 1);
        }
        measurements_.push_back(MeasurementRequest{qubit, bit});
        return *this;
    }

    /// @brief Measures every qubit q into classical bit q.
    Circuit& measureAll() {
        num_classical_bits_ = std::max(num_classical_bits_, num_qubits_);
        for (QubitIndex q = 0; q < num_qubits_; ++q) {
            measurements_.push_back(MeasurementRequest{q, q});
        }
        return *this;
    }

    // Builders for the built-in gates
    Circuit& h(QubitIndex q) { return addGate(Gate::h(), {q}); }
    Circuit& x(QubitIndex q) { return addGate(Gate::x(), {q}); }
    Circuit& y(QubitIndex q) { return addGate(Gate::y(), {q}); }
    Circuit& z(QubitIndex q) { return addGate(Gate::z(), {q}); }
    Circuit& s(QubitIndex q) { return addGate(Gate::s(), {q}); }
    Circuit& sdg(QubitIndex q) { return addGate(Gate::sdg(), {q}); }
    Circuit& t(QubitIndex q) { return addGate(Gate::t(), {q}); }
    Circuit& tdg(QubitIndex q) { return addGate(Gate::tdg(), {q}); }
    Circuit& rx(QubitIndex q, Angle theta) { return addGate(Gate::rx(theta), {q}); }
    Circuit& ry(QubitIndex q, Angle theta) { return addGate(Gate::ry(theta), {q}); }
    Circuit& rz(QubitIndex q, Angle theta) { return addGate(Gate::rz(theta), {q}); }
    Circuit& cnot(QubitIndex control, QubitIndex target) {
        return addGate(Gate::cnot(), {control, target});
    }
    Circuit& cz(QubitIndex q1, QubitIndex q2) { return addGate(Gate::cz(), {q1, q2}); }
    Circuit& swap(QubitIndex q1, QubitIndex q2) { return addGate(Gate::swap(), {q1, q2}); }
    Circuit& toffoli(QubitIndex c1, QubitIndex c2, QubitIndex target) {
        return addGate(Gate::toffoli(), {c1, c2, target});
    }

    /**
     * @brief Returns the instruction at the specified index.
     * @throws std::out_of_range if index >= numGates()
     */
    [[nodiscard]] const Instruction& instruction(std::size_t index) const {
        if (index >= instructions_.size()) {
            throw std::out_of_range(
                "Instruction index " + std::to_string(index) +
                " out of range [0, " + std::to_string(instructions_.size()) + ")");
        }
        return instructions_[index];
    }

    [[nodiscard]] const std::vector<Instruction>& instructions() const noexcept {
        return instructions_;
    }

    [[nodiscard]] const std::vector<MeasurementRequest>& measurements() const noexcept {
        return measurements_;
    }

    /// @brief Removes all instructions and measurements.
    void clear() noexcept {
        instructions_.clear();
        measurements_.clear();
    }

    // -------------------------------------------------------------------------
    // Circuit Properties
    // -------------------------------------------------------------------------

    /// @brief Returns the number of qubits in the circuit.
    [[nodiscard]] std::size_t numQubits() const noexcept { return num_qubits_; }

    /// @brief Returns the size of the classical register.
    [[nodiscard]] std::size_t numClassicalBits() const noexcept { return num_classical_bits_; }

    /// @brief Returns the number of gates in the circuit.
    [[nodiscard]] std::size_t numGates() const noexcept { return instructions_.size(); }

    /// @brief Returns true if the circuit has no gates.
    [[nodiscard]] bool empty() const noexcept { return instructions_.empty(); }

    /// @brief Returns true if at least one measurement was requested.
    [[nodiscard]] bool hasMeasurements() const noexcept { return !measurements_.empty(); }

    /**
     * @brief Calculates the circuit depth.
     *
     * Depth is the maximum number of gates on any single qubit path,
     * representing the critical path length.
     *
     * @return Circuit depth (0 for empty circuits)
     */
    [[nodiscard]] std::size_t depth() const {
        if (instructions_.empty()) {
            return 0;
        }

        std::vector<std::size_t> qubit_depths(num_qubits_, 0);

        for (const auto& inst : instructions_) {
            std::size_t max_depth = 0;
            for (auto q : inst.qubits) {
                max_depth = std::max(max_depth, qubit_depths[q]);
            }
            for (auto q : inst.qubits) {
                qubit_depths[q] = max_depth + 1;
            }
        }

        return *std::max_element(qubit_depths.begin(), qubit_depths.end());
    }

    /**
     * @brief Counts gates of a specific type.
     * @param type The gate type to count
     */
    [[nodiscard]] std::size_t countGates(GateType type) const noexcept {
        return static_cast<std::size_t>(
            std::count_if(instructions_.begin(), instructions_.end(),
                          [type](const Instruction& i) { return i.gate.type() == type; }));
    }

    /// @brief Gate counts keyed by gate name.
    [[nodiscard]] std::map<std::string, std::size_t> gateCounts() const {
        std::map<std::string, std::size_t> counts;
        for (const auto& inst : instructions_) {
            ++counts[inst.gate.name()];
        }
        return counts;
    }

    /**
     * @brief Counts two-qubit gates in the circuit.
     * @return Number of two-qubit gates
     */
    [[nodiscard]] std::size_t countTwoQubitGates() const noexcept {
        return static_cast<std::size_t>(
            std::count_if(instructions_.begin(), instructions_.end(),
                          [](const Instruction& i) { return i.gate.numQubits() == 2; }));
    }

    /**
     * @brief Re-validates every instruction and measurement.
     *
     * Backends call this before simulation.
     * @throws sim::GateArityError, sim::QubitIndexError, sim::ClassicalBitIndexError
     */
    void validate() const {
        for (const auto& inst : instructions_) {
            validateInstruction(inst.gate, inst.qubits);
        }
        for (const auto& m : measurements_) {
            if (!isValidQubit(m.qubit, num_qubits_)) {
                throw sim::QubitIndexError(
                    "Measurement references qubit " + std::to_string(m.qubit));
            }
            if (m.classical_bit >= num_classical_bits_) {
                throw sim::ClassicalBitIndexError(
                    "Classical bit " + std::to_string(m.classical_bit) +
                    " out of range [0, " + std::to_string(num_classical_bits_) + ")");
            }
        }
    }

    // -------------------------------------------------------------------------
    // Iteration
    // -------------------------------------------------------------------------

    [[nodiscard]] iterator begin() noexcept { return instructions_.begin(); }
    [[nodiscard]] iterator end() noexcept { return instructions_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return instructions_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return instructions_.end(); }
    [[nodiscard]] const_iterator cbegin() const noexcept { return instructions_.cbegin(); }
    [[nodiscard]] const_iterator cend() const noexcept { return instructions_.cend(); }

    // -------------------------------------------------------------------------
    // Utilities
    // -------------------------------------------------------------------------

    /**
     * @brief Creates a deep copy of the circuit.
     * @return New circuit with copied instructions and measurements
     */
    [[nodiscard]] Circuit clone() const {
        Circuit copy(num_qubits_, num_classical_bits_);
        copy.instructions_ = instructions_;
        copy.measurements_ = measurements_;
        return copy;
    }

    /**
     * @brief Returns a string representation of the circuit.
     * @return Multi-line string showing circuit structure
     */
    [[nodiscard]] std::string toString() const {
        std::string result = "Circuit(" + std::to_string(num_qubits_) +
                             " qubits, " + std::to_string(instructions_.size()) +
                             " gates, depth " + std::to_string(depth()) + "):\n";
        for (const auto& inst : instructions_) {
            result += "  " + inst.toString() + "\n";
        }
        for (const auto& m : measurements_) {
            result += "  measure q[" + std::to_string(m.qubit) + "] -> c[" +
                      std::to_string(m.classical_bit) + "]\n";
        }
        return result;
    }

private:
    std::size_t num_qubits_;
    std::size_t num_classical_bits_;
    std::vector<Instruction> instructions_;
    std::vector<MeasurementRequest> measurements_;

    void validateInstruction(const Gate& g, const std::vector<QubitIndex>& qubits) const {
        if (qubits.size() != g.numQubits()) {
            throw sim::GateArityError(
                "Gate " + g.name() + " acts on " + std::to_string(g.numQubits()) +
                " qubit(s) but " + std::to_string(qubits.size()) + " were given");
        }
        for (std::size_t k = 0; k < qubits.size(); ++k) {
            if (!isValidQubit(qubits[k], num_qubits_)) {
                throw sim::QubitIndexError(
                    "Gate " + g.name() + " references qubit " +
                    std::to_string(qubits[k]) + " but circuit only has " +
                    std::to_string(num_qubits_) + " qubits");
            }
            for (std::size_t j = 0; j < k; ++j) {
                if (qubits[j] == qubits[k]) {
                    throw sim::QubitIndexError(
                        "Gate " + g.name() + " uses qubit " +
                        std::to_string(qubits[k]) + " more than once");
                }
            }
        }
    }
};

}  // namespace qsim::ir
