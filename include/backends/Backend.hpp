// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Backend.hpp
 * @brief Abstract base class for simulation backends
 *
 * A Backend turns a Circuit into an ExecutionResult. The base class owns
 * the parts every strategy shares: seeding, initial-state preparation,
 * the gate loop, history snapshots, shot sampling, resource warnings and
 * metadata. Derived classes choose the state representation and may hook
 * into the loop after each gate.
 *
 * Execution proceeds as:
 * 1. Validate the circuit
 * 2. Prepare the initial state (|0...0> or caller supplied)
 * 3. Apply every gate in order, snapshotting if requested
 * 4. Sample shots by measuring the requested qubits
 * 5. Package state, records, history and metadata
 *
 * @see StatevectorBackend.hpp, DensityMatrixBackend.hpp,
 *      StabilizerBackend.hpp, NoisyBackend.hpp
 */

#pragma once

#include "../ir/Circuit.hpp"
#include "../logging/Logger.hpp"
#include "../sim/ExecutionResult.hpp"
#include "../sim/QuantumState.hpp"
#include "../sim/Random.hpp"
#include "../sim/SimulationError.hpp"
#include "../sim/TensorContraction.hpp"

#include <fmt/core.h>

#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace qsim::backends {

/**
 * @brief Answer to "can this backend run the circuit?".
 *
 * When supported is true, reason may still carry a non-fatal warning.
 */
struct Capability {
    bool supported = true;
    std::optional<std::string> reason;
};

/**
 * @brief Abstract base class for simulation backends.
 *
 * Example:
 * @code
 * Circuit circuit(2);
 * circuit.h(0).cnot(0, 1).measureAll();
 *
 * StatevectorBackend backend(42);
 * sim::ExecutionOptions options;
 * options.shots = 100;
 * auto result = backend.execute(circuit, options);
 * auto counts = result.counts();
 * @endcode
 */
class Backend {
public:
    virtual ~Backend() noexcept = default;

    // Non-copyable, movable
    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;
    Backend(Backend&&) noexcept = default;
    Backend& operator=(Backend&&) noexcept = default;

    /**
     * @brief Returns the backend name used in metadata and selection.
     */
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Reports whether the circuit can run here. Never throws.
     */
    [[nodiscard]] virtual Capability canExecute(const ir::Circuit& circuit) const noexcept = 0;

    /**
     * @brief Throws if the circuit cannot run on this backend.
     *
     * The base implementation re-validates every instruction and
     * measurement against the circuit's registers.
     */
    virtual void validateCircuit(const ir::Circuit& circuit) const {
        circuit.validate();
    }

    /**
     * @brief Executes a circuit with a fresh Rng from this backend's seed.
     *
     * Unseeded backends draw the seed from std::random_device.
     *
     * @throws std::invalid_argument if options.shots == 0
     * @throws sim::SimulationError subclasses on invalid circuits or states
     */
    [[nodiscard]] sim::ExecutionResult execute(const ir::Circuit& circuit,
                                               const sim::ExecutionOptions& options = {}) {
        sim::Rng rng = seed_.has_value() ? sim::Rng(*seed_) : sim::Rng::fromEntropy();
        return run(circuit, options, rng);
    }

    /**
     * @brief Executes a circuit drawing randomness from a caller-supplied Rng.
     */
    [[nodiscard]] virtual sim::ExecutionResult run(const ir::Circuit& circuit,
                                                   const sim::ExecutionOptions& options,
                                                   sim::Rng& rng) = 0;

    // -------------------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------------------

    [[nodiscard]] std::optional<std::uint64_t> seed() const noexcept { return seed_; }

    [[nodiscard]] const std::shared_ptr<logging::Logger>& logger() const noexcept { return logger_; }

    /// @brief Sets the log sink; nullptr restores the null logger.
    virtual void setLogger(std::shared_ptr<logging::Logger> logger) {
        logger_ = logger ? std::move(logger) : logging::nullLogger();
    }

    // -------------------------------------------------------------------------
    // Resource Estimation
    // -------------------------------------------------------------------------

    /**
     * @brief Bytes needed to store the state: 2^n * 16, or 4^n * 16 when mixed.
     */
    [[nodiscard]] static double estimateMemoryBytes(std::size_t num_qubits,
                                                    bool density_matrix) noexcept {
        const int exponent = static_cast<int>(density_matrix ? 2 * num_qubits : num_qubits);
        return std::ldexp(constants::BYTES_PER_AMPLITUDE, exponent);
    }

    /**
     * @brief Non-fatal warning when the estimate exceeds 10 GiB.
     */
    [[nodiscard]] static std::optional<std::string> memoryWarning(std::size_t num_qubits,
                                                                  bool density_matrix) {
        const double bytes = estimateMemoryBytes(num_qubits, density_matrix);
        if (bytes <= constants::MEMORY_WARNING_BYTES) {
            return std::nullopt;
        }
        return fmt::format("Warning: Circuit requires ~{:.2f}GB memory for {} qubits",
                           bytes / (1024.0 * 1024.0 * 1024.0), num_qubits);
    }

protected:
    /// @brief Called after each gate with the gate index, instruction,
    ///        working state and result under construction.
    using AfterGateHook = std::function<void(std::size_t,
                                             const ir::Instruction&,
                                             sim::QuantumState&,
                                             sim::ExecutionResult&)>;

    explicit Backend(std::optional<std::uint64_t> seed = std::nullopt)
        : seed_(seed)
        , logger_(logging::nullLogger())
    {}

    /**
     * @brief Builds the starting state for a run.
     * @param mixed Whether the backend evolves a density matrix
     * @throws sim::DimensionMismatchError if the qubit count differs from the
     *         circuit's, or a density matrix is given to a pure backend
     * @throws std::invalid_argument if the state is not normalized, or is a
     *         density matrix that is not Hermitian
     */
    [[nodiscard]] static sim::QuantumState initialState(const ir::Circuit& circuit,
                                                        const sim::ExecutionOptions& options,
                                                        bool mixed) {
        if (!options.initial_state.has_value()) {
            return sim::QuantumState::zero(circuit.numQubits(), mixed);
        }
        const auto& given = *options.initial_state;
        if (given.numQubits() != circuit.numQubits()) {
            throw sim::DimensionMismatchError(
                "Initial state has " + std::to_string(given.numQubits()) +
                " qubits but circuit has " + std::to_string(circuit.numQubits()));
        }
        if (!given.isNormalized()) {
            throw std::invalid_argument(given.isDensityMatrix()
                ? fmt::format("Initial density matrix has trace {:.6f}, expected 1",
                              given.trace())
                : fmt::format("Initial state has norm {:.6f}, expected 1", given.norm()));
        }
        if (!given.isHermitian(constants::NORM_TOLERANCE)) {
            throw std::invalid_argument("Initial density matrix is not Hermitian");
        }
        if (mixed) {
            return given.toDensityMatrix();
        }
        if (given.isDensityMatrix()) {
            throw sim::DimensionMismatchError(
                "Statevector simulation requires a pure initial state, got a density matrix");
        }
        return given.copy();
    }

    /**
     * @brief Shared gate loop and shot sampler.
     *
     * History, when requested, starts with the initial state and gets one
     * snapshot per gate, taken after the hook ran.
     *
     * @throws std::invalid_argument if options.shots == 0
     */
    [[nodiscard]] sim::ExecutionResult simulate(const ir::Circuit& circuit,
                                                sim::QuantumState state,
                                                const sim::ExecutionOptions& options,
                                                sim::Rng& rng,
                                                const AfterGateHook& after_gate = {}) const {
        if (options.shots == 0) {
            throw std::invalid_argument("Number of shots must be at least 1");
        }

        sim::ExecutionResult result(std::move(state));
        sim::ExecutionMetadata& meta = result.metadata;
        meta.backend = name();
        meta.num_qubits = circuit.numQubits();
        meta.num_gates = circuit.numGates();
        meta.circuit_depth = circuit.depth();
        meta.shots = options.shots;
        meta.shot_mode = options.shot_mode;
        meta.seed = rng.seed();
        meta.resource_warning = memoryWarning(circuit.numQubits(),
                                              result.state.isDensityMatrix());

        logger_->info(fmt::format("{}: executing {} qubits, {} gates, depth {}, {} shot(s)",
                                  meta.backend, meta.num_qubits, meta.num_gates,
                                  meta.circuit_depth, meta.shots));
        if (meta.resource_warning) {
            logger_->warn(*meta.resource_warning);
        }

        sim::QuantumState& working = result.state;
        if (options.record_history) {
            result.history.push_back(working.copy());
        }

        const auto& instructions = circuit.instructions();
        for (std::size_t i = 0; i < instructions.size(); ++i) {
            const auto& inst = instructions[i];
            sim::applyGate(working, inst.gate, inst.qubits);
            logger_->debug(fmt::format("gate {}: {}", i, inst.toString()));
            if (after_gate) {
                after_gate(i, inst, working, result);
            }
            if (options.record_history) {
                result.history.push_back(working.copy());
            }
        }

        sampleShots(circuit, working, options, rng, result.measurements);
        return result;
    }

private:
    std::optional<std::uint64_t> seed_;
    std::shared_ptr<logging::Logger> logger_;

    /**
     * @brief Draws every shot.
     *
     * ReuseCollapsed keeps measuring the working state, so shot s > 0
     * starts from the state collapsed by shot s - 1. Independent restores
     * the post-gate state before each shot.
     */
    static void sampleShots(const ir::Circuit& circuit,
                            sim::QuantumState& working,
                            const sim::ExecutionOptions& options,
                            sim::Rng& rng,
                            std::vector<sim::MeasurementRecord>& records) {
        records.reserve(options.shots);
        if (!circuit.hasMeasurements()) {
            records.assign(options.shots, sim::MeasurementRecord{});
            return;
        }

        std::optional<sim::QuantumState> post_gate;
        if (options.shot_mode == sim::ShotMode::Independent) {
            post_gate = working.copy();
        }

        for (std::size_t shot = 0; shot < options.shots; ++shot) {
            if (post_gate.has_value() && shot > 0) {
                working = post_gate->copy();
            }
            sim::MeasurementRecord record;
            for (const auto& m : circuit.measurements()) {
                record[m.classical_bit] = working.measure(m.qubit, rng, m.classical_bit);
            }
            records.push_back(std::move(record));
        }
    }
};

}  // namespace qsim::backends
