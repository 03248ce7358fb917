// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file ExecutionResult.hpp
 * @brief Execution options, metadata and results returned by backends
 */

#pragma once

#include "../ir/Types.hpp"
#include "QuantumState.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qsim::sim {

/// @brief Outcomes of one shot, keyed by classical bit.
using MeasurementRecord = std::map<ClassicalBitIndex, int>;

/**
 * @brief How repeated shots relate to each other.
 */
enum class ShotMode {
    ReuseCollapsed,  ///< Each shot measures the state collapsed by the previous one
    Independent,     ///< Each shot measures a fresh copy of the post-gate state
};

[[nodiscard]] constexpr std::string_view shotModeName(ShotMode mode) noexcept {
    switch (mode) {
        case ShotMode::ReuseCollapsed: return "reuse";
        case ShotMode::Independent:    return "independent";
    }
    return "unknown";
}

/**
 * @brief Per-call execution options.
 */
struct ExecutionOptions {
    std::optional<QuantumState> initial_state;
    std::size_t shots = 1;
    bool record_history = false;
    ShotMode shot_mode = ShotMode::ReuseCollapsed;
};

/// @brief One noise channel application recorded by NoisyBackend.
struct NoiseApplication {
    std::size_t gate_index;
    QubitIndex qubit;
    std::string channel_name;
    double fidelity_before;  ///< F(rho before channel, rho after channel)
};

/**
 * @brief Typed execution metadata.
 */
struct ExecutionMetadata {
    std::string backend;
    std::optional<std::string> base_backend;
    std::size_t num_qubits = 0;
    std::size_t num_gates = 0;
    std::size_t circuit_depth = 0;
    std::size_t shots = 0;
    ShotMode shot_mode = ShotMode::ReuseCollapsed;
    std::optional<std::uint64_t> seed;
    std::optional<std::string> resource_warning;
    std::vector<std::string> notes;
    std::vector<NoiseApplication> noise_applications;

    [[nodiscard]] std::string toString() const {
        std::ostringstream os;
        os << "backend=" << backend;
        if (base_backend) os << " base=" << *base_backend;
        os << " qubits=" << num_qubits << " gates=" << num_gates
           << " depth=" << circuit_depth << " shots=" << shots
           << " shot_mode=" << shotModeName(shot_mode);
        if (seed) os << " seed=" << *seed;
        if (resource_warning) os << " warning=\"" << *resource_warning << "\"";
        if (!noise_applications.empty()) {
            os << " noise_applications=" << noise_applications.size();
        }
        for (const auto& note : notes) {
            os << "\n  note: " << note;
        }
        return os.str();
    }
};

/**
 * @brief Everything a backend returns from one execution.
 */
struct ExecutionResult {
    QuantumState state;
    std::vector<MeasurementRecord> measurements;
    std::vector<QuantumState> history;
    std::vector<QuantumState> ideal_history;
    ExecutionMetadata metadata;

    explicit ExecutionResult(QuantumState final_state)
        : state(std::move(final_state))
    {}

    /**
     * @brief Histogram of shot outcomes.
     *
     * Keys concatenate outcomes by ascending classical bit; shots without
     * measurements contribute to the empty key.
     */
    [[nodiscard]] std::map<std::string, std::size_t> counts() const {
        std::map<std::string, std::size_t> result;
        for (const auto& record : measurements) {
            std::string key;
            key.reserve(record.size());
            for (const auto& [bit, value] : record) {
                key.push_back(value == 0 ? '0' : '1');
            }
            ++result[key];
        }
        return result;
    }

    /**
     * @brief State after the last gate and before any shot.
     *
     * That is the last history snapshot when history was recorded;
     * otherwise the final state, which measurements may have collapsed.
     */
    [[nodiscard]] const QuantumState& preMeasurementState() const noexcept {
        return history.empty() ? state : history.back();
    }

    /// @brief Final-state basis probabilities, indexed by basis index.
    [[nodiscard]] std::vector<double> probabilities() const {
        return state.probabilities();
    }
};

}  // namespace qsim::sim
