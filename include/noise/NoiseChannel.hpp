// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file NoiseChannel.hpp
 * @brief Single-qubit noise channels and noise models
 *
 * Provides the NoiseChannel class: a named, parameterized, stateless set of
 * 2x2 Kraus operators. Built-in families are constructed through factory
 * methods that reject out-of-range parameters; custom channels are checked
 * for completeness.
 *
 * @see Kraus.hpp for the application routines
 * @see NoisyBackend.hpp for per-gate noise injection
 */

#pragma once

#include "Kraus.hpp"
#include "../ir/Types.hpp"
#include "../sim/QuantumState.hpp"
#include "../sim/SimulationError.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qsim::noise {

/**
 * @brief Enumeration of noise channel families.
 */
enum class ChannelKind {
    Depolarizing,      ///< Symmetric Pauli error with probability p
    AmplitudeDamping,  ///< Energy relaxation |1> -> |0> with probability gamma
    PhaseDamping,      ///< Loss of coherence without energy loss
    BitFlip,           ///< X error with probability p
    PhaseFlip,         ///< Z error with probability p
    Custom             ///< User-supplied Kraus set
};

/// @brief Returns the display name of a channel family.
[[nodiscard]] constexpr std::string_view channelKindName(ChannelKind kind) noexcept {
    switch (kind) {
        case ChannelKind::Depolarizing:     return "Depolarizing";
        case ChannelKind::AmplitudeDamping: return "AmplitudeDamping";
        case ChannelKind::PhaseDamping:     return "PhaseDamping";
        case ChannelKind::BitFlip:          return "BitFlip";
        case ChannelKind::PhaseFlip:        return "PhaseFlip";
        case ChannelKind::Custom:           return "Custom";
    }
    return "Unknown";
}

/**
 * @brief A single-qubit quantum channel defined by Kraus operators.
 *
 * Example:
 * @code
 * auto rho = sim::QuantumState::zero(1, true);
 * auto channel = NoiseChannel::amplitudeDamping(0.1);
 * channel.apply(rho, 0);
 * @endcode
 */
class NoiseChannel {
public:
    // -------------------------------------------------------------------------
    // Factory Methods
    // -------------------------------------------------------------------------

    /// @brief sqrt(1-p) I, sqrt(p/3) X, sqrt(p/3) Y, sqrt(p/3) Z
    [[nodiscard]] static NoiseChannel depolarizing(double p) {
        checkProbability(p, "Error probability p");
        const double a = std::sqrt(1.0 - p);
        const double b = std::sqrt(p / 3.0);
        return NoiseChannel(ChannelKind::Depolarizing, {{"p", p}},
                            {a * identity(), b * pauliX(), b * pauliY(), b * pauliZ()});
    }

    /// @brief [[1,0],[0,sqrt(1-gamma)]], [[0,sqrt(gamma)],[0,0]]
    [[nodiscard]] static NoiseChannel amplitudeDamping(double gamma) {
        checkProbability(gamma, "Damping parameter gamma");
        CMatrix k0 = CMatrix::Zero(2, 2);
        k0(0, 0) = 1.0;
        k0(1, 1) = std::sqrt(1.0 - gamma);
        CMatrix k1 = CMatrix::Zero(2, 2);
        k1(0, 1) = std::sqrt(gamma);
        return NoiseChannel(ChannelKind::AmplitudeDamping, {{"gamma", gamma}},
                            {std::move(k0), std::move(k1)});
    }

    /// @brief sqrt(1-gamma) I, sqrt(gamma) |0><0|, sqrt(gamma) |1><1|
    [[nodiscard]] static NoiseChannel phaseDamping(double gamma) {
        checkProbability(gamma, "Damping parameter gamma");
        const double s = std::sqrt(gamma);
        CMatrix p0 = CMatrix::Zero(2, 2);
        p0(0, 0) = s;
        CMatrix p1 = CMatrix::Zero(2, 2);
        p1(1, 1) = s;
        return NoiseChannel(ChannelKind::PhaseDamping, {{"gamma", gamma}},
                            {std::sqrt(1.0 - gamma) * identity(), std::move(p0), std::move(p1)});
    }

    /// @brief sqrt(1-p) I, sqrt(p) X
    [[nodiscard]] static NoiseChannel bitFlip(double p) {
        checkProbability(p, "Error probability p");
        return NoiseChannel(ChannelKind::BitFlip, {{"p", p}},
                            {std::sqrt(1.0 - p) * identity(), std::sqrt(p) * pauliX()});
    }

    /// @brief sqrt(1-p) I, sqrt(p) Z
    [[nodiscard]] static NoiseChannel phaseFlip(double p) {
        checkProbability(p, "Error probability p");
        return NoiseChannel(ChannelKind::PhaseFlip, {{"p", p}},
                            {std::sqrt(1.0 - p) * identity(), std::sqrt(p) * pauliZ()});
    }

    /**
     * @brief Creates a channel from an arbitrary single-qubit Kraus set.
     * @throws sim::DimensionMismatchError if the set is empty or an operator is not 2x2
     * @throws sim::IncompleteChannelError if sum K^dagger K != I within 1e-8
     */
    [[nodiscard]] static NoiseChannel custom(std::string name, KrausSet ops) {
        if (ops.empty()) {
            throw sim::DimensionMismatchError("Channel " + name + " has no Kraus operators");
        }
        for (const auto& k : ops) {
            if (k.rows() != 2 || k.cols() != 2) {
                throw sim::DimensionMismatchError(
                    "Channel " + name + " Kraus operators must be 2x2, got " +
                    std::to_string(k.rows()) + "x" + std::to_string(k.cols()));
            }
        }
        if (!verifyCompleteness(ops)) {
            throw sim::IncompleteChannelError(
                "Kraus operators of channel " + name +
                " do not satisfy completeness condition");
        }
        NoiseChannel channel(ChannelKind::Custom, {}, std::move(ops));
        channel.name_ = std::move(name);
        return channel;
    }

    /**
     * @brief Creates a built-in channel from its configuration name.
     *
     * Accepted (case-insensitive): depolarizing, amplitude_damping,
     * phase_damping, bit_flip, phase_flip.
     *
     * @throws std::invalid_argument for unknown names
     * @throws sim::InvalidChannelParameterError for out-of-range parameters
     */
    [[nodiscard]] static NoiseChannel fromName(std::string_view name, double parameter) {
        std::string key(name);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (key == "depolarizing") return depolarizing(parameter);
        if (key == "amplitude_damping") return amplitudeDamping(parameter);
        if (key == "phase_damping") return phaseDamping(parameter);
        if (key == "bit_flip") return bitFlip(parameter);
        if (key == "phase_flip") return phaseFlip(parameter);
        throw std::invalid_argument("Unknown noise channel '" + std::string(name) + "'");
    }

    // -------------------------------------------------------------------------
    // Application
    // -------------------------------------------------------------------------

    /**
     * @brief Applies the channel to one qubit of a density matrix in place.
     * @throws std::invalid_argument if the state is a statevector
     * @throws sim::QubitIndexError if qubit is out of range
     */
    void apply(sim::QuantumState& state, QubitIndex qubit) const {
        applyKraus(state, kraus_, qubit);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] ChannelKind kind() const noexcept { return kind_; }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const std::map<std::string, double>& params() const noexcept {
        return params_;
    }

    [[nodiscard]] const KrausSet& krausOperators() const noexcept { return kraus_; }

    /// @brief e.g. "Depolarizing(p=0.01)"
    [[nodiscard]] std::string toString() const {
        std::ostringstream os;
        os << name_ << "(";
        bool first = true;
        for (const auto& [key, value] : params_) {
            if (!first) os << ", ";
            os << key << "=" << value;
            first = false;
        }
        os << ")";
        return os.str();
    }

private:
    ChannelKind kind_;
    std::string name_;
    std::map<std::string, double> params_;
    KrausSet kraus_;

    NoiseChannel(ChannelKind kind, std::map<std::string, double> params, KrausSet kraus)
        : kind_(kind)
        , name_(channelKindName(kind))
        , params_(std::move(params))
        , kraus_(std::move(kraus))
    {}

    static void checkProbability(double value, const char* what) {
        if (std::isnan(value) || value < 0.0 || value > 1.0) {
            throw sim::InvalidChannelParameterError(
                std::string(what) + " must be in [0, 1], got " + std::to_string(value));
        }
    }

    static CMatrix identity() { return CMatrix::Identity(2, 2); }

    static CMatrix pauliX() {
        CMatrix m(2, 2);
        m << 0.0, 1.0,
             1.0, 0.0;
        return m;
    }

    static CMatrix pauliY() {
        const Complex i(0.0, 1.0);
        CMatrix m(2, 2);
        m << 0.0, -i,
             i, 0.0;
        return m;
    }

    static CMatrix pauliZ() {
        CMatrix m(2, 2);
        m << 1.0, 0.0,
             0.0, -1.0;
        return m;
    }
};

/// @brief Per-qubit noise channels, applied in registration order.
using NoiseModel = std::map<QubitIndex, std::vector<NoiseChannel>>;

}  // namespace qsim::noise
