// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file NoisyBackend.hpp
 * @brief Backend wrapper that injects noise channels after each gate
 *
 * The wrapper always evolves a density matrix. After every gate, each
 * touched qubit with registered channels has them applied in registration
 * order, and every application is recorded with the fidelity between the
 * state before and after the channel. The wrapped base backend decides
 * which circuits are accepted.
 *
 * @see NoiseChannel.hpp
 */

#pragma once

#include "Backend.hpp"
#include "DensityMatrixBackend.hpp"
#include "../metrics/Fidelity.hpp"
#include "../noise/NoiseChannel.hpp"

#include <fmt/core.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace qsim::backends {

class NoisyBackend : public Backend {
public:
    /**
     * @brief Wraps a base backend with a noise model.
     * @param base Capability gate; DensityMatrixBackend when null
     * @param noise_model Channels per qubit
     * @param seed Seed for measurement sampling
     */
    explicit NoisyBackend(std::unique_ptr<Backend> base = nullptr,
                          noise::NoiseModel noise_model = {},
                          std::optional<std::uint64_t> seed = std::nullopt)
        : Backend(seed)
        , base_(orDefault(std::move(base), seed))
        , noise_model_(std::move(noise_model))
    {}

    [[nodiscard]] std::string name() const override { return "noisy"; }

    [[nodiscard]] Capability canExecute(const ir::Circuit& circuit) const noexcept override {
        Capability base = base_->canExecute(circuit);
        if (!base.supported) {
            return base;
        }
        if (auto stray = noiseOutsideCircuit(circuit)) {
            return Capability{false, outOfRangeMessage(*stray, circuit)};
        }
        return Capability{true, memoryWarning(circuit.numQubits(), true)};
    }

    /**
     * @throws sim::QubitIndexError if the noise model targets a qubit the
     *         circuit does not have
     */
    void validateCircuit(const ir::Circuit& circuit) const override {
        base_->validateCircuit(circuit);
        if (auto stray = noiseOutsideCircuit(circuit)) {
            throw sim::QubitIndexError(outOfRangeMessage(*stray, circuit));
        }
    }

    void setLogger(std::shared_ptr<logging::Logger> logger) override {
        Backend::setLogger(logger);
        base_->setLogger(std::move(logger));
    }

    /// @brief Registers a channel on a qubit, after any already present.
    void addNoise(QubitIndex qubit, noise::NoiseChannel channel) {
        noise_model_[qubit].push_back(std::move(channel));
    }

    [[nodiscard]] const noise::NoiseModel& noiseModel() const noexcept { return noise_model_; }

    [[nodiscard]] const Backend& baseBackend() const noexcept { return *base_; }

    /**
     * @brief Runs the circuit on a density matrix with noise after each gate.
     *
     * ideal_history gets the post-gate, pre-noise state of every gate when
     * history is requested.
     */
    [[nodiscard]] sim::ExecutionResult run(const ir::Circuit& circuit,
                                           const sim::ExecutionOptions& options,
                                           sim::Rng& rng) override {
        validateCircuit(circuit);

        const auto inject = [this, &options](std::size_t gate_index,
                                             const ir::Instruction& inst,
                                             sim::QuantumState& state,
                                             sim::ExecutionResult& result) {
            if (options.record_history) {
                result.ideal_history.push_back(state.copy());
            }
            for (auto q : inst.qubits) {
                auto it = noise_model_.find(q);
                if (it == noise_model_.end()) {
                    continue;
                }
                for (const auto& channel : it->second) {
                    const CMatrix before = state.densityMatrix();
                    channel.apply(state, q);
                    const double fidelity =
                        metrics::densityMatrixFidelity(before, state.densityMatrix());
                    logger()->debug(fmt::format("gate {}: {} on qubit {} (fidelity {:.6f})",
                                                gate_index, channel.toString(), q, fidelity));
                    result.metadata.noise_applications.push_back(
                        sim::NoiseApplication{gate_index, q, channel.name(), fidelity});
                }
            }
        };

        sim::ExecutionResult result =
            simulate(circuit, initialState(circuit, options, true), options, rng, inject);
        result.metadata.base_backend = base_->name();
        return result;
    }

private:
    std::unique_ptr<Backend> base_;
    noise::NoiseModel noise_model_;

    [[nodiscard]] std::optional<QubitIndex> noiseOutsideCircuit(const ir::Circuit& circuit) const noexcept {
        for (const auto& [qubit, channels] : noise_model_) {
            if (!channels.empty() && !ir::isValidQubit(qubit, circuit.numQubits())) {
                return qubit;
            }
        }
        return std::nullopt;
    }

    static std::string outOfRangeMessage(QubitIndex qubit, const ir::Circuit& circuit) {
        return fmt::format("Noise model targets qubit {} but circuit has {} qubits",
                           qubit, circuit.numQubits());
    }

    static std::unique_ptr<Backend> orDefault(std::unique_ptr<Backend> base,
                                              std::optional<std::uint64_t> seed) {
        if (base) {
            return base;
        }
        return std::make_unique<DensityMatrixBackend>(seed);
    }
};

}  // namespace qsim::backends
