// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file main.cpp
 * @brief Command-line driver for the quantum circuit simulator
 *
 * Usage: qsim_demo [circuit] [config-file]
 *
 * circuit is one of bell, ghz, phase, noisy_bell (default bell). Settings
 * come from the config file, then QSIM_BACKEND, QSIM_SHOTS and QSIM_SEED.
 */

#include "backends/BackendSelector.hpp"
#include "config/ConfigLoader.hpp"
#include "config/SimulatorConfig.hpp"
#include "diagnostics/FailureDetection.hpp"
#include "ir/Circuit.hpp"
#include "logging/FmtLogger.hpp"
#include "metrics/Entanglement.hpp"
#include "metrics/Observables.hpp"

#include <fmt/core.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace qsim;

namespace {

std::optional<ir::Circuit> buildCircuit(const std::string& name) {
    if (name == "bell") {
        ir::Circuit c(2);
        c.h(0).cnot(0, 1).measureAll();
        return c;
    }
    if (name == "ghz") {
        ir::Circuit c(4);
        c.h(0).cnot(0, 1).cnot(1, 2).cnot(2, 3).measureAll();
        return c;
    }
    if (name == "phase") {
        // Phase kickback through T gates; not Clifford
        ir::Circuit c(2);
        c.h(0).x(1).t(0).t(0).h(0).measure(0);
        return c;
    }
    if (name == "noisy_bell") {
        ir::Circuit c(2);
        c.h(0).cnot(0, 1).x(0).x(0).measureAll();
        return c;
    }
    return std::nullopt;
}

void printResult(const ir::Circuit& circuit, const sim::ExecutionResult& result) {
    fmt::print("{}\n", circuit.toString());
    fmt::print("{}\n\n", result.metadata.toString());

    fmt::print("Counts:\n");
    for (const auto& [key, count] : result.counts()) {
        fmt::print("  {:>6}  {}\n", key.empty() ? "-" : key, count);
    }

    // Entropy and Bloch vectors describe the state after the last shot
    fmt::print("\nFinal state (after the last shot):\n");
    fmt::print("  purity: {:.6f}\n", result.state.purity());
    if (circuit.numQubits() > 1) {
        fmt::print("  S(q0): {:.6f} bits\n",
                   metrics::vonNeumannEntropy(result.state, std::vector<QubitIndex>{0}));
    }
    for (QubitIndex q = 0; q < circuit.numQubits(); ++q) {
        const auto r = metrics::blochVector(result.state, q);
        fmt::print("  bloch(q{}): ({:+.4f}, {:+.4f}, {:+.4f})\n", q, r[0], r[1], r[2]);
    }
}

}  // namespace

int main(int argc, char** argv) {
    const std::string circuit_name = argc > 1 ? argv[1] : "bell";

    config::SimulatorConfig cfg;
    if (circuit_name == "noisy_bell") {
        cfg.use_noise = true;
        cfg.noise.push_back({0, "depolarizing", 0.05});
        cfg.noise.push_back({1, "amplitude_damping", 0.1});
    }

    std::vector<std::string> errs;
    if (argc > 2) {
        errs = config::loadFromFile(cfg, argv[2]);
    }
    const auto env_errs = config::applyEnvOverrides(cfg);
    errs.insert(errs.end(), env_errs.begin(), env_errs.end());
    const auto invalid = config::validate(cfg);
    errs.insert(errs.end(), invalid.begin(), invalid.end());

    auto logger = std::make_shared<logging::FmtLogger>(cfg.debug);
    if (!errs.empty()) {
        for (const auto& e : errs) {
            logger->error(e);
        }
        return 1;
    }

    auto circuit = buildCircuit(circuit_name);
    if (!circuit) {
        logger->error(fmt::format("unknown circuit '{}' (expected bell, ghz, phase or noisy_bell)",
                                  circuit_name));
        return 1;
    }

    try {
        auto selection = backends::BackendSelector::select(
            *circuit, config::toSelectionOptions(cfg, logger));

        const auto capability = selection.backend->canExecute(*circuit);
        if (!capability.supported) {
            logger->error(capability.reason.value_or("circuit not supported"));
            return 1;
        }
        for (const auto& limitation :
             diagnostics::detectBackendLimitations(*circuit, selection.backend->name())) {
            logger->warn(limitation.toString());
        }

        auto result = selection.backend->execute(*circuit, config::toExecutionOptions(cfg));
        printResult(*circuit, result);
    } catch (const sim::SimulationError& e) {
        logger->error(fmt::format("simulation failed [{}]: {}",
                                  sim::errorKindName(e.kind()), e.message()));
        return 1;
    } catch (const std::exception& e) {
        logger->error(fmt::format("simulation failed: {}", e.what()));
        return 1;
    }

    return 0;
}
