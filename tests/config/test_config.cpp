// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file test_config.cpp
 * @brief Unit tests for configuration parsing, validation and translation
 */

#include "config/ConfigLoader.hpp"
#include "config/SimulatorConfig.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

namespace qsim::config {
namespace {

bool anyContains(const std::vector<std::string>& messages, const std::string& needle) {
    for (const auto& m : messages) {
        if (m.find(needle) != std::string::npos) return true;
    }
    return false;
}

// =============================================================================
// Parsing Tests
// =============================================================================

TEST(ConfigParseTest, DefaultsAreUsable) {
    SimulatorConfig cfg;
    EXPECT_EQ(cfg.backend, "auto");
    EXPECT_EQ(cfg.shots, 1u);
    EXPECT_FALSE(cfg.seed.has_value());
    EXPECT_EQ(cfg.shot_mode, sim::ShotMode::ReuseCollapsed);
    EXPECT_TRUE(validate(cfg).empty());
}

TEST(ConfigParseTest, ReadsEverySetting) {
    SimulatorConfig cfg;
    const std::string text =
        "# run settings\n"
        "backend = Density_Matrix\n"
        "shots=250\n"
        "seed=42\n"
        "\n"
        "history=yes\n"
        "shot_mode=independent\n"
        "debug=on\n"
        "noise.0=depolarizing:0.01, amplitude_damping:0.05\n"
        "noise.2=bit_flip:0.1\n";

    auto errs = loadFromString(cfg, text);
    EXPECT_TRUE(errs.empty());
    EXPECT_EQ(cfg.backend, "density_matrix");
    EXPECT_EQ(cfg.shots, 250u);
    ASSERT_TRUE(cfg.seed.has_value());
    EXPECT_EQ(*cfg.seed, 42u);
    EXPECT_TRUE(cfg.record_history);
    EXPECT_EQ(cfg.shot_mode, sim::ShotMode::Independent);
    EXPECT_TRUE(cfg.debug);
    EXPECT_TRUE(cfg.use_noise);

    ASSERT_EQ(cfg.noise.size(), 3u);
    EXPECT_EQ(cfg.noise[0].qubit, 0u);
    EXPECT_EQ(cfg.noise[0].channel, "depolarizing");
    EXPECT_DOUBLE_EQ(cfg.noise[1].parameter, 0.05);
    EXPECT_EQ(cfg.noise[2].qubit, 2u);
    EXPECT_EQ(cfg.noise[2].channel, "bit_flip");
}

TEST(ConfigParseTest, ReportsBadLinesAndKeepsGoodOnes) {
    SimulatorConfig cfg;
    const std::string text =
        "shots=12\n"
        "this line has no equals\n"
        "shots=-4\n"
        "seed=abc\n"
        "history=maybe\n"
        "shot_mode=sometimes\n"
        "colour=blue\n"
        "noise.1=depolarizing\n";

    auto errs = loadFromString(cfg, text);
    ASSERT_EQ(errs.size(), 7u);
    EXPECT_EQ(errs[0], "line 2: expected key=value");
    EXPECT_TRUE(anyContains(errs, "line 3: shots:"));
    EXPECT_TRUE(anyContains(errs, "line 4: seed:"));
    EXPECT_TRUE(anyContains(errs, "line 7: colour: unknown key 'colour'"));
    EXPECT_TRUE(anyContains(errs, "must be <channel>:<parameter>"));
    EXPECT_EQ(cfg.shots, 12u);
    EXPECT_FALSE(cfg.seed.has_value());
    EXPECT_FALSE(cfg.use_noise);
}

TEST(ConfigParseTest, RejectsTrailingCharacters) {
    SimulatorConfig cfg;
    auto errs = loadFromString(cfg, "shots=10x\nnoise.0=bit_flip:0.1q\n");
    EXPECT_EQ(errs.size(), 2u);
    EXPECT_EQ(cfg.shots, 1u);
}

TEST(ConfigParseTest, MissingFileIsNotAnError) {
    SimulatorConfig cfg;
    EXPECT_TRUE(loadFromFile(cfg, "/nonexistent/qsim.conf").empty());
    EXPECT_EQ(cfg.backend, "auto");
}

TEST(ConfigParseTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "qsim_config_test.conf";
    {
        std::ofstream out(path);
        out << "backend=statevector\nshots=8\n";
    }
    SimulatorConfig cfg;
    EXPECT_TRUE(loadFromFile(cfg, path).empty());
    EXPECT_EQ(cfg.backend, "statevector");
    EXPECT_EQ(cfg.shots, 8u);
    std::remove(path.c_str());
}

// =============================================================================
// Environment Override Tests
// =============================================================================

TEST(ConfigEnvTest, OverridesFileSettings) {
    SimulatorConfig cfg;
    ASSERT_TRUE(loadFromString(cfg, "backend=statevector\nshots=5\n").empty());

    ::setenv("QSIM_BACKEND", "stabilizer", 1);
    ::setenv("QSIM_SHOTS", "64", 1);
    ::setenv("QSIM_SEED", "9", 1);
    auto errs = applyEnvOverrides(cfg);
    ::unsetenv("QSIM_BACKEND");
    ::unsetenv("QSIM_SHOTS");
    ::unsetenv("QSIM_SEED");

    EXPECT_TRUE(errs.empty());
    EXPECT_EQ(cfg.backend, "stabilizer");
    EXPECT_EQ(cfg.shots, 64u);
    EXPECT_EQ(*cfg.seed, 9u);
}

TEST(ConfigEnvTest, ReportsUnparsableVariables) {
    SimulatorConfig cfg;
    ::setenv("QSIM_SHOTS", "many", 1);
    auto errs = applyEnvOverrides(cfg);
    ::unsetenv("QSIM_SHOTS");

    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].rfind("QSIM_SHOTS: ", 0), 0u);
    EXPECT_EQ(cfg.shots, 1u);
}

TEST(ConfigEnvTest, UnsetVariablesChangeNothing) {
    ::unsetenv("QSIM_BACKEND");
    ::unsetenv("QSIM_SHOTS");
    ::unsetenv("QSIM_SEED");
    SimulatorConfig cfg;
    EXPECT_TRUE(applyEnvOverrides(cfg).empty());
    EXPECT_EQ(cfg.backend, "auto");
}

// =============================================================================
// Validation and Translation Tests
// =============================================================================

TEST(ConfigValidateTest, FlagsEveryProblem) {
    SimulatorConfig cfg;
    cfg.backend = "quantum_annealer";
    cfg.shots = 0;
    cfg.noise.push_back({0, "depolarizing", 1.5});
    cfg.noise.push_back({1, "thermal", 0.1});

    auto errs = validate(cfg);
    ASSERT_EQ(errs.size(), 4u);
    EXPECT_EQ(errs[0], "unknown backend 'quantum_annealer'");
    EXPECT_EQ(errs[1], "shots must be at least 1");
    EXPECT_TRUE(anyContains(errs, "noise on qubit 0:"));
    EXPECT_TRUE(anyContains(errs, "noise on qubit 1:"));
}

TEST(ConfigTranslateTest, BuildsNoiseModelInOrder) {
    SimulatorConfig cfg;
    ASSERT_TRUE(loadFromString(cfg, "noise.1=phase_flip:0.2,bit_flip:0.1\nnoise.0=phase_damping:0.3\n")
                    .empty());
    auto model = buildNoiseModel(cfg);
    ASSERT_EQ(model.size(), 2u);
    ASSERT_EQ(model.at(1).size(), 2u);
    EXPECT_EQ(model.at(1)[0].kind(), noise::ChannelKind::PhaseFlip);
    EXPECT_EQ(model.at(1)[1].kind(), noise::ChannelKind::BitFlip);
    EXPECT_EQ(model.at(0)[0].kind(), noise::ChannelKind::PhaseDamping);
}

TEST(ConfigTranslateTest, BuildNoiseModelThrowsOnBadEntry) {
    SimulatorConfig cfg;
    cfg.noise.push_back({0, "bit_flip", -0.5});
    EXPECT_THROW((void)buildNoiseModel(cfg), sim::InvalidChannelParameterError);
}

TEST(ConfigTranslateTest, ExecutionAndSelectionOptions) {
    SimulatorConfig cfg;
    cfg.shots = 30;
    cfg.record_history = true;
    cfg.shot_mode = sim::ShotMode::Independent;
    cfg.seed = 77;

    auto exec = toExecutionOptions(cfg);
    EXPECT_EQ(exec.shots, 30u);
    EXPECT_TRUE(exec.record_history);
    EXPECT_EQ(exec.shot_mode, sim::ShotMode::Independent);
    EXPECT_FALSE(exec.initial_state.has_value());

    auto sel = toSelectionOptions(cfg);
    EXPECT_FALSE(sel.preferred_backend.has_value());
    EXPECT_FALSE(sel.use_noise);
    EXPECT_EQ(*sel.seed, 77u);
    EXPECT_FALSE(sel.logger);

    cfg.backend = "density_matrix";
    EXPECT_EQ(*toSelectionOptions(cfg).preferred_backend, "density_matrix");
}

TEST(ConfigTranslateTest, EndToEndNoisyRun) {
    SimulatorConfig cfg;
    ASSERT_TRUE(loadFromString(cfg,
                               "seed=3\nshots=10\nshot_mode=independent\n"
                               "noise.0=bit_flip:1.0\n")
                    .empty());
    ASSERT_TRUE(validate(cfg).empty());

    ir::Circuit circuit(1);
    circuit.measure(0);
    auto selection = backends::BackendSelector::select(circuit, toSelectionOptions(cfg));
    EXPECT_EQ(selection.backend->name(), "noisy");

    // Measurement-only circuits have no gates, so no noise is injected
    auto result = selection.backend->execute(circuit, toExecutionOptions(cfg));
    EXPECT_EQ(result.counts().at("0"), 10u);
    EXPECT_TRUE(result.metadata.noise_applications.empty());
}

}  // namespace
}  // namespace qsim::config
