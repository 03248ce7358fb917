// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file ConfigLoader.hpp
 * @brief key=value configuration files and QSIM_* environment overrides
 *
 * Format, one setting per line ('#' starts a comment line):
 * @code
 * backend=density_matrix
 * shots=1000
 * seed=42
 * history=true
 * shot_mode=independent
 * debug=false
 * noise.0=depolarizing:0.01,amplitude_damping:0.05
 * @endcode
 *
 * Any noise entry turns use_noise on. Loaders report problems as a list
 * of messages and keep every setting that parsed.
 */

#pragma once

#include "SimulatorConfig.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace qsim::config {

namespace detail {

[[nodiscard]] inline std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

[[nodiscard]] inline std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/// @brief Parses a whole string as an unsigned integer.
/// @throws std::invalid_argument on trailing characters or a sign
[[nodiscard]] inline std::uint64_t parseUnsigned(const std::string& text) {
    if (text.empty() || text.front() == '-' || text.front() == '+') {
        throw std::invalid_argument("expected a non-negative integer, got '" + text + "'");
    }
    std::size_t used = 0;
    const unsigned long long value = std::stoull(text, &used);
    if (used != text.size()) {
        throw std::invalid_argument("expected a non-negative integer, got '" + text + "'");
    }
    return static_cast<std::uint64_t>(value);
}

[[nodiscard]] inline double parseDouble(const std::string& text) {
    std::size_t used = 0;
    const double value = std::stod(text, &used);
    if (used != text.size()) {
        throw std::invalid_argument("expected a number, got '" + text + "'");
    }
    return value;
}

[[nodiscard]] inline bool parseBool(const std::string& text) {
    const std::string v = lower(text);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw std::invalid_argument("expected a boolean, got '" + text + "'");
}

[[nodiscard]] inline sim::ShotMode parseShotMode(const std::string& text) {
    const std::string v = lower(text);
    if (v == "reuse") return sim::ShotMode::ReuseCollapsed;
    if (v == "independent") return sim::ShotMode::Independent;
    throw std::invalid_argument("shot_mode must be 'reuse' or 'independent', got '" + text + "'");
}

/// @brief "ch:p[,ch:p...]" for one qubit.
[[nodiscard]] inline std::vector<NoiseSpec> parseNoiseList(QubitIndex qubit, const std::string& text) {
    std::vector<NoiseSpec> specs;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (item.empty()) continue;
        const auto colon = item.find(':');
        if (colon == std::string::npos) {
            throw std::invalid_argument("noise entry '" + item + "' must be <channel>:<parameter>");
        }
        specs.push_back(NoiseSpec{qubit,
                                  lower(trim(item.substr(0, colon))),
                                  parseDouble(trim(item.substr(colon + 1)))});
    }
    return specs;
}

inline void applySetting(SimulatorConfig& cfg, const std::string& key, const std::string& value) {
    if (key == "backend") {
        cfg.backend = lower(value);
    } else if (key == "shots") {
        cfg.shots = static_cast<std::size_t>(parseUnsigned(value));
    } else if (key == "seed") {
        cfg.seed = parseUnsigned(value);
    } else if (key == "history") {
        cfg.record_history = parseBool(value);
    } else if (key == "shot_mode") {
        cfg.shot_mode = parseShotMode(value);
    } else if (key == "debug") {
        cfg.debug = parseBool(value);
    } else if (key.rfind("noise.", 0) == 0) {
        const QubitIndex qubit = static_cast<QubitIndex>(parseUnsigned(key.substr(6)));
        auto specs = parseNoiseList(qubit, value);
        cfg.noise.insert(cfg.noise.end(), specs.begin(), specs.end());
        cfg.use_noise = true;
    } else {
        throw std::invalid_argument("unknown key '" + key + "'");
    }
}

}  // namespace detail

/**
 * @brief Applies key=value lines on top of cfg.
 * @return One message per rejected line
 */
[[nodiscard]] inline std::vector<std::string> loadFromString(SimulatorConfig& cfg,
                                                             const std::string& text) {
    std::vector<std::string> errs;
    std::istringstream iss(text);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(iss, line)) {
        ++line_no;
        const std::string stripped = detail::trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;
        const auto eq = stripped.find('=');
        if (eq == std::string::npos) {
            errs.push_back(fmt::format("line {}: expected key=value", line_no));
            continue;
        }
        const std::string key = detail::lower(detail::trim(stripped.substr(0, eq)));
        const std::string value = detail::trim(stripped.substr(eq + 1));
        try {
            detail::applySetting(cfg, key, value);
        } catch (const std::exception& ex) {
            errs.push_back(fmt::format("line {}: {}: {}", line_no, key, ex.what()));
        }
    }
    return errs;
}

/**
 * @brief Reads a configuration file. A missing file is not an error.
 */
[[nodiscard]] inline std::vector<std::string> loadFromFile(SimulatorConfig& cfg,
                                                           const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) return {};  // optional

    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadFromString(cfg, buffer.str());
}

/**
 * @brief Applies QSIM_BACKEND, QSIM_SHOTS and QSIM_SEED on top of cfg.
 * @return One message per unparsable variable
 */
[[nodiscard]] inline std::vector<std::string> applyEnvOverrides(SimulatorConfig& cfg) {
    std::vector<std::string> errs;
    const auto apply = [&](const char* variable, const char* key) {
        const char* value = std::getenv(variable);
        if (value == nullptr) return;
        try {
            detail::applySetting(cfg, key, detail::trim(value));
        } catch (const std::exception& ex) {
            errs.push_back(fmt::format("{}: {}", variable, ex.what()));
        }
    };
    apply("QSIM_BACKEND", "backend");
    apply("QSIM_SHOTS", "shots");
    apply("QSIM_SEED", "seed");
    return errs;
}

}  // namespace qsim::config
