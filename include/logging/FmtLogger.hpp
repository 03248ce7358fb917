// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file FmtLogger.hpp
 * @brief Console logger built on fmt
 *
 * Prints "[LEVEL] message" lines. Errors go to stderr, everything else to
 * stdout; debug lines only when enabled.
 */

#pragma once

#include "Logger.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <string_view>

namespace qsim::logging {

class FmtLogger : public Logger {
public:
    explicit FmtLogger(bool enable_debug = false) : enable_debug_(enable_debug) {}

    void info(std::string_view msg) override { printLine(stdout, "INFO", msg); }
    void warn(std::string_view msg) override { printLine(stdout, "WARN", msg); }
    void error(std::string_view msg) override { printLine(stderr, "ERROR", msg); }
    void debug(std::string_view msg) override {
        if (enable_debug_) printLine(stdout, "DEBUG", msg);
    }

private:
    bool enable_debug_;

    static void printLine(std::FILE* stream, std::string_view level, std::string_view msg) {
        fmt::print(stream, "[{}] {}\n", level, msg);
    }
};

}  // namespace qsim::logging
