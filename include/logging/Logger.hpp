// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Logger.hpp
 * @brief Logging interface used by backends and tools
 *
 * @see FmtLogger.hpp for the console implementation
 */

#pragma once

#include <memory>
#include <string_view>

namespace qsim::logging {

/**
 * @brief Abstract sink for log messages.
 */
class Logger {
public:
    virtual ~Logger() = default;
    virtual void info(std::string_view msg) = 0;
    virtual void warn(std::string_view msg) = 0;
    virtual void error(std::string_view msg) = 0;
    virtual void debug(std::string_view msg) = 0;
};

/**
 * @brief Logger that discards every message.
 */
class NullLogger final : public Logger {
public:
    void info(std::string_view) override {}
    void warn(std::string_view) override {}
    void error(std::string_view) override {}
    void debug(std::string_view) override {}
};

/// @brief Shared NullLogger instance, the default for every backend.
[[nodiscard]] inline std::shared_ptr<Logger> nullLogger() {
    static const std::shared_ptr<Logger> instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace qsim::logging
