// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-SRE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of SRE (Stateful Record Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE

#pragma once

#include "common/ILoggerBackend.h"
#include <fmt/format.h>
#include <memory>
#include <source_location>
#include <string>

namespace SRE {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * 1. Default mode: spdlog backend created on first use
 * 2. Custom mode: hosts inject their own ILoggerBackend implementation
 *
 * Thread-safe: backend installation is serialized, logging is delegated to
 * the (thread-safe) backend.
 *
 * @code
 * SRE::Logger::initialize();
 * LOG_INFO("Registry frozen with {} machines", count);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout, no file)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     *
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace SRE

// Formatting goes through fmt, the library spdlog is built on
#define LOG_TRACE(...) SRE::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) SRE::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) SRE::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) SRE::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) SRE::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
