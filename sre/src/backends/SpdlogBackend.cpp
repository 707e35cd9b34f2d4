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

#include "backends/SpdlogBackend.h"
#include "common/Constants.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace SRE {

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    // Reuse the registered logger when a previous backend already created it
    logger_ = spdlog::get(Constants::LOGGER_NAME);

    if (!logger_) {
        std::vector<spdlog::sink_ptr> sinks;

        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern(Constants::CONSOLE_LOG_PATTERN);
        sinks.push_back(consoleSink);

        if (logToFile && !logDir.empty()) {
            std::filesystem::create_directories(logDir);
            std::filesystem::path logPath = std::filesystem::path(logDir) / Constants::LOG_FILE_NAME;

            auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
            fileSink->set_pattern(Constants::FILE_LOG_PATTERN);
            sinks.push_back(fileSink);
        }

        logger_ = std::make_shared<spdlog::logger>(Constants::LOGGER_NAME, sinks.begin(), sinks.end());
        spdlog::register_logger(logger_);
    }

    logger_->set_level(spdlog::level::info);
    applyEnvironmentLevel();
}

void SpdlogBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

void SpdlogBackend::applyEnvironmentLevel() {
    const char *envLevel = std::getenv(Constants::LOG_LEVEL_ENV);
    if (!envLevel) {
        return;
    }

    std::string levelStr(envLevel);
    std::transform(levelStr.begin(), levelStr.end(), levelStr.begin(), ::tolower);

    if (levelStr == "trace") {
        logger_->set_level(spdlog::level::trace);
    } else if (levelStr == "debug") {
        logger_->set_level(spdlog::level::debug);
    } else if (levelStr == "info") {
        logger_->set_level(spdlog::level::info);
    } else if (levelStr == "warn" || levelStr == "warning") {
        logger_->set_level(spdlog::level::warn);
    } else if (levelStr == "err" || levelStr == "error") {
        logger_->set_level(spdlog::level::err);
    } else if (levelStr == "critical") {
        logger_->set_level(spdlog::level::critical);
    } else if (levelStr == "off") {
        logger_->set_level(spdlog::level::off);
    }
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::info;
    }
}

}  // namespace SRE
