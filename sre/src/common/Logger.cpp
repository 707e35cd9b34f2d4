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

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>

namespace SRE {

std::unique_ptr<ILoggerBackend> Logger::backend_;

// Serializes backend installation
static std::mutex backend_mutex;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Trace, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Debug, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Info, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Warn, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Error, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "UnknownFunction";
    }

    // Last space outside template/parameter brackets separates the return type
    size_t nameStart = 0;
    int depth = 0;
    for (size_t i = 0; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<' || c == '(') {
            depth++;
        } else if (c == '>' || c == ')') {
            depth--;
        } else if (c == ' ' && depth == 0) {
            nameStart = i + 1;
        }
    }

    std::string result;
    int angleDepth = 0;
    for (size_t i = nameStart; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (angleDepth == 0 && c != '*' && c != '&') {
            result += c;
        }
    }

    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace SRE
