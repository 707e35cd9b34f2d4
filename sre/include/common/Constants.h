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

/**
 * @file Constants.h
 * @brief Global constants shared by the engine, its logger and the store doubles
 */

namespace SRE::Constants {

// ============================================================================
// State slot
// ============================================================================

/**
 * @brief Sentinel held by a record's state slot before a state is assigned
 *
 * A record whose slot holds this value is treated as "no state" by the
 * initial-state bootstrap and receives its initial state before first persistence.
 */
constexpr const char *NO_STATE = "";

// ============================================================================
// Hook methods
// ============================================================================

// Hook method names are "<prefix><state or event name>", e.g. "before_enter_first_gear"
constexpr const char *HOOK_BEFORE_ENTER_PREFIX = "before_enter_";
constexpr const char *HOOK_AFTER_ENTER_PREFIX = "after_enter_";
constexpr const char *HOOK_BEFORE_EXIT_PREFIX = "before_exit_";
constexpr const char *HOOK_AFTER_EXIT_PREFIX = "after_exit_";
constexpr const char *HOOK_BEFORE_EVENT_PREFIX = "before_";
constexpr const char *HOOK_AFTER_EVENT_PREFIX = "after_";

// Event names may not start with these; "before_" + "enter_x" would be the hook of state x
constexpr const char *RESERVED_EVENT_PREFIX_ENTER = "enter_";
constexpr const char *RESERVED_EVENT_PREFIX_EXIT = "exit_";

// ============================================================================
// Logging
// ============================================================================

constexpr const char *LOGGER_NAME = "SRE";
constexpr const char *LOG_FILE_NAME = "sre.log";
constexpr const char *LOG_LEVEL_ENV = "SPDLOG_LEVEL";
constexpr const char *CONSOLE_LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

}  // namespace SRE::Constants
