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

#include <chrono>
#include <optional>
#include <string>

namespace SRE {

/**
 * @brief Audit entry for one realized transition
 *
 * fromState and eventName are both empty only for the entry written when a
 * record is born into its initial state.
 */
struct StateChange {
    std::string recordType;
    std::string recordId;
    std::optional<std::string> fromState;
    std::string toState;
    std::optional<std::string> eventName;
    std::chrono::system_clock::time_point occurredAt;

    bool isInitial() const {
        return !fromState.has_value() && !eventName.has_value();
    }
};

}  // namespace SRE
