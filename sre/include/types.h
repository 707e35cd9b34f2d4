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

#include <any>
#include <vector>

namespace SRE {

enum class CallbackPhase {
    BEFORE_ENTER,  // State is about to be entered
    AFTER_ENTER,   // State has been entered
    BEFORE_EXIT,   // State is about to be exited
    AFTER_EXIT,    // State has been exited
    BEFORE,        // Event is about to be applied
    AFTER          // Event has been applied
};

/**
 * @brief Opaque arguments forwarded from fire() to callbacks and guards
 */
using CallbackArgs = std::vector<std::any>;

/**
 * @brief Phase name as used in hook method names and log output
 */
inline const char *phaseToString(CallbackPhase phase) {
    switch (phase) {
    case CallbackPhase::BEFORE_ENTER:
        return "before_enter";
    case CallbackPhase::AFTER_ENTER:
        return "after_enter";
    case CallbackPhase::BEFORE_EXIT:
        return "before_exit";
    case CallbackPhase::AFTER_EXIT:
        return "after_exit";
    case CallbackPhase::BEFORE:
        return "before";
    case CallbackPhase::AFTER:
        return "after";
    }
    return "unknown";
}

inline bool isStatePhase(CallbackPhase phase) {
    return phase != CallbackPhase::BEFORE && phase != CallbackPhase::AFTER;
}

}  // namespace SRE
