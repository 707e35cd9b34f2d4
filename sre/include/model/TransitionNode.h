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

#include "model/Guard.h"
#include <string>
#include <vector>

namespace SRE {

/**
 * @brief Transition of an event: (from-state set, to-state, guard)
 *
 * An empty from-set makes the transition eligible from any state.
 * Immutable once constructed.
 */
class TransitionNode {
public:
    TransitionNode(const std::string &eventName, const std::vector<std::string> &fromStates, const std::string &toState,
                   Guard guard = Guard());

    const std::string &getEventName() const {
        return eventName_;
    }

    const std::vector<std::string> &getFromStates() const {
        return fromStates_;
    }

    const std::string &getToState() const {
        return toState_;
    }

    const Guard &getGuard() const {
        return guard_;
    }

    bool appliesFromAnyState() const {
        return fromStates_.empty();
    }

    /**
     * @brief Whether the from-set admits the given state
     */
    bool isEligibleFrom(const std::string &stateName) const;

    bool guardPasses(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const;

    /**
     * @brief Eligible from the state and guard passes
     */
    bool matches(IStatefulRecord &record, const std::string &stateName, const CallbackArgs &args,
                 const MethodTable &methods) const;

    std::string describe() const;

private:
    std::string eventName_;
    std::vector<std::string> fromStates_;
    std::string toState_;
    Guard guard_;
};

}  // namespace SRE
