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

#include "model/TransitionNode.h"
#include <algorithm>
#include <stdexcept>

namespace SRE {

TransitionNode::TransitionNode(const std::string &eventName, const std::vector<std::string> &fromStates,
                               const std::string &toState, Guard guard)
    : eventName_(eventName), fromStates_(fromStates), toState_(toState), guard_(std::move(guard)) {
    if (toState_.empty()) {
        throw std::invalid_argument("Transition of event '" + eventName_ + "' requires a target state");
    }
}

bool TransitionNode::isEligibleFrom(const std::string &stateName) const {
    if (fromStates_.empty()) {
        return true;
    }
    return std::find(fromStates_.begin(), fromStates_.end(), stateName) != fromStates_.end();
}

bool TransitionNode::guardPasses(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const {
    return guard_.passes(record, args, methods);
}

bool TransitionNode::matches(IStatefulRecord &record, const std::string &stateName, const CallbackArgs &args,
                             const MethodTable &methods) const {
    return isEligibleFrom(stateName) && guardPasses(record, args, methods);
}

std::string TransitionNode::describe() const {
    std::string from;
    if (fromStates_.empty()) {
        from = "*";
    } else {
        for (const auto &state : fromStates_) {
            if (!from.empty()) {
                from += "|";
            }
            from += state;
        }
    }
    return eventName_ + ": " + from + " -> " + toState_ + " [" + guard_.describe() + "]";
}

}  // namespace SRE
