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

#include "model/StateNode.h"
#include "common/Logger.h"
#include <stdexcept>

namespace SRE {

StateNode::StateNode(const std::string &ownerType, const std::string &name, int catalogId)
    : ownerType_(ownerType), name_(name), catalogId_(catalogId) {}

void StateNode::addCallback(CallbackPhase phase, ConditionalCallback callback) {
    if (!isStatePhase(phase)) {
        throw std::invalid_argument(std::string("State callbacks cannot use event phase '") + phaseToString(phase) +
                                    "'");
    }

    LOG_DEBUG("StateNode: {}#{} {} += '{}'", ownerType_, name_, phaseToString(phase),
              callback.getAction().describe());
    callbacks_[phase].push_back(std::move(callback));
}

void StateNode::addCallbacks(const CallbackMap &callbacks) {
    // Fixed phase order keeps logging deterministic
    for (CallbackPhase phase : {CallbackPhase::BEFORE_ENTER, CallbackPhase::AFTER_ENTER, CallbackPhase::BEFORE_EXIT,
                                CallbackPhase::AFTER_EXIT, CallbackPhase::BEFORE, CallbackPhase::AFTER}) {
        auto it = callbacks.find(phase);
        if (it == callbacks.end()) {
            continue;
        }
        for (const auto &callback : it->second) {
            addCallback(phase, callback);
        }
    }
}

const std::vector<ConditionalCallback> &StateNode::getCallbacks(CallbackPhase phase) const {
    auto it = callbacks_.find(phase);
    return it != callbacks_.end() ? it->second : emptyCallbacks_;
}

std::shared_ptr<StateNode> StateNode::cloneFor(const std::string &ownerType) const {
    auto copy = std::make_shared<StateNode>(ownerType, name_, catalogId_);
    copy->callbacks_ = callbacks_;
    return copy;
}

}  // namespace SRE
