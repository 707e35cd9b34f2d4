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

#include "model/EventNode.h"
#include "common/Logger.h"
#include <stdexcept>

namespace SRE {

EventNode::EventNode(const std::string &ownerType, const std::string &name, int catalogId)
    : ownerType_(ownerType), name_(name), catalogId_(catalogId) {}

void EventNode::addTransition(std::shared_ptr<const TransitionNode> transition) {
    if (!transition) {
        throw std::invalid_argument("Cannot add null transition to event '" + name_ + "'");
    }
    if (transition->getEventName() != name_) {
        throw std::invalid_argument("Transition for event '" + transition->getEventName() +
                                    "' cannot be added to event '" + name_ + "'");
    }

    LOG_DEBUG("EventNode: {}#{} transition #{} {}", ownerType_, name_, transitions_.size(), transition->describe());
    transitions_.push_back(std::move(transition));
}

void EventNode::addCallback(CallbackPhase phase, ConditionalCallback callback) {
    if (phase == CallbackPhase::BEFORE) {
        beforeCallbacks_.push_back(std::move(callback));
    } else if (phase == CallbackPhase::AFTER) {
        afterCallbacks_.push_back(std::move(callback));
    } else {
        throw std::invalid_argument(std::string("Event callbacks cannot use state phase '") + phaseToString(phase) +
                                    "'");
    }
}

void EventNode::addCallbacks(const CallbackMap &callbacks) {
    for (CallbackPhase phase : {CallbackPhase::BEFORE, CallbackPhase::AFTER, CallbackPhase::BEFORE_ENTER,
                                CallbackPhase::AFTER_ENTER, CallbackPhase::BEFORE_EXIT, CallbackPhase::AFTER_EXIT}) {
        auto it = callbacks.find(phase);
        if (it == callbacks.end()) {
            continue;
        }
        for (const auto &callback : it->second) {
            addCallback(phase, callback);
        }
    }
}

const std::vector<ConditionalCallback> &EventNode::getCallbacks(CallbackPhase phase) const {
    if (phase == CallbackPhase::BEFORE) {
        return beforeCallbacks_;
    }
    if (phase == CallbackPhase::AFTER) {
        return afterCallbacks_;
    }
    throw std::invalid_argument(std::string("Event has no '") + phaseToString(phase) + "' callbacks");
}

std::vector<std::shared_ptr<const TransitionNode>> EventNode::possibleTransitionsFrom(IStatefulRecord &record,
                                                                                      const std::string &stateName,
                                                                                      const CallbackArgs &args,
                                                                                      const MethodTable &methods) const {
    std::vector<std::shared_ptr<const TransitionNode>> result;
    for (const auto &transition : transitions_) {
        if (transition->matches(record, stateName, args, methods)) {
            result.push_back(transition);
        }
    }
    return result;
}

std::shared_ptr<const TransitionNode> EventNode::selectTransition(IStatefulRecord &record,
                                                                  const std::string &stateName,
                                                                  const CallbackArgs &args,
                                                                  const MethodTable &methods) const {
    for (const auto &transition : transitions_) {
        if (!transition->isEligibleFrom(stateName)) {
            continue;
        }

        if (transition->guardPasses(record, args, methods)) {
            LOG_DEBUG("EventNode: {}#{} selected {}", ownerType_, name_, transition->describe());
            return transition;
        }

        LOG_DEBUG("EventNode: {}#{} guard rejected {}", ownerType_, name_, transition->describe());
    }

    return nullptr;
}

std::shared_ptr<EventNode> EventNode::cloneFor(const std::string &ownerType) const {
    auto copy = std::make_shared<EventNode>(ownerType, name_, catalogId_);
    // Transitions are immutable and may be shared; the vector itself is copied
    copy->transitions_ = transitions_;
    copy->beforeCallbacks_ = beforeCallbacks_;
    copy->afterCallbacks_ = afterCallbacks_;
    return copy;
}

}  // namespace SRE
