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

#include "runtime/StateMachineBuilder.h"
#include <stdexcept>

namespace SRE {

StateMachineBuilder::StateMachineBuilder(StateMachineRegistry &registry, const std::string &ownerType)
    : registry_(registry), ownerType_(ownerType) {
    if (ownerType_.empty()) {
        throw std::invalid_argument("StateMachineBuilder requires an owner type");
    }
}

StateMachineBuilder &StateMachineBuilder::declareStates(const std::vector<std::string> &names) {
    for (const auto &name : names) {
        registry_.getCatalog().declareState(ownerType_, name);
    }
    return *this;
}

StateMachineBuilder &StateMachineBuilder::declareEvents(const std::vector<std::string> &names) {
    for (const auto &name : names) {
        registry_.getCatalog().declareEvent(ownerType_, name);
    }
    return *this;
}

StateMachineBuilder &StateMachineBuilder::hasStates(const MachineOptions &options) {
    registry_.hasStates(ownerType_, options);
    return *this;
}

StateMachineBuilder &StateMachineBuilder::hasStates(const std::string &initialState, bool recordChanges) {
    MachineOptions options;
    options.initial = InitialStateRule::named(initialState);
    options.recordChanges = recordChanges;
    return hasStates(options);
}

StateMachineBuilder &StateMachineBuilder::inheritsFrom(const std::string &parentType) {
    registry_.inherit(parentType, ownerType_);
    return *this;
}

StateMachineBuilder &StateMachineBuilder::initialState(const InitialStateRule &rule) {
    registry_.setInitialState(ownerType_, rule);
    return *this;
}

StateMachineBuilder &StateMachineBuilder::state(const std::string &name, const CallbackMap &callbacks) {
    registry_.defineState(ownerType_, name, callbacks);
    return *this;
}

StateMachineBuilder &StateMachineBuilder::states(const std::vector<std::string> &names, const CallbackMap &callbacks) {
    for (const auto &name : names) {
        registry_.defineState(ownerType_, name, callbacks);
    }
    return *this;
}

StateMachineBuilder &StateMachineBuilder::onState(const std::string &name, CallbackPhase phase,
                                                  ConditionalCallback callback) {
    registry_.extendState(ownerType_, name).addCallback(phase, std::move(callback));
    return *this;
}

StateMachineBuilder &StateMachineBuilder::event(const std::string &name, const EventBody &body,
                                                const CallbackMap &callbacks) {
    registry_.defineEvent(ownerType_, name, callbacks);
    if (body) {
        EventBuilder eventBuilder(registry_, ownerType_, name);
        body(eventBuilder);
    }
    return *this;
}

StateMachineBuilder &StateMachineBuilder::extendEvent(const std::string &name, const EventBody &body) {
    registry_.extendEvent(ownerType_, name);
    if (body) {
        EventBuilder eventBuilder(registry_, ownerType_, name);
        body(eventBuilder);
    }
    return *this;
}

StateMachineBuilder &StateMachineBuilder::predicate(const std::string &name, PredicateFunction predicate) {
    registry_.definePredicate(ownerType_, name, std::move(predicate));
    return *this;
}

StateMachineBuilder &StateMachineBuilder::action(const std::string &name, ActionFunction action) {
    registry_.defineAction(ownerType_, name, std::move(action));
    return *this;
}

}  // namespace SRE
