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

#include "runtime/MachineDefinition.h"
#include "common/StateMachineErrors.h"
#include <stdexcept>

namespace SRE {

MachineDefinition::MachineDefinition(const std::string &ownerType, const MachineOptions &options,
                                     const std::optional<std::string> &parentType)
    : ownerType_(ownerType), options_(options), parentType_(parentType) {
    if (!options_.initial.isSet()) {
        throw NoInitialState("No initial state was specified for " + ownerType_);
    }
}

void MachineDefinition::setInitialState(const InitialStateRule &rule) {
    if (!rule.isSet()) {
        throw NoInitialState("No initial state was specified for " + ownerType_);
    }
    options_.initial = rule;
}

void MachineDefinition::addState(std::shared_ptr<StateNode> state) {
    if (!state || state->getOwnerType() != ownerType_) {
        throw std::invalid_argument("State must belong to " + ownerType_);
    }
    const std::string name = state->getName();
    if (states_.find(name) == states_.end()) {
        stateOrder_.push_back(name);
    }
    states_[name] = std::move(state);
}

void MachineDefinition::addEvent(std::shared_ptr<EventNode> event) {
    if (!event || event->getOwnerType() != ownerType_) {
        throw std::invalid_argument("Event must belong to " + ownerType_);
    }
    const std::string name = event->getName();
    if (events_.find(name) == events_.end()) {
        eventOrder_.push_back(name);
    }
    events_[name] = std::move(event);
}

std::shared_ptr<StateNode> MachineDefinition::findState(const std::string &name) const {
    auto it = states_.find(name);
    return it != states_.end() ? it->second : nullptr;
}

std::shared_ptr<EventNode> MachineDefinition::findEvent(const std::string &name) const {
    auto it = events_.find(name);
    return it != events_.end() ? it->second : nullptr;
}

std::shared_ptr<MachineDefinition> MachineDefinition::cloneFor(const std::string &subclassType) const {
    auto copy = std::make_shared<MachineDefinition>(subclassType, options_, ownerType_);

    for (const auto &name : stateOrder_) {
        copy->addState(states_.at(name)->cloneFor(subclassType));
    }
    for (const auto &name : eventOrder_) {
        copy->addEvent(events_.at(name)->cloneFor(subclassType));
    }
    copy->methods_ = methods_;

    return copy;
}

}  // namespace SRE
