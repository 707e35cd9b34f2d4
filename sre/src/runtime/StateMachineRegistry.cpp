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

#include "runtime/StateMachineRegistry.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "common/StateMachineErrors.h"
#include <mutex>
#include <stdexcept>

namespace SRE {

MachineDefinition &StateMachineRegistry::hasStates(const std::string &ownerType, const MachineOptions &options) {
    requireNotFrozen("hasStates");

    if (ownerType.empty()) {
        throw std::invalid_argument("Owner type cannot be empty");
    }
    if (!options.initial.isSet()) {
        throw NoInitialState("No initial state was specified for " + ownerType);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (machines_.find(ownerType) != machines_.end()) {
        throw std::logic_error(ownerType + " already has a state machine");
    }

    auto machine = std::make_shared<MachineDefinition>(ownerType, options);
    machines_[ownerType] = machine;

    LOG_INFO("StateMachineRegistry: {} has states (initial={}, recordChanges={})", ownerType,
             options.initial.isDynamic() ? std::string("<dynamic>") : options.initial.stateName,
             options.recordChanges);
    return *machine;
}

MachineDefinition &StateMachineRegistry::inherit(const std::string &parentType, const std::string &subclassType) {
    requireNotFrozen("inherit");

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto parent = machines_.find(parentType);
    if (parent == machines_.end()) {
        throw MachineNotDefined(parentType + " has no state machine to inherit");
    }
    if (machines_.find(subclassType) != machines_.end()) {
        throw std::logic_error(subclassType + " already has a state machine");
    }

    auto machine = parent->second->cloneFor(subclassType);
    machines_[subclassType] = machine;

    LOG_INFO("StateMachineRegistry: {} inherits {} states and {} events from {}", subclassType,
             machine->getStateNames().size(), machine->getEventNames().size(), parentType);
    return *machine;
}

void StateMachineRegistry::setInitialState(const std::string &ownerType, const InitialStateRule &rule) {
    requireNotFrozen("setInitialState");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    requireMutableMachine(ownerType).setInitialState(rule);
}

StateNode &StateMachineRegistry::defineState(const std::string &ownerType, const std::string &name,
                                             const CallbackMap &callbacks) {
    requireNotFrozen("defineState");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    MachineDefinition &machine = requireMutableMachine(ownerType);

    if (machine.hasState(name)) {
        throw StateAlreadyActive(ownerType + " state with name=\"" + name + "\" has already been defined");
    }

    auto catalogId = catalog_.find(StateCatalog::Category::STATE, lineageLocked(ownerType), name);
    if (!catalogId) {
        throw StateNotFound("Couldn't find " + ownerType + " state with name=\"" + name + "\"");
    }

    auto state = std::make_shared<StateNode>(ownerType, name, *catalogId);
    state->addCallbacks(callbacks);
    machine.addState(state);

    LOG_INFO("StateMachineRegistry: {} state '{}' active", ownerType, name);
    return *state;
}

StateNode &StateMachineRegistry::extendState(const std::string &ownerType, const std::string &name) {
    requireNotFrozen("extendState");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    MachineDefinition &machine = requireMutableMachine(ownerType);

    auto state = machine.findState(name);
    if (!state) {
        throw StateNotActive("Couldn't find active " + ownerType + " state with name=\"" + name + "\"");
    }
    return *state;
}

EventNode &StateMachineRegistry::defineEvent(const std::string &ownerType, const std::string &name,
                                             const CallbackMap &callbacks) {
    requireNotFrozen("defineEvent");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    MachineDefinition &machine = requireMutableMachine(ownerType);

    if (name.starts_with(Constants::RESERVED_EVENT_PREFIX_ENTER) ||
        name.starts_with(Constants::RESERVED_EVENT_PREFIX_EXIT)) {
        throw std::invalid_argument(ownerType + " event name \"" + name + "\" collides with state hook methods");
    }

    if (machine.hasEvent(name)) {
        throw EventAlreadyActive(ownerType + " event with name=\"" + name + "\" has already been defined");
    }

    auto catalogId = catalog_.find(StateCatalog::Category::EVENT, lineageLocked(ownerType), name);
    if (!catalogId) {
        throw EventNotFound("Couldn't find " + ownerType + " event with name=\"" + name + "\"");
    }

    auto event = std::make_shared<EventNode>(ownerType, name, *catalogId);
    event->addCallbacks(callbacks);
    machine.addEvent(event);

    LOG_INFO("StateMachineRegistry: {} event '{}' active", ownerType, name);
    return *event;
}

EventNode &StateMachineRegistry::extendEvent(const std::string &ownerType, const std::string &name) {
    requireNotFrozen("extendEvent");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    MachineDefinition &machine = requireMutableMachine(ownerType);

    auto event = machine.findEvent(name);
    if (!event) {
        throw EventNotActive("Couldn't find active " + ownerType + " event with name=\"" + name + "\"");
    }
    return *event;
}

void StateMachineRegistry::addTransition(const std::string &ownerType, const std::string &eventName,
                                         const std::string &toState, const std::vector<std::string> &fromStates,
                                         Guard guard) {
    requireNotFrozen("addTransition");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    MachineDefinition &machine = requireMutableMachine(ownerType);

    auto event = machine.findEvent(eventName);
    if (!event) {
        throw EventNotActive("Couldn't find active " + ownerType + " event with name=\"" + eventName + "\"");
    }

    if (!machine.hasState(toState)) {
        throw StateNotActive("Couldn't find active " + ownerType + " state with name=\"" + toState + "\"");
    }
    for (const auto &fromState : fromStates) {
        if (!machine.hasState(fromState)) {
            throw StateNotActive("Couldn't find active " + ownerType + " state with name=\"" + fromState + "\"");
        }
    }

    event->addTransition(std::make_shared<TransitionNode>(eventName, fromStates, toState, std::move(guard)));
}

void StateMachineRegistry::definePredicate(const std::string &ownerType, const std::string &name,
                                           PredicateFunction predicate) {
    requireNotFrozen("definePredicate");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    requireMutableMachine(ownerType).getMethods().definePredicate(name, std::move(predicate));
}

void StateMachineRegistry::defineAction(const std::string &ownerType, const std::string &name, ActionFunction action) {
    requireNotFrozen("defineAction");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    requireMutableMachine(ownerType).getMethods().defineAction(name, std::move(action));
}

bool StateMachineRegistry::hasMachine(const std::string &ownerType) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return machines_.find(ownerType) != machines_.end();
}

std::shared_ptr<const MachineDefinition> StateMachineRegistry::findMachine(const std::string &ownerType) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = machines_.find(ownerType);
    return it != machines_.end() ? it->second : nullptr;
}

const MachineDefinition &StateMachineRegistry::getMachine(const std::string &ownerType) const {
    auto machine = findMachine(ownerType);
    if (!machine) {
        throw MachineNotDefined(ownerType + " has no state machine");
    }
    return *machine;
}

bool StateMachineRegistry::isActiveState(const std::string &ownerType, const std::string &name) const {
    auto machine = findMachine(ownerType);
    return machine && machine->hasState(name);
}

bool StateMachineRegistry::isActiveEvent(const std::string &ownerType, const std::string &name) const {
    auto machine = findMachine(ownerType);
    return machine && machine->hasEvent(name);
}

std::vector<std::string> StateMachineRegistry::getLineage(const std::string &ownerType) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return lineageLocked(ownerType);
}

std::vector<std::string> StateMachineRegistry::getOwnerTypes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> ownerTypes;
    ownerTypes.reserve(machines_.size());
    for (const auto &[ownerType, machine] : machines_) {
        ownerTypes.push_back(ownerType);
    }
    return ownerTypes;
}

void StateMachineRegistry::freeze() {
    frozen_.store(true);
    LOG_INFO("StateMachineRegistry: Frozen with {} machines", getOwnerTypes().size());
}

MachineDefinition &StateMachineRegistry::requireMutableMachine(const std::string &ownerType) {
    auto it = machines_.find(ownerType);
    if (it == machines_.end()) {
        throw MachineNotDefined(ownerType + " has no state machine; call hasStates() first");
    }
    return *it->second;
}

std::vector<std::string> StateMachineRegistry::lineageLocked(const std::string &ownerType) const {
    std::vector<std::string> lineage;
    std::string current = ownerType;

    // Parent links are only created by inherit(), which requires an existing parent, so no cycles
    while (true) {
        lineage.push_back(current);
        auto it = machines_.find(current);
        if (it == machines_.end() || !it->second->getParentType()) {
            break;
        }
        current = *it->second->getParentType();
    }
    return lineage;
}

void StateMachineRegistry::requireNotFrozen(const std::string &operation) const {
    if (frozen_.load()) {
        throw std::logic_error("StateMachineRegistry is frozen; " + operation + " not allowed");
    }
}

}  // namespace SRE
