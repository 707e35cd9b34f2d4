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

#include "model/ConditionalCallback.h"
#include "model/StateCatalog.h"
#include "runtime/MachineDefinition.h"
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace SRE {

/**
 * @brief Per-owner-type table of state machine definitions
 *
 * Definitions are made once at startup (directly or through
 * StateMachineBuilder); afterwards the registry is read-only and can be
 * shared between threads without synchronization on the caller side.
 * freeze() turns any later definition attempt into a std::logic_error.
 *
 * Inheritance is an explicit deep copy: inherit(parent, subclass) clones
 * every state and event of the parent with the owner rebound to the
 * subclass, so extending the subclass never alters the parent.
 */
class StateMachineRegistry {
public:
    StateMachineRegistry() = default;

    StateMachineRegistry(const StateMachineRegistry &) = delete;
    StateMachineRegistry &operator=(const StateMachineRegistry &) = delete;

    /**
     * @brief Backing vocabulary states/events must be declared in before activation
     */
    StateCatalog &getCatalog() {
        return catalog_;
    }

    const StateCatalog &getCatalog() const {
        return catalog_;
    }

    /**
     * @brief Give an owner type a state machine
     * @throws NoInitialState if options carry no initial-state rule
     * @throws std::logic_error if the owner type already has a machine
     */
    MachineDefinition &hasStates(const std::string &ownerType, const MachineOptions &options);

    /**
     * @brief Copy the parent's machine into a subclass
     * @throws MachineNotDefined if the parent has no machine
     * @throws std::logic_error if the subclass already has a machine
     */
    MachineDefinition &inherit(const std::string &parentType, const std::string &subclassType);

    /**
     * @brief Replace the initial-state rule of an owner type
     * @throws NoInitialState if the rule is empty
     */
    void setInitialState(const std::string &ownerType, const InitialStateRule &rule);

    /**
     * @brief Activate a declared state
     * @throws StateAlreadyActive if the name is already active for the owner type
     * @throws StateNotFound if the name is not declared for the owner type or its ancestors
     */
    StateNode &defineState(const std::string &ownerType, const std::string &name, const CallbackMap &callbacks = {});

    /**
     * @brief Reopen an active state (own or inherited copy) to add callbacks
     * @throws StateNotActive if the name is not active
     */
    StateNode &extendState(const std::string &ownerType, const std::string &name);

    /**
     * @brief Activate a declared event
     * @throws EventAlreadyActive if the name is already active for the owner type
     * @throws EventNotFound if the name is not declared for the owner type or its ancestors
     * @throws std::invalid_argument if the name starts with "enter_" or "exit_"
     */
    EventNode &defineEvent(const std::string &ownerType, const std::string &name, const CallbackMap &callbacks = {});

    /**
     * @brief Reopen an active event (own or inherited copy) to add transitions or callbacks
     * @throws EventNotActive if the name is not active
     */
    EventNode &extendEvent(const std::string &ownerType, const std::string &name);

    /**
     * @brief Append a transition to an active event
     * @param fromStates Eligible source states, empty for "any state"
     * @throws EventNotActive if the event is not active
     * @throws StateNotActive if the target or a source state is not active
     */
    void addTransition(const std::string &ownerType, const std::string &eventName, const std::string &toState,
                       const std::vector<std::string> &fromStates = {}, Guard guard = Guard());

    void definePredicate(const std::string &ownerType, const std::string &name, PredicateFunction predicate);
    void defineAction(const std::string &ownerType, const std::string &name, ActionFunction action);

    bool hasMachine(const std::string &ownerType) const;

    /**
     * @return Machine of the owner type, nullptr if none
     */
    std::shared_ptr<const MachineDefinition> findMachine(const std::string &ownerType) const;

    /**
     * @throws MachineNotDefined if the owner type has no machine
     */
    const MachineDefinition &getMachine(const std::string &ownerType) const;

    bool isActiveState(const std::string &ownerType, const std::string &name) const;
    bool isActiveEvent(const std::string &ownerType, const std::string &name) const;

    /**
     * @brief Owner type followed by its ancestors, most derived first
     */
    std::vector<std::string> getLineage(const std::string &ownerType) const;

    std::vector<std::string> getOwnerTypes() const;

    void freeze();

    bool isFrozen() const {
        return frozen_.load();
    }

private:
    MachineDefinition &requireMutableMachine(const std::string &ownerType);
    std::vector<std::string> lineageLocked(const std::string &ownerType) const;
    void requireNotFrozen(const std::string &operation) const;

    mutable std::shared_mutex mutex_;
    StateCatalog catalog_;
    std::unordered_map<std::string, std::shared_ptr<MachineDefinition>> machines_;
    std::atomic<bool> frozen_{false};
};

}  // namespace SRE
