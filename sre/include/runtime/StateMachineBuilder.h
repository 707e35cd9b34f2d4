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

#include "runtime/StateMachineRegistry.h"
#include <functional>
#include <string>
#include <vector>

namespace SRE {

/**
 * @brief Adds transitions and callbacks to one event
 */
class EventBuilder {
public:
    EventBuilder(StateMachineRegistry &registry, const std::string &ownerType, const std::string &eventName)
        : registry_(registry), ownerType_(ownerType), eventName_(eventName) {}

    /**
     * @brief Append a transition; an empty fromStates means "from any state"
     */
    EventBuilder &transitionTo(const std::string &toState, const std::vector<std::string> &fromStates = {},
                               Guard guard = Guard()) {
        registry_.addTransition(ownerType_, eventName_, toState, fromStates, std::move(guard));
        return *this;
    }

    EventBuilder &before(ConditionalCallback callback) {
        registry_.extendEvent(ownerType_, eventName_).addCallback(CallbackPhase::BEFORE, std::move(callback));
        return *this;
    }

    EventBuilder &after(ConditionalCallback callback) {
        registry_.extendEvent(ownerType_, eventName_).addCallback(CallbackPhase::AFTER, std::move(callback));
        return *this;
    }

private:
    StateMachineRegistry &registry_;
    std::string ownerType_;
    std::string eventName_;
};

/**
 * @brief Fluent registration API for one owner type
 *
 * Each call is applied to the registry immediately, so errors surface at the
 * offending line of the definition.
 *
 * @code
 * StateMachineBuilder(registry, "Car")
 *     .declareStates({"parked", "idling", "first_gear"})
 *     .declareEvents({"ignite", "shift_up"})
 *     .hasStates("parked")
 *     .states({"parked", "idling"})
 *     .state("first_gear", {{CallbackPhase::BEFORE_ENTER, {ConditionalCallback(makeMethodAction("put_on_seatbelt"))}}})
 *     .event("ignite", [](EventBuilder &e) { e.transitionTo("idling", {"parked"}); })
 *     .event("shift_up", [](EventBuilder &e) {
 *         e.transitionTo("first_gear", {"idling"}, Guard::when(makeMethodPredicate("seatbelt_on")));
 *     });
 * @endcode
 */
class StateMachineBuilder {
public:
    using EventBody = std::function<void(EventBuilder &)>;

    StateMachineBuilder(StateMachineRegistry &registry, const std::string &ownerType);

    /**
     * @brief Add names to the owner type's backing vocabulary
     */
    StateMachineBuilder &declareStates(const std::vector<std::string> &names);
    StateMachineBuilder &declareEvents(const std::vector<std::string> &names);

    StateMachineBuilder &hasStates(const MachineOptions &options);
    StateMachineBuilder &hasStates(const std::string &initialState, bool recordChanges = true);

    /**
     * @brief Start from a copy of the parent's machine
     */
    StateMachineBuilder &inheritsFrom(const std::string &parentType);

    /**
     * @brief Override the initial-state rule (e.g. in a subclass)
     */
    StateMachineBuilder &initialState(const InitialStateRule &rule);

    StateMachineBuilder &state(const std::string &name, const CallbackMap &callbacks = {});

    /**
     * @brief Activate several states sharing the same callbacks
     */
    StateMachineBuilder &states(const std::vector<std::string> &names, const CallbackMap &callbacks = {});

    /**
     * @brief Add a callback to an already active (possibly inherited) state
     */
    StateMachineBuilder &onState(const std::string &name, CallbackPhase phase, ConditionalCallback callback);

    StateMachineBuilder &event(const std::string &name, const EventBody &body = nullptr,
                               const CallbackMap &callbacks = {});

    /**
     * @brief Reopen an active (possibly inherited) event
     */
    StateMachineBuilder &extendEvent(const std::string &name, const EventBody &body);

    StateMachineBuilder &predicate(const std::string &name, PredicateFunction predicate);
    StateMachineBuilder &action(const std::string &name, ActionFunction action);

    const std::string &getOwnerType() const {
        return ownerType_;
    }

private:
    StateMachineRegistry &registry_;
    std::string ownerType_;
};

}  // namespace SRE
