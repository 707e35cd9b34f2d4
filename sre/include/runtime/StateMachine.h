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

#include "common/StateMachineErrors.h"
#include "model/IStatefulRecord.h"
#include "model/TransitionNode.h"
#include "runtime/IStateStore.h"
#include "runtime/StateMachineRegistry.h"
#include "runtime/TransitionExecutor.h"
#include "types.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SRE {

/**
 * @brief Result of firing an event
 */
struct FireOutcome {
    enum class Kind {
        NO_MATCH,  // No transition eligible from the current state; nothing changed
        APPLIED,   // Transition realized and committed
        REJECTED   // Engine refused the fire; nothing changed
    };

    Kind kind = Kind::NO_MATCH;
    std::string eventName;
    std::string fromState;
    std::string toState;                 // Only set when applied
    ErrorKind error = ErrorKind::NONE;  // Only set when rejected
    std::string errorMessage;

    static FireOutcome noMatch(const std::string &event, const std::string &from) {
        FireOutcome outcome;
        outcome.kind = Kind::NO_MATCH;
        outcome.eventName = event;
        outcome.fromState = from;
        return outcome;
    }

    static FireOutcome applied(const std::string &event, const std::string &from, const std::string &to) {
        FireOutcome outcome;
        outcome.kind = Kind::APPLIED;
        outcome.eventName = event;
        outcome.fromState = from;
        outcome.toState = to;
        return outcome;
    }

    static FireOutcome rejected(const std::string &event, const std::string &from, ErrorKind kind,
                                const std::string &message) {
        FireOutcome outcome;
        outcome.kind = Kind::REJECTED;
        outcome.eventName = event;
        outcome.fromState = from;
        outcome.error = kind;
        outcome.errorMessage = message;
        return outcome;
    }

    bool isApplied() const {
        return kind == Kind::APPLIED;
    }

    bool isNoMatch() const {
        return kind == Kind::NO_MATCH;
    }

    bool isRejected() const {
        return kind == Kind::REJECTED;
    }
};

/**
 * @brief Which entries into a state stateEnteredAt reports
 */
enum class Occurrence {
    FIRST,  // Earliest entry only
    LAST,   // Most recent entry only
    ALL     // Every entry, oldest first
};

/**
 * @brief Runtime entry point: fires events and answers state queries
 *
 * Holds no per-record state. A single instance may be shared by any number
 * of threads; transitions of the same record are serialized by the store's
 * conditional write.
 */
class StateMachine {
public:
    StateMachine(std::shared_ptr<const StateMachineRegistry> registry, std::shared_ptr<IStateStore> store,
                 StoreStateChangeRecorder::Clock clock = nullptr);

    /**
     * @brief Fire an event on a persisted record
     *
     * Engine-detected errors (inactive event or state, missing machine, unsaved
     * record, concurrent transition) are returned as REJECTED. A record whose
     * slot differs from the persisted state is rejected as a concurrent
     * transition before any callback runs. Exceptions from
     * callbacks, guards or the audit append propagate after full rollback.
     */
    FireOutcome fire(IStatefulRecord &record, const std::string &eventName, const CallbackArgs &args = {});

    /**
     * @brief State slot, or the initial state for a new record with no state yet
     */
    std::string currentState(const IStatefulRecord &record) const;

    /**
     * @throws MachineNotDefined if the record's type has no machine
     */
    std::string initialStateName(const IStatefulRecord &record) const;

    bool isActiveState(const std::string &ownerType, const std::string &stateName) const;
    bool isActiveEvent(const std::string &ownerType, const std::string &eventName) const;

    /**
     * @brief Transitions the event would consider from a state, guards evaluated
     * @throws EventNotActive if the event is not active for the record's type
     */
    std::vector<std::shared_ptr<const TransitionNode>> possibleTransitionsFrom(IStatefulRecord &record,
                                                                               const std::string &eventName,
                                                                               const std::string &stateName,
                                                                               const CallbackArgs &args = {}) const;

    /**
     * @brief Target states reachable by the event from the current state, in definition order
     */
    std::vector<std::string> nextStatesForEvent(IStatefulRecord &record, const std::string &eventName,
                                                const CallbackArgs &args = {}) const;

    std::optional<std::string> nextStateForEvent(IStatefulRecord &record, const std::string &eventName,
                                                 const CallbackArgs &args = {}) const;

    /**
     * @throws StateNotActive if the name is not an active state of the record's type
     */
    bool isInState(const IStatefulRecord &record, const std::string &stateName) const;

    /**
     * @brief Number of persisted records of the type in any of the states
     * @throws StateNotActive if one of the names is not active
     */
    size_t countInState(const std::string &ownerType, const std::vector<std::string> &stateNames) const;

    /**
     * @brief Times at which the record entered a state, from its recorded state changes
     * @return Empty if the record never entered the state (or its type records no changes)
     * @throws StateNotActive if the name is not an active state of the record's type
     */
    std::vector<std::chrono::system_clock::time_point> stateEnteredAt(const IStatefulRecord &record,
                                                                      const std::string &stateName,
                                                                      Occurrence occurrence = Occurrence::LAST) const;

    /**
     * @brief Fill an unset state slot with the initial state; call before first persistence
     * @throws StateNotActive if the initial state is not active
     */
    void assignInitialState(IStatefulRecord &record) const;

    /**
     * @brief Run the initial state's after_enter actions; call right after durable creation
     *
     * Always acts on initialStateName(record), even if the host stored another state.
     *
     * @return false if the record already has recorded state changes
     * @throws RecordNotPersisted if the record was never created
     */
    bool runInitialStateActions(IStatefulRecord &record);

    const StateMachineRegistry &getRegistry() const {
        return *registry_;
    }

private:
    const MachineDefinition &requireMachine(const std::string &ownerType) const;

    std::shared_ptr<const StateMachineRegistry> registry_;
    std::shared_ptr<IStateStore> store_;
    TransitionExecutor executor_;
};

}  // namespace SRE
