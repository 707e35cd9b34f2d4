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

#include "model/EventNode.h"
#include "model/IStatefulRecord.h"
#include "model/StateNode.h"
#include "runtime/IStateStore.h"
#include "runtime/MachineDefinition.h"
#include "runtime/StateChangeRecorder.h"
#include "types.h"
#include <memory>
#include <string>

namespace SRE {

/**
 * @brief Applies one selected transition inside an atomic unit
 *
 * Callback order is fixed:
 *   before_exit(from) -> before_enter(to) -> before(event) -> write ->
 *   after_exit(from) -> after_enter(to) -> after(event) -> commit
 *
 * Every phase runs its declared callbacks in declaration order, then the
 * owner type's hook method for that phase if one is defined. An exception
 * from any step rolls the unit back, restores the record's state slot and
 * propagates unchanged.
 */
class TransitionExecutor {
public:
    /**
     * @param store Storage collaborator
     * @param clock Timestamp source of audit entries, system clock if empty
     */
    explicit TransitionExecutor(std::shared_ptr<IStateStore> store, StoreStateChangeRecorder::Clock clock = nullptr);

    /**
     * @brief Realize from -> to for the record
     * @throws ConcurrentTransitionConflict if the persisted state is no longer from
     */
    void execute(const MachineDefinition &machine, IStatefulRecord &record, const StateNode &from,
                 const StateNode &to, const EventNode &event, const CallbackArgs &args);

    /**
     * @brief Run after_enter of the initial state and record (none, initial, none)
     */
    void runInitialStateActions(const MachineDefinition &machine, IStatefulRecord &record,
                                const StateNode &initialState);

private:
    void runStatePhase(const MachineDefinition &machine, IStatefulRecord &record, const StateNode &state,
                       CallbackPhase phase, const CallbackArgs &args) const;
    void runEventPhase(const MachineDefinition &machine, IStatefulRecord &record, const EventNode &event,
                       CallbackPhase phase, const CallbackArgs &args) const;
    void runHook(const MachineDefinition &machine, IStatefulRecord &record, const std::string &hookName,
                 const CallbackArgs &args) const;

    std::shared_ptr<IStateStore> store_;
    StoreStateChangeRecorder::Clock clock_;
};

}  // namespace SRE
