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

#include "runtime/TransitionExecutor.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "common/StateMachineErrors.h"
#include "runtime/AtomicUnitGuard.h"
#include "runtime/StateChangeRecorder.h"
#include <stdexcept>

namespace SRE {

namespace {

std::string hookPrefix(CallbackPhase phase) {
    switch (phase) {
    case CallbackPhase::BEFORE_ENTER:
        return Constants::HOOK_BEFORE_ENTER_PREFIX;
    case CallbackPhase::AFTER_ENTER:
        return Constants::HOOK_AFTER_ENTER_PREFIX;
    case CallbackPhase::BEFORE_EXIT:
        return Constants::HOOK_BEFORE_EXIT_PREFIX;
    case CallbackPhase::AFTER_EXIT:
        return Constants::HOOK_AFTER_EXIT_PREFIX;
    case CallbackPhase::BEFORE:
        return Constants::HOOK_BEFORE_EVENT_PREFIX;
    case CallbackPhase::AFTER:
        return Constants::HOOK_AFTER_EVENT_PREFIX;
    }
    return "";
}

}  // anonymous namespace

TransitionExecutor::TransitionExecutor(std::shared_ptr<IStateStore> store, StoreStateChangeRecorder::Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
    if (!store_) {
        throw std::invalid_argument("TransitionExecutor requires a state store");
    }
}

void TransitionExecutor::execute(const MachineDefinition &machine, IStatefulRecord &record, const StateNode &from,
                                 const StateNode &to, const EventNode &event, const CallbackArgs &args) {
    const std::string previousSlot = record.getStateName();
    auto recorder = createStateChangeRecorder(machine.isRecordingChanges(), store_, clock_);

    try {
        AtomicUnitGuard unit(*store_);

        runStatePhase(machine, record, from, CallbackPhase::BEFORE_EXIT, args);
        runStatePhase(machine, record, to, CallbackPhase::BEFORE_ENTER, args);
        runEventPhase(machine, record, event, CallbackPhase::BEFORE, args);

        if (!store_->conditionalWriteState(unit.get(), record, from.getName(), to.getName())) {
            throw ConcurrentTransitionConflict(record.getRecordType() + "#" + record.getRecordId() +
                                               " is no longer in state \"" + from.getName() + "\"");
        }
        record.setStateName(to.getName());
        recorder->append(unit.get(), record, from.getName(), to.getName(), event.getName());

        runStatePhase(machine, record, from, CallbackPhase::AFTER_EXIT, args);
        runStatePhase(machine, record, to, CallbackPhase::AFTER_ENTER, args);
        runEventPhase(machine, record, event, CallbackPhase::AFTER, args);

        unit.commit();
    } catch (const std::exception &e) {
        // The unit has already been rolled back by the guard at this point
        record.setStateName(previousSlot);
        LOG_ERROR("TransitionExecutor: {}#{} {} -> {} via {} rolled back - {}", record.getRecordType(),
                  record.getRecordId(), from.getName(), to.getName(), event.getName(), e.what());
        throw;
    } catch (...) {
        record.setStateName(previousSlot);
        LOG_ERROR("TransitionExecutor: {}#{} {} -> {} via {} rolled back - non-standard exception",
                  record.getRecordType(), record.getRecordId(), from.getName(), to.getName(), event.getName());
        throw;
    }

    LOG_INFO("TransitionExecutor: {}#{} {} -> {} via {}", record.getRecordType(), record.getRecordId(),
             from.getName(), to.getName(), event.getName());
}

void TransitionExecutor::runInitialStateActions(const MachineDefinition &machine, IStatefulRecord &record,
                                                const StateNode &initialState) {
    auto recorder = createStateChangeRecorder(machine.isRecordingChanges(), store_, clock_);

    try {
        AtomicUnitGuard unit(*store_);

        runStatePhase(machine, record, initialState, CallbackPhase::AFTER_ENTER, {});
        recorder->append(unit.get(), record, std::nullopt, initialState.getName(), std::nullopt);

        unit.commit();
    } catch (const std::exception &e) {
        LOG_ERROR("TransitionExecutor: Initial state actions of {}#{} rolled back - {}", record.getRecordType(),
                  record.getRecordId(), e.what());
        throw;
    } catch (...) {
        LOG_ERROR("TransitionExecutor: Initial state actions of {}#{} rolled back - non-standard exception",
                  record.getRecordType(), record.getRecordId());
        throw;
    }

    LOG_INFO("TransitionExecutor: {}#{} entered initial state {}", record.getRecordType(), record.getRecordId(),
             initialState.getName());
}

void TransitionExecutor::runStatePhase(const MachineDefinition &machine, IStatefulRecord &record,
                                       const StateNode &state, CallbackPhase phase, const CallbackArgs &args) const {
    const auto &callbacks = state.getCallbacks(phase);
    LOG_DEBUG("TransitionExecutor: {} '{}' ({} callbacks)", phaseToString(phase), state.getName(), callbacks.size());

    for (const auto &callback : callbacks) {
        callback.run(record, args, machine.getMethods());
    }
    runHook(machine, record, hookPrefix(phase) + state.getName(), args);
}

void TransitionExecutor::runEventPhase(const MachineDefinition &machine, IStatefulRecord &record,
                                       const EventNode &event, CallbackPhase phase, const CallbackArgs &args) const {
    const auto &callbacks = event.getCallbacks(phase);
    LOG_DEBUG("TransitionExecutor: {} '{}' ({} callbacks)", phaseToString(phase), event.getName(), callbacks.size());

    for (const auto &callback : callbacks) {
        callback.run(record, args, machine.getMethods());
    }
    runHook(machine, record, hookPrefix(phase) + event.getName(), args);
}

void TransitionExecutor::runHook(const MachineDefinition &machine, IStatefulRecord &record,
                                 const std::string &hookName, const CallbackArgs &args) const {
    if (!machine.getMethods().hasAction(hookName)) {
        return;
    }
    LOG_DEBUG("TransitionExecutor: Hook method {}", hookName);
    machine.getMethods().callAction(hookName, record, args);
}

}  // namespace SRE
