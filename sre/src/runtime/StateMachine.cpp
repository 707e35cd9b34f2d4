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

#include "runtime/StateMachine.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include <stdexcept>

namespace SRE {

StateMachine::StateMachine(std::shared_ptr<const StateMachineRegistry> registry, std::shared_ptr<IStateStore> store,
                           StoreStateChangeRecorder::Clock clock)
    : registry_(std::move(registry)), store_(std::move(store)), executor_(store_, std::move(clock)) {
    if (!registry_) {
        throw std::invalid_argument("StateMachine requires a registry");
    }
}

FireOutcome StateMachine::fire(IStatefulRecord &record, const std::string &eventName, const CallbackArgs &args) {
    const std::string &recordType = record.getRecordType();
    const std::string current = record.getStateName();

    auto reject = [&](ErrorKind kind, const std::string &message) {
        LOG_WARN("StateMachine: {} rejected for {}#{} - {}: {}", eventName, recordType, record.getRecordId(),
                 errorKindToString(kind), message);
        return FireOutcome::rejected(eventName, current, kind, message);
    };

    auto machine = registry_->findMachine(recordType);
    if (!machine) {
        return reject(ErrorKind::MACHINE_NOT_DEFINED, recordType + " has no state machine");
    }
    if (record.isNewRecord()) {
        return reject(ErrorKind::RECORD_NOT_PERSISTED, recordType + "#" + record.getRecordId() + " was never created");
    }

    auto event = machine->findEvent(eventName);
    if (!event) {
        return reject(ErrorKind::EVENT_NOT_ACTIVE,
                      "Couldn't find active " + recordType + " event with name=\"" + eventName + "\"");
    }

    auto from = machine->findState(current);
    if (!from) {
        return reject(ErrorKind::STATE_NOT_ACTIVE,
                      "Couldn't find active " + recordType + " state with name=\"" + current + "\"");
    }

    auto transition = event->selectTransition(record, current, args, machine->getMethods());
    if (!transition) {
        LOG_DEBUG("StateMachine: {} has no transition from '{}' for {}#{}", eventName, current, recordType,
                  record.getRecordId());
        return FireOutcome::noMatch(eventName, current);
    }

    auto to = machine->findState(transition->getToState());
    if (!to) {
        return reject(ErrorKind::STATE_NOT_ACTIVE, "Couldn't find active " + recordType + " state with name=\"" +
                                                       transition->getToState() + "\"");
    }

    std::string persisted = store_->readCurrentState(record);
    if (persisted != current) {
        return reject(ErrorKind::CONCURRENT_TRANSITION_CONFLICT, recordType + "#" + record.getRecordId() +
                                                                     " is persisted in state \"" + persisted + "\"");
    }

    try {
        executor_.execute(*machine, record, *from, *to, *event, args);
    } catch (const ConcurrentTransitionConflict &e) {
        return reject(e.getKind(), e.what());
    }

    return FireOutcome::applied(eventName, current, to->getName());
}

std::string StateMachine::currentState(const IStatefulRecord &record) const {
    if (record.isNewRecord() && record.getStateName() == Constants::NO_STATE) {
        return initialStateName(record);
    }
    return record.getStateName();
}

std::string StateMachine::initialStateName(const IStatefulRecord &record) const {
    return requireMachine(record.getRecordType()).getOptions().initial.resolve(record);
}

bool StateMachine::isActiveState(const std::string &ownerType, const std::string &stateName) const {
    return registry_->isActiveState(ownerType, stateName);
}

bool StateMachine::isActiveEvent(const std::string &ownerType, const std::string &eventName) const {
    return registry_->isActiveEvent(ownerType, eventName);
}

std::vector<std::shared_ptr<const TransitionNode>> StateMachine::possibleTransitionsFrom(
    IStatefulRecord &record, const std::string &eventName, const std::string &stateName,
    const CallbackArgs &args) const {
    const MachineDefinition &machine = requireMachine(record.getRecordType());

    auto event = machine.findEvent(eventName);
    if (!event) {
        throw EventNotActive("Couldn't find active " + record.getRecordType() + " event with name=\"" + eventName +
                             "\"");
    }
    return event->possibleTransitionsFrom(record, stateName, args, machine.getMethods());
}

std::vector<std::string> StateMachine::nextStatesForEvent(IStatefulRecord &record, const std::string &eventName,
                                                          const CallbackArgs &args) const {
    std::vector<std::string> nextStates;
    for (const auto &transition : possibleTransitionsFrom(record, eventName, currentState(record), args)) {
        nextStates.push_back(transition->getToState());
    }
    return nextStates;
}

std::optional<std::string> StateMachine::nextStateForEvent(IStatefulRecord &record, const std::string &eventName,
                                                           const CallbackArgs &args) const {
    auto nextStates = nextStatesForEvent(record, eventName, args);
    if (nextStates.empty()) {
        return std::nullopt;
    }
    return nextStates.front();
}

bool StateMachine::isInState(const IStatefulRecord &record, const std::string &stateName) const {
    if (!requireMachine(record.getRecordType()).hasState(stateName)) {
        throw StateNotActive("Couldn't find active " + record.getRecordType() + " state with name=\"" + stateName +
                             "\"");
    }
    return currentState(record) == stateName;
}

size_t StateMachine::countInState(const std::string &ownerType, const std::vector<std::string> &stateNames) const {
    const MachineDefinition &machine = requireMachine(ownerType);
    for (const auto &name : stateNames) {
        if (!machine.hasState(name)) {
            throw StateNotActive("Couldn't find active " + ownerType + " state with name=\"" + name + "\"");
        }
    }
    return store_->countInStates(ownerType, stateNames);
}

std::vector<std::chrono::system_clock::time_point> StateMachine::stateEnteredAt(const IStatefulRecord &record,
                                                                                const std::string &stateName,
                                                                                Occurrence occurrence) const {
    if (!requireMachine(record.getRecordType()).hasState(stateName)) {
        throw StateNotActive("Couldn't find active " + record.getRecordType() + " state with name=\"" + stateName +
                             "\"");
    }

    std::vector<std::chrono::system_clock::time_point> times;
    for (const auto &change : store_->getStateChanges(record)) {
        if (change.toState == stateName) {
            times.push_back(change.occurredAt);
        }
    }

    if (times.empty() || occurrence == Occurrence::ALL) {
        return times;
    }
    if (occurrence == Occurrence::FIRST) {
        return {times.front()};
    }
    return {times.back()};
}

void StateMachine::assignInitialState(IStatefulRecord &record) const {
    if (record.getStateName() != Constants::NO_STATE) {
        return;
    }

    const MachineDefinition &machine = requireMachine(record.getRecordType());
    std::string initial = machine.getOptions().initial.resolve(record);
    if (!machine.hasState(initial)) {
        throw StateNotActive("Couldn't find active " + record.getRecordType() + " state with name=\"" + initial +
                             "\"");
    }

    record.setStateName(initial);
    LOG_DEBUG("StateMachine: {}#{} assigned initial state {}", record.getRecordType(), record.getRecordId(), initial);
}

bool StateMachine::runInitialStateActions(IStatefulRecord &record) {
    if (record.isNewRecord()) {
        throw RecordNotPersisted(record.getRecordType() + "#" + record.getRecordId() + " was never created");
    }

    const MachineDefinition &machine = requireMachine(record.getRecordType());
    if (store_->hasStateChanges(record)) {
        LOG_DEBUG("StateMachine: {}#{} already has state changes, initial actions skipped", record.getRecordType(),
                  record.getRecordId());
        return false;
    }

    std::string initialName = machine.getOptions().initial.resolve(record);
    auto initial = machine.findState(initialName);
    if (!initial) {
        throw StateNotActive("Couldn't find active " + record.getRecordType() + " state with name=\"" + initialName +
                             "\"");
    }

    executor_.runInitialStateActions(machine, record, *initial);
    return true;
}

const MachineDefinition &StateMachine::requireMachine(const std::string &ownerType) const {
    return registry_->getMachine(ownerType);
}

}  // namespace SRE
