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

#include <stdexcept>
#include <string>

namespace SRE {

/**
 * @brief Classification of every failure the engine can report
 */
enum class ErrorKind {
    NONE,
    STATE_NOT_FOUND,
    STATE_NOT_ACTIVE,
    STATE_ALREADY_ACTIVE,
    EVENT_NOT_FOUND,
    EVENT_NOT_ACTIVE,
    EVENT_ALREADY_ACTIVE,
    NO_INITIAL_STATE,
    METHOD_NOT_FOUND,
    MACHINE_NOT_DEFINED,
    RECORD_NOT_PERSISTED,
    CONCURRENT_TRANSITION_CONFLICT
};

/**
 * @brief Convert error kind to its canonical name (e.g. "StateNotActive")
 */
const char *errorKindToString(ErrorKind kind);

/**
 * @brief Base class of all engine errors
 */
class StateMachineError : public std::runtime_error {
public:
    StateMachineError(ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

    ErrorKind getKind() const {
        return kind_;
    }

private:
    ErrorKind kind_;
};

// An unknown state was specified
class StateNotFound : public StateMachineError {
public:
    explicit StateNotFound(const std::string &message) : StateMachineError(ErrorKind::STATE_NOT_FOUND, message) {}
};

// An inactive state was specified
class StateNotActive : public StateMachineError {
public:
    explicit StateNotActive(const std::string &message) : StateMachineError(ErrorKind::STATE_NOT_ACTIVE, message) {}
};

// A state has already been activated
class StateAlreadyActive : public StateMachineError {
public:
    explicit StateAlreadyActive(const std::string &message)
        : StateMachineError(ErrorKind::STATE_ALREADY_ACTIVE, message) {}
};

// An unknown event was specified
class EventNotFound : public StateMachineError {
public:
    explicit EventNotFound(const std::string &message) : StateMachineError(ErrorKind::EVENT_NOT_FOUND, message) {}
};

// An inactive event was specified
class EventNotActive : public StateMachineError {
public:
    explicit EventNotActive(const std::string &message) : StateMachineError(ErrorKind::EVENT_NOT_ACTIVE, message) {}
};

// An event has already been activated
class EventAlreadyActive : public StateMachineError {
public:
    explicit EventAlreadyActive(const std::string &message)
        : StateMachineError(ErrorKind::EVENT_ALREADY_ACTIVE, message) {}
};

// No initial state was specified for the machine
class NoInitialState : public StateMachineError {
public:
    explicit NoInitialState(const std::string &message) : StateMachineError(ErrorKind::NO_INITIAL_STATE, message) {}
};

// A named predicate or action is not defined for the owner type
class MethodNotFound : public StateMachineError {
public:
    explicit MethodNotFound(const std::string &message) : StateMachineError(ErrorKind::METHOD_NOT_FOUND, message) {}
};

// The owner type never declared a machine
class MachineNotDefined : public StateMachineError {
public:
    explicit MachineNotDefined(const std::string &message)
        : StateMachineError(ErrorKind::MACHINE_NOT_DEFINED, message) {}
};

// The record has not been created in the store yet
class RecordNotPersisted : public StateMachineError {
public:
    explicit RecordNotPersisted(const std::string &message)
        : StateMachineError(ErrorKind::RECORD_NOT_PERSISTED, message) {}
};

// The persisted state diverged from the state observed at selection time
class ConcurrentTransitionConflict : public StateMachineError {
public:
    explicit ConcurrentTransitionConflict(const std::string &message)
        : StateMachineError(ErrorKind::CONCURRENT_TRANSITION_CONFLICT, message) {}
};

}  // namespace SRE
