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

#include "model/IStatefulRecord.h"
#include "model/StateChange.h"
#include <memory>
#include <string>
#include <vector>

namespace SRE {

/**
 * @brief Unit of work opened by the storage collaborator
 *
 * Every write performed through the unit becomes durable on commit() and is
 * undone by rollback(). Exactly one of the two may be called.
 */
class IAtomicUnit {
public:
    virtual ~IAtomicUnit() = default;

    virtual void commit() = 0;
    virtual void rollback() = 0;

    /**
     * @brief Whether neither commit() nor rollback() has been called yet
     */
    virtual bool isOpen() const = 0;
};

/**
 * @brief Storage collaborator contract
 *
 * The engine never decides storage consistency; it relies on the
 * conditional write to detect concurrent transitions of the same record.
 */
class IStateStore {
public:
    virtual ~IStateStore() = default;

    /**
     * @brief Read the persisted current state of a record
     * @return State name, Constants::NO_STATE if the record is unknown
     */
    virtual std::string readCurrentState(const IStatefulRecord &record) = 0;

    /**
     * @brief Compare-and-swap write of the current state
     * @param unit Unit of work the write belongs to
     * @param record Record being transitioned
     * @param expectedFrom State observed when the transition was selected
     * @param to New state
     * @return false if the persisted state no longer equals expectedFrom
     */
    virtual bool conditionalWriteState(IAtomicUnit &unit, const IStatefulRecord &record,
                                       const std::string &expectedFrom, const std::string &to) = 0;

    virtual std::unique_ptr<IAtomicUnit> openAtomicUnit() = 0;

    /**
     * @brief Append an audit entry
     * @throws std::runtime_error (or a subclass) if the entry cannot be stored
     */
    virtual void appendStateChange(IAtomicUnit &unit, const IStatefulRecord &record, const StateChange &change) = 0;

    /**
     * @brief Committed audit entries of a record, oldest first
     */
    virtual std::vector<StateChange> getStateChanges(const IStatefulRecord &record) = 0;

    virtual bool hasStateChanges(const IStatefulRecord &record) = 0;

    /**
     * @brief Number of records of an owner type whose state is one of the names
     */
    virtual size_t countInStates(const std::string &recordType, const std::vector<std::string> &stateNames) = 0;
};

}  // namespace SRE
