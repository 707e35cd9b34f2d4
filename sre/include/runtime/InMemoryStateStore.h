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

#include "runtime/IStateStore.h"
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace SRE {

/**
 * @brief Process-local state store honoring the IStateStore contract
 *
 * Keeps persisted states and audit entries in memory. A unit's writes stay
 * pending inside the unit and become visible to readers only on commit.
 * While a unit holds a pending write for a record, conditional writes of
 * other units to that record fail. Thread-safe; must outlive its units.
 */
class InMemoryStateStore : public IStateStore {
public:
    InMemoryStateStore() = default;

    /**
     * @brief Durably create a record with the value of its state slot
     * @throws std::runtime_error if the record already exists
     */
    void createRecord(const IStatefulRecord &record);

    bool containsRecord(const IStatefulRecord &record) const;

    /**
     * @brief Overwrite the persisted state outside any unit (simulates another writer)
     */
    void forceState(const IStatefulRecord &record, const std::string &stateName);

    size_t getRecordCount() const;

    // IStateStore
    std::string readCurrentState(const IStatefulRecord &record) override;
    bool conditionalWriteState(IAtomicUnit &unit, const IStatefulRecord &record, const std::string &expectedFrom,
                               const std::string &to) override;
    std::unique_ptr<IAtomicUnit> openAtomicUnit() override;
    void appendStateChange(IAtomicUnit &unit, const IStatefulRecord &record, const StateChange &change) override;
    std::vector<StateChange> getStateChanges(const IStatefulRecord &record) override;
    bool hasStateChanges(const IStatefulRecord &record) override;
    size_t countInStates(const std::string &recordType, const std::vector<std::string> &stateNames) override;

private:
    class Unit : public IAtomicUnit {
    public:
        Unit(InMemoryStateStore &store, uint64_t id) : store_(store), id_(id) {}
        ~Unit() override;

        void commit() override;
        void rollback() override;

        bool isOpen() const override {
            return open_;
        }

        uint64_t getId() const {
            return id_;
        }

    private:
        friend class InMemoryStateStore;

        InMemoryStateStore &store_;
        uint64_t id_;
        bool open_ = true;
        std::vector<std::pair<std::string, std::string>> pendingWrites_;   // recordKey -> new state, in write order
        std::vector<std::pair<std::string, StateChange>> pendingChanges_;  // recordKey -> audit entry
    };

    struct RecordEntry {
        std::string recordType;
        std::string stateName;
    };

    static std::string makeKey(const IStatefulRecord &record);
    Unit &requireOpenUnit(IAtomicUnit &unit) const;

    void applyUnit(Unit &unit);
    void discardUnit(Unit &unit) noexcept;
    void releaseClaimsLocked(const Unit &unit);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RecordEntry> records_;                // recordKey -> committed state
    std::unordered_map<std::string, std::vector<StateChange>> changes_;  // recordKey -> committed audit entries
    std::unordered_map<std::string, uint64_t> claims_;                    // recordKey -> unit with a pending write
    uint64_t nextUnitId_ = 1;
};

}  // namespace SRE
