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

#include "runtime/InMemoryStateStore.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include <algorithm>
#include <stdexcept>

namespace SRE {

InMemoryStateStore::Unit::~Unit() {
    if (open_) {
        store_.discardUnit(*this);
    }
}

void InMemoryStateStore::Unit::commit() {
    if (!open_) {
        throw std::logic_error("Atomic unit already closed");
    }
    store_.applyUnit(*this);
    open_ = false;
    LOG_DEBUG("InMemoryStateStore: Unit {} committed", id_);
}

void InMemoryStateStore::Unit::rollback() {
    if (!open_) {
        throw std::logic_error("Atomic unit already closed");
    }
    size_t discarded = pendingWrites_.size() + pendingChanges_.size();
    store_.discardUnit(*this);
    open_ = false;
    LOG_DEBUG("InMemoryStateStore: Unit {} rolled back {} writes", id_, discarded);
}

std::string InMemoryStateStore::makeKey(const IStatefulRecord &record) {
    return record.getRecordType() + "#" + record.getRecordId();
}

InMemoryStateStore::Unit &InMemoryStateStore::requireOpenUnit(IAtomicUnit &unit) const {
    auto *memoryUnit = dynamic_cast<Unit *>(&unit);
    if (!memoryUnit || &memoryUnit->store_ != this) {
        throw std::invalid_argument("Atomic unit was not opened by this store");
    }
    if (!memoryUnit->isOpen()) {
        throw std::logic_error("Atomic unit already closed");
    }
    return *memoryUnit;
}

void InMemoryStateStore::applyUnit(Unit &unit) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto &[key, stateName] : unit.pendingWrites_) {
        auto it = records_.find(key);
        if (it != records_.end()) {
            it->second.stateName = stateName;
        }
    }
    for (auto &[key, change] : unit.pendingChanges_) {
        changes_[key].push_back(std::move(change));
    }

    releaseClaimsLocked(unit);
    unit.pendingWrites_.clear();
    unit.pendingChanges_.clear();
}

void InMemoryStateStore::discardUnit(Unit &unit) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    releaseClaimsLocked(unit);
    unit.pendingWrites_.clear();
    unit.pendingChanges_.clear();
}

void InMemoryStateStore::releaseClaimsLocked(const Unit &unit) {
    for (const auto &write : unit.pendingWrites_) {
        auto claim = claims_.find(write.first);
        if (claim != claims_.end() && claim->second == unit.getId()) {
            claims_.erase(claim);
        }
    }
}

void InMemoryStateStore::createRecord(const IStatefulRecord &record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string key = makeKey(record);
    if (records_.find(key) != records_.end()) {
        throw std::runtime_error("Record " + key + " already exists");
    }

    records_[key] = RecordEntry{record.getRecordType(), record.getStateName()};
    LOG_DEBUG("InMemoryStateStore: Created {} in state '{}'", key, record.getStateName());
}

bool InMemoryStateStore::containsRecord(const IStatefulRecord &record) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.find(makeKey(record)) != records_.end();
}

void InMemoryStateStore::forceState(const IStatefulRecord &record, const std::string &stateName) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(makeKey(record));
    if (it == records_.end()) {
        throw std::runtime_error("Record " + makeKey(record) + " does not exist");
    }
    it->second.stateName = stateName;
}

size_t InMemoryStateStore::getRecordCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::string InMemoryStateStore::readCurrentState(const IStatefulRecord &record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(makeKey(record));
    if (it == records_.end()) {
        return Constants::NO_STATE;
    }
    return it->second.stateName;
}

bool InMemoryStateStore::conditionalWriteState(IAtomicUnit &unit, const IStatefulRecord &record,
                                               const std::string &expectedFrom, const std::string &to) {
    Unit &memoryUnit = requireOpenUnit(unit);
    std::string key = makeKey(record);

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(key);
    if (it == records_.end()) {
        LOG_WARN("InMemoryStateStore: Conditional write rejected for {} - record does not exist", key);
        return false;
    }

    auto claim = claims_.find(key);
    if (claim != claims_.end() && claim->second != memoryUnit.getId()) {
        LOG_WARN("InMemoryStateStore: Conditional write rejected for {} - pending write of unit {}", key,
                 claim->second);
        return false;
    }

    // A unit sees its own latest pending write
    std::string current = it->second.stateName;
    for (const auto &write : memoryUnit.pendingWrites_) {
        if (write.first == key) {
            current = write.second;
        }
    }

    if (current != expectedFrom) {
        LOG_WARN("InMemoryStateStore: Conditional write rejected for {} - expected '{}', found '{}'", key,
                 expectedFrom, current);
        return false;
    }

    memoryUnit.pendingWrites_.emplace_back(key, to);
    claims_[key] = memoryUnit.getId();
    return true;
}

std::unique_ptr<IAtomicUnit> InMemoryStateStore::openAtomicUnit() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<Unit>(*this, nextUnitId_++);
}

void InMemoryStateStore::appendStateChange(IAtomicUnit &unit, const IStatefulRecord &record,
                                           const StateChange &change) {
    Unit &memoryUnit = requireOpenUnit(unit);

    std::lock_guard<std::mutex> lock(mutex_);
    memoryUnit.pendingChanges_.emplace_back(makeKey(record), change);
}

std::vector<StateChange> InMemoryStateStore::getStateChanges(const IStatefulRecord &record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = changes_.find(makeKey(record));
    if (it == changes_.end()) {
        return {};
    }
    return it->second;
}

bool InMemoryStateStore::hasStateChanges(const IStatefulRecord &record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = changes_.find(makeKey(record));
    return it != changes_.end() && !it->second.empty();
}

size_t InMemoryStateStore::countInStates(const std::string &recordType, const std::vector<std::string> &stateNames) {
    std::lock_guard<std::mutex> lock(mutex_);

    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(), [&](const auto &item) {
        const RecordEntry &entry = item.second;
        return entry.recordType == recordType &&
               std::find(stateNames.begin(), stateNames.end(), entry.stateName) != stateNames.end();
    }));
}

}  // namespace SRE
