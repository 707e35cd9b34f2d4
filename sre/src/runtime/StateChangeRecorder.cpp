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

#include "runtime/StateChangeRecorder.h"
#include "common/Logger.h"
#include <stdexcept>

namespace SRE {

StoreStateChangeRecorder::StoreStateChangeRecorder(std::shared_ptr<IStateStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
    if (!store_) {
        throw std::invalid_argument("StoreStateChangeRecorder requires a state store");
    }
    if (!clock_) {
        clock_ = []() { return std::chrono::system_clock::now(); };
    }
}

void StoreStateChangeRecorder::append(IAtomicUnit &unit, const IStatefulRecord &record,
                                      const std::optional<std::string> &fromState, const std::string &toState,
                                      const std::optional<std::string> &eventName) {
    StateChange change;
    change.recordType = record.getRecordType();
    change.recordId = record.getRecordId();
    change.fromState = fromState;
    change.toState = toState;
    change.eventName = eventName;
    change.occurredAt = clock_();

    store_->appendStateChange(unit, record, change);

    LOG_DEBUG("StateChangeRecorder: {}#{} recorded {} -> {} via {}", change.recordType, change.recordId,
              fromState.value_or("<none>"), toState, eventName.value_or("<none>"));
}

std::unique_ptr<IStateChangeRecorder> createStateChangeRecorder(bool recordChanges, std::shared_ptr<IStateStore> store,
                                                                StoreStateChangeRecorder::Clock clock) {
    if (!recordChanges) {
        return std::make_unique<NullStateChangeRecorder>();
    }
    return std::make_unique<StoreStateChangeRecorder>(std::move(store), std::move(clock));
}

}  // namespace SRE
