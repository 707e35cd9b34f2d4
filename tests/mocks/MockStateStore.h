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
#include "runtime/InMemoryStateStore.h"
#include <gmock/gmock.h>
#include <memory>

namespace SRE {
namespace Test {

/**
 * @brief gmock state store delegating to a real InMemoryStateStore
 *
 * By default every call reaches the in-memory store, so tests only override
 * the call they want to fail (e.g. appendStateChange) with EXPECT_CALL/ON_CALL.
 */
class MockStateStore : public IStateStore {
public:
    MockStateStore() : real_(std::make_shared<InMemoryStateStore>()) {
        using ::testing::_;
        using ::testing::Invoke;

        ON_CALL(*this, readCurrentState(_)).WillByDefault(Invoke(real_.get(), &InMemoryStateStore::readCurrentState));
        ON_CALL(*this, conditionalWriteState(_, _, _, _))
            .WillByDefault(Invoke(real_.get(), &InMemoryStateStore::conditionalWriteState));
        ON_CALL(*this, openAtomicUnit()).WillByDefault(Invoke(real_.get(), &InMemoryStateStore::openAtomicUnit));
        ON_CALL(*this, appendStateChange(_, _, _))
            .WillByDefault(Invoke(real_.get(), &InMemoryStateStore::appendStateChange));
        ON_CALL(*this, getStateChanges(_)).WillByDefault(Invoke(real_.get(), &InMemoryStateStore::getStateChanges));
        ON_CALL(*this, hasStateChanges(_)).WillByDefault(Invoke(real_.get(), &InMemoryStateStore::hasStateChanges));
        ON_CALL(*this, countInStates(_, _)).WillByDefault(Invoke(real_.get(), &InMemoryStateStore::countInStates));
    }

    MOCK_METHOD(std::string, readCurrentState, (const IStatefulRecord &record), (override));
    MOCK_METHOD(bool, conditionalWriteState,
                (IAtomicUnit & unit, const IStatefulRecord &record, const std::string &expectedFrom,
                 const std::string &to),
                (override));
    MOCK_METHOD(std::unique_ptr<IAtomicUnit>, openAtomicUnit, (), (override));
    MOCK_METHOD(void, appendStateChange, (IAtomicUnit & unit, const IStatefulRecord &record, const StateChange &change),
                (override));
    MOCK_METHOD(std::vector<StateChange>, getStateChanges, (const IStatefulRecord &record), (override));
    MOCK_METHOD(bool, hasStateChanges, (const IStatefulRecord &record), (override));
    MOCK_METHOD(size_t, countInStates, (const std::string &recordType, const std::vector<std::string> &stateNames),
                (override));

    InMemoryStateStore &real() {
        return *real_;
    }

private:
    std::shared_ptr<InMemoryStateStore> real_;
};

}  // namespace Test
}  // namespace SRE
