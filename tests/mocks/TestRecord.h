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

#include "common/Constants.h"
#include "model/IStatefulRecord.h"
#include <string>

namespace SRE {
namespace Test {

/**
 * @brief Plain stateful record for tests
 *
 * Starts as a new record with an unset state slot. markPersisted() flips it
 * to "created" once the test has stored it.
 */
class TestRecord : public IStatefulRecord {
public:
    TestRecord(const std::string &recordType, const std::string &recordId,
               const std::string &stateName = Constants::NO_STATE)
        : recordType_(recordType), recordId_(recordId), stateName_(stateName) {}

    const std::string &getRecordType() const override {
        return recordType_;
    }

    const std::string &getRecordId() const override {
        return recordId_;
    }

    bool isNewRecord() const override {
        return newRecord_;
    }

    const std::string &getStateName() const override {
        return stateName_;
    }

    void setStateName(const std::string &stateName) override {
        stateName_ = stateName;
    }

    void markPersisted() {
        newRecord_ = false;
    }

    // Free-form attributes used by guards in tests
    bool seatbeltOn = false;
    int gas = 100;

private:
    std::string recordType_;
    std::string recordId_;
    std::string stateName_;
    bool newRecord_ = true;
};

}  // namespace Test
}  // namespace SRE
