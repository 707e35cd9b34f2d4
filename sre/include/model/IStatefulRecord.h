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

#include <string>

namespace SRE {

/**
 * @brief Stateful record interface
 *
 * A host entity whose lifecycle is governed by the engine. The engine reads
 * and writes the in-memory state slot; persistence of that slot belongs to
 * the storage collaborator (IStateStore).
 */
class IStatefulRecord {
public:
    virtual ~IStatefulRecord() = default;

    /**
     * @brief Runtime owner type of the record (selects its machine)
     */
    virtual const std::string &getRecordType() const = 0;

    /**
     * @brief Identity of the record within its owner type
     */
    virtual const std::string &getRecordId() const = 0;

    /**
     * @brief Whether the record has not been durably created yet
     */
    virtual bool isNewRecord() const = 0;

    /**
     * @brief Current value of the state slot (Constants::NO_STATE if unset)
     */
    virtual const std::string &getStateName() const = 0;

    virtual void setStateName(const std::string &stateName) = 0;
};

}  // namespace SRE
