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
#include "types.h"
#include <string>

namespace SRE {

class MethodTable;

/**
 * @brief Condition over a record
 *
 * Every guard and callback condition is an IPredicate, whether it names a
 * method of the owner type or wraps an inline expression.
 */
class IPredicate {
public:
    virtual ~IPredicate() = default;

    /**
     * @brief Evaluate the condition
     * @param record Subject record
     * @param args Arguments passed to fire()
     * @param methods Method table of the record's owner type
     * @return true if the condition holds
     */
    virtual bool evaluate(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const = 0;

    /**
     * @brief Human readable form for logging
     */
    virtual std::string describe() const = 0;
};

}  // namespace SRE
