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

#include "model/IPredicate.h"
#include <memory>
#include <string>
#include <vector>

namespace SRE {

/**
 * @brief Combined if/unless condition
 *
 * Passes when every "if" predicate holds and no "unless" predicate holds.
 * An empty guard always passes. Predicates are evaluated in declaration
 * order and evaluation stops at the first deciding predicate.
 *
 * @code
 * Guard guard = Guard::when(makeMethodPredicate("seatbelt_on"))
 *                   .unless(makeMethodPredicate("out_of_gas"));
 * @endcode
 */
class Guard {
public:
    Guard() = default;

    static Guard when(std::shared_ptr<const IPredicate> predicate);
    static Guard whenNot(std::shared_ptr<const IPredicate> predicate);

    Guard &andIf(std::shared_ptr<const IPredicate> predicate);
    Guard &unless(std::shared_ptr<const IPredicate> predicate);

    bool isEmpty() const {
        return ifPredicates_.empty() && unlessPredicates_.empty();
    }

    bool passes(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const;

    const std::vector<std::shared_ptr<const IPredicate>> &getIfPredicates() const {
        return ifPredicates_;
    }

    const std::vector<std::shared_ptr<const IPredicate>> &getUnlessPredicates() const {
        return unlessPredicates_;
    }

    std::string describe() const;

private:
    std::vector<std::shared_ptr<const IPredicate>> ifPredicates_;
    std::vector<std::shared_ptr<const IPredicate>> unlessPredicates_;
};

}  // namespace SRE
