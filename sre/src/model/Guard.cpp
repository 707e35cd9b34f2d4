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

#include "model/Guard.h"
#include <stdexcept>

namespace SRE {

Guard Guard::when(std::shared_ptr<const IPredicate> predicate) {
    Guard guard;
    guard.andIf(std::move(predicate));
    return guard;
}

Guard Guard::whenNot(std::shared_ptr<const IPredicate> predicate) {
    Guard guard;
    guard.unless(std::move(predicate));
    return guard;
}

Guard &Guard::andIf(std::shared_ptr<const IPredicate> predicate) {
    if (!predicate) {
        throw std::invalid_argument("Guard predicate cannot be null");
    }
    ifPredicates_.push_back(std::move(predicate));
    return *this;
}

Guard &Guard::unless(std::shared_ptr<const IPredicate> predicate) {
    if (!predicate) {
        throw std::invalid_argument("Guard predicate cannot be null");
    }
    unlessPredicates_.push_back(std::move(predicate));
    return *this;
}

bool Guard::passes(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const {
    for (const auto &predicate : ifPredicates_) {
        if (!predicate->evaluate(record, args, methods)) {
            return false;
        }
    }

    for (const auto &predicate : unlessPredicates_) {
        if (predicate->evaluate(record, args, methods)) {
            return false;
        }
    }

    return true;
}

std::string Guard::describe() const {
    if (isEmpty()) {
        return "<always>";
    }

    std::string result;
    for (const auto &predicate : ifPredicates_) {
        if (!result.empty()) {
            result += " && ";
        }
        result += predicate->describe();
    }
    for (const auto &predicate : unlessPredicates_) {
        if (!result.empty()) {
            result += " && ";
        }
        result += "!" + predicate->describe();
    }
    return result;
}

}  // namespace SRE
