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

#include "model/MethodTable.h"
#include "common/StateMachineErrors.h"
#include <algorithm>

namespace SRE {

void MethodTable::definePredicate(const std::string &name, PredicateFunction predicate) {
    if (name.empty() || !predicate) {
        throw std::invalid_argument("Predicate requires a name and a callable");
    }
    predicates_[name] = std::move(predicate);
}

void MethodTable::defineAction(const std::string &name, ActionFunction action) {
    if (name.empty() || !action) {
        throw std::invalid_argument("Action requires a name and a callable");
    }
    actions_[name] = std::move(action);
}

bool MethodTable::hasPredicate(const std::string &name) const {
    return predicates_.find(name) != predicates_.end();
}

bool MethodTable::hasAction(const std::string &name) const {
    return actions_.find(name) != actions_.end();
}

bool MethodTable::callPredicate(const std::string &name, IStatefulRecord &record, const CallbackArgs &args) const {
    auto it = predicates_.find(name);
    if (it == predicates_.end()) {
        throw MethodNotFound("Undefined predicate '" + name + "' for " + record.getRecordType());
    }
    return it->second(record, args);
}

void MethodTable::callAction(const std::string &name, IStatefulRecord &record, const CallbackArgs &args) const {
    auto it = actions_.find(name);
    if (it == actions_.end()) {
        throw MethodNotFound("Undefined action '" + name + "' for " + record.getRecordType());
    }
    it->second(record, args);
}

std::vector<std::string> MethodTable::getPredicateNames() const {
    std::vector<std::string> names;
    names.reserve(predicates_.size());
    for (const auto &[name, predicate] : predicates_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> MethodTable::getActionNames() const {
    std::vector<std::string> names;
    names.reserve(actions_.size());
    for (const auto &[name, action] : actions_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace SRE
