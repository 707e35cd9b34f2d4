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
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace SRE {

using PredicateFunction = std::function<bool(IStatefulRecord &, const CallbackArgs &)>;
using ActionFunction = std::function<void(IStatefulRecord &, const CallbackArgs &)>;

/**
 * @brief Named predicates and actions of one owner type
 *
 * Named guards/callbacks (MethodPredicate, MethodAction) and hook methods
 * such as "before_enter_first_gear" resolve here. Copied into subclasses on
 * inheritance; a subclass may override a name without touching the parent.
 */
class MethodTable {
public:
    void definePredicate(const std::string &name, PredicateFunction predicate);
    void defineAction(const std::string &name, ActionFunction action);

    bool hasPredicate(const std::string &name) const;
    bool hasAction(const std::string &name) const;

    /**
     * @brief Evaluate a named predicate
     * @throws MethodNotFound if no predicate with that name exists
     */
    bool callPredicate(const std::string &name, IStatefulRecord &record, const CallbackArgs &args) const;

    /**
     * @brief Invoke a named action
     * @throws MethodNotFound if no action with that name exists
     */
    void callAction(const std::string &name, IStatefulRecord &record, const CallbackArgs &args) const;

    std::vector<std::string> getPredicateNames() const;
    std::vector<std::string> getActionNames() const;

private:
    std::unordered_map<std::string, PredicateFunction> predicates_;
    std::unordered_map<std::string, ActionFunction> actions_;
};

}  // namespace SRE
