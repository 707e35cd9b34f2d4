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
#include "model/MethodTable.h"
#include <memory>
#include <string>

namespace SRE {

/**
 * @brief Inline expression predicate
 */
class ExpressionPredicate : public IPredicate {
public:
    ExpressionPredicate(PredicateFunction expression, const std::string &description = "<expression>");

    bool evaluate(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const override;
    std::string describe() const override;

private:
    PredicateFunction expression_;
    std::string description_;
};

/**
 * @brief Predicate naming a method of the owner type
 *
 * Resolved against the record's method table at evaluation time, so a
 * subclass override is honored.
 */
class MethodPredicate : public IPredicate {
public:
    explicit MethodPredicate(const std::string &methodName);

    bool evaluate(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const override;
    std::string describe() const override;

    const std::string &getMethodName() const {
        return methodName_;
    }

private:
    std::string methodName_;
};

std::shared_ptr<const IPredicate> makeMethodPredicate(const std::string &methodName);
std::shared_ptr<const IPredicate> makeExpressionPredicate(PredicateFunction expression,
                                                          const std::string &description = "<expression>");

}  // namespace SRE
