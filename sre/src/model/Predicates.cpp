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

#include "model/Predicates.h"
#include <stdexcept>

namespace SRE {

ExpressionPredicate::ExpressionPredicate(PredicateFunction expression, const std::string &description)
    : expression_(std::move(expression)), description_(description) {
    if (!expression_) {
        throw std::invalid_argument("ExpressionPredicate requires a callable");
    }
}

bool ExpressionPredicate::evaluate(IStatefulRecord &record, const CallbackArgs &args,
                                   [[maybe_unused]] const MethodTable &methods) const {
    return expression_(record, args);
}

std::string ExpressionPredicate::describe() const {
    return description_;
}

MethodPredicate::MethodPredicate(const std::string &methodName) : methodName_(methodName) {
    if (methodName_.empty()) {
        throw std::invalid_argument("MethodPredicate requires a method name");
    }
}

bool MethodPredicate::evaluate(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const {
    return methods.callPredicate(methodName_, record, args);
}

std::string MethodPredicate::describe() const {
    return methodName_;
}

std::shared_ptr<const IPredicate> makeMethodPredicate(const std::string &methodName) {
    return std::make_shared<MethodPredicate>(methodName);
}

std::shared_ptr<const IPredicate> makeExpressionPredicate(PredicateFunction expression,
                                                          const std::string &description) {
    return std::make_shared<ExpressionPredicate>(std::move(expression), description);
}

}  // namespace SRE
