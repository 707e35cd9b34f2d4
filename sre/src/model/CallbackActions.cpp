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

#include "model/CallbackActions.h"
#include <stdexcept>

namespace SRE {

FunctionAction::FunctionAction(ActionFunction function, const std::string &description)
    : function_(std::move(function)), description_(description) {
    if (!function_) {
        throw std::invalid_argument("FunctionAction requires a callable");
    }
}

void FunctionAction::execute(IStatefulRecord &record, const CallbackArgs &args,
                             [[maybe_unused]] const MethodTable &methods) const {
    function_(record, args);
}

std::string FunctionAction::describe() const {
    return description_;
}

MethodAction::MethodAction(const std::string &methodName) : methodName_(methodName) {
    if (methodName_.empty()) {
        throw std::invalid_argument("MethodAction requires a method name");
    }
}

void MethodAction::execute(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const {
    methods.callAction(methodName_, record, args);
}

std::string MethodAction::describe() const {
    return methodName_;
}

std::shared_ptr<const ICallbackAction> makeMethodAction(const std::string &methodName) {
    return std::make_shared<MethodAction>(methodName);
}

std::shared_ptr<const ICallbackAction> makeFunctionAction(ActionFunction function, const std::string &description) {
    return std::make_shared<FunctionAction>(std::move(function), description);
}

}  // namespace SRE
