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

#include "model/ICallbackAction.h"
#include "model/MethodTable.h"
#include <memory>
#include <string>

namespace SRE {

class FunctionAction : public ICallbackAction {
public:
    FunctionAction(ActionFunction function, const std::string &description = "<function>");

    void execute(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const override;
    std::string describe() const override;

private:
    ActionFunction function_;
    std::string description_;
};

/**
 * @brief Callback naming an action of the owner type's method table
 */
class MethodAction : public ICallbackAction {
public:
    explicit MethodAction(const std::string &methodName);

    void execute(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const override;
    std::string describe() const override;

private:
    std::string methodName_;
};

std::shared_ptr<const ICallbackAction> makeMethodAction(const std::string &methodName);
std::shared_ptr<const ICallbackAction> makeFunctionAction(ActionFunction function,
                                                          const std::string &description = "<function>");

}  // namespace SRE
