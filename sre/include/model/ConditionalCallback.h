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

#include "model/Guard.h"
#include "model/ICallbackAction.h"
#include "types.h"
#include <memory>
#include <unordered_map>
#include <vector>

namespace SRE {

/**
 * @brief Callback action paired with the guard deciding whether it runs
 */
class ConditionalCallback {
public:
    ConditionalCallback(std::shared_ptr<const ICallbackAction> action, Guard guard = Guard());

    /**
     * @brief Run the action if the guard passes
     * @return true if the action ran
     */
    bool run(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const;

    const ICallbackAction &getAction() const {
        return *action_;
    }

    const Guard &getGuard() const {
        return guard_;
    }

private:
    std::shared_ptr<const ICallbackAction> action_;
    Guard guard_;
};

/**
 * @brief Callbacks to attach at definition time, keyed by phase
 */
using CallbackMap = std::unordered_map<CallbackPhase, std::vector<ConditionalCallback>>;

}  // namespace SRE
