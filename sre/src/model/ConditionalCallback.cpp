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

#include "model/ConditionalCallback.h"
#include "common/Logger.h"
#include <stdexcept>

namespace SRE {

ConditionalCallback::ConditionalCallback(std::shared_ptr<const ICallbackAction> action, Guard guard)
    : action_(std::move(action)), guard_(std::move(guard)) {
    if (!action_) {
        throw std::invalid_argument("ConditionalCallback requires an action");
    }
}

bool ConditionalCallback::run(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const {
    if (!guard_.passes(record, args, methods)) {
        LOG_DEBUG("Skipping callback '{}' - condition '{}' not met", action_->describe(), guard_.describe());
        return false;
    }

    action_->execute(record, args, methods);
    return true;
}

}  // namespace SRE
