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
#include <string>

namespace SRE {

class MethodTable;

/**
 * @brief Lifecycle callback body
 *
 * Runs inside the transition's atomic unit; any exception it raises aborts
 * and rolls back the whole transition.
 */
class ICallbackAction {
public:
    virtual ~ICallbackAction() = default;

    virtual void execute(IStatefulRecord &record, const CallbackArgs &args, const MethodTable &methods) const = 0;

    virtual std::string describe() const = 0;
};

}  // namespace SRE
