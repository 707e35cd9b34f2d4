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

#include "model/ConditionalCallback.h"
#include "types.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace SRE {

/**
 * @brief Active state of an owner type
 *
 * Identity is (ownerType, name). Carries the conditional enter/exit
 * callbacks of that state. Each owner type owns its own copy; inheriting
 * a machine clones the node with the owner rebound (cloneFor).
 */
class StateNode {
public:
    StateNode(const std::string &ownerType, const std::string &name, int catalogId);

    const std::string &getOwnerType() const {
        return ownerType_;
    }

    const std::string &getName() const {
        return name_;
    }

    /**
     * @brief Id of the name in the backing StateCatalog
     */
    int getCatalogId() const {
        return catalogId_;
    }

    /**
     * @brief Append a callback to one of the enter/exit phases
     * @throws std::invalid_argument for event phases (BEFORE/AFTER)
     */
    void addCallback(CallbackPhase phase, ConditionalCallback callback);

    void addCallbacks(const CallbackMap &callbacks);

    /**
     * @brief Callbacks of a phase in declaration order
     */
    const std::vector<ConditionalCallback> &getCallbacks(CallbackPhase phase) const;

    /**
     * @brief Deep copy bound to another owner type
     */
    std::shared_ptr<StateNode> cloneFor(const std::string &ownerType) const;

private:
    std::string ownerType_;
    std::string name_;
    int catalogId_;
    std::unordered_map<CallbackPhase, std::vector<ConditionalCallback>> callbacks_;
    const std::vector<ConditionalCallback> emptyCallbacks_;
};

}  // namespace SRE
