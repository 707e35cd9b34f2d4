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
#include "model/TransitionNode.h"
#include <memory>
#include <string>
#include <vector>

namespace SRE {

/**
 * @brief Active event of an owner type
 *
 * Holds the event's transitions in definition order; selection is
 * first-match-wins over that order. before/after callbacks wrap every
 * transition the event applies.
 */
class EventNode {
public:
    EventNode(const std::string &ownerType, const std::string &name, int catalogId);

    const std::string &getOwnerType() const {
        return ownerType_;
    }

    const std::string &getName() const {
        return name_;
    }

    int getCatalogId() const {
        return catalogId_;
    }

    /**
     * @brief Append a transition (definition order is significant)
     */
    void addTransition(std::shared_ptr<const TransitionNode> transition);

    const std::vector<std::shared_ptr<const TransitionNode>> &getTransitions() const {
        return transitions_;
    }

    /**
     * @brief Append a before/after callback
     * @throws std::invalid_argument for state phases
     */
    void addCallback(CallbackPhase phase, ConditionalCallback callback);

    void addCallbacks(const CallbackMap &callbacks);

    const std::vector<ConditionalCallback> &getCallbacks(CallbackPhase phase) const;

    /**
     * @brief Transitions eligible from the state whose guards pass, in definition order
     */
    std::vector<std::shared_ptr<const TransitionNode>> possibleTransitionsFrom(IStatefulRecord &record,
                                                                               const std::string &stateName,
                                                                               const CallbackArgs &args,
                                                                               const MethodTable &methods) const;

    /**
     * @brief First eligible transition whose guard passes
     * @return Selected transition, nullptr when nothing matches
     */
    std::shared_ptr<const TransitionNode> selectTransition(IStatefulRecord &record, const std::string &stateName,
                                                           const CallbackArgs &args,
                                                           const MethodTable &methods) const;

    std::shared_ptr<EventNode> cloneFor(const std::string &ownerType) const;

private:
    std::string ownerType_;
    std::string name_;
    int catalogId_;
    std::vector<std::shared_ptr<const TransitionNode>> transitions_;
    std::vector<ConditionalCallback> beforeCallbacks_;
    std::vector<ConditionalCallback> afterCallbacks_;
};

}  // namespace SRE
