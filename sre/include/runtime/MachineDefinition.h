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

#include "model/EventNode.h"
#include "model/MethodTable.h"
#include "model/StateNode.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace SRE {

/**
 * @brief Rule producing a record's initial state
 *
 * Either a fixed state name or a function of the record.
 */
struct InitialStateRule {
    std::string stateName;
    std::function<std::string(const IStatefulRecord &)> resolver;

    static InitialStateRule named(const std::string &stateName) {
        InitialStateRule rule;
        rule.stateName = stateName;
        return rule;
    }

    static InitialStateRule computed(std::function<std::string(const IStatefulRecord &)> resolver) {
        InitialStateRule rule;
        rule.resolver = std::move(resolver);
        return rule;
    }

    bool isSet() const {
        return !stateName.empty() || static_cast<bool>(resolver);
    }

    bool isDynamic() const {
        return static_cast<bool>(resolver);
    }

    std::string resolve(const IStatefulRecord &record) const {
        return resolver ? resolver(record) : stateName;
    }
};

/**
 * @brief Per-owner-type machine options
 */
struct MachineOptions {
    InitialStateRule initial;
    bool recordChanges = true;  // Write a StateChange for every realized transition
};

/**
 * @brief Active states, events and named methods of one owner type
 */
class MachineDefinition {
public:
    MachineDefinition(const std::string &ownerType, const MachineOptions &options,
                      const std::optional<std::string> &parentType = std::nullopt);

    const std::string &getOwnerType() const {
        return ownerType_;
    }

    const std::optional<std::string> &getParentType() const {
        return parentType_;
    }

    const MachineOptions &getOptions() const {
        return options_;
    }

    void setInitialState(const InitialStateRule &rule);

    bool isRecordingChanges() const {
        return options_.recordChanges;
    }

    void addState(std::shared_ptr<StateNode> state);
    void addEvent(std::shared_ptr<EventNode> event);

    /**
     * @return Active state, nullptr if the name is not active
     */
    std::shared_ptr<StateNode> findState(const std::string &name) const;
    std::shared_ptr<EventNode> findEvent(const std::string &name) const;

    bool hasState(const std::string &name) const {
        return findState(name) != nullptr;
    }

    bool hasEvent(const std::string &name) const {
        return findEvent(name) != nullptr;
    }

    /**
     * @brief Active names in activation order
     */
    const std::vector<std::string> &getStateNames() const {
        return stateOrder_;
    }

    const std::vector<std::string> &getEventNames() const {
        return eventOrder_;
    }

    MethodTable &getMethods() {
        return methods_;
    }

    const MethodTable &getMethods() const {
        return methods_;
    }

    /**
     * @brief Deep copy for a subclass: every state and event is cloned with its owner rebound
     */
    std::shared_ptr<MachineDefinition> cloneFor(const std::string &subclassType) const;

private:
    std::string ownerType_;
    MachineOptions options_;
    std::optional<std::string> parentType_;
    std::unordered_map<std::string, std::shared_ptr<StateNode>> states_;
    std::unordered_map<std::string, std::shared_ptr<EventNode>> events_;
    std::vector<std::string> stateOrder_;
    std::vector<std::string> eventOrder_;
    MethodTable methods_;
};

}  // namespace SRE
