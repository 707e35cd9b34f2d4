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
#include "model/StateChange.h"
#include "runtime/IStateStore.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace SRE {

/**
 * @brief Append-only audit log of realized transitions
 *
 * Only called from inside a transition's atomic unit.
 */
class IStateChangeRecorder {
public:
    virtual ~IStateChangeRecorder() = default;

    /**
     * @brief Record a transition
     * @param unit Unit of work of the transition
     * @param record Transitioned record
     * @param fromState Previous state, std::nullopt for the initial entry
     * @param toState New state
     * @param eventName Fired event, std::nullopt for the initial entry
     */
    virtual void append(IAtomicUnit &unit, const IStatefulRecord &record, const std::optional<std::string> &fromState,
                        const std::string &toState, const std::optional<std::string> &eventName) = 0;

    virtual bool isEnabled() const = 0;
};

/**
 * @brief Recorder for owner types that did not opt in to recording
 */
class NullStateChangeRecorder : public IStateChangeRecorder {
public:
    void append(IAtomicUnit &, const IStatefulRecord &, const std::optional<std::string> &, const std::string &,
                const std::optional<std::string> &) override {}

    bool isEnabled() const override {
        return false;
    }
};

/**
 * @brief Recorder writing entries through the storage collaborator
 */
class StoreStateChangeRecorder : public IStateChangeRecorder {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit StoreStateChangeRecorder(std::shared_ptr<IStateStore> store, Clock clock = nullptr);

    void append(IAtomicUnit &unit, const IStatefulRecord &record, const std::optional<std::string> &fromState,
                const std::string &toState, const std::optional<std::string> &eventName) override;

    bool isEnabled() const override {
        return true;
    }

private:
    std::shared_ptr<IStateStore> store_;
    Clock clock_;
};

/**
 * @brief Recorder matching an owner type's recordChanges option
 */
std::unique_ptr<IStateChangeRecorder> createStateChangeRecorder(bool recordChanges, std::shared_ptr<IStateStore> store,
                                                                StoreStateChangeRecorder::Clock clock = nullptr);

}  // namespace SRE
