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

#include "common/Logger.h"
#include "runtime/IStateStore.h"
#include <memory>
#include <stdexcept>

namespace SRE {

/**
 * @brief RAII scope of an atomic unit of work
 *
 * Opens a unit on construction; rolls it back on scope exit unless
 * commit() was reached.
 *
 * Usage:
 * @code
 * {
 *     AtomicUnitGuard unit(store);
 *     store.conditionalWriteState(unit.get(), record, "parked", "idling");
 *     unit.commit();
 * }  // rolled back instead if anything above threw
 * @endcode
 */
class AtomicUnitGuard {
public:
    explicit AtomicUnitGuard(IStateStore &store) : unit_(store.openAtomicUnit()) {
        if (!unit_) {
            throw std::runtime_error("State store returned no atomic unit");
        }
    }

    /**
     * @brief Destructor rolls back an uncommitted unit
     * @note noexcept to prevent exception propagation during stack unwinding
     */
    ~AtomicUnitGuard() noexcept {
        if (unit_->isOpen()) {
            try {
                unit_->rollback();
            } catch (const std::exception &e) {
                LOG_ERROR("AtomicUnitGuard: Rollback failed - {}", e.what());
            }
        }
    }

    IAtomicUnit &get() {
        return *unit_;
    }

    void commit() {
        unit_->commit();
    }

    AtomicUnitGuard(const AtomicUnitGuard &) = delete;
    AtomicUnitGuard &operator=(const AtomicUnitGuard &) = delete;
    AtomicUnitGuard(AtomicUnitGuard &&) = delete;
    AtomicUnitGuard &operator=(AtomicUnitGuard &&) = delete;

private:
    std::unique_ptr<IAtomicUnit> unit_;
};

}  // namespace SRE
