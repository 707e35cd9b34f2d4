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

#include "common/StateMachineErrors.h"

namespace SRE {

const char *errorKindToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE:
        return "None";
    case ErrorKind::STATE_NOT_FOUND:
        return "StateNotFound";
    case ErrorKind::STATE_NOT_ACTIVE:
        return "StateNotActive";
    case ErrorKind::STATE_ALREADY_ACTIVE:
        return "StateAlreadyActive";
    case ErrorKind::EVENT_NOT_FOUND:
        return "EventNotFound";
    case ErrorKind::EVENT_NOT_ACTIVE:
        return "EventNotActive";
    case ErrorKind::EVENT_ALREADY_ACTIVE:
        return "EventAlreadyActive";
    case ErrorKind::NO_INITIAL_STATE:
        return "NoInitialState";
    case ErrorKind::METHOD_NOT_FOUND:
        return "MethodNotFound";
    case ErrorKind::MACHINE_NOT_DEFINED:
        return "MachineNotDefined";
    case ErrorKind::RECORD_NOT_PERSISTED:
        return "RecordNotPersisted";
    case ErrorKind::CONCURRENT_TRANSITION_CONFLICT:
        return "ConcurrentTransitionConflict";
    }
    return "Unknown";
}

}  // namespace SRE
