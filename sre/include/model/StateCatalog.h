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

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace SRE {

/**
 * @brief Pre-declared vocabulary of state and event names
 *
 * A state or event can only be activated for an owner type if its name was
 * declared here for that owner type or one of its ancestors.
 */
class StateCatalog {
public:
    enum class Category {
        STATE,
        EVENT
    };

    /**
     * @brief Declare a name for an owner type
     * @return Stable id of the declaration (existing id when declared twice)
     */
    int declare(Category category, const std::string &ownerType, const std::string &name);

    int declareState(const std::string &ownerType, const std::string &name) {
        return declare(Category::STATE, ownerType, name);
    }

    int declareEvent(const std::string &ownerType, const std::string &name) {
        return declare(Category::EVENT, ownerType, name);
    }

    /**
     * @brief Find a declaration along an owner lineage (most derived first)
     * @return Declaration id, std::nullopt if no owner in the lineage declares the name
     */
    std::optional<int> find(Category category, const std::vector<std::string> &lineage, const std::string &name) const;

    std::vector<std::string> getDeclaredNames(Category category, const std::string &ownerType) const;

    void clear();

    static std::string categoryToString(Category category);

private:
    struct Key {
        Category category;
        std::string ownerType;
        std::string name;

        bool operator==(const Key &other) const = default;
    };

    struct KeyHash {
        size_t operator()(const Key &key) const;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<Key, int, KeyHash> ids_;
    std::unordered_map<std::string, std::vector<std::string>> declarationOrder_;
    int nextId_ = 1;
};

}  // namespace SRE
