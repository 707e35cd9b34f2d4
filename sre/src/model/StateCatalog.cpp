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

#include "model/StateCatalog.h"
#include "common/Logger.h"
#include <functional>
#include <mutex>
#include <stdexcept>

namespace SRE {

size_t StateCatalog::KeyHash::operator()(const Key &key) const {
    size_t seed = std::hash<int>()(static_cast<int>(key.category));
    seed ^= std::hash<std::string>()(key.ownerType) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    seed ^= std::hash<std::string>()(key.name) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

int StateCatalog::declare(Category category, const std::string &ownerType, const std::string &name) {
    if (ownerType.empty() || name.empty()) {
        throw std::invalid_argument("StateCatalog: owner type and name are required");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    Key key{category, ownerType, name};
    auto existing = ids_.find(key);
    if (existing != ids_.end()) {
        return existing->second;
    }

    int id = nextId_++;
    ids_.emplace(std::move(key), id);
    declarationOrder_[categoryToString(category) + ":" + ownerType].push_back(name);

    LOG_DEBUG("StateCatalog: Declared {} '{}' for {} (id={})", categoryToString(category), name, ownerType, id);
    return id;
}

std::optional<int> StateCatalog::find(Category category, const std::vector<std::string> &lineage,
                                      const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    for (const auto &ownerType : lineage) {
        auto it = ids_.find(Key{category, ownerType, name});
        if (it != ids_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::vector<std::string> StateCatalog::getDeclaredNames(Category category, const std::string &ownerType) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = declarationOrder_.find(categoryToString(category) + ":" + ownerType);
    if (it == declarationOrder_.end()) {
        return {};
    }
    return it->second;
}

void StateCatalog::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ids_.clear();
    declarationOrder_.clear();
    nextId_ = 1;
}

std::string StateCatalog::categoryToString(Category category) {
    switch (category) {
    case Category::STATE:
        return "state";
    case Category::EVENT:
        return "event";
    default:
        return "unknown";
    }
}

}  // namespace SRE
