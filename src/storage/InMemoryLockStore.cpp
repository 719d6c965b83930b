// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * DLock a distributed lock manager for shared file-backed stores.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "storage/InMemoryLockStore.hpp"
#include <expected>
#include <string>
#include <shared_mutex>
#include <mutex>
#include <cstddef>
#include <optional>
#include <variant>
#include "common/Error.hpp"

namespace dlock {

InMemoryLockStore::InMemoryLockStore() : store{}, m{} {}

std::expected<std::monostate, Error> InMemoryLockStore::conditionalPut(const LockRecord& record, double now) {
    const std::unique_lock lock {m};
    auto i = store.find(record.key);
    if (i == store.end()) {
        store.emplace(record.key, record);
        return {};
    }
    if (!(i->second.expiresAt < now)) {
        return std::unexpected {Error {ErrorCode::ConditionFailed, "Lock is held until " + std::to_string(i->second.expiresAt), record.key}};
    }
    i->second = record;
    return {};
}

std::expected<std::monostate, Error> InMemoryLockStore::conditionalDelete(const std::string& key, const std::string& ownerId) {
    const std::unique_lock lock {m};
    auto i = store.find(key);
    if (i == store.end()) {
        return std::unexpected {Error {ErrorCode::ConditionFailed, "No lock record", key}};
    }
    if (i->second.ownerId != ownerId) {
        return std::unexpected {Error {ErrorCode::ConditionFailed, "Lock is owned by " + i->second.ownerId, key}};
    }
    store.erase(i);
    return {};
}

std::optional<LockRecord> InMemoryLockStore::get(const std::string& key) const {
    const std::shared_lock lock {m};
    auto i = store.find(key);
    if (i == store.end()) {
        return std::nullopt;
    }
    return i->second;
}

size_t InMemoryLockStore::size() const {
    const std::shared_lock lock {m};
    return store.size();
}

} // namespace dlock
