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
#ifndef DLOCK_IN_MEMORY_LOCK_STORE_H
#define DLOCK_IN_MEMORY_LOCK_STORE_H

#include <string>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <expected>
#include <optional>
#include "common/Error.hpp"
#include "storage/LockStore.hpp"

namespace dlock {

class InMemoryLockStore : public LockStore {
public:
    InMemoryLockStore();
    std::expected<std::monostate, Error> conditionalPut(const LockRecord& record, double now) override;
    std::expected<std::monostate, Error> conditionalDelete(const std::string& key, const std::string& ownerId) override;
    [[nodiscard]] std::optional<LockRecord> get(const std::string& key) const;
    [[nodiscard]] size_t size() const;
private:
    std::unordered_map<std::string, LockRecord> store;
    mutable std::shared_mutex m;
};

} // namespace dlock

#endif // DLOCK_IN_MEMORY_LOCK_STORE_H
