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
#ifndef DLOCK_LOCK_STORE_HPP
#define DLOCK_LOCK_STORE_HPP

#include "common/Error.hpp"
#include <expected>
#include <string>
#include <variant>

namespace dlock {

struct LockRecord {
    std::string key;
    std::string ownerId;
    double expiresAt;

    bool operator==(const LockRecord& other) const = default;
};

// Both operations must be atomic at the store. A failed precondition is
// reported as ErrorCode::ConditionFailed, anything else is a transport or
// service fault.
class LockStore {
public:
    virtual ~LockStore() = default;

    // Writes iff no record exists for record.key or the existing one has
    // expiresAt < now.
    virtual std::expected<std::monostate, Error> conditionalPut(const LockRecord& record, double now) = 0;
    // Deletes iff the existing record is owned by ownerId.
    virtual std::expected<std::monostate, Error> conditionalDelete(const std::string& key, const std::string& ownerId) = 0;
};

} // namespace dlock

#endif // DLOCK_LOCK_STORE_HPP
