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
#ifndef DLOCK_SESSION_H
#define DLOCK_SESSION_H

#include <expected>
#include <string>
#include <variant>
#include <vector>
#include "common/Error.hpp"
#include "lock/LockManager.hpp"

namespace dlock {

using Params = std::vector<std::string>;

// The underlying file-backed store's connection.
class Connection {
public:
    virtual ~Connection() = default;
    virtual std::expected<std::monostate, Error> connect() = 0;
    virtual std::expected<std::monostate, Error> close() = 0;
    virtual std::expected<std::monostate, Error> execute(const std::string& query, const Params& params) = 0;
    virtual std::expected<std::monostate, Error> executeMany(const std::string& query, const std::vector<Params>& paramSets) = 0;
    virtual std::expected<std::monostate, Error> commit() = 0;
    virtual std::expected<std::monostate, Error> rollback() = 0;
};

// Wraps every connection lifecycle call in the lock it needs.
class Session {
public:
    Session(Connection& c, LockManager& l);
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    std::expected<std::monostate, Error> connect();
    // Skipped, and reported as success, while a recovery marker is present
    // outside a transaction. A failed close keeps any lock it took.
    std::expected<std::monostate, Error> close();
    std::expected<std::monostate, Error> execute(const std::string& query, const Params& params = {});
    std::expected<std::monostate, Error> executeMany(const std::string& query, const std::vector<Params>& paramSets);
    std::expected<std::monostate, Error> commit();
    std::expected<std::monostate, Error> rollback();
private:
    Connection& connection;
    LockManager& lockManager;
};

} // namespace dlock

#endif // DLOCK_SESSION_H
