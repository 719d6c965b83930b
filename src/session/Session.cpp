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
#include "session/Session.hpp"
#include <expected>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <spdlog/spdlog.h>
#include "common/Error.hpp"
#include "lock/LockManager.hpp"

namespace dlock {

namespace {

using Result = std::expected<std::monostate, Error>;

Result flatten(std::expected<Result, Error>&& guarded) {
    if (!guarded.has_value()) {
        return std::unexpected {guarded.error()};
    }
    return std::move(guarded).value();
}

} // namespace

Session::Session(Connection& c, LockManager& l) : connection {c}, lockManager {l} {}

std::expected<std::monostate, Error> Session::connect() {
    if (lockManager.crashRecoveryCheck()) {
        spdlog::warn("Rollback journal found. Acquiring lock before opening new connection.");
        if (auto acquired = lockManager.acquire(); !acquired.has_value()) {
            return acquired;
        }
    }
    auto connected = connection.connect();
    lockManager.release();
    return connected;
}

std::expected<std::monostate, Error> Session::close() {
    if (lockManager.inTransaction()) {
        if (auto acquired = lockManager.acquire(); !acquired.has_value()) {
            return acquired;
        }
    } else if (lockManager.crashRecoveryCheck()) {
        spdlog::warn("Rollback journal exists. Skip connection closure.");
        return {};
    }
    auto closed = connection.close();
    if (!closed.has_value()) {
        spdlog::error("Connection close failed. Lock retained: '{}'.", closed.error().what);
        return closed;
    }
    lockManager.release();
    return closed;
}

std::expected<std::monostate, Error> Session::execute(const std::string& query, const Params& params) {
    return flatten(lockManager.guardedOperation(query, [this, &query, &params] {
        spdlog::debug("Executing query: '{}'.", lockManager.state().pendingOperation.value_or(query));
        return connection.execute(query, params);
    }));
}

std::expected<std::monostate, Error> Session::executeMany(const std::string& query, const std::vector<Params>& paramSets) {
    return flatten(lockManager.guardedOperation(query, [this, &query, &paramSets] {
        spdlog::debug("Executing multiple queries: '{}'.", lockManager.state().pendingOperation.value_or(query));
        return connection.executeMany(query, paramSets);
    }));
}

std::expected<std::monostate, Error> Session::commit() {
    return lockManager.commit([this] { return connection.commit(); });
}

std::expected<std::monostate, Error> Session::rollback() {
    return lockManager.rollback([this] { return connection.rollback(); });
}

} // namespace dlock
