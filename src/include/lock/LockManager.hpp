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
#ifndef DLOCK_LOCK_MANAGER_H
#define DLOCK_LOCK_MANAGER_H

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <spdlog/common.h>
#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "lock/LockConfig.hpp"
#include "storage/LockStore.hpp"
#include "storage/RecoveryMarker.hpp"

namespace dlock {

// Condition failures are expected contention, transport faults are worth a
// warning, anything else is critical.
spdlog::level::level_enum putFailureLevel(const Error& error, bool lastAttempt);
// A ConditionFailed delete means the lease expired and someone else took it.
spdlog::level::level_enum deleteFailureLevel(const Error& error);

struct LockState {
    std::optional<std::string> lockId;
    std::optional<double> acquiredAt;
    std::optional<double> expiresAt;
    bool inTransaction {false};
    std::optional<std::string> pendingOperation;
};

// Holds at most one lease on config.resourceKey() in the lock store.
// One instance per connection, driven by a single thread.
class LockManager {
public:
    using Finalize = std::function<std::expected<std::monostate, Error>()>;

    LockManager(LockConfig c, LockStore& s, Clock& cl, const RecoveryMarker& m);
    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;

    // Retries conditional puts with linear backoff until maxAttempts or the
    // wait timeout runs out, then fails with ErrorCode::ResourceBusy.
    [[nodiscard]] std::expected<std::monostate, Error> acquire();
    // Never fails: a lease that cannot be deleted expires on its own.
    void release();
    [[nodiscard]] bool isLockActive() const;

    // Runs body under the lock its operation text calls for. Writes and
    // transaction starts acquire; reads do not. On exit the lock is released
    // unless a transaction is open.
    template<typename F, typename R = std::invoke_result_t<F&>>
    std::expected<R, Error> guardedOperation(std::string_view operation, F&& body) {
        if (auto begun = beginOperation(operation); !begun.has_value()) {
            return std::unexpected {begun.error()};
        }
        const OperationScope scope {*this};
        if constexpr (std::is_void_v<R>) {
            std::invoke(body);
            return {};
        } else {
            return std::expected<R, Error> {std::in_place, std::invoke(body)};
        }
    }

    // Both fail with ErrorCode::LockRequired, without calling finalize, when no
    // lock is held. A failed finalize keeps the lock.
    [[nodiscard]] std::expected<std::monostate, Error> commit(const Finalize& finalize);
    [[nodiscard]] std::expected<std::monostate, Error> rollback(const Finalize& finalize);

    [[nodiscard]] bool crashRecoveryCheck() const;
    [[nodiscard]] bool inTransaction() const;
    [[nodiscard]] const LockState& state() const;
    [[nodiscard]] const LockConfig& config() const;
private:
    class OperationScope {
    public:
        explicit OperationScope(LockManager& m) : manager {m} {}
        ~OperationScope() { manager.finishOperation(); }
        OperationScope(const OperationScope&) = delete;
        OperationScope& operator=(const OperationScope&) = delete;
    private:
        LockManager& manager;
    };

    std::expected<std::monostate, Error> beginOperation(std::string_view operation);
    void finishOperation();
    std::expected<std::monostate, Error> finalize(const std::string& what, const Finalize& f);
    void logPutFailure(const Error& error, int attempt, bool last) const;
    void clearLock();

    const LockConfig cfg;
    const std::string key;
    LockStore& store;
    Clock& clock;
    const RecoveryMarker& marker;
    LockState lockState;
};

} // namespace dlock

#endif // DLOCK_LOCK_MANAGER_H
