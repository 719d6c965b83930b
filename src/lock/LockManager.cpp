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
#include "lock/LockManager.hpp"
#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <spdlog/spdlog.h>
#include "common/Backoff.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include "query/QueryClassifier.hpp"

namespace dlock {

LockManager::LockManager(LockConfig c, LockStore& s, Clock& cl, const RecoveryMarker& m)
    : cfg {std::move(c)},
      key {cfg.resourceKey()},
      store {s},
      clock {cl},
      marker {m},
      lockState {} {}

std::expected<std::monostate, Error> LockManager::acquire() {
    if (isLockActive()) {
        return {};
    }
    Backoff backoff {cfg.policy};
    const double deadline = clock.now() + std::chrono::duration<double>(cfg.policy.waitTimeout).count();
    int attempts = 0;
    while (clock.now() < deadline && attempts < cfg.policy.maxAttempts) {
        ++attempts;
        auto lockId = uuid_to_string(generate_uuid_v4());
        const double acquiredAt = clock.now();
        const LockRecord record {key, lockId, acquiredAt + cfg.lockExpiration};
        auto put = store.conditionalPut(record, acquiredAt);
        if (put.has_value()) {
            lockState.lockId = std::move(lockId);
            lockState.acquiredAt = acquiredAt;
            lockState.expiresAt = record.expiresAt;
            spdlog::info("Lock acquired: ID '{}', Resource '{}', Timestamp {:.6f}.",
                lockState.lockId.value(), cfg.resourcePath, acquiredAt);
            return {};
        }
        logPutFailure(put.error(), attempts, attempts == cfg.policy.maxAttempts);
        clearLock();
        if (const auto delay = backoff.nextDelay(); delay.has_value()) {
            clock.sleepFor(delay.value());
        }
    }
    spdlog::error("Lock acquisition failed: Resource '{}', Duration {} seconds, Attempts {}.",
        cfg.resourcePath, std::chrono::duration<double>(cfg.policy.waitTimeout).count(), attempts);
    return std::unexpected {Error {ErrorCode::ResourceBusy, "Failed to acquire lock.", key}};
}

void LockManager::release() {
    if (!isLockActive()) {
        spdlog::debug("No active lock to release.");
        return;
    }
    const auto& lockId = lockState.lockId.value();
    if (auto erased = store.conditionalDelete(key, lockId); !erased.has_value()) {
        spdlog::log(deleteFailureLevel(erased.error()), "Lock release failed: ID '{}', Resource '{}', Error '{}': {}.",
            lockId, cfg.resourcePath, toString(erased.error().code), erased.error().what);
    }
    const double releasedAt = clock.now();
    spdlog::info("Lock released: ID '{}', Resource '{}', Timestamp {:.6f}, Duration {:.3f} seconds.",
        lockId, cfg.resourcePath, releasedAt, releasedAt - lockState.acquiredAt.value_or(releasedAt));
    clearLock();
    lockState.inTransaction = false;
}

bool LockManager::isLockActive() const {
    return lockState.lockId.has_value()
        && lockState.expiresAt.has_value()
        && lockState.expiresAt.value() > clock.now();
}

std::expected<std::monostate, Error> LockManager::commit(const Finalize& finalize) {
    return this->finalize("commit", finalize);
}

std::expected<std::monostate, Error> LockManager::rollback(const Finalize& finalize) {
    return this->finalize("rollback", finalize);
}

bool LockManager::crashRecoveryCheck() const {
    return marker.present();
}

bool LockManager::inTransaction() const {
    return lockState.inTransaction;
}

const LockState& LockManager::state() const {
    return lockState;
}

const LockConfig& LockManager::config() const {
    return cfg;
}

std::expected<std::monostate, Error> LockManager::beginOperation(std::string_view operation) {
    lockState.pendingOperation = query::normalize(operation);
    const auto kind = query::classify(operation);
    if (kind == QueryKind::Read) {
        return {};
    }
    const bool startsTransaction = kind == QueryKind::TransactionStart;
    if (startsTransaction) {
        lockState.inTransaction = true;
    }
    auto acquired = acquire();
    if (!acquired.has_value()) {
        if (startsTransaction) {
            lockState.inTransaction = false;
        }
        lockState.pendingOperation.reset();
    }
    return acquired;
}

void LockManager::finishOperation() {
    if (!lockState.inTransaction) {
        release();
    }
    lockState.pendingOperation.reset();
}

std::expected<std::monostate, Error> LockManager::finalize(const std::string& what, const Finalize& f) {
    if (!isLockActive()) {
        return std::unexpected {Error {ErrorCode::LockRequired, "Lock is required for transaction " + what + ".", key}};
    }
    auto result = f();
    if (!result.has_value()) {
        spdlog::error("Transaction {} failed. Lock retained: ID '{}', Error '{}'.",
            what, lockState.lockId.value_or(""), result.error().what);
        return result;
    }
    spdlog::debug("Transaction {} succeeded. Releasing lock.", what);
    release();
    return {};
}

spdlog::level::level_enum putFailureLevel(const Error& error, bool lastAttempt) {
    if (error.code == ErrorCode::ConditionFailed) {
        return lastAttempt ? spdlog::level::warn : spdlog::level::info;
    }
    if (isTransient("conditionalPut", error.code)) {
        return lastAttempt ? spdlog::level::err : spdlog::level::warn;
    }
    return spdlog::level::critical;
}

spdlog::level::level_enum deleteFailureLevel(const Error& error) {
    if (error.code == ErrorCode::ConditionFailed) {
        return spdlog::level::warn;
    }
    if (isTransient("conditionalDelete", error.code)) {
        return spdlog::level::err;
    }
    return spdlog::level::critical;
}

void LockManager::logPutFailure(const Error& error, int attempt, bool last) const {
    spdlog::log(putFailureLevel(error, last), "Failed to add lock record. Key: '{}', Attempt: {}, Error: '{}': {}.",
        key, attempt, toString(error.code), error.what);
}

void LockManager::clearLock() {
    lockState.lockId.reset();
    lockState.acquiredAt.reset();
    lockState.expiresAt.reset();
}

} // namespace dlock
