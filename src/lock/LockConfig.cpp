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
#include "lock/LockConfig.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include "common/Settings.hpp"

namespace dlock {

namespace {

constexpr int defaultWaitTimeoutSeconds = 3;
constexpr int defaultMaxAttempts = 10;
constexpr std::chrono::microseconds baseDelay {50000L};

} // namespace

LockConfig::LockConfig(std::string path, std::string table, double expiration, RetryPolicy p)
    : resourcePath {std::move(path)},
      lockTable {std::move(table)},
      lockExpiration {expiration},
      policy {p} {
    if (resourcePath.empty()) {
        throw ConfigurationError("Resource path must not be empty.");
    }
    if (lockTable.empty()) {
        throw ConfigurationError(std::string{lockTableSetting} + " must not be empty.");
    }
    if (!(lockExpiration > 0)) {
        throw ConfigurationError(std::string{lockExpirationSetting} + " must be > zero.");
    }
}

LockConfig LockConfig::fromSettings(const Settings& settings, const std::string& path, std::optional<int> waitTimeout) {
    const int wait = waitTimeout.has_value() && waitTimeout.value() >= 1 ? waitTimeout.value() : defaultWaitTimeoutSeconds;
    const int attempts = settings.getInt(lockMaxAttemptsSetting, defaultMaxAttempts);
    const double expiration = settings.getDouble(lockExpirationSetting);
    auto table = settings.get(lockTableSetting);
    if (attempts < 1) {
        throw ConfigurationError(std::string{lockMaxAttemptsSetting} + " must be >= one.");
    }
    return LockConfig {
        path,
        std::move(table),
        expiration,
        RetryPolicy {baseDelay, baseDelay * attempts, attempts, std::chrono::seconds {wait}}
    };
}

std::string LockConfig::resourceKey() const {
    return "database#" + resourcePath;
}

} // namespace dlock
