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
#ifndef DLOCK_LOCK_CONFIG_H
#define DLOCK_LOCK_CONFIG_H

#include <optional>
#include <string>
#include "common/RetryPolicy.hpp"
#include "common/Settings.hpp"

namespace dlock {

inline constexpr auto lockExpirationSetting = "DLOCK_LOCK_EXPIRATION";
inline constexpr auto lockTableSetting = "DLOCK_LOCK_TABLE";
inline constexpr auto lockMaxAttemptsSetting = "DLOCK_LOCK_MAX_ATTEMPTS";
inline constexpr auto lockStoreAddressSetting = "DLOCK_LOCK_STORE_ADDRESS";

struct LockConfig {
    LockConfig(std::string path, std::string table, double expiration, RetryPolicy policy);

    // waitTimeout in seconds; unset or below one falls back to three.
    static LockConfig fromSettings(
        const Settings& settings,
        const std::string& path,
        std::optional<int> waitTimeout = std::nullopt);

    [[nodiscard]] std::string resourceKey() const;

    std::string resourcePath;
    std::string lockTable;
    double lockExpiration;
    RetryPolicy policy;
};

} // namespace dlock

#endif // DLOCK_LOCK_CONFIG_H
