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
#ifndef DLOCK_SETTINGS_H
#define DLOCK_SETTINGS_H

#include <optional>
#include <string>
#include <unordered_map>

namespace dlock {

// Looks a key up in explicit overrides first, then in the process environment.
class Settings {
public:
    explicit Settings(std::unordered_map<std::string, std::string> overrides = {});
    [[nodiscard]] std::optional<std::string> lookup(const std::string& key) const;
    [[nodiscard]] std::string get(const std::string& key) const;
    [[nodiscard]] std::string get(const std::string& key, const std::string& fallback) const;
    [[nodiscard]] int getInt(const std::string& key) const;
    [[nodiscard]] int getInt(const std::string& key, int fallback) const;
    [[nodiscard]] double getDouble(const std::string& key) const;
private:
    std::unordered_map<std::string, std::string> values;
};

} // namespace dlock

#endif // DLOCK_SETTINGS_H
