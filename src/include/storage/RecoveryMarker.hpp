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
#ifndef DLOCK_RECOVERY_MARKER_H
#define DLOCK_RECOVERY_MARKER_H

#include <filesystem>
#include <string>

namespace dlock {

// Signals an interrupted transaction on the protected store.
class RecoveryMarker {
public:
    virtual ~RecoveryMarker() = default;
    [[nodiscard]] virtual bool present() const = 0;
};

// The rollback journal the store leaves beside its file: <path>-journal.
class JournalMarker : public RecoveryMarker {
public:
    explicit JournalMarker(const std::string& resourcePath);
    [[nodiscard]] bool present() const override;
    [[nodiscard]] const std::filesystem::path& path() const;
private:
    std::filesystem::path journal;
};

} // namespace dlock

#endif // DLOCK_RECOVERY_MARKER_H
