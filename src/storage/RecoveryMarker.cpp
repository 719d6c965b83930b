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
#include "storage/RecoveryMarker.hpp"
#include <filesystem>
#include <string>
#include <system_error>
#include <spdlog/spdlog.h>

namespace dlock {

JournalMarker::JournalMarker(const std::string& resourcePath)
    : journal {resourcePath + "-journal"} {}

bool JournalMarker::present() const {
    std::error_code ec;
    const bool exists = std::filesystem::exists(journal, ec);
    if (ec) {
        // An unreadable marker is treated as present.
        spdlog::error("Could not check recovery marker '{}': {}", journal.string(), ec.message());
        return true;
    }
    return exists;
}

const std::filesystem::path& JournalMarker::path() const {
    return journal;
}

} // namespace dlock
