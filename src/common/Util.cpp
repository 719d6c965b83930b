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
#include "common/Util.hpp"
#include <random>
#include <string>
#include <cstdint>
#include <cstddef>

namespace dlock {

UUID generate_uuid_v4() {
    thread_local auto rng = random_generator<>();
    auto dist = std::uniform_int_distribution<unsigned int>{0, 255};

    UUID uuid{};
    for (auto& b : uuid) {
        b = static_cast<uint8_t>(dist(rng));
    }

    // Set version 4 (bits 12-15 of time_hi_and_version)
    uuid[6] = (uuid[6] & 0x0F) | 0x40;

    // Set variant bits (bits 6-7 of clock_seq_hi_and_reserved)
    uuid[8] = (uuid[8] & 0x3F) | 0x80;

    return uuid;
}

std::string uuid_to_string(const UUID& uuid) {
    static constexpr auto hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < uuid.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(hex[uuid[i] >> 4]);
        out.push_back(hex[uuid[i] & 0x0F]);
    }
    return out;
}

} // namespace dlock
