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
#include <gtest/gtest.h>
#include <regex>
#include <string>
#include <unordered_set>
#include "common/Util.hpp"

using dlock::generate_uuid_v4;
using dlock::uuid_to_string;

TEST(UtilTest, UuidHasVersionAndVariantBits) {
    for (int i = 0; i < 100; ++i) {
        const auto uuid = generate_uuid_v4();
        EXPECT_EQ(uuid[6] >> 4, 0x4);
        EXPECT_EQ(uuid[8] & 0xC0, 0x80);
    }
}

TEST(UtilTest, UuidStringIsCanonical) {
    const std::regex canonical {"^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$"};
    for (int i = 0; i < 100; ++i) {
        const auto text = uuid_to_string(generate_uuid_v4());
        EXPECT_TRUE(std::regex_match(text, canonical)) << text;
    }
}

TEST(UtilTest, KnownBytesFormat) {
    dlock::UUID uuid {};
    for (std::size_t i = 0; i < uuid.size(); ++i) {
        uuid[i] = static_cast<uint8_t>(i * 0x11);
    }
    EXPECT_EQ(uuid_to_string(uuid), "00112233-4455-6677-8899-aabbccddeeff");
}

TEST(UtilTest, UuidsDoNotRepeat) {
    std::unordered_set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(seen.insert(uuid_to_string(generate_uuid_v4())).second);
    }
}
