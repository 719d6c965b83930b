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
#include "query/QueryClassifier.hpp"
#include <array>
#include <cctype>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace dlock {

namespace {

constexpr std::string_view transactionKeyword {"BEGIN"};
constexpr std::array<std::string_view, 2> readKeywords {"SELECT", "EXPLAIN"};

} // namespace

std::ostream& operator<<(std::ostream& os, const QueryKind& kind) {
    switch (kind) {
        case QueryKind::Read: return os << "Read";
        case QueryKind::Write: return os << "Write";
        case QueryKind::TransactionStart: return os << "TransactionStart";
    }
    std::unreachable();
}

namespace query {

std::string normalize(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (const char c : text) {
        if (c == '\t' || c == '\n' || c == '\r') {
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

bool isTransactionStart(std::string_view text) {
    return normalize(text).starts_with(transactionKeyword);
}

bool isWrite(std::string_view text) {
    const auto normalized = normalize(text);
    for (const auto keyword : readKeywords) {
        if (normalized.starts_with(keyword)) {
            return false;
        }
    }
    return true;
}

QueryKind classify(std::string_view text) {
    if (isTransactionStart(text)) {
        return QueryKind::TransactionStart;
    }
    if (isWrite(text)) {
        return QueryKind::Write;
    }
    return QueryKind::Read;
}

} // namespace query

} // namespace dlock
