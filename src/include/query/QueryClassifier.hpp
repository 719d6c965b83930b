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
#ifndef DLOCK_QUERY_CLASSIFIER_H
#define DLOCK_QUERY_CLASSIFIER_H

#include <string>
#include <string_view>
#include <ostream>

namespace dlock {

enum class QueryKind : char {
    Read,
    Write,
    TransactionStart
};

std::ostream& operator<<(std::ostream& os, const QueryKind& kind);

// Textual heuristic over the leading keyword, not a parser.
namespace query {

// Drops tabs and line breaks, collapses remaining whitespace, upper-cases.
std::string normalize(std::string_view text);
bool isTransactionStart(std::string_view text);
// Anything that is not a SELECT or an EXPLAIN.
bool isWrite(std::string_view text);
QueryKind classify(std::string_view text);

} // namespace query

} // namespace dlock

#endif // DLOCK_QUERY_CLASSIFIER_H
