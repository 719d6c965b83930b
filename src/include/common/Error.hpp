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
#ifndef DLOCK_COMMON_ERROR_HPP
#define DLOCK_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <stdexcept>
#include <unordered_set>
#include <unordered_map>
#include <functional>
#include <type_traits>
#include <proto/error.pb.h>

namespace dlock {

// OK through Cancelled and Unknown travel in proto::ErrorDetails.
// ResourceBusy and LockRequired are raised by the lock manager only.
enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    ServiceTemporarilyUnavailable = 2,
    ConditionFailed = 3,
    Timeout = 4,
    Internal = 5,
    Cancelled = 6,
    ResourceBusy = 64,
    LockRequired = 65,
    Unknown = 128
};

struct ErrorCodeHash {
    std::size_t operator()(const ErrorCode& code) const noexcept {
        return std::hash<std::underlying_type_t<ErrorCode>>{}(static_cast<std::underlying_type_t<ErrorCode>>(code));
    }
};

// Codes a lock store call may return for a transport or service fault,
// as opposed to a failed condition.
extern const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> transientErrorCodes;
bool isTransient(const std::string& op, const ErrorCode& code);

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

// Codes with no wire form become proto::Unknown.
proto::ErrorCode toProtoCode(const ErrorCode& code);
// Values this build does not know, e.g. from a newer peer, become Unknown.
ErrorCode fromProtoCode(int code);

struct Error {
    ErrorCode code;
    std::string what;
    std::string key;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, std::string k);
    explicit Error(const ErrorCode& c);
    explicit Error(const proto::ErrorDetails& error);
};

// Thrown when a required setting is missing or malformed.
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace dlock

#endif // DLOCK_COMMON_ERROR_HPP
