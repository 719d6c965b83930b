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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <unordered_set>
#include <unordered_map>

namespace dlock {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::ServiceTemporarilyUnavailable: return "ServiceTemporarilyUnavailable";
        case ErrorCode::ConditionFailed: return "ConditionFailed";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::ResourceBusy: return "ResourceBusy";
        case ErrorCode::LockRequired: return "LockRequired";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

proto::ErrorCode toProtoCode(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::OK: return proto::ErrorCode::OK;
        case ErrorCode::InvalidArg: return proto::ErrorCode::InvalidArg;
        case ErrorCode::ServiceTemporarilyUnavailable: return proto::ErrorCode::ServiceTemporarilyUnavailable;
        case ErrorCode::ConditionFailed: return proto::ErrorCode::ConditionFailed;
        case ErrorCode::Timeout: return proto::ErrorCode::Timeout;
        case ErrorCode::Internal: return proto::ErrorCode::Internal;
        case ErrorCode::Cancelled: return proto::ErrorCode::Cancelled;
        default: return proto::ErrorCode::Unknown;
    }
}

ErrorCode fromProtoCode(int code) {
    switch (code) {
        case proto::ErrorCode::OK: return ErrorCode::OK;
        case proto::ErrorCode::InvalidArg: return ErrorCode::InvalidArg;
        case proto::ErrorCode::ServiceTemporarilyUnavailable: return ErrorCode::ServiceTemporarilyUnavailable;
        case proto::ErrorCode::ConditionFailed: return ErrorCode::ConditionFailed;
        case proto::ErrorCode::Timeout: return ErrorCode::Timeout;
        case proto::ErrorCode::Internal: return ErrorCode::Internal;
        case proto::ErrorCode::Cancelled: return ErrorCode::Cancelled;
        default: return ErrorCode::Unknown;
    }
}

const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> transientErrorCodes = {
    {"conditionalDelete", {
        ErrorCode::ServiceTemporarilyUnavailable,
        ErrorCode::Timeout,
        ErrorCode::Cancelled,
    }},
    {"default", {
        ErrorCode::ServiceTemporarilyUnavailable,
        ErrorCode::Timeout,
        ErrorCode::Cancelled,
        ErrorCode::Internal,
    }}
};

bool isTransient(const std::string& op, const ErrorCode& code) {
    auto it = transientErrorCodes.find(op);
    if (it != transientErrorCodes.end()) {
        return it->second.contains(code);
    } else {
        auto d = transientErrorCodes.find("default");
        return d->second.contains(code);
    }
}

Error::Error(const ErrorCode& c, std::string w, std::string k) : code {c}, what {std::move(w)}, key {std::move(k)} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, key{} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, key{} {}
Error::Error(const proto::ErrorDetails& error)
    : code {fromProtoCode(error.code())}, what {error.what()}, key {error.key()} {}

} // namespace dlock
