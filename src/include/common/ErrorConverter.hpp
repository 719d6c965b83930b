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
#ifndef DLOCK_ERROR_CONVERTER_H
#define DLOCK_ERROR_CONVERTER_H

#include "common/Error.hpp"
#include <grpcpp/support/status.h>
#include <expected>
#include <variant>

namespace dlock {

grpc::StatusCode toGrpcStatusCode(const ErrorCode& code);

grpc::Status toGrpcStatus(const Error& error);

template<typename T>
grpc::Status toGrpcStatus(const std::expected<T, Error>& v) {
    if (v.has_value()) {
        return grpc::Status::OK;
    }
    return toGrpcStatus(v.error());
}

Error toError(const grpc::Status& status);

std::expected<std::monostate, Error> toExpected(const grpc::Status& status);

} // namespace dlock

#endif // DLOCK_ERROR_CONVERTER_H
