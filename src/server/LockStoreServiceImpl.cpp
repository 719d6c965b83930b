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
#include "server/LockStoreServiceImpl.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <grpcpp/support/status.h>
#include <spdlog/spdlog.h>
#include "proto/lockStore.pb.h"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "storage/LockStore.hpp"

namespace dlock {

InMemoryLockStore& LockStoreServiceImpl::table(const std::string& name) {
    std::lock_guard<std::mutex> lock {m};
    auto& t = tables[name];
    if (!t) {
        spdlog::info("Creating lock table '{}'", name);
        t = std::make_unique<InMemoryLockStore>();
    }
    return *t;
}

grpc::Status LockStoreServiceImpl::conditionalPut(
    grpc::ServerContext* context,
    const lockStore::PutRequest* request,
    lockStore::PutReply* reply) {
    std::ignore = context;
    std::ignore = reply;
    if (request->table().empty() || request->record().key().empty()) {
        return toGrpcStatus(Error {ErrorCode::InvalidArg, "table and key are required"});
    }
    const LockRecord record {
        request->record().key(),
        request->record().ownerid(),
        request->record().expiresat()
    };
    auto result = table(request->table()).conditionalPut(record, request->now());
    spdlog::debug("conditionalPut table '{}' key '{}' owner '{}': {}",
        request->table(), record.key, record.ownerId, result.has_value() ? "OK" : result.error().what);
    return toGrpcStatus(result);
}

grpc::Status LockStoreServiceImpl::conditionalDelete(
    grpc::ServerContext* context,
    const lockStore::DeleteRequest* request,
    lockStore::DeleteReply* reply) {
    std::ignore = context;
    std::ignore = reply;
    if (request->table().empty() || request->key().empty()) {
        return toGrpcStatus(Error {ErrorCode::InvalidArg, "table and key are required"});
    }
    auto result = table(request->table()).conditionalDelete(request->key(), request->ownerid());
    spdlog::debug("conditionalDelete table '{}' key '{}' owner '{}': {}",
        request->table(), request->key(), request->ownerid(), result.has_value() ? "OK" : result.error().what);
    return toGrpcStatus(result);
}

} // namespace dlock
