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
#ifndef DLOCK_LOCK_STORE_SERVICE_IMPL_HPP
#define DLOCK_LOCK_STORE_SERVICE_IMPL_HPP

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <grpcpp/grpcpp.h>
#include "proto/lockStore.grpc.pb.h"
#include "storage/InMemoryLockStore.hpp"

namespace dlock {

// Serves one InMemoryLockStore per table name, created on first use.
class LockStoreServiceImpl final : public lockStore::LockStoreService::Service {
public:
    LockStoreServiceImpl() = default;
    grpc::Status conditionalPut(
        grpc::ServerContext* context,
        const lockStore::PutRequest* request,
        lockStore::PutReply* reply) override;
    grpc::Status conditionalDelete(
        grpc::ServerContext* context,
        const lockStore::DeleteRequest* request,
        lockStore::DeleteReply* reply) override;
    [[nodiscard]] InMemoryLockStore& table(const std::string& name);
private:
    std::mutex m;
    std::unordered_map<std::string, std::unique_ptr<InMemoryLockStore>> tables;
};

} // namespace dlock

#endif // DLOCK_LOCK_STORE_SERVICE_IMPL_HPP
