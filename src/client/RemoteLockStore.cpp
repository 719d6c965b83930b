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
#include "client/RemoteLockStore.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <variant>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include "proto/lockStore.pb.h"
#include "proto/lockStore.grpc.pb.h"
#include "common/Error.hpp"
#include "lock/LockConfig.hpp"

namespace dlock {

RemoteLockStore::RemoteLockStore(
    const std::string& address,
    std::string table,
    std::chrono::milliseconds rpc,
    std::chrono::milliseconds channel)
    : addr {address},
      lockTable {std::move(table)},
      rpcTimeout {rpc},
      channelTimeout {channel} {}

std::unique_ptr<RemoteLockStore> RemoteLockStore::fromSettings(const Settings& settings) {
    return std::make_unique<RemoteLockStore>(
        settings.get(lockStoreAddressSetting, "localhost:50051"),
        settings.get(lockTableSetting));
}

std::expected<std::monostate, Error> RemoteLockStore::conditionalPut(const LockRecord& record, double now) {
    lockStore::PutRequest request;
    request.set_table(lockTable);
    request.mutable_record()->set_key(record.key);
    request.mutable_record()->set_ownerid(record.ownerId);
    request.mutable_record()->set_expiresat(record.expiresAt);
    request.set_now(now);
    return call(&Stub::conditionalPut, request);
}

std::expected<std::monostate, Error> RemoteLockStore::conditionalDelete(const std::string& key, const std::string& ownerId) {
    lockStore::DeleteRequest request;
    request.set_table(lockTable);
    request.set_key(key);
    request.set_ownerid(ownerId);
    return call(&Stub::conditionalDelete, request);
}

std::expected<std::monostate, Error> RemoteLockStore::connect() {
    std::lock_guard<std::mutex> lock {m};
    if (channel) {
        auto state = channel->GetState(false);
        if (state == GRPC_CHANNEL_READY && stub) {
            return {};
        }
        if (state == GRPC_CHANNEL_IDLE || state == GRPC_CHANNEL_CONNECTING || state == GRPC_CHANNEL_READY) {
            if (channel->WaitForConnected(std::chrono::system_clock::now() + channelTimeout)) {
                if (!stub) {
                    stub = lockStore::LockStoreService::NewStub(channel);
                }
                return {};
            }
        }
    }

    channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
    stub.reset();
    if (!channel->WaitForConnected(std::chrono::system_clock::now() + channelTimeout)) {
        spdlog::warn("Could not connect to lock store @{}", addr);
        return std::unexpected {Error{ErrorCode::ServiceTemporarilyUnavailable, "Could not connect to lock store @" + addr}};
    }
    stub = lockStore::LockStoreService::NewStub(channel);
    return {};
}

bool RemoteLockStore::connected() const {
    std::lock_guard<std::mutex> lock {m};
    if (!channel || !stub) {
        return false;
    }
    return channel->GetState(false) == GRPC_CHANNEL_READY;
}

std::string RemoteLockStore::address() const {
    return addr;
}

} // namespace dlock
