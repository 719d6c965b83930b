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
#ifndef DLOCK_REMOTE_LOCK_STORE_H
#define DLOCK_REMOTE_LOCK_STORE_H

#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <grpcpp/grpcpp.h>
#include "proto/lockStore.grpc.pb.h"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Settings.hpp"
#include "storage/LockStore.hpp"

namespace dlock {

// LockStore backed by a LockStoreService over gRPC. One call per operation,
// each bounded by rpcTimeout; retrying is left to the caller.
class RemoteLockStore : public LockStore {
public:
    RemoteLockStore(
        const std::string& address,
        std::string table,
        std::chrono::milliseconds rpc = std::chrono::milliseconds{1000L},
        std::chrono::milliseconds channel = std::chrono::milliseconds{1000L});
    RemoteLockStore(const RemoteLockStore&) = delete;
    RemoteLockStore& operator=(const RemoteLockStore&) = delete;

    static std::unique_ptr<RemoteLockStore> fromSettings(const Settings& settings);

    std::expected<std::monostate, Error> conditionalPut(const LockRecord& record, double now) override;
    std::expected<std::monostate, Error> conditionalDelete(const std::string& key, const std::string& ownerId) override;
    [[nodiscard]] bool connected() const;
    [[nodiscard]] std::string address() const;
private:
    using Stub = lockStore::LockStoreService::Stub;

    std::expected<std::monostate, Error> connect();

    template<typename Req, typename Rep>
    std::expected<std::monostate, Error> call(
        grpc::Status (Stub::* f)(grpc::ClientContext*, const Req&, Rep*),
        const Req& request) {
        if (auto c = connect(); !c.has_value()) {
            return c;
        }
        std::shared_ptr<Stub> s;
        {
            std::lock_guard<std::mutex> lock {m};
            s = stub;
        }
        grpc::ClientContext context {};
        context.set_deadline(std::chrono::system_clock::now() + rpcTimeout);
        Rep reply {};
        return toExpected((s.get()->*f)(&context, request, &reply));
    }

    mutable std::mutex m;
    const std::string addr;
    const std::string lockTable;
    const std::chrono::milliseconds rpcTimeout;
    const std::chrono::milliseconds channelTimeout;
    std::shared_ptr<grpc::Channel> channel;
    std::shared_ptr<Stub> stub;
};

} // namespace dlock

#endif // DLOCK_REMOTE_LOCK_STORE_H
