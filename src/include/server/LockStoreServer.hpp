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
#ifndef DLOCK_LOCK_STORE_SERVER_HPP
#define DLOCK_LOCK_STORE_SERVER_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <grpcpp/grpcpp.h>
#include "server/LockStoreServiceImpl.hpp"

namespace dlock {

// Owns the lock tables and serves them on one address until shut down.
// An address ending in ":0" binds any free port; port() reports it.
class LockStoreServer {
public:
    explicit LockStoreServer(const std::string& address);
    ~LockStoreServer();
    LockStoreServer(const LockStoreServer&) = delete;
    LockStoreServer& operator=(const LockStoreServer&) = delete;

    // In-flight calls get the grace period, then are cancelled. Safe to call twice.
    void shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds{100L});
    [[nodiscard]] bool running() const;
    [[nodiscard]] int port() const;
    // host:port that a RemoteLockStore can dial.
    [[nodiscard]] std::string target() const;
    [[nodiscard]] LockStoreServiceImpl& service();
private:
    std::string listenAddress;
    int boundPort {0};
    LockStoreServiceImpl impl;
    mutable std::mutex m;
    std::unique_ptr<grpc::Server> server;
    std::thread serverThread;
};

} // namespace dlock

#endif // DLOCK_LOCK_STORE_SERVER_HPP
