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
#include "server/LockStoreServer.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

namespace dlock {

LockStoreServer::LockStoreServer(const std::string& address)
    : listenAddress {address} {
    grpc::ServerBuilder builder {};
    builder.AddListeningPort(listenAddress, grpc::InsecureServerCredentials(), &boundPort);
    builder.RegisterService(&impl);
    server = builder.BuildAndStart();
    if (!server || boundPort == 0) {
        throw std::runtime_error("Failed to start lock store on address: " + listenAddress);
    }
    spdlog::info("Lock store listening on {} (port {})", listenAddress, boundPort);
    serverThread = std::thread([s = server.get()] { s->Wait(); });
}

LockStoreServer::~LockStoreServer() {
    shutdown();
}

void LockStoreServer::shutdown(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock {m};
    if (!server) {
        return;
    }
    server->Shutdown(std::chrono::system_clock::now() + grace);
    if (serverThread.joinable()) {
        serverThread.join();
    }
    server.reset();
    spdlog::info("Lock store on port {} stopped", boundPort);
}

bool LockStoreServer::running() const {
    std::lock_guard<std::mutex> lock {m};
    return server != nullptr;
}

int LockStoreServer::port() const {
    return boundPort;
}

std::string LockStoreServer::target() const {
    return "localhost:" + std::to_string(boundPort);
}

LockStoreServiceImpl& LockStoreServer::service() {
    return impl;
}

} // namespace dlock
