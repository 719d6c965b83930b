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
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>
#include "server/LockStoreServer.hpp"

using dlock::LockStoreServer;

namespace {

std::atomic<bool> stopRequested {false};

void onSignal(int /*signal*/) {
    stopRequested.store(true);
}

} // namespace

int main(int argc, char** argv) {
    const std::string listenAddress {argc > 1 ? argv[1] : "0.0.0.0:50051"};
    spdlog::info("DLock lock store! Starting...");
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    try {
        LockStoreServer server {listenAddress};
        while (!stopRequested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds{200L});
        }
        spdlog::info("Shutting down");
        server.shutdown();
    } catch (const std::exception& e) {
        spdlog::critical("Lock store failed: {}", e.what());
        return 1;
    }
    return 0;
}
