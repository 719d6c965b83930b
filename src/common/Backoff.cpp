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
#include "common/Backoff.hpp"
#include "common/RetryPolicy.hpp"

#include <algorithm>
#include <optional>
#include <chrono>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace dlock {

Backoff::Backoff(const RetryPolicy p)
    : policy {p} {}

std::optional<std::chrono::microseconds> Backoff::nextDelay() {
    if (attempt >= policy.maxAttempts) {
        return std::nullopt;
    }
    attempt++;
    auto baseCount = static_cast<uint64_t>(policy.baseDelay.count());
    auto delay = baseCount * static_cast<uint64_t>(attempt);
    spdlog::debug("Backoff: Attempt {}, delay: {}, maxDelay: {}", attempt, delay, policy.maxDelay.count());
    return std::chrono::microseconds(std::min(delay, static_cast<uint64_t>(policy.maxDelay.count())));
}

void Backoff::reset() {
    attempt = 0;
}

int Backoff::attempts() const {
    return attempt;
}

} // namespace dlock
