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
#include "common/RetryPolicy.hpp"
#include <stdexcept>
#include <chrono>

namespace dlock {

RetryPolicy::RetryPolicy(
    std::chrono::microseconds base,
    std::chrono::microseconds max,
    int attempts,
    std::chrono::milliseconds wait)
    : baseDelay(base),
      maxDelay(max),
      maxAttempts(attempts),
      waitTimeout(wait) {
    if (attempts < 1) {
        throw std::invalid_argument("Max attempts must be >= one.");
    }
    if (base < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Base delay must be >= zero.");
    }
    if (max < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Max delay must be >= zero.");
    }
    if (wait < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Wait timeout must be >= zero.");
    }
    if (max < base) {
        throw std::invalid_argument("Max delay must be >= base delay.");
    }
}

} // namespace dlock
