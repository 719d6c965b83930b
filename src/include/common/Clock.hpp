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
#ifndef DLOCK_CLOCK_H
#define DLOCK_CLOCK_H

#include <chrono>

namespace dlock {

class Clock {
public:
    virtual ~Clock() = default;
    // Seconds since the Unix epoch, sub-second precision.
    virtual double now() = 0;
    virtual void sleepFor(std::chrono::microseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    double now() override;
    void sleepFor(std::chrono::microseconds duration) override;
};

} // namespace dlock

#endif // DLOCK_CLOCK_H
