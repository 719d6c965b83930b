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
#ifndef DLOCK_TST_TEST_DOUBLES_HPP
#define DLOCK_TST_TEST_DOUBLES_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "session/Session.hpp"
#include "storage/InMemoryLockStore.hpp"
#include "storage/LockStore.hpp"
#include "storage/RecoveryMarker.hpp"

namespace dlock::test {

// Time only moves when told to, or when someone sleeps.
class ManualClock : public Clock {
public:
    explicit ManualClock(double start) : t {start} {}
    double now() override { return t; }
    void sleepFor(std::chrono::microseconds duration) override {
        slept.push_back(duration);
        t += std::chrono::duration<double>(duration).count();
    }
    void set(double v) { t = v; }
    [[nodiscard]] std::chrono::microseconds totalSlept() const {
        std::chrono::microseconds total {0};
        for (const auto d : slept) {
            total += d;
        }
        return total;
    }
    std::vector<std::chrono::microseconds> slept;
private:
    double t;
};

// Records every call and forwards to an in-memory store unless a failure is queued.
class RecordingLockStore : public LockStore {
public:
    std::expected<std::monostate, Error> conditionalPut(const LockRecord& record, double now) override {
        puts.emplace_back(record, now);
        if (alwaysFailPut.has_value()) {
            return std::unexpected {alwaysFailPut.value()};
        }
        if (!putFailures.empty()) {
            auto e = putFailures.front();
            putFailures.pop_front();
            return std::unexpected {e};
        }
        return backing.conditionalPut(record, now);
    }
    std::expected<std::monostate, Error> conditionalDelete(const std::string& key, const std::string& ownerId) override {
        deletes.emplace_back(key, ownerId);
        if (deleteFailure.has_value()) {
            return std::unexpected {deleteFailure.value()};
        }
        return backing.conditionalDelete(key, ownerId);
    }
    std::vector<std::pair<LockRecord, double>> puts;
    std::vector<std::pair<std::string, std::string>> deletes;
    std::deque<Error> putFailures;
    std::optional<Error> alwaysFailPut;
    std::optional<Error> deleteFailure;
    InMemoryLockStore backing;
};

class FakeMarker : public RecoveryMarker {
public:
    [[nodiscard]] bool present() const override { return isPresent; }
    bool isPresent {false};
};

class FakeConnection : public Connection {
public:
    using Result = std::expected<std::monostate, Error>;
    Result connect() override { calls.emplace_back("connect"); return next(connectResult); }
    Result close() override { calls.emplace_back("close"); return next(closeResult); }
    Result execute(const std::string& query, const Params& params) override {
        calls.emplace_back("execute");
        executed.push_back(query);
        lastParams = params;
        if (onExecute) {
            onExecute();
        }
        return next(executeResult);
    }
    Result executeMany(const std::string& query, const std::vector<Params>& paramSets) override {
        calls.emplace_back("executeMany");
        executed.push_back(query);
        batchSize = paramSets.size();
        if (onExecute) {
            onExecute();
        }
        return next(executeResult);
    }
    Result commit() override { calls.emplace_back("commit"); return next(commitResult); }
    Result rollback() override { calls.emplace_back("rollback"); return next(rollbackResult); }

    std::vector<std::string> calls;
    std::vector<std::string> executed;
    Params lastParams;
    std::size_t batchSize {0};
    std::function<void()> onExecute;
    std::optional<Error> connectResult;
    std::optional<Error> closeResult;
    std::optional<Error> executeResult;
    std::optional<Error> commitResult;
    std::optional<Error> rollbackResult;
private:
    static Result next(const std::optional<Error>& failure) {
        if (failure.has_value()) {
            return std::unexpected {failure.value()};
        }
        return {};
    }
};

} // namespace dlock::test

#endif // DLOCK_TST_TEST_DOUBLES_HPP
