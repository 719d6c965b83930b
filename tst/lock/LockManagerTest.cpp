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
#include <gtest/gtest.h>
#include <chrono>
#include <expected>
#include <stdexcept>
#include <string>
#include <variant>
#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include "lock/LockConfig.hpp"
#include "lock/LockManager.hpp"
#include "storage/InMemoryLockStore.hpp"
#include "fakes/TestDoubles.hpp"
#include <spdlog/common.h>

using dlock::Error;
using dlock::ErrorCode;
using dlock::LockConfig;
using dlock::LockManager;
using dlock::LockRecord;
using dlock::RetryPolicy;
using dlock::test::FakeMarker;
using dlock::test::ManualClock;
using dlock::test::RecordingLockStore;

namespace {

LockConfig makeConfig(int attempts = 10, std::chrono::milliseconds wait = std::chrono::seconds{5L}) {
    return LockConfig {
        "/path/to/sqlite.db",
        "LockTable",
        10.0,
        RetryPolicy {std::chrono::milliseconds{50L}, std::chrono::milliseconds{500L}, attempts, wait}
    };
}

std::expected<std::monostate, Error> succeed() {
    return {};
}

} // namespace

class LockManagerTest : public ::testing::Test {
protected:
    ManualClock clock {1000.0};
    RecordingLockStore store;
    FakeMarker marker;
    LockManager manager {makeConfig(), store, clock, marker};
    const std::string key {"database#/path/to/sqlite.db"};
};

TEST_F(LockManagerTest, AcquireWritesRecordAndHoldsLock) {
    ASSERT_TRUE(manager.acquire().has_value());
    ASSERT_EQ(store.puts.size(), 1);
    const auto& [record, now] = store.puts.front();
    EXPECT_EQ(record.key, key);
    EXPECT_DOUBLE_EQ(record.expiresAt, 1010.0);
    EXPECT_DOUBLE_EQ(now, 1000.0);
    EXPECT_EQ(record.ownerId, manager.state().lockId.value());
    EXPECT_EQ(record.ownerId.size(), 36);
    EXPECT_DOUBLE_EQ(manager.state().acquiredAt.value(), 1000.0);
    EXPECT_DOUBLE_EQ(manager.state().expiresAt.value(), 1010.0);
    EXPECT_TRUE(manager.isLockActive());
}

TEST_F(LockManagerTest, SecondAcquireWhileActiveMakesNoStoreCall) {
    ASSERT_TRUE(manager.acquire().has_value());
    clock.set(1005.0);
    ASSERT_TRUE(manager.acquire().has_value());
    EXPECT_EQ(store.puts.size(), 1);
}

TEST_F(LockManagerTest, AcquireAfterLocalExpiryWritesFreshRecord) {
    ASSERT_TRUE(manager.acquire().has_value());
    const auto first = manager.state().lockId.value();
    clock.set(1011.0);
    EXPECT_FALSE(manager.isLockActive());
    ASSERT_TRUE(manager.acquire().has_value());
    ASSERT_EQ(store.puts.size(), 2);
    EXPECT_NE(manager.state().lockId.value(), first);
    EXPECT_DOUBLE_EQ(manager.state().expiresAt.value(), 1021.0);
}

TEST_F(LockManagerTest, AcquireFailsBusyAfterMaxAttempts) {
    store.alwaysFailPut = Error {ErrorCode::ConditionFailed, "held"};
    auto result = manager.acquire();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ResourceBusy);
    EXPECT_EQ(store.puts.size(), 10);
    // 50ms * (1 + 2 + ... + 10), the last one after the final put
    EXPECT_EQ(clock.totalSlept(), std::chrono::milliseconds{2750L});
    ASSERT_EQ(clock.slept.size(), 10);
    EXPECT_EQ(clock.slept.back(), std::chrono::milliseconds{500L});
    EXPECT_FALSE(manager.isLockActive());
    EXPECT_FALSE(manager.state().lockId.has_value());
    EXPECT_FALSE(manager.state().expiresAt.has_value());
}

TEST_F(LockManagerTest, EveryAttemptUsesFreshLockId) {
    store.putFailures.emplace_back(ErrorCode::ConditionFailed, "held");
    store.putFailures.emplace_back(ErrorCode::ConditionFailed, "held");
    ASSERT_TRUE(manager.acquire().has_value());
    ASSERT_EQ(store.puts.size(), 3);
    EXPECT_NE(store.puts[0].first.ownerId, store.puts[1].first.ownerId);
    EXPECT_NE(store.puts[1].first.ownerId, store.puts[2].first.ownerId);
    EXPECT_EQ(manager.state().lockId.value(), store.puts[2].first.ownerId);
}

TEST_F(LockManagerTest, TransientErrorsAreRetriedLikeConflicts) {
    store.putFailures.emplace_back(ErrorCode::ServiceTemporarilyUnavailable, "throttled");
    store.putFailures.emplace_back(ErrorCode::Timeout, "deadline");
    store.putFailures.emplace_back(ErrorCode::Unknown, "boom");
    ASSERT_TRUE(manager.acquire().has_value());
    EXPECT_EQ(store.puts.size(), 4);
    ASSERT_EQ(clock.slept.size(), 3);
    EXPECT_EQ(clock.slept[0], std::chrono::milliseconds{50L});
    EXPECT_EQ(clock.slept[1], std::chrono::milliseconds{100L});
    EXPECT_EQ(clock.slept[2], std::chrono::milliseconds{150L});
}

TEST_F(LockManagerTest, AcquireStopsAtWaitDeadline) {
    LockManager shortWait {makeConfig(10, std::chrono::seconds{1L}), store, clock, marker};
    store.alwaysFailPut = Error {ErrorCode::ConditionFailed, "held"};
    auto result = shortWait.acquire();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ResourceBusy);
    // Attempts at +0, +0.05, +0.15, +0.30, +0.50, +0.75; +1.05 is past the deadline.
    EXPECT_EQ(store.puts.size(), 6);
}

TEST_F(LockManagerTest, AcquireElapsedCoversBackoffDelays) {
    dlock::SystemClock systemClock;
    dlock::InMemoryLockStore held;
    ASSERT_TRUE(held.conditionalPut(LockRecord {key, "someone-else", systemClock.now() + 60.0}, systemClock.now()).has_value());
    const LockConfig config {
        "/path/to/sqlite.db",
        "LockTable",
        10.0,
        RetryPolicy {std::chrono::milliseconds{20L}, std::chrono::milliseconds{200L}, 3, std::chrono::seconds{5L}}
    };
    LockManager contender {config, held, systemClock, marker};
    const auto start = std::chrono::steady_clock::now();
    auto result = contender.acquire();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ResourceBusy);
    EXPECT_GE(elapsed, std::chrono::milliseconds{60L});
}

TEST_F(LockManagerTest, StaleRecordCanBeTakenOver) {
    ASSERT_TRUE(manager.acquire().has_value());
    ASSERT_DOUBLE_EQ(store.backing.get(key).value().expiresAt, 1010.0);

    ManualClock otherClock {1005.0};
    LockManager other {makeConfig(), store, otherClock, marker};
    auto blocked = other.acquire();
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, ErrorCode::ResourceBusy);
    EXPECT_EQ(store.backing.get(key).value().ownerId, manager.state().lockId.value());

    otherClock.set(1011.0);
    ASSERT_TRUE(other.acquire().has_value());
    EXPECT_EQ(store.backing.get(key).value().ownerId, other.state().lockId.value());
    EXPECT_DOUBLE_EQ(store.backing.get(key).value().expiresAt, 1021.0);
}

TEST_F(LockManagerTest, ReleaseWithoutLockMakesNoStoreCall) {
    manager.release();
    EXPECT_TRUE(store.deletes.empty());
    EXPECT_TRUE(store.puts.empty());
}

TEST_F(LockManagerTest, ReleaseDeletesWithAcquiredLockId) {
    ASSERT_TRUE(manager.acquire().has_value());
    const auto lockId = manager.state().lockId.value();
    manager.release();
    ASSERT_EQ(store.deletes.size(), 1);
    EXPECT_EQ(store.deletes.front().first, key);
    EXPECT_EQ(store.deletes.front().second, lockId);
    EXPECT_FALSE(store.backing.get(key).has_value());
    EXPECT_FALSE(manager.isLockActive());
    EXPECT_FALSE(manager.state().acquiredAt.has_value());
}

TEST_F(LockManagerTest, ReleaseAfterLocalExpiryIsNoOp) {
    ASSERT_TRUE(manager.acquire().has_value());
    clock.set(1010.0);
    manager.release();
    EXPECT_TRUE(store.deletes.empty());
}

TEST_F(LockManagerTest, ReleaseFailureIsLoggedNotReturned) {
    ASSERT_TRUE(manager.acquire().has_value());
    store.deleteFailure = Error {ErrorCode::ServiceTemporarilyUnavailable, "network"};
    EXPECT_NO_THROW(manager.release());
    EXPECT_EQ(store.deletes.size(), 1);
    EXPECT_FALSE(manager.isLockActive());
    EXPECT_FALSE(manager.state().lockId.has_value());
}

TEST_F(LockManagerTest, ReleaseNeverDeletesStolenLock) {
    ASSERT_TRUE(manager.acquire().has_value());
    ManualClock thiefClock {1011.0};
    LockManager thief {makeConfig(), store, thiefClock, marker};
    ASSERT_TRUE(thief.acquire().has_value());

    // This instance still believes its lease is live.
    ASSERT_TRUE(manager.isLockActive());
    manager.release();
    ASSERT_EQ(store.deletes.size(), 1);
    EXPECT_FALSE(manager.isLockActive());
    ASSERT_TRUE(store.backing.get(key).has_value());
    EXPECT_EQ(store.backing.get(key).value().ownerId, thief.state().lockId.value());
}

TEST_F(LockManagerTest, GuardedWriteAcquiresAndReleases) {
    bool activeInside = false;
    auto result = manager.guardedOperation("INSERT INTO users (id) VALUES (1)", [&] {
        activeInside = manager.isLockActive();
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(activeInside);
    EXPECT_EQ(store.puts.size(), 1);
    EXPECT_EQ(store.deletes.size(), 1);
    EXPECT_FALSE(manager.isLockActive());
    EXPECT_FALSE(manager.state().pendingOperation.has_value());
}

TEST_F(LockManagerTest, GuardedReadDoesNotAcquire) {
    bool ran = false;
    auto result = manager.guardedOperation("select * from users", [&] { ran = true; });
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(ran);
    EXPECT_TRUE(store.puts.empty());
    EXPECT_TRUE(store.deletes.empty());
}

TEST_F(LockManagerTest, GuardedExplainIsRead) {
    auto result = manager.guardedOperation("EXPLAIN QUERY PLAN SELECT 1", [] {});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(store.puts.empty());
}

TEST_F(LockManagerTest, GuardedOperationReturnsBodyValue) {
    auto result = manager.guardedOperation("UPDATE users SET name = 'x'", [] { return 42; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 42);
}

TEST_F(LockManagerTest, PendingOperationIsNormalizedDuringBody) {
    std::string seen;
    auto result = manager.guardedOperation("\n\tdelete  from users\r\n where id = 1", [&] {
        seen = manager.state().pendingOperation.value_or("");
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(seen, "DELETE FROM USERS WHERE ID = 1");
    EXPECT_FALSE(manager.state().pendingOperation.has_value());
}

TEST_F(LockManagerTest, GuardedOperationReleasesWhenBodyThrows) {
    EXPECT_THROW(
        (void)manager.guardedOperation("DELETE FROM users", []() -> int { throw std::runtime_error("disk I/O error"); }),
        std::runtime_error
    );
    EXPECT_EQ(store.deletes.size(), 1);
    EXPECT_FALSE(manager.isLockActive());
    EXPECT_FALSE(manager.state().pendingOperation.has_value());
}

TEST_F(LockManagerTest, GuardedOperationSkipsBodyWhenBusy) {
    store.alwaysFailPut = Error {ErrorCode::ConditionFailed, "held"};
    bool ran = false;
    auto result = manager.guardedOperation("BEGIN", [&] { ran = true; });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ResourceBusy);
    EXPECT_FALSE(ran);
    EXPECT_FALSE(manager.inTransaction());
    EXPECT_FALSE(manager.state().pendingOperation.has_value());
}

TEST_F(LockManagerTest, BeginRetainsLockUntilCommit) {
    ASSERT_TRUE(manager.guardedOperation("BEGIN", [] {}).has_value());
    EXPECT_TRUE(manager.inTransaction());
    EXPECT_TRUE(manager.isLockActive());
    EXPECT_TRUE(store.deletes.empty());

    ASSERT_TRUE(manager.guardedOperation("INSERT INTO users VALUES (1)", [] {}).has_value());
    ASSERT_TRUE(manager.guardedOperation("SELECT * FROM users", [] {}).has_value());
    EXPECT_EQ(store.puts.size(), 1);
    EXPECT_TRUE(store.deletes.empty());
    EXPECT_TRUE(manager.isLockActive());

    int finalized = 0;
    auto committed = manager.commit([&] { ++finalized; return succeed(); });
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(finalized, 1);
    EXPECT_EQ(store.deletes.size(), 1);
    EXPECT_FALSE(manager.isLockActive());
    EXPECT_FALSE(manager.inTransaction());
}

TEST_F(LockManagerTest, RollbackReleasesTransactionLock) {
    ASSERT_TRUE(manager.guardedOperation("begin immediate", [] {}).has_value());
    auto rolledBack = manager.rollback(succeed);
    ASSERT_TRUE(rolledBack.has_value());
    EXPECT_FALSE(manager.isLockActive());
    EXPECT_FALSE(manager.inTransaction());
}

TEST_F(LockManagerTest, CommitWithoutLockFailsLockRequired) {
    int finalized = 0;
    auto result = manager.commit([&] { ++finalized; return succeed(); });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::LockRequired);
    EXPECT_EQ(finalized, 0);
}

TEST_F(LockManagerTest, RollbackWithoutLockFailsLockRequired) {
    int finalized = 0;
    auto result = manager.rollback([&] { ++finalized; return succeed(); });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::LockRequired);
    EXPECT_EQ(finalized, 0);
}

TEST_F(LockManagerTest, CommitAfterLockExpiredFailsLockRequired) {
    ASSERT_TRUE(manager.guardedOperation("BEGIN", [] {}).has_value());
    clock.set(1010.5);
    auto result = manager.commit(succeed);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::LockRequired);
}

TEST_F(LockManagerTest, FailedCommitRetainsLock) {
    ASSERT_TRUE(manager.guardedOperation("BEGIN", [] {}).has_value());
    auto result = manager.commit([]() -> std::expected<std::monostate, Error> {
        return std::unexpected {Error {ErrorCode::Internal, "database is locked"}};
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Internal);
    EXPECT_EQ(result.error().what, "database is locked");
    EXPECT_TRUE(manager.isLockActive());
    EXPECT_TRUE(manager.inTransaction());
    EXPECT_TRUE(store.deletes.empty());
}

TEST_F(LockManagerTest, CrashRecoveryCheckFollowsMarker) {
    EXPECT_FALSE(manager.crashRecoveryCheck());
    marker.isPresent = true;
    EXPECT_TRUE(manager.crashRecoveryCheck());
}

TEST(FailureLevelTest, PutFailureLevels) {
    using dlock::putFailureLevel;
    const Error held {ErrorCode::ConditionFailed, "held"};
    const Error throttled {ErrorCode::ServiceTemporarilyUnavailable, "throttled"};
    const Error internal {ErrorCode::Internal, "5xx"};
    const Error odd {ErrorCode::Unknown, "?"};
    EXPECT_EQ(putFailureLevel(held, false), spdlog::level::info);
    EXPECT_EQ(putFailureLevel(held, true), spdlog::level::warn);
    EXPECT_EQ(putFailureLevel(throttled, false), spdlog::level::warn);
    EXPECT_EQ(putFailureLevel(internal, true), spdlog::level::err);
    EXPECT_EQ(putFailureLevel(odd, false), spdlog::level::critical);
}

TEST(FailureLevelTest, DeleteFailureSeparatesLostLeaseFromTransport) {
    using dlock::deleteFailureLevel;
    EXPECT_EQ(deleteFailureLevel(Error {ErrorCode::ConditionFailed, "taken over"}), spdlog::level::warn);
    EXPECT_EQ(deleteFailureLevel(Error {ErrorCode::Timeout, "deadline"}), spdlog::level::err);
    EXPECT_EQ(deleteFailureLevel(Error {ErrorCode::Cancelled, "cancelled"}), spdlog::level::err);
    EXPECT_EQ(deleteFailureLevel(Error {ErrorCode::Internal, "5xx"}), spdlog::level::critical);
    EXPECT_EQ(deleteFailureLevel(Error {ErrorCode::Unknown, "?"}), spdlog::level::critical);
}
