// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * RCoord distributed locks and shared maps over Redis.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "StoreFakes.hpp"
#include "common/Error.hpp"
#include "storage/InMemoryStore.hpp"

using namespace std::chrono_literals;
using rcoord::ErrorCode;
using rcoord::InMemoryStore;
using rcoord::SetCondition;

class InMemoryStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<InMemoryStore> kv = makeStore(clock);
};

TEST_F(InMemoryStoreTest, SetAndGet) {
    auto w = kv->set("k", "v", 0ms, SetCondition::Always);
    ASSERT_TRUE(w.has_value());
    EXPECT_TRUE(w.value());
    auto r = kv->get("k");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), "v");
}

TEST_F(InMemoryStoreTest, GetMissingIsEmpty) {
    auto r = kv->get("missing");
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r.value().has_value());
}

TEST_F(InMemoryStoreTest, IfAbsentOnlyCreates) {
    EXPECT_TRUE(kv->set("k", "a", 0ms, SetCondition::IfAbsent).value());
    EXPECT_FALSE(kv->set("k", "b", 0ms, SetCondition::IfAbsent).value());
    EXPECT_EQ(kv->get("k").value(), "a");
}

TEST_F(InMemoryStoreTest, IfPresentOnlyUpdates) {
    EXPECT_FALSE(kv->set("k", "a", 0ms, SetCondition::IfPresent).value());
    EXPECT_FALSE(kv->get("k").value().has_value());
    ASSERT_TRUE(kv->set("k", "a", 0ms, SetCondition::Always).has_value());
    EXPECT_TRUE(kv->set("k", "b", 0ms, SetCondition::IfPresent).value());
    EXPECT_EQ(kv->get("k").value(), "b");
}

TEST_F(InMemoryStoreTest, KeysExpireAfterTtl) {
    ASSERT_TRUE(kv->set("k", "v", 1000ms, SetCondition::Always).has_value());
    clock->advance(999ms);
    EXPECT_EQ(kv->get("k").value(), "v");
    clock->advance(1ms);
    EXPECT_FALSE(kv->get("k").value().has_value());
    EXPECT_EQ(kv->size(), 0U);
    EXPECT_TRUE(kv->set("k", "w", 0ms, SetCondition::IfAbsent).value());
}

TEST_F(InMemoryStoreTest, PlainSetClearsTtl) {
    ASSERT_TRUE(kv->set("k", "v", 1000ms, SetCondition::Always).has_value());
    ASSERT_TRUE(kv->set("k", "w", 0ms, SetCondition::Always).has_value());
    clock->advance(5000ms);
    EXPECT_EQ(kv->get("k").value(), "w");
}

TEST_F(InMemoryStoreTest, DelCountsRemovedKeys) {
    ASSERT_TRUE(kv->set("k", "v", 0ms, SetCondition::Always).has_value());
    EXPECT_EQ(kv->del("k").value(), 1U);
    EXPECT_EQ(kv->del("k").value(), 0U);
}

TEST_F(InMemoryStoreTest, CompareAndExpireNeedsMatchingValue) {
    ASSERT_TRUE(kv->set("k", "mine", 1000ms, SetCondition::Always).has_value());
    EXPECT_FALSE(kv->compareAndExpire("k", "theirs", 5000ms).value());
    clock->advance(900ms);
    EXPECT_TRUE(kv->compareAndExpire("k", "mine", 1000ms).value());
    clock->advance(900ms);
    EXPECT_EQ(kv->get("k").value(), "mine");
    clock->advance(100ms);
    EXPECT_FALSE(kv->get("k").value().has_value());
    EXPECT_FALSE(kv->compareAndExpire("k", "mine", 1000ms).value());
}

TEST_F(InMemoryStoreTest, CompareAndDeleteNeedsMatchingValue) {
    ASSERT_TRUE(kv->set("k", "mine", 0ms, SetCondition::Always).has_value());
    EXPECT_FALSE(kv->compareAndDelete("k", "theirs").value());
    EXPECT_TRUE(kv->get("k").value().has_value());
    EXPECT_TRUE(kv->compareAndDelete("k", "mine").value());
    EXPECT_FALSE(kv->get("k").value().has_value());
    EXPECT_FALSE(kv->compareAndDelete("k", "mine").value());
}

TEST_F(InMemoryStoreTest, HashFields) {
    EXPECT_TRUE(kv->hset("h", "a", "1").value());
    EXPECT_FALSE(kv->hset("h", "a", "2").value());
    EXPECT_TRUE(kv->hset("h", "b", "3").value());
    EXPECT_EQ(kv->hget("h", "a").value(), "2");
    EXPECT_FALSE(kv->hget("h", "zz").value().has_value());
    EXPECT_FALSE(kv->hget("nohash", "a").value().has_value());
    EXPECT_TRUE(kv->hexists("h", "b").value());
    EXPECT_FALSE(kv->hexists("h", "c").value());
    EXPECT_EQ(kv->hlen("h").value(), 2U);
    EXPECT_EQ(kv->hlen("nohash").value(), 0U);

    auto keys = kv->hkeys("h").value();
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string> {"a", "b"}));

    auto vals = kv->hvals("h").value();
    std::sort(vals.begin(), vals.end());
    EXPECT_EQ(vals, (std::vector<std::string> {"2", "3"}));

    auto all = kv->hgetall("h").value();
    std::sort(all.begin(), all.end());
    EXPECT_EQ(all, (std::vector<rcoord::Field> {{"a", "2"}, {"b", "3"}}));
}

TEST_F(InMemoryStoreTest, HdelDropsEmptyHash) {
    ASSERT_TRUE(kv->hset("h", "a", "1").has_value());
    EXPECT_EQ(kv->hdel("h", "a").value(), 1U);
    EXPECT_EQ(kv->hdel("h", "a").value(), 0U);
    EXPECT_EQ(kv->size(), 0U);
    EXPECT_EQ(kv->del("h").value(), 0U);
}

TEST_F(InMemoryStoreTest, WrongTypeIsReplyError) {
    ASSERT_TRUE(kv->set("s", "v", 0ms, SetCondition::Always).has_value());
    ASSERT_TRUE(kv->hset("h", "f", "v").has_value());

    auto hsetOnString = kv->hset("s", "f", "v");
    ASSERT_FALSE(hsetOnString.has_value());
    EXPECT_EQ(hsetOnString.error().code, ErrorCode::ReplyError);
    EXPECT_FALSE(kv->hget("s", "f").has_value());
    EXPECT_FALSE(kv->hlen("s").has_value());

    auto getOnHash = kv->get("h");
    ASSERT_FALSE(getOnHash.has_value());
    EXPECT_EQ(getOnHash.error().code, ErrorCode::ReplyError);

    // SET replaces whatever the key held, as in Redis
    EXPECT_TRUE(kv->set("h", "v", 0ms, SetCondition::Always).value());
    EXPECT_EQ(kv->get("h").value(), "v");
}

TEST_F(InMemoryStoreTest, ConcurrentIfAbsentHasOneWinner) {
    constexpr int nThreads = 16;
    std::atomic<int> winners {0};
    std::vector<std::thread> threads;
    for (int i = 0; i < nThreads; ++i) {
        threads.emplace_back([this, i, &winners] {
            auto r = kv->set("race", std::to_string(i), 10000ms, SetCondition::IfAbsent);
            if (r.has_value() && r.value()) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(winners.load(), 1);
}

TEST_F(InMemoryStoreTest, PingAlwaysSucceeds) {
    EXPECT_TRUE(kv->ping().has_value());
}

TEST_F(InMemoryStoreTest, HugeTtlSaturatesInsteadOfWrapping) {
    EXPECT_TRUE(kv->set("k", "a", std::chrono::milliseconds::max(), SetCondition::IfAbsent).value());
    EXPECT_FALSE(kv->set("k", "b", 0ms, SetCondition::IfAbsent).value());
    clock->advance(24h * 365);
    EXPECT_EQ(kv->get("k").value(), "a");

    EXPECT_TRUE(kv->compareAndExpire("k", "a", std::chrono::milliseconds::max()).value());
    EXPECT_EQ(kv->get("k").value(), "a");
    EXPECT_EQ(kv->size(), 1U);
}

TEST_F(InMemoryStoreTest, PurgeDropsOnlyExpiredKeys) {
    ASSERT_TRUE(kv->set("a", "1", 100ms, SetCondition::Always).has_value());
    ASSERT_TRUE(kv->set("b", "2", 100ms, SetCondition::Always).has_value());
    ASSERT_TRUE(kv->set("c", "3", 0ms, SetCondition::Always).has_value());
    EXPECT_EQ(kv->purgeExpired(), 0U);
    clock->advance(100ms);
    EXPECT_EQ(kv->purgeExpired(), 2U);
    EXPECT_EQ(kv->purgeExpired(), 0U);
    EXPECT_EQ(kv->get("c").value(), "3");
}

TEST_F(InMemoryStoreTest, WritesSweepExpiredKeysOfOtherNames) {
    for (size_t i = 0; i < 10; ++i) {
        ASSERT_TRUE(kv->set("lock-" + std::to_string(i), "t", 100ms, SetCondition::IfAbsent).has_value());
    }
    clock->advance(200ms);
    for (size_t i = 10; i < InMemoryStore::sweepInterval; ++i) {
        ASSERT_TRUE(kv->set("other", std::to_string(i), 0ms, SetCondition::Always).has_value());
    }
    // the sweep already ran on the last write
    EXPECT_EQ(kv->purgeExpired(), 0U);
    EXPECT_EQ(kv->size(), 1U);
}
