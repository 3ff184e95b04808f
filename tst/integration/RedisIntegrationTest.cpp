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
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "client/Resolver.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include "lock/Lock.hpp"
#include "map/RemoteMap.hpp"
#include "storage/RedisStore.hpp"
#include "storage/Store.hpp"

using namespace std::chrono_literals;
using rcoord::ErrorCode;
using rcoord::Json;
using rcoord::Lock;
using rcoord::ReleaseMode;
using rcoord::RemoteMap;
using rcoord::SetCondition;

// Runs against the Redis named by RCOORD_TEST_REDIS_URL, e.g. redis://127.0.0.1:6379/15.
class RedisIntegrationTest : public ::testing::Test {
protected:
    std::shared_ptr<rcoord::Store> store;
    std::string prefix = "rcoord-test:" + uuid_v7_to_hex(generate_uuid_v7()) + ":";

    void SetUp() override {
        const char* url = std::getenv("RCOORD_TEST_REDIS_URL");
        if (url == nullptr) {
            GTEST_SKIP() << "RCOORD_TEST_REDIS_URL not set";
        }
        auto resolved = rcoord::resolve(url, {});
        ASSERT_TRUE(resolved.has_value()) << resolved.error();
        store = resolved.value();
    }
};

TEST_F(RedisIntegrationTest, LockHandOver) {
    const auto name = prefix + "job-1";
    Lock a {store, name, 5s};
    Lock b {store, name, 5s};
    ASSERT_TRUE(a.acquire().value());
    EXPECT_FALSE(b.acquire().value());
    ASSERT_TRUE(a.release().has_value());
    EXPECT_TRUE(b.acquire().value());
    ASSERT_TRUE(b.release().has_value());
}

TEST_F(RedisIntegrationTest, LockExpiresAndRenewChecksOwner) {
    const auto name = prefix + "short";
    Lock a {store, name, 1s, ReleaseMode::Atomic};
    Lock b {store, name, 5s, ReleaseMode::Atomic};
    ASSERT_TRUE(a.acquire().value());
    EXPECT_TRUE(a.renew().value());
    std::this_thread::sleep_for(1500ms);
    ASSERT_TRUE(b.acquire().value());
    EXPECT_FALSE(a.renew().value());
    ASSERT_TRUE(a.release().has_value());
    EXPECT_EQ(store->get(name).value(), b.token());
    ASSERT_TRUE(b.release().has_value());
    EXPECT_FALSE(store->get(name).value().has_value());
}

TEST_F(RedisIntegrationTest, MapOperations) {
    RemoteMap sessions {prefix + "sessions", store};
    ASSERT_TRUE(sessions.set("u1", Json {{"name", "Ann"}}).has_value());
    EXPECT_EQ(sessions.get("u1").value(), (Json {{"name", "Ann"}}));
    EXPECT_TRUE(sessions.contains("u1").value());
    EXPECT_EQ(sessions.size().value(), 1U);
    EXPECT_EQ(sessions.setDefault("u2", 2).value(), 2);
    EXPECT_EQ(sessions.setDefault("u2", 3).value(), 2);
    EXPECT_EQ(sessions.items().value().size(), 2U);
    ASSERT_TRUE(sessions.erase("u1").has_value());
    EXPECT_EQ(sessions.get("u1").error().code, ErrorCode::KeyNotFound);
    EXPECT_EQ(sessions.erase("u1").error().code, ErrorCode::KeyNotFound);
    ASSERT_TRUE(sessions.clear().has_value());
    EXPECT_EQ(sessions.size().value(), 0U);
}

TEST_F(RedisIntegrationTest, ConditionalSets) {
    const auto key = prefix + "cond";
    EXPECT_FALSE(store->set(key, "a", 0ms, SetCondition::IfPresent).value());
    EXPECT_TRUE(store->set(key, "a", 10s, SetCondition::IfAbsent).value());
    EXPECT_FALSE(store->set(key, "b", 10s, SetCondition::IfAbsent).value());
    EXPECT_TRUE(store->set(key, "c", 10s, SetCondition::IfPresent).value());
    EXPECT_EQ(store->get(key).value(), "c");
    EXPECT_EQ(store->del(key).value(), 1U);
}

TEST_F(RedisIntegrationTest, WrongTypeIsReplyError) {
    const auto key = prefix + "str";
    ASSERT_TRUE(store->set(key, "v", 10s, SetCondition::Always).has_value());
    auto r = store->hget(key, "f");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ReplyError);
    EXPECT_EQ(store->del(key).value(), 1U);
}

TEST_F(RedisIntegrationTest, BinaryRepliesNeedDecodeTextOff) {
    const char* url = std::getenv("RCOORD_TEST_REDIS_URL");
    auto raw = rcoord::resolve(url, {}, false);
    ASSERT_TRUE(raw.has_value());
    auto* redisStore = dynamic_cast<rcoord::RedisStore*>(raw.value().get());
    ASSERT_NE(redisStore, nullptr);
    EXPECT_FALSE(redisStore->decodesText());
    const auto key = prefix + "bin";
    const std::string bytes {"\xFF\x00\xFE", 3};
    ASSERT_TRUE(store->set(key, bytes, 10s, SetCondition::Always).has_value());

    auto asText = store->get(key);
    ASSERT_FALSE(asText.has_value());
    EXPECT_EQ(asText.error().code, ErrorCode::DecodeError);

    auto asBytes = raw.value()->get(key);
    ASSERT_TRUE(asBytes.has_value());
    EXPECT_EQ(asBytes.value(), bytes);
    EXPECT_EQ(store->del(key).value(), 1U);
}

TEST(RedisUnreachableTest, ConnectionFailureIsNotConfigurationError) {
    // port 1 on localhost refuses connections
    auto store = rcoord::resolve("tcp://127.0.0.1:1", {});
    ASSERT_FALSE(store.has_value());
    EXPECT_NE(store.error().code, ErrorCode::Configuration);
    EXPECT_TRUE(rcoord::isRetriable(store.error().code)) << store.error();
}
