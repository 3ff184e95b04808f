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
#include "storage/RedisStore.hpp"
#include <chrono>
#include <expected>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <spdlog/spdlog.h>
#include <sw/redis++/redis++.h>
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Util.hpp"

namespace rcoord {

namespace {

constexpr auto compareAndExpireScript =
    "if redis.call('get', KEYS[1]) == ARGV[1] then\n"
    "    return redis.call('pexpire', KEYS[1], ARGV[2])\n"
    "else\n"
    "    return 0\n"
    "end";

constexpr auto compareAndDeleteScript =
    "if redis.call('get', KEYS[1]) == ARGV[1] then\n"
    "    return redis.call('del', KEYS[1])\n"
    "else\n"
    "    return 0\n"
    "end";

sw::redis::UpdateType toUpdateType(SetCondition condition) {
    switch (condition) {
        case SetCondition::Always: return sw::redis::UpdateType::ALWAYS;
        case SetCondition::IfAbsent: return sw::redis::UpdateType::NOT_EXIST;
        case SetCondition::IfPresent: return sw::redis::UpdateType::EXIST;
    }
    std::unreachable();
}

Error notText(const std::string& key) {
    return Error {ErrorCode::DecodeError, "reply is not valid UTF-8 text", key};
}

} // namespace

RedisStore::RedisStore(std::unique_ptr<sw::redis::Redis> r, std::string d, bool t)
    : redis {std::move(r)}, desc {std::move(d)}, decodeText {t} {}

const std::string& RedisStore::description() const {
    return desc;
}

bool RedisStore::decodesText() const {
    return decodeText;
}

std::expected<std::optional<std::string>, Error> RedisStore::decode(const std::string& key, std::optional<std::string> reply) const {
    if (decodeText && reply.has_value() && !is_valid_utf8(reply.value())) {
        return std::unexpected {notText(key)};
    }
    return reply;
}

std::expected<std::vector<std::string>, Error> RedisStore::decode(const std::string& key, std::vector<std::string> reply) const {
    if (decodeText) {
        for (const auto& s : reply) {
            if (!is_valid_utf8(s)) {
                return std::unexpected {notText(key)};
            }
        }
    }
    return reply;
}

std::expected<std::monostate, Error> RedisStore::ping() {
    return toExpected("", [this] {
        auto pong = redis->ping();
        spdlog::debug("RedisStore @ {}: {}", desc, pong);
    });
}

std::expected<bool, Error> RedisStore::set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl, SetCondition condition) {
    return toExpected(key, [&] {
        return redis->set(key, value, ttl, toUpdateType(condition));
    });
}

std::expected<std::optional<std::string>, Error> RedisStore::get(const std::string& key) {
    return toExpected(key, [&] {
        return std::optional<std::string> {redis->get(key)};
    }).and_then([&](std::optional<std::string> reply) {
        return decode(key, std::move(reply));
    });
}

std::expected<size_t, Error> RedisStore::del(const std::string& key) {
    return toExpected(key, [&] {
        return static_cast<size_t>(redis->del(key));
    });
}

std::expected<bool, Error> RedisStore::compareAndExpire(const std::string& key, const std::string& expected, std::chrono::milliseconds ttl) {
    const auto ms = std::to_string(ttl.count());
    return toExpected(key, [&] {
        return redis->eval<long long>(compareAndExpireScript, {key}, {expected, ms}) == 1;
    });
}

std::expected<bool, Error> RedisStore::compareAndDelete(const std::string& key, const std::string& expected) {
    return toExpected(key, [&] {
        return redis->eval<long long>(compareAndDeleteScript, {key}, {expected}) == 1;
    });
}

std::expected<bool, Error> RedisStore::hset(const std::string& key, const std::string& field, const std::string& value) {
    return toExpected(key, [&] {
        return static_cast<bool>(redis->hset(key, field, value));
    });
}

std::expected<std::optional<std::string>, Error> RedisStore::hget(const std::string& key, const std::string& field) {
    return toExpected(key, [&] {
        return std::optional<std::string> {redis->hget(key, field)};
    }).and_then([&](std::optional<std::string> reply) {
        return decode(key, std::move(reply));
    });
}

std::expected<size_t, Error> RedisStore::hdel(const std::string& key, const std::string& field) {
    return toExpected(key, [&] {
        return static_cast<size_t>(redis->hdel(key, field));
    });
}

std::expected<bool, Error> RedisStore::hexists(const std::string& key, const std::string& field) {
    return toExpected(key, [&] {
        return redis->hexists(key, field);
    });
}

std::expected<size_t, Error> RedisStore::hlen(const std::string& key) {
    return toExpected(key, [&] {
        return static_cast<size_t>(redis->hlen(key));
    });
}

std::expected<std::vector<std::string>, Error> RedisStore::hkeys(const std::string& key) {
    return toExpected(key, [&] {
        std::vector<std::string> keys;
        redis->hkeys(key, std::back_inserter(keys));
        return keys;
    }).and_then([&](std::vector<std::string> reply) {
        return decode(key, std::move(reply));
    });
}

std::expected<std::vector<std::string>, Error> RedisStore::hvals(const std::string& key) {
    return toExpected(key, [&] {
        std::vector<std::string> values;
        redis->hvals(key, std::back_inserter(values));
        return values;
    }).and_then([&](std::vector<std::string> reply) {
        return decode(key, std::move(reply));
    });
}

std::expected<std::vector<Field>, Error> RedisStore::hgetall(const std::string& key) {
    return toExpected(key, [&] {
        std::vector<Field> fields;
        redis->hgetall(key, std::back_inserter(fields));
        return fields;
    }).and_then([&](std::vector<Field> reply) -> std::expected<std::vector<Field>, Error> {
        if (decodeText) {
            for (const auto& [f, v] : reply) {
                if (!is_valid_utf8(f) || !is_valid_utf8(v)) {
                    return std::unexpected {notText(key)};
                }
            }
        }
        return reply;
    });
}

} // namespace rcoord
