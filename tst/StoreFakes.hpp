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
#ifndef RCOORD_TST_STORE_FAKES_HPP
#define RCOORD_TST_STORE_FAKES_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "common/Error.hpp"
#include "storage/InMemoryStore.hpp"
#include "storage/Store.hpp"

// Time source for InMemoryStore that only moves when told to.
struct ManualClock {
    std::chrono::steady_clock::time_point now {std::chrono::steady_clock::now()};

    void advance(std::chrono::milliseconds d) {
        now += d;
    }
};

inline std::shared_ptr<rcoord::InMemoryStore> makeStore(const std::shared_ptr<ManualClock>& clock) {
    return std::make_shared<rcoord::InMemoryStore>([clock] { return clock->now; });
}

// Every call fails the way a dropped connection does.
class UnreachableStore : public rcoord::Store {
public:
    explicit UnreachableStore(rcoord::ErrorCode c = rcoord::ErrorCode::ConnectionFailed) : code {c} {}

    std::expected<std::monostate, rcoord::Error> ping() override { return fail(""); }
    std::expected<bool, rcoord::Error> set(const std::string& key, const std::string&, std::chrono::milliseconds, rcoord::SetCondition) override { return fail(key); }
    std::expected<std::optional<std::string>, rcoord::Error> get(const std::string& key) override { return fail(key); }
    std::expected<size_t, rcoord::Error> del(const std::string& key) override { return fail(key); }
    std::expected<bool, rcoord::Error> compareAndExpire(const std::string& key, const std::string&, std::chrono::milliseconds) override { return fail(key); }
    std::expected<bool, rcoord::Error> compareAndDelete(const std::string& key, const std::string&) override { return fail(key); }
    std::expected<bool, rcoord::Error> hset(const std::string& key, const std::string&, const std::string&) override { return fail(key); }
    std::expected<std::optional<std::string>, rcoord::Error> hget(const std::string& key, const std::string&) override { return fail(key); }
    std::expected<size_t, rcoord::Error> hdel(const std::string& key, const std::string&) override { return fail(key); }
    std::expected<bool, rcoord::Error> hexists(const std::string& key, const std::string&) override { return fail(key); }
    std::expected<size_t, rcoord::Error> hlen(const std::string& key) override { return fail(key); }
    std::expected<std::vector<std::string>, rcoord::Error> hkeys(const std::string& key) override { return fail(key); }
    std::expected<std::vector<std::string>, rcoord::Error> hvals(const std::string& key) override { return fail(key); }
    std::expected<std::vector<rcoord::Field>, rcoord::Error> hgetall(const std::string& key) override { return fail(key); }

    int calls {0};
private:
    std::unexpected<rcoord::Error> fail(const std::string& key) {
        ++calls;
        return std::unexpected {rcoord::Error(code, "connection refused", key)};
    }
    rcoord::ErrorCode code;
};

// In-process store whose DEL always fails, everything else works.
class FailingDelStore : public rcoord::InMemoryStore {
public:
    std::expected<size_t, rcoord::Error> del(const std::string& key) override {
        return std::unexpected {rcoord::Error(rcoord::ErrorCode::Timeout, "timed out", key)};
    }
};

#endif // RCOORD_TST_STORE_FAKES_HPP
