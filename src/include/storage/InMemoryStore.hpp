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
#ifndef RCOORD_STORAGE_IN_MEMORY_STORE_HPP
#define RCOORD_STORAGE_IN_MEMORY_STORE_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include "common/Error.hpp"
#include "storage/Store.hpp"

namespace rcoord {

// Process-local store with Redis semantics for the primitives rcoord uses.
// Expired keys are dropped when touched by a writer and by a full sweep every sweepInterval writes.
class InMemoryStore : public Store {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr size_t sweepInterval = 128;

    InMemoryStore();
    explicit InMemoryStore(Clock c);

    std::expected<std::monostate, Error> ping() override;
    std::expected<bool, Error> set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl, SetCondition condition) override;
    std::expected<std::optional<std::string>, Error> get(const std::string& key) override;
    std::expected<size_t, Error> del(const std::string& key) override;
    std::expected<bool, Error> compareAndExpire(const std::string& key, const std::string& expected, std::chrono::milliseconds ttl) override;
    std::expected<bool, Error> compareAndDelete(const std::string& key, const std::string& expected) override;
    std::expected<bool, Error> hset(const std::string& key, const std::string& field, const std::string& value) override;
    std::expected<std::optional<std::string>, Error> hget(const std::string& key, const std::string& field) override;
    std::expected<size_t, Error> hdel(const std::string& key, const std::string& field) override;
    std::expected<bool, Error> hexists(const std::string& key, const std::string& field) override;
    std::expected<size_t, Error> hlen(const std::string& key) override;
    std::expected<std::vector<std::string>, Error> hkeys(const std::string& key) override;
    std::expected<std::vector<std::string>, Error> hvals(const std::string& key) override;
    std::expected<std::vector<Field>, Error> hgetall(const std::string& key) override;

    size_t size() const;
    // Drops every expired key now. Returns how many were removed.
    size_t purgeExpired();
private:
    using Hash = std::unordered_map<std::string, std::string>;

    struct Entry {
        std::variant<std::string, Hash> data;
        std::optional<std::chrono::steady_clock::time_point> expiresAt;
    };

    const Entry* live(const std::string& key) const;
    Entry* live(const std::string& key);
    std::expected<const Hash*, Error> liveHash(const std::string& key) const;
    void wrote();
    size_t sweep();

    Clock clock;
    std::unordered_map<std::string, Entry> store;
    size_t writes {0};
    mutable std::shared_mutex m;
};

} // namespace rcoord

#endif // RCOORD_STORAGE_IN_MEMORY_STORE_HPP
