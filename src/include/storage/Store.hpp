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
#ifndef RCOORD_STORAGE_STORE_HPP
#define RCOORD_STORAGE_STORE_HPP

#include "common/Error.hpp"
#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace rcoord {

enum class SetCondition {
    Always,
    IfAbsent,
    IfPresent
};

using Field = std::pair<std::string, std::string>;

// Handle to one logical store, safe to share between threads. Each call is one atomic store operation.
class Store {
public:
    virtual ~Store() = default;

    virtual std::expected<std::monostate, Error> ping() = 0;

    // Returns whether the value was written. A zero ttl means no expiry.
    virtual std::expected<bool, Error> set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl, SetCondition condition) = 0;
    virtual std::expected<std::optional<std::string>, Error> get(const std::string& key) = 0;
    virtual std::expected<size_t, Error> del(const std::string& key) = 0;

    // Reset the ttl of key only while it still holds expected.
    virtual std::expected<bool, Error> compareAndExpire(const std::string& key, const std::string& expected, std::chrono::milliseconds ttl) = 0;
    // Delete key only while it still holds expected.
    virtual std::expected<bool, Error> compareAndDelete(const std::string& key, const std::string& expected) = 0;

    // Returns true when the field was newly created.
    virtual std::expected<bool, Error> hset(const std::string& key, const std::string& field, const std::string& value) = 0;
    virtual std::expected<std::optional<std::string>, Error> hget(const std::string& key, const std::string& field) = 0;
    virtual std::expected<size_t, Error> hdel(const std::string& key, const std::string& field) = 0;
    virtual std::expected<bool, Error> hexists(const std::string& key, const std::string& field) = 0;
    virtual std::expected<size_t, Error> hlen(const std::string& key) = 0;
    virtual std::expected<std::vector<std::string>, Error> hkeys(const std::string& key) = 0;
    virtual std::expected<std::vector<std::string>, Error> hvals(const std::string& key) = 0;
    virtual std::expected<std::vector<Field>, Error> hgetall(const std::string& key) = 0;
};

} // namespace rcoord

#endif // RCOORD_STORAGE_STORE_HPP
