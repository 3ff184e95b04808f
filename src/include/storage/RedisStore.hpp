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
#ifndef RCOORD_STORAGE_REDIS_STORE_HPP
#define RCOORD_STORAGE_REDIS_STORE_HPP

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <sw/redis++/redis++.h>
#include "common/Error.hpp"
#include "storage/Store.hpp"

namespace rcoord {

// With decodeText set, a string reply that is not valid UTF-8 fails with DecodeError.
class RedisStore : public Store {
public:
    RedisStore(std::unique_ptr<sw::redis::Redis> r, std::string desc, bool decodeText);
    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

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

    const std::string& description() const;
    bool decodesText() const;
private:
    std::expected<std::optional<std::string>, Error> decode(const std::string& key, std::optional<std::string> reply) const;
    std::expected<std::vector<std::string>, Error> decode(const std::string& key, std::vector<std::string> reply) const;

    std::unique_ptr<sw::redis::Redis> redis;
    const std::string desc;
    const bool decodeText;
};

} // namespace rcoord

#endif // RCOORD_STORAGE_REDIS_STORE_HPP
