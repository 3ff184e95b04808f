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
#ifndef RCOORD_CLIENT_CONFIG_HPP
#define RCOORD_CLIENT_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "common/Error.hpp"

namespace rcoord {

inline constexpr auto defaultServiceName = "mymaster";
inline constexpr int defaultRedisPort = 6379;
inline constexpr int defaultSentinelPort = 26379;
inline constexpr auto defaultRedisUrl = "redis://localhost:6379/0";

using Endpoint = std::pair<std::string, int>;

// Where to find the primary when going through Sentinel: redis://[user[:pass]@]service[:port][/db]
struct SentinelLocator {
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::string service;
    int port;
    int db;
};

std::expected<SentinelLocator, Error> parseSentinelLocator(const std::string& url);

// Whole non-negative decimal number of seconds, nothing else.
std::expected<std::chrono::seconds, Error> parseSeconds(std::string_view text);

// "host1,host2" plus one port for all of them. Empty hosts means no Sentinel.
std::expected<std::vector<Endpoint>, Error> parseSentinelHosts(const std::string& hosts, const std::string& port);

struct StoreConfig {
    std::string address {defaultRedisUrl};
    std::vector<Endpoint> sentinels {};
    bool decodeText {true};
    // Sentinel connections only; direct URLs carry these as query options. Zero keeps the client default.
    std::chrono::milliseconds connectTimeout {0};
    std::chrono::milliseconds socketTimeout {0};
    std::size_t poolSize {1};

    // REDIS_URL, REDIS_SENTINEL_HOSTS and REDIS_SENTINEL_PORT
    static std::expected<StoreConfig, Error> fromEnvironment();
};

} // namespace rcoord

#endif // RCOORD_CLIENT_CONFIG_HPP
