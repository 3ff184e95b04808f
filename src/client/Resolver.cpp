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
#include "client/Resolver.hpp"
#include <expected>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include <sw/redis++/redis++.h>
#include "client/Config.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "storage/RedisStore.hpp"

namespace rcoord {

namespace {

std::expected<std::shared_ptr<Store>, Error> connected(std::unique_ptr<sw::redis::Redis> redis, const std::string& desc, bool decodeText) {
    auto store = std::make_shared<RedisStore>(std::move(redis), desc, decodeText);
    auto pong = store->ping();
    if (!pong.has_value()) {
        spdlog::warn("Could not connect to Redis @ {}: {}", store->description(), pong.error().what);
        return std::unexpected {pong.error()};
    }
    spdlog::info("Connected to Redis @ {} (decodeText: {})", store->description(), store->decodesText());
    return store;
}

std::expected<std::shared_ptr<Store>, Error> resolveDirect(const StoreConfig& config) {
    const auto desc = redactAddress(config.address);
    std::unique_ptr<sw::redis::Redis> redis;
    try {
        redis = std::make_unique<sw::redis::Redis>(config.address);
    } catch (const sw::redis::IoError& e) {
        return std::unexpected {toError(e)};
    } catch (const sw::redis::Error& e) {
        return std::unexpected {Error(ErrorCode::Configuration, e.what(), desc)};
    }
    return connected(std::move(redis), desc, config.decodeText);
}

std::expected<std::shared_ptr<Store>, Error> resolveSentinel(const StoreConfig& config) {
    auto locator = parseSentinelLocator(config.address);
    if (!locator.has_value()) {
        return std::unexpected {locator.error()};
    }
    const auto& l = locator.value();

    sw::redis::SentinelOptions sentinelOptions;
    sentinelOptions.nodes = config.sentinels;
    if (config.connectTimeout.count() > 0) {
        sentinelOptions.connect_timeout = config.connectTimeout;
    }
    if (config.socketTimeout.count() > 0) {
        sentinelOptions.socket_timeout = config.socketTimeout;
    }

    sw::redis::ConnectionOptions connectionOptions;
    // host and port come from Sentinel; the locator port only seeds the options
    connectionOptions.port = l.port;
    connectionOptions.db = l.db;
    if (l.username.has_value()) {
        connectionOptions.user = l.username.value();
    }
    if (l.password.has_value()) {
        connectionOptions.password = l.password.value();
    }
    if (config.connectTimeout.count() > 0) {
        connectionOptions.connect_timeout = config.connectTimeout;
    }
    if (config.socketTimeout.count() > 0) {
        connectionOptions.socket_timeout = config.socketTimeout;
    }

    sw::redis::ConnectionPoolOptions poolOptions;
    poolOptions.size = config.poolSize;

    const auto desc = "sentinel:" + l.service + "/" + std::to_string(l.db);
    spdlog::info("Resolving primary of '{}' through {} sentinel(s)", l.service, config.sentinels.size());
    std::unique_ptr<sw::redis::Redis> redis;
    try {
        auto sentinel = std::make_shared<sw::redis::Sentinel>(sentinelOptions);
        redis = std::make_unique<sw::redis::Redis>(sentinel, l.service, sw::redis::Role::MASTER, connectionOptions, poolOptions);
    } catch (const sw::redis::Error& e) {
        return std::unexpected {toError(e, desc)};
    }
    return connected(std::move(redis), desc, config.decodeText);
}

} // namespace

std::string redactAddress(const std::string& address) {
    const auto sep = address.find("://");
    if (sep == std::string::npos) {
        return address;
    }
    const auto start = sep + 3;
    const auto end = address.find_first_of("/?#", start);
    const auto at = address.rfind('@', end == std::string::npos ? std::string::npos : end);
    if (at == std::string::npos || at < start) {
        return address;
    }
    const auto colon = address.find(':', start);
    if (colon == std::string::npos || colon > at) {
        return address;
    }
    return address.substr(0, colon + 1) + "***" + address.substr(at);
}

std::expected<std::shared_ptr<Store>, Error> resolve(const std::string& address, const std::vector<Endpoint>& sentinels, bool decodeText) {
    StoreConfig config;
    config.address = address;
    config.sentinels = sentinels;
    config.decodeText = decodeText;
    return resolve(config);
}

std::expected<std::shared_ptr<Store>, Error> resolve(const StoreConfig& config) {
    if (config.sentinels.empty()) {
        return resolveDirect(config);
    }
    return resolveSentinel(config);
}

} // namespace rcoord
