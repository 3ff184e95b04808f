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
#include "client/Config.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include "common/Error.hpp"

namespace rcoord {

namespace {

std::expected<int, Error> parseNumber(std::string_view text, const std::string& what) {
    int v = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, v);
    if (text.empty() || ec != std::errc{} || ptr != end || v < 0) {
        return std::unexpected {Error(ErrorCode::Configuration, "invalid " + what + ": '" + std::string {text} + "'")};
    }
    return v;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::string env(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return v == nullptr ? fallback : std::string {v};
}

} // namespace

std::expected<SentinelLocator, Error> parseSentinelLocator(const std::string& url) {
    const auto sep = url.find("://");
    if (sep == std::string::npos || url.substr(0, sep) != "redis") {
        return std::unexpected {Error(ErrorCode::Configuration, "invalid scheme, Sentinel locator must use redis://", url)};
    }
    std::string_view rest {url};
    rest.remove_prefix(sep + 3);
    rest = rest.substr(0, rest.find_first_of("?#"));

    const auto slash = rest.find('/');
    const auto netloc = rest.substr(0, slash);
    const auto path = slash == std::string_view::npos ? std::string_view {} : rest.substr(slash + 1);

    SentinelLocator locator {std::nullopt, std::nullopt, defaultServiceName, defaultRedisPort, 0};

    auto hostPort = netloc;
    const auto at = netloc.rfind('@');
    if (at != std::string_view::npos) {
        const auto userInfo = netloc.substr(0, at);
        hostPort = netloc.substr(at + 1);
        const auto colon = userInfo.find(':');
        const auto user = userInfo.substr(0, colon);
        if (!user.empty()) {
            locator.username = std::string {user};
        }
        if (colon != std::string_view::npos && colon + 1 < userInfo.size()) {
            locator.password = std::string {userInfo.substr(colon + 1)};
        }
    }

    std::string_view host = hostPort;
    std::string_view port {};
    if (!hostPort.empty() && hostPort.front() == '[') {
        const auto close = hostPort.find(']');
        if (close == std::string_view::npos) {
            return std::unexpected {Error(ErrorCode::Configuration, "invalid IPv6 host", url)};
        }
        host = hostPort.substr(1, close - 1);
        auto tail = hostPort.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return std::unexpected {Error(ErrorCode::Configuration, "invalid host", url)};
            }
            port = tail.substr(1);
        }
    } else {
        const auto colon = hostPort.rfind(':');
        if (colon != std::string_view::npos) {
            host = hostPort.substr(0, colon);
            port = hostPort.substr(colon + 1);
        }
    }

    if (!host.empty()) {
        locator.service = std::string {host};
        std::transform(locator.service.begin(), locator.service.end(), locator.service.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    if (!port.empty()) {
        auto p = parseNumber(port, "port");
        if (!p.has_value()) {
            return std::unexpected {p.error()};
        }
        if (p.value() == 0 || p.value() > 65535) {
            return std::unexpected {Error(ErrorCode::Configuration, "port out of range: " + std::string {port}, url)};
        }
        locator.port = p.value();
    }
    if (!path.empty()) {
        auto db = parseNumber(path, "database index");
        if (!db.has_value()) {
            return std::unexpected {db.error()};
        }
        locator.db = db.value();
    }
    return locator;
}

std::expected<std::chrono::seconds, Error> parseSeconds(std::string_view text) {
    long long v = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, v);
    if (text.empty() || ec != std::errc{} || ptr != end || v < 0) {
        return std::unexpected {Error(ErrorCode::InvalidArg, "invalid number of seconds: '" + std::string {text} + "'")};
    }
    return std::chrono::seconds {v};
}

std::expected<std::vector<Endpoint>, Error> parseSentinelHosts(const std::string& hosts, const std::string& port) {
    std::vector<Endpoint> endpoints;
    if (trim(hosts).empty()) {
        return endpoints;
    }
    auto p = parseNumber(trim(port), "REDIS_SENTINEL_PORT");
    if (!p.has_value()) {
        return std::unexpected {p.error()};
    }
    std::string_view rest {hosts};
    while (true) {
        const auto comma = rest.find(',');
        const auto host = trim(rest.substr(0, comma));
        if (!host.empty()) {
            endpoints.emplace_back(std::string {host}, p.value());
        }
        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }
    return endpoints;
}

std::expected<StoreConfig, Error> StoreConfig::fromEnvironment() {
    StoreConfig config;
    config.address = env("REDIS_URL", defaultRedisUrl);
    auto sentinels = parseSentinelHosts(env("REDIS_SENTINEL_HOSTS", ""), env("REDIS_SENTINEL_PORT", std::to_string(defaultSentinelPort)));
    if (!sentinels.has_value()) {
        return std::unexpected {sentinels.error()};
    }
    config.sentinels = std::move(sentinels.value());
    return config;
}

} // namespace rcoord
