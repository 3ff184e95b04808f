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
#include "map/RemoteMap.hpp"
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "common/Error.hpp"
#include "storage/Store.hpp"

namespace rcoord {

std::expected<std::string, Error> encodeValue(const Json& value) {
    try {
        return value.dump();
    } catch (const Json::type_error& e) {
        return std::unexpected {Error(ErrorCode::InvalidArg, e.what())};
    }
}

std::expected<Json, Error> decodeValue(const std::string& key, const std::string& text) {
    try {
        return Json::parse(text);
    } catch (const Json::parse_error& e) {
        spdlog::warn("RemoteMap: field {} does not hold JSON: {}", key, e.what());
        return std::unexpected {Error(ErrorCode::DecodeError, e.what(), key)};
    }
}

RemoteMap::RemoteMap(std::string name, std::shared_ptr<Store> s) : mapName {std::move(name)}, store {std::move(s)} {
    if (!store) {
        throw std::invalid_argument("RemoteMap: no store");
    }
}

const std::string& RemoteMap::name() const {
    return mapName;
}

std::expected<std::monostate, Error> RemoteMap::set(const std::string& key, const Json& value) {
    return encodeValue(value)
        .and_then([&](const std::string& text) {
            return store->hset(mapName, key, text);
        })
        .transform([](bool) {
            return std::monostate {};
        });
}

std::expected<Json, Error> RemoteMap::get(const std::string& key) const {
    return store->hget(mapName, key).and_then([&](const std::optional<std::string>& text) -> std::expected<Json, Error> {
        if (!text.has_value()) {
            return std::unexpected {Error(ErrorCode::KeyNotFound, "no such key in " + mapName, key)};
        }
        return decodeValue(key, text.value());
    });
}

std::expected<std::monostate, Error> RemoteMap::erase(const std::string& key) {
    return store->hdel(mapName, key).and_then([&](size_t removed) -> std::expected<std::monostate, Error> {
        if (removed == 0) {
            return std::unexpected {Error(ErrorCode::KeyNotFound, "no such key in " + mapName, key)};
        }
        return {};
    });
}

std::expected<bool, Error> RemoteMap::contains(const std::string& key) const {
    return store->hexists(mapName, key);
}

std::expected<size_t, Error> RemoteMap::size() const {
    return store->hlen(mapName);
}

std::expected<std::vector<std::string>, Error> RemoteMap::keys() const {
    return store->hkeys(mapName);
}

std::expected<std::vector<Json>, Error> RemoteMap::values() const {
    auto raw = store->hvals(mapName);
    if (!raw.has_value()) {
        return std::unexpected {raw.error()};
    }
    std::vector<Json> result;
    result.reserve(raw.value().size());
    for (const auto& text : raw.value()) {
        auto v = decodeValue(mapName, text);
        if (!v.has_value()) {
            return std::unexpected {v.error()};
        }
        result.push_back(std::move(v.value()));
    }
    return result;
}

std::expected<std::vector<Item>, Error> RemoteMap::items() const {
    auto raw = store->hgetall(mapName);
    if (!raw.has_value()) {
        return std::unexpected {raw.error()};
    }
    std::vector<Item> result;
    result.reserve(raw.value().size());
    for (const auto& [k, text] : raw.value()) {
        auto v = decodeValue(k, text);
        if (!v.has_value()) {
            return std::unexpected {v.error()};
        }
        result.emplace_back(k, std::move(v.value()));
    }
    return result;
}

std::expected<std::monostate, Error> RemoteMap::clear() {
    return store->del(mapName).transform([](size_t) {
        return std::monostate {};
    });
}

} // namespace rcoord
