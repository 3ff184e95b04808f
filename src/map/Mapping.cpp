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
#include "map/Mapping.hpp"
#include <expected>
#include <string>
#include <variant>
#include <vector>
#include "common/Error.hpp"

namespace rcoord {

std::expected<Json, Error> Mapping::get(const std::string& key, const Json& fallback) const {
    return get(key).or_else([&fallback](const Error& e) -> std::expected<Json, Error> {
        if (e.code == ErrorCode::KeyNotFound) {
            return fallback;
        }
        return std::unexpected {e};
    });
}

std::expected<Json, Error> Mapping::setDefault(const std::string& key, const Json& fallback) {
    auto present = contains(key);
    if (!present.has_value()) {
        return std::unexpected {present.error()};
    }
    if (present.value()) {
        return get(key);
    }
    return set(key, fallback).transform([&fallback](std::monostate) {
        return fallback;
    });
}

std::expected<std::monostate, Error> Mapping::update(const std::vector<Item>& source) {
    for (const auto& [k, v] : source) {
        auto written = set(k, v);
        if (!written.has_value()) {
            return written;
        }
    }
    return {};
}

std::expected<std::monostate, Error> Mapping::update(const Json& source) {
    if (!source.is_object()) {
        return std::unexpected {Error(ErrorCode::InvalidArg, std::string {"update source must be a JSON object, got "} + source.type_name())};
    }
    for (const auto& entry : source.items()) {
        auto written = set(entry.key(), entry.value());
        if (!written.has_value()) {
            return written;
        }
    }
    return {};
}

std::expected<std::monostate, Error> Mapping::update(const Mapping& source) {
    auto entries = source.items();
    if (!entries.has_value()) {
        return std::unexpected {entries.error()};
    }
    return update(entries.value());
}

} // namespace rcoord
