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
#ifndef RCOORD_MAP_MAPPING_HPP
#define RCOORD_MAP_MAPPING_HPP

#include <cstddef>
#include <expected>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Error.hpp"

namespace rcoord {

using Json = nlohmann::json;
using Item = std::pair<std::string, Json>;

// String-keyed mapping of JSON values, nothing cached. The non-virtual composites are not atomic.
class Mapping {
public:
    virtual ~Mapping() = default;

    virtual std::expected<std::monostate, Error> set(const std::string& key, const Json& value) = 0;
    // KeyNotFound if absent. A stored null and a missing key are told apart only by this error.
    virtual std::expected<Json, Error> get(const std::string& key) const = 0;
    // KeyNotFound if absent.
    virtual std::expected<std::monostate, Error> erase(const std::string& key) = 0;
    virtual std::expected<bool, Error> contains(const std::string& key) const = 0;
    virtual std::expected<size_t, Error> size() const = 0;
    // Store order, which callers must not rely on.
    virtual std::expected<std::vector<std::string>, Error> keys() const = 0;
    virtual std::expected<std::vector<Json>, Error> values() const = 0;
    virtual std::expected<std::vector<Item>, Error> items() const = 0;
    virtual std::expected<std::monostate, Error> clear() = 0;

    std::expected<Json, Error> get(const std::string& key, const Json& fallback) const;
    std::expected<Json, Error> setDefault(const std::string& key, const Json& fallback);
    // Stops at the first failed set; earlier writes stay visible.
    std::expected<std::monostate, Error> update(const std::vector<Item>& source);
    // source must be a JSON object
    std::expected<std::monostate, Error> update(const Json& source);
    std::expected<std::monostate, Error> update(const Mapping& source);
};

} // namespace rcoord

#endif // RCOORD_MAP_MAPPING_HPP
