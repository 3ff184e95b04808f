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
#ifndef RCOORD_MAP_REMOTE_MAP_HPP
#define RCOORD_MAP_REMOTE_MAP_HPP

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "common/Error.hpp"
#include "map/Mapping.hpp"
#include "storage/Store.hpp"

namespace rcoord {

// Mapping kept in one store hash named after the map. Values are stored as compact JSON text.
class RemoteMap : public Mapping {
public:
    RemoteMap(std::string name, std::shared_ptr<Store> s);
    RemoteMap(const RemoteMap&) = delete;
    RemoteMap& operator=(const RemoteMap&) = delete;

    using Mapping::get;
    using Mapping::update;

    std::expected<std::monostate, Error> set(const std::string& key, const Json& value) override;
    std::expected<Json, Error> get(const std::string& key) const override;
    std::expected<std::monostate, Error> erase(const std::string& key) override;
    std::expected<bool, Error> contains(const std::string& key) const override;
    std::expected<size_t, Error> size() const override;
    std::expected<std::vector<std::string>, Error> keys() const override;
    std::expected<std::vector<Json>, Error> values() const override;
    std::expected<std::vector<Item>, Error> items() const override;
    std::expected<std::monostate, Error> clear() override;

    const std::string& name() const;
private:
    const std::string mapName;
    std::shared_ptr<Store> store;
};

std::expected<std::string, Error> encodeValue(const Json& value);
std::expected<Json, Error> decodeValue(const std::string& key, const std::string& text);

} // namespace rcoord

#endif // RCOORD_MAP_REMOTE_MAP_HPP
