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
#ifndef RCOORD_CLIENT_RESOLVER_HPP
#define RCOORD_CLIENT_RESOLVER_HPP

#include <expected>
#include <memory>
#include <string>
#include <vector>
#include "client/Config.hpp"
#include "common/Error.hpp"
#include "storage/Store.hpp"

namespace rcoord {

// Connected handle to the Redis primary: a direct URL, or a Sentinel locator when sentinels are given.
// Checked with one PING, never retried. Malformed addresses fail with Configuration.
std::expected<std::shared_ptr<Store>, Error> resolve(const std::string& address, const std::vector<Endpoint>& sentinels, bool decodeText = true);

std::expected<std::shared_ptr<Store>, Error> resolve(const StoreConfig& config);

// address with any password replaced by "***", safe for logs
std::string redactAddress(const std::string& address);

} // namespace rcoord

#endif // RCOORD_CLIENT_RESOLVER_HPP
