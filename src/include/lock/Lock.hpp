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
#ifndef RCOORD_LOCK_HPP
#define RCOORD_LOCK_HPP

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <variant>
#include "common/Error.hpp"
#include "storage/Store.hpp"

namespace rcoord {

enum class ReleaseMode {
    // GET then DEL; another holder can slip in between the two round trips
    CheckThenDelete,
    // compare and delete in one script at the store
    Atomic
};

// Longest lease a Lock accepts.
inline constexpr std::chrono::seconds maxLockTtl = std::chrono::hours {24 * 365 * 100};

// Single-owner, expiring lock stored as one key holding this instance's token.
// acquire() never blocks. A Lock object is not synchronized, give each thread its own.
class Lock {
public:
    Lock(std::shared_ptr<Store> s, std::string name, std::chrono::seconds ttl, ReleaseMode mode = ReleaseMode::CheckThenDelete);
    Lock(const Lock&) = delete;
    Lock& operator=(const Lock&) = delete;

    // SET NX with expiry. False means someone else holds the lock.
    [[nodiscard]] std::expected<bool, Error> acquire();
    // Extends the expiry only while the record still carries our token. Stricter than a plain
    // "update if present"; whether that weaker form was ever intended is still open.
    [[nodiscard]] std::expected<bool, Error> renew();
    // Removes the record if it is still ours. A lost lock is not an error.
    [[nodiscard]] std::expected<std::monostate, Error> release();

    const std::string& name() const;
    const std::string& token() const;
    std::chrono::seconds ttl() const;
    bool held() const;
private:
    std::shared_ptr<Store> store;
    const std::string lockName;
    const std::string lockToken;
    const std::chrono::seconds lockTtl;
    const ReleaseMode mode;
    bool lockHeld {false};
};

} // namespace rcoord

#endif // RCOORD_LOCK_HPP
