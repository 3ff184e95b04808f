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
#include "lock/Lock.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <spdlog/spdlog.h>
#include "common/Error.hpp"
#include "common/Util.hpp"
#include "storage/Store.hpp"

namespace rcoord {

Lock::Lock(std::shared_ptr<Store> s, std::string name, std::chrono::seconds ttl, ReleaseMode m)
    : store {std::move(s)},
      lockName {std::move(name)},
      lockToken {uuid_v7_to_hex(generate_uuid_v7())},
      lockTtl {ttl},
      mode {m} {
    if (!store) {
        throw std::invalid_argument("Lock: no store");
    }
    if (lockTtl <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("Lock: ttl must be positive");
    }
    if (lockTtl > maxLockTtl) {
        throw std::invalid_argument("Lock: ttl too large");
    }
}

std::expected<bool, Error> Lock::acquire() {
    auto acquired = store->set(lockName, lockToken, lockTtl, SetCondition::IfAbsent);
    if (!acquired.has_value()) {
        return acquired;
    }
    lockHeld = acquired.value();
    spdlog::debug("Lock {}: acquire by {} -> {}", lockName, lockToken, lockHeld);
    return lockHeld;
}

std::expected<bool, Error> Lock::renew() {
    auto renewed = store->compareAndExpire(lockName, lockToken, lockTtl);
    if (!renewed.has_value()) {
        return renewed;
    }
    if (!renewed.value() && lockHeld) {
        spdlog::warn("Lock {}: lease of {} lost before renewal", lockName, lockToken);
    }
    lockHeld = renewed.value();
    return renewed;
}

std::expected<std::monostate, Error> Lock::release() {
    if (mode == ReleaseMode::Atomic) {
        auto deleted = store->compareAndDelete(lockName, lockToken);
        if (!deleted.has_value()) {
            return std::unexpected {deleted.error()};
        }
        lockHeld = false;
        spdlog::debug("Lock {}: released by {} -> {}", lockName, lockToken, deleted.value());
        return {};
    }

    auto current = store->get(lockName);
    if (!current.has_value()) {
        return std::unexpected {current.error()};
    }
    if (!current.value().has_value() || current.value().value() != lockToken) {
        lockHeld = false;
        spdlog::debug("Lock {}: not held by {}, nothing to release", lockName, lockToken);
        return {};
    }
    auto deleted = store->del(lockName);
    if (!deleted.has_value()) {
        return std::unexpected {deleted.error()};
    }
    lockHeld = false;
    spdlog::debug("Lock {}: released by {}", lockName, lockToken);
    return {};
}

const std::string& Lock::name() const {
    return lockName;
}

const std::string& Lock::token() const {
    return lockToken;
}

std::chrono::seconds Lock::ttl() const {
    return lockTtl;
}

bool Lock::held() const {
    return lockHeld;
}

} // namespace rcoord
