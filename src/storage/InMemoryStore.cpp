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
#include "storage/InMemoryStore.hpp"
#include <chrono>
#include <cstddef>
#include <expected>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "common/Error.hpp"

namespace rcoord {

namespace {

Error wrongType(const std::string& key) {
    return Error {ErrorCode::ReplyError, "WRONGTYPE Operation against a key holding the wrong kind of value", key};
}

// now + ttl, saturating at the end of the clock's range
std::chrono::steady_clock::time_point expiry(std::chrono::steady_clock::time_point now, std::chrono::milliseconds ttl) {
    using TimePoint = std::chrono::steady_clock::time_point;
    if (ttl > std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::max() - now)) {
        return TimePoint::max();
    }
    return now + ttl;
}

} // namespace

InMemoryStore::InMemoryStore() : InMemoryStore([] { return std::chrono::steady_clock::now(); }) {}

InMemoryStore::InMemoryStore(Clock c) : clock {std::move(c)}, store {}, m {} {}

const InMemoryStore::Entry* InMemoryStore::live(const std::string& key) const {
    auto i = store.find(key);
    if (i == store.end()) {
        return nullptr;
    }
    if (i->second.expiresAt.has_value() && i->second.expiresAt.value() <= clock()) {
        return nullptr;
    }
    return &i->second;
}

InMemoryStore::Entry* InMemoryStore::live(const std::string& key) {
    auto i = store.find(key);
    if (i == store.end()) {
        return nullptr;
    }
    if (i->second.expiresAt.has_value() && i->second.expiresAt.value() <= clock()) {
        store.erase(i);
        return nullptr;
    }
    return &i->second;
}

void InMemoryStore::wrote() {
    if (++writes % sweepInterval == 0) {
        sweep();
    }
}

size_t InMemoryStore::sweep() {
    const auto now = clock();
    return std::erase_if(store, [now](const auto& kv) {
        return kv.second.expiresAt.has_value() && kv.second.expiresAt.value() <= now;
    });
}

size_t InMemoryStore::purgeExpired() {
    const std::unique_lock lock {m};
    return sweep();
}

std::expected<const InMemoryStore::Hash*, Error> InMemoryStore::liveHash(const std::string& key) const {
    const auto* e = live(key);
    if (e == nullptr) {
        return nullptr;
    }
    const auto* h = std::get_if<Hash>(&e->data);
    if (h == nullptr) {
        return std::unexpected {wrongType(key)};
    }
    return h;
}

std::expected<std::monostate, Error> InMemoryStore::ping() {
    return {};
}

std::expected<bool, Error> InMemoryStore::set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl, SetCondition condition) {
    const std::unique_lock lock {m};
    auto* e = live(key);
    if ((condition == SetCondition::IfAbsent && e != nullptr) ||
        (condition == SetCondition::IfPresent && e == nullptr)) {
        return false;
    }
    std::optional<std::chrono::steady_clock::time_point> expiresAt;
    if (ttl > std::chrono::milliseconds::zero()) {
        expiresAt = expiry(clock(), ttl);
    }
    store.insert_or_assign(key, Entry {value, expiresAt});
    wrote();
    return true;
}

std::expected<std::optional<std::string>, Error> InMemoryStore::get(const std::string& key) {
    const std::shared_lock lock {m};
    const auto* e = std::as_const(*this).live(key);
    if (e == nullptr) {
        return std::nullopt;
    }
    const auto* s = std::get_if<std::string>(&e->data);
    if (s == nullptr) {
        return std::unexpected {wrongType(key)};
    }
    return *s;
}

std::expected<size_t, Error> InMemoryStore::del(const std::string& key) {
    const std::unique_lock lock {m};
    if (live(key) == nullptr) {
        return 0;
    }
    store.erase(key);
    return 1;
}

std::expected<bool, Error> InMemoryStore::compareAndExpire(const std::string& key, const std::string& expected, std::chrono::milliseconds ttl) {
    const std::unique_lock lock {m};
    auto* e = live(key);
    if (e == nullptr) {
        return false;
    }
    const auto* s = std::get_if<std::string>(&e->data);
    if (s == nullptr) {
        return std::unexpected {wrongType(key)};
    }
    if (*s != expected) {
        return false;
    }
    e->expiresAt = expiry(clock(), ttl);
    return true;
}

std::expected<bool, Error> InMemoryStore::compareAndDelete(const std::string& key, const std::string& expected) {
    const std::unique_lock lock {m};
    auto* e = live(key);
    if (e == nullptr) {
        return false;
    }
    const auto* s = std::get_if<std::string>(&e->data);
    if (s == nullptr) {
        return std::unexpected {wrongType(key)};
    }
    if (*s != expected) {
        return false;
    }
    store.erase(key);
    return true;
}

std::expected<bool, Error> InMemoryStore::hset(const std::string& key, const std::string& field, const std::string& value) {
    const std::unique_lock lock {m};
    auto* e = live(key);
    if (e == nullptr) {
        e = &store.emplace(key, Entry {Hash {}, std::nullopt}).first->second;
    }
    auto* h = std::get_if<Hash>(&e->data);
    if (h == nullptr) {
        return std::unexpected {wrongType(key)};
    }
    auto [i, created] = h->insert_or_assign(field, value);
    wrote();
    return created;
}

std::expected<std::optional<std::string>, Error> InMemoryStore::hget(const std::string& key, const std::string& field) {
    const std::shared_lock lock {m};
    return liveHash(key).and_then([&field](const Hash* h) -> std::expected<std::optional<std::string>, Error> {
        if (h == nullptr) {
            return std::nullopt;
        }
        auto i = h->find(field);
        if (i == h->end()) {
            return std::nullopt;
        }
        return i->second;
    });
}

std::expected<size_t, Error> InMemoryStore::hdel(const std::string& key, const std::string& field) {
    const std::unique_lock lock {m};
    auto* e = live(key);
    if (e == nullptr) {
        return 0;
    }
    auto* h = std::get_if<Hash>(&e->data);
    if (h == nullptr) {
        return std::unexpected {wrongType(key)};
    }
    auto n = h->erase(field);
    // Redis drops a hash once its last field is gone
    if (h->empty()) {
        store.erase(key);
    }
    return n;
}

std::expected<bool, Error> InMemoryStore::hexists(const std::string& key, const std::string& field) {
    const std::shared_lock lock {m};
    return liveHash(key).transform([&field](const Hash* h) {
        return h != nullptr && h->contains(field);
    });
}

std::expected<size_t, Error> InMemoryStore::hlen(const std::string& key) {
    const std::shared_lock lock {m};
    return liveHash(key).transform([](const Hash* h) -> size_t {
        return h == nullptr ? 0 : h->size();
    });
}

std::expected<std::vector<std::string>, Error> InMemoryStore::hkeys(const std::string& key) {
    const std::shared_lock lock {m};
    return liveHash(key).transform([](const Hash* h) {
        std::vector<std::string> keys;
        if (h != nullptr) {
            keys.reserve(h->size());
            for (const auto& [k, v] : *h) {
                keys.push_back(k);
            }
        }
        return keys;
    });
}

std::expected<std::vector<std::string>, Error> InMemoryStore::hvals(const std::string& key) {
    const std::shared_lock lock {m};
    return liveHash(key).transform([](const Hash* h) {
        std::vector<std::string> values;
        if (h != nullptr) {
            values.reserve(h->size());
            for (const auto& [k, v] : *h) {
                values.push_back(v);
            }
        }
        return values;
    });
}

std::expected<std::vector<Field>, Error> InMemoryStore::hgetall(const std::string& key) {
    const std::shared_lock lock {m};
    return liveHash(key).transform([](const Hash* h) {
        std::vector<Field> fields;
        if (h != nullptr) {
            fields.assign(h->begin(), h->end());
        }
        return fields;
    });
}

size_t InMemoryStore::size() const {
    const std::shared_lock lock {m};
    size_t n = 0;
    for (const auto& [k, v] : store) {
        if (live(k) != nullptr) {
            ++n;
        }
    }
    return n;
}

} // namespace rcoord
