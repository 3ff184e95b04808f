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
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <expected>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "client/Config.hpp"
#include "client/Resolver.hpp"
#include "common/Error.hpp"
#include "lock/Lock.hpp"
#include "map/RemoteMap.hpp"

using rcoord::Error;
using rcoord::Json;
using rcoord::Lock;
using rcoord::parseSeconds;
using rcoord::RemoteMap;
using rcoord::StoreConfig;

namespace {

constexpr int exitFailure = 1;
constexpr int exitUsage = 2;

int usage() {
    std::cerr << "usage:\n"
              << "  rcoord map get|del|has <map> <key>\n"
              << "  rcoord map set <map> <key> <json>\n"
              << "  rcoord map len|keys|items|clear <map>\n"
              << "  rcoord lock try <name> <ttl-seconds>\n"
              << "  rcoord lock hold <name> <ttl-seconds> <hold-seconds>\n"
              << "environment: REDIS_URL, REDIS_SENTINEL_HOSTS, REDIS_SENTINEL_PORT, RCOORD_LOG_LEVEL\n";
    return exitUsage;
}

int fail(const Error& e) {
    std::cerr << e << '\n';
    return exitFailure;
}

int runMap(RemoteMap& map, const std::string& op, const std::vector<std::string>& args) {
    if (op == "get" && args.size() == 1) {
        auto v = map.get(args[0]);
        if (!v.has_value()) {
            return fail(v.error());
        }
        std::cout << v.value().dump(2) << '\n';
    } else if (op == "set" && args.size() == 2) {
        Json value = Json::parse(args[1], nullptr, false);
        if (value.is_discarded()) {
            std::cerr << "not valid JSON: " << args[1] << '\n';
            return exitUsage;
        }
        auto r = map.set(args[0], value);
        if (!r.has_value()) {
            return fail(r.error());
        }
    } else if (op == "del" && args.size() == 1) {
        auto r = map.erase(args[0]);
        if (!r.has_value()) {
            return fail(r.error());
        }
    } else if (op == "has" && args.size() == 1) {
        auto r = map.contains(args[0]);
        if (!r.has_value()) {
            return fail(r.error());
        }
        std::cout << (r.value() ? "true" : "false") << '\n';
    } else if (op == "len" && args.empty()) {
        auto r = map.size();
        if (!r.has_value()) {
            return fail(r.error());
        }
        std::cout << r.value() << '\n';
    } else if (op == "keys" && args.empty()) {
        auto r = map.keys();
        if (!r.has_value()) {
            return fail(r.error());
        }
        for (const auto& k : r.value()) {
            std::cout << k << '\n';
        }
    } else if (op == "items" && args.empty()) {
        auto r = map.items();
        if (!r.has_value()) {
            return fail(r.error());
        }
        for (const auto& [k, v] : r.value()) {
            std::cout << k << '\t' << v.dump() << '\n';
        }
    } else if (op == "clear" && args.empty()) {
        auto r = map.clear();
        if (!r.has_value()) {
            return fail(r.error());
        }
    } else {
        return usage();
    }
    return EXIT_SUCCESS;
}

int runLock(Lock& lock, const std::string& op, std::chrono::seconds hold) {
    auto acquired = lock.acquire();
    if (!acquired.has_value()) {
        return fail(acquired.error());
    }
    if (!acquired.value()) {
        std::cout << "busy\n";
        return exitFailure;
    }
    std::cout << "acquired " << lock.name() << " as " << lock.token() << '\n';

    if (op == "hold") {
        const auto deadline = std::chrono::steady_clock::now() + hold;
        const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(lock.ttl()) / 2;
        while (std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(interval, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())));
            auto renewed = lock.renew();
            if (!renewed.has_value()) {
                return fail(renewed.error());
            }
            if (!renewed.value()) {
                std::cout << "lost\n";
                return exitFailure;
            }
        }
    }

    auto released = lock.release();
    if (!released.has_value()) {
        return fail(released.error());
    }
    std::cout << "released\n";
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    if (const char* level = std::getenv("RCOORD_LOG_LEVEL"); level != nullptr) {
        spdlog::set_level(spdlog::level::from_str(level));
    }
    const std::vector<std::string> args(argv + 1, argv + argc);
    if (args.size() < 3) {
        return usage();
    }

    auto config = StoreConfig::fromEnvironment();
    if (!config.has_value()) {
        return fail(config.error());
    }
    auto store = rcoord::resolve(config.value());
    if (!store.has_value()) {
        return fail(store.error());
    }

    const auto& component = args[0];
    const auto& op = args[1];
    if (component == "map") {
        RemoteMap map {args[2], store.value()};
        return runMap(map, op, {args.begin() + 3, args.end()});
    }
    if (component == "lock" && (op == "try" || op == "hold")) {
        if ((op == "try" && args.size() != 4) || (op == "hold" && args.size() != 5)) {
            return usage();
        }
        auto ttl = parseSeconds(args[3]);
        auto duration = op == "hold" ? parseSeconds(args[4]) : std::expected<std::chrono::seconds, Error> {std::chrono::seconds::zero()};
        if (!ttl.has_value() || !duration.has_value()) {
            std::cerr << (ttl.has_value() ? duration.error() : ttl.error()) << '\n';
            return exitUsage;
        }
        try {
            Lock lock {store.value(), args[2], ttl.value()};
            return runLock(lock, op, duration.value());
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << '\n';
            return exitUsage;
        }
    }
    return usage();
}
