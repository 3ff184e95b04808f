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
#ifndef RCOORD_COMMON_ERROR_CONVERTER_HPP
#define RCOORD_COMMON_ERROR_CONVERTER_HPP

#include "common/Error.hpp"
#include <sw/redis++/errors.h>
#include <expected>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace rcoord {

Error toError(const sw::redis::Error& error, const std::string& key = "");

template<typename F>
using converted_t = std::conditional_t<std::is_void_v<std::invoke_result_t<F>>, std::monostate, std::invoke_result_t<F>>;

// Runs one client call and turns a client exception into the matching Error.
template<typename F>
std::expected<converted_t<F>, Error> toExpected(const std::string& key, F&& f) {
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
            std::forward<F>(f)();
            return std::monostate {};
        } else {
            return std::forward<F>(f)();
        }
    } catch (const sw::redis::Error& e) {
        return std::unexpected {toError(e, key)};
    }
}

ErrorCode errorCode(const Error& err);

template<typename T>
ErrorCode errorCode(const std::expected<T, Error>& result) {
    if (result.has_value()) {
        return ErrorCode::OK;
    }
    return errorCode(result.error());
}

} // namespace rcoord

#endif // RCOORD_COMMON_ERROR_CONVERTER_HPP
