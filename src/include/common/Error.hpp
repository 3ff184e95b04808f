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
#ifndef RCOORD_COMMON_ERROR_HPP
#define RCOORD_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <functional>
#include <type_traits>
#include <unordered_set>

namespace rcoord {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    Configuration = 2,
    ConnectionFailed = 3,
    ConnectionClosed = 4,
    Timeout = 5,
    KeyNotFound = 6,
    DecodeError = 7,
    ReplyError = 8,
    Internal = 9,
    Unknown = 128
};

struct ErrorCodeHash {
    std::size_t operator()(const ErrorCode& code) const noexcept {
        return std::hash<std::underlying_type_t<ErrorCode>>{}(static_cast<std::underlying_type_t<ErrorCode>>(code));
    }
};

extern const std::unordered_set<ErrorCode, ErrorCodeHash> retriableErrorCodes;

// Transient transport failures a caller may choose to retry. Nothing in rcoord retries on its own.
bool isRetriable(const ErrorCode& code);

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    std::string key;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, std::string k);
    explicit Error(const ErrorCode& c);
};

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace rcoord

#endif // RCOORD_COMMON_ERROR_HPP
