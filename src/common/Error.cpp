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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <unordered_set>

namespace rcoord {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << toString(error.code) << ": " << error.what;
    if (!error.key.empty()) {
        os << " (key: " << error.key << ")";
    }
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::Configuration: return "Configuration";
        case ErrorCode::ConnectionFailed: return "ConnectionFailed";
        case ErrorCode::ConnectionClosed: return "ConnectionClosed";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::KeyNotFound: return "KeyNotFound";
        case ErrorCode::DecodeError: return "DecodeError";
        case ErrorCode::ReplyError: return "ReplyError";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

const std::unordered_set<ErrorCode, ErrorCodeHash> retriableErrorCodes = {
    ErrorCode::ConnectionFailed,
    ErrorCode::ConnectionClosed,
    ErrorCode::Timeout,
};

bool isRetriable(const ErrorCode& code) {
    return retriableErrorCodes.contains(code);
}

Error::Error(const ErrorCode& c, std::string w, std::string k) : code {c}, what {std::move(w)}, key {std::move(k)} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, key {} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, key {} {}

} // namespace rcoord
