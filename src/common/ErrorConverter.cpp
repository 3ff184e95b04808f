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
#include "common/ErrorConverter.hpp"
#include <sw/redis++/errors.h>
#include <string>
#include "common/Error.hpp"

namespace rcoord {

Error toError(const sw::redis::Error& error, const std::string& key) {
    ErrorCode code = ErrorCode::Unknown;
    if (dynamic_cast<const sw::redis::TimeoutError*>(&error) != nullptr) {
        code = ErrorCode::Timeout;
    } else if (dynamic_cast<const sw::redis::IoError*>(&error) != nullptr) {
        code = ErrorCode::ConnectionFailed;
    } else if (dynamic_cast<const sw::redis::ClosedError*>(&error) != nullptr) {
        code = ErrorCode::ConnectionClosed;
    } else if (dynamic_cast<const sw::redis::ReplyError*>(&error) != nullptr) {
        code = ErrorCode::ReplyError;
    } else if (dynamic_cast<const sw::redis::ProtoError*>(&error) != nullptr ||
               dynamic_cast<const sw::redis::OomError*>(&error) != nullptr) {
        code = ErrorCode::Internal;
    }
    return Error(code, error.what(), key);
}

ErrorCode errorCode(const Error& err) {
    return err.code;
}

} // namespace rcoord
