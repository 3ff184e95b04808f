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
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "common/Error.hpp"

using rcoord::Error;
using rcoord::ErrorCode;

TEST(ErrorTest, ToStringNamesEveryCode) {
    EXPECT_EQ(rcoord::toString(ErrorCode::OK), "OK");
    EXPECT_EQ(rcoord::toString(ErrorCode::Configuration), "Configuration");
    EXPECT_EQ(rcoord::toString(ErrorCode::KeyNotFound), "KeyNotFound");
    EXPECT_EQ(rcoord::toString(ErrorCode::DecodeError), "DecodeError");
    EXPECT_EQ(rcoord::toString(ErrorCode::Timeout), "Timeout");
    EXPECT_EQ(rcoord::toString(ErrorCode::Unknown), "Unknown");
}

TEST(ErrorTest, CodeOnlyConstructorUsesCodeName) {
    Error e {ErrorCode::ConnectionClosed};
    EXPECT_EQ(e.code, ErrorCode::ConnectionClosed);
    EXPECT_EQ(e.what, "ConnectionClosed");
    EXPECT_TRUE(e.key.empty());
}

TEST(ErrorTest, StreamsCodeMessageAndKey) {
    std::ostringstream os;
    os << Error(ErrorCode::KeyNotFound, "no such key in sessions", "u1");
    EXPECT_EQ(os.str(), "KeyNotFound: no such key in sessions (key: u1)");

    std::ostringstream bare;
    bare << Error(ErrorCode::Configuration, "invalid scheme");
    EXPECT_EQ(bare.str(), "Configuration: invalid scheme");
}

TEST(ErrorTest, OnlyTransportFailuresAreRetriable) {
    EXPECT_TRUE(rcoord::isRetriable(ErrorCode::ConnectionFailed));
    EXPECT_TRUE(rcoord::isRetriable(ErrorCode::ConnectionClosed));
    EXPECT_TRUE(rcoord::isRetriable(ErrorCode::Timeout));
    EXPECT_FALSE(rcoord::isRetriable(ErrorCode::Configuration));
    EXPECT_FALSE(rcoord::isRetriable(ErrorCode::KeyNotFound));
    EXPECT_FALSE(rcoord::isRetriable(ErrorCode::DecodeError));
    EXPECT_FALSE(rcoord::isRetriable(ErrorCode::ReplyError));
}
