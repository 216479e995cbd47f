// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <edge/core/byte_string.hpp>
#include <edge/core/bytes.hpp>
#include <edge/core/fmt/bytes_fmt.hpp>
#include <edge/core/hex.hpp>
#include <edge/core/int.hpp>

#include <evmc/evmc.hpp>

#include <fmt/format.h>

#include <gtest/gtest.h>

using namespace edge;
using namespace evmc::literals;

TEST(Hex, ParseQuantity)
{
    EXPECT_EQ(parse_quantity("0x0"), uint256_t{0});
    EXPECT_EQ(parse_quantity("0x5208"), uint256_t{21000});
    EXPECT_EQ(parse_quantity("0X5208"), uint256_t{21000});
    EXPECT_EQ(parse_quantity("0xDE0B6B3A7640000"), uint256_t{1'000'000'000'000'000'000});

    EXPECT_FALSE(parse_quantity("").has_value());
    EXPECT_FALSE(parse_quantity("0x").has_value());
    EXPECT_FALSE(parse_quantity("5208").has_value());
    EXPECT_FALSE(parse_quantity("0x52g8").has_value());
    // more than 256 bits
    EXPECT_FALSE(parse_quantity("0x1" + std::string(64, '0')).has_value());
}

TEST(Hex, ParseData)
{
    EXPECT_EQ(parse_data("0x"), byte_string{});
    EXPECT_EQ(parse_data("0x00ff"), byte_string({0x00, 0xff}));
    EXPECT_FALSE(parse_data("0x0").has_value());
    EXPECT_FALSE(parse_data("00ff").has_value());
    EXPECT_FALSE(parse_data("0xzz").has_value());
}

TEST(Hex, ParseFixed)
{
    EXPECT_EQ(
        parse_fixed<evmc::address>(
            "0x5df9b87991262f6ba471f09758cde1c0fc1de734"),
        0x5df9b87991262f6ba471f09758cde1c0fc1de734_address);
    EXPECT_EQ(
        parse_fixed<evmc::address>(
            "0x5DF9B87991262F6BA471F09758CDE1C0FC1DE734"),
        0x5df9b87991262f6ba471f09758cde1c0fc1de734_address);
    // no implicit padding
    EXPECT_FALSE(parse_fixed<evmc::address>("0x01").has_value());
    EXPECT_FALSE(parse_fixed<bytes32_t>(
                     "0x5df9b87991262f6ba471f09758cde1c0fc1de734")
                     .has_value());
}

TEST(Hex, Format)
{
    EXPECT_EQ(to_hex(byte_string({0x00, 0xab})), "0x00ab");
    EXPECT_EQ(to_hex({}), "0x");
    EXPECT_EQ(
        fmt::format("{}", bytes32_t{}),
        "0x0000000000000000000000000000000000000000000000000000000000000000");
    EXPECT_EQ(
        fmt::format("{}", 0x5df9b87991262f6ba471f09758cde1c0fc1de734_address),
        "0x5df9b87991262f6ba471f09758cde1c0fc1de734");
}
