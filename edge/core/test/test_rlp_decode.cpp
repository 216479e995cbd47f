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
#include <edge/core/int.hpp>
#include <edge/core/rlp/decode.hpp>
#include <edge/core/rlp/decode_error.hpp>
#include <edge/core/rlp/encode2.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace edge;
using namespace edge::rlp;

TEST(Rlp, DecodeUnsigned)
{
    {
        byte_string const encoding{0x80};
        byte_string_view enc{encoding};
        auto const decoding = decode_unsigned<uint64_t>(enc);
        ASSERT_FALSE(decoding.has_error());
        EXPECT_EQ(decoding.value(), 0u);
        EXPECT_TRUE(enc.empty());
    }

    {
        byte_string const encoding{0x82, 0x04, 0x00};
        byte_string_view enc{encoding};
        auto const decoding = decode_unsigned<uint16_t>(enc);
        ASSERT_FALSE(decoding.has_error());
        EXPECT_EQ(decoding.value(), 1024u);
    }

    {
        using namespace intx;
        auto const encoding =
            encode_unsigned(0xbea34dd04b09ad3b6014251ee2457807_u256);
        byte_string_view enc{encoding};
        auto const decoding = decode_unsigned<uint256_t>(enc);
        ASSERT_FALSE(decoding.has_error());
        EXPECT_EQ(decoding.value(), 0xbea34dd04b09ad3b6014251ee2457807_u256);
    }
}

TEST(Rlp, DecodeUnsignedErrors)
{
    // leading zero
    {
        byte_string const encoding{0x82, 0x00, 0x01};
        byte_string_view enc{encoding};
        auto const decoding = decode_unsigned<uint64_t>(enc);
        ASSERT_TRUE(decoding.has_error());
        EXPECT_EQ(decoding.error(), DecodeError::LeadingZero);
    }

    // does not fit
    {
        byte_string const encoding{0x83, 0x01, 0x00, 0x00};
        byte_string_view enc{encoding};
        auto const decoding = decode_unsigned<uint16_t>(enc);
        ASSERT_TRUE(decoding.has_error());
        EXPECT_EQ(decoding.error(), DecodeError::Overflow);
    }

    // list where a string is expected
    {
        byte_string const encoding{0xc0};
        byte_string_view enc{encoding};
        auto const decoding = decode_unsigned<uint64_t>(enc);
        ASSERT_TRUE(decoding.has_error());
        EXPECT_EQ(decoding.error(), DecodeError::TypeUnexpected);
    }
}

TEST(Rlp, DecodeString)
{
    byte_string const encoding{0x83, 'd', 'o', 'g', 0x05};
    byte_string_view enc{encoding};
    auto const decoding = decode_string(enc);
    ASSERT_FALSE(decoding.has_error());
    EXPECT_EQ(decoding.value(), to_byte_string_view("dog"));
    // only one item is consumed
    EXPECT_EQ(enc, byte_string_view(encoding).substr(4));

    byte_string const long_string(56, 'a');
    auto const long_encoding = encode_string2(long_string);
    byte_string_view long_enc{long_encoding};
    auto const long_decoding = decode_string(long_enc);
    ASSERT_FALSE(long_decoding.has_error());
    EXPECT_EQ(long_decoding.value(), long_string);
    EXPECT_TRUE(long_enc.empty());
}

TEST(Rlp, DecodeTruncated)
{
    {
        byte_string_view enc{};
        EXPECT_EQ(
            parse_string_metadata(enc).error(), DecodeError::InputTooShort);
    }
    {
        byte_string const encoding{0x83, 'd', 'o'};
        byte_string_view enc{encoding};
        EXPECT_EQ(
            parse_string_metadata(enc).error(), DecodeError::InputTooShort);
    }
    {
        byte_string const encoding{0xb9, 0x04};
        byte_string_view enc{encoding};
        EXPECT_EQ(
            parse_string_metadata(enc).error(), DecodeError::InputTooShort);
    }
    {
        byte_string const encoding{0xc3, 0x80, 0x80};
        byte_string_view enc{encoding};
        EXPECT_EQ(parse_list_metadata(enc).error(), DecodeError::InputTooShort);
    }
}

TEST(Rlp, DecodeList)
{
    byte_string const encoding{0xc7, 0xc0, 0xc1, 0xc0, 0xc3, 0xc0, 0xc1, 0xc0};
    byte_string_view enc{encoding};
    auto const payload = parse_list_metadata(enc);
    ASSERT_FALSE(payload.has_error());
    EXPECT_EQ(payload.value().size(), 7u);
    EXPECT_TRUE(enc.empty());

    byte_string_view inner_enc{encoding};
    inner_enc.remove_prefix(1);
    auto const empty = parse_list_metadata(inner_enc);
    ASSERT_FALSE(empty.has_error());
    EXPECT_TRUE(empty.value().empty());

    byte_string const not_a_list{0x80};
    byte_string_view not_a_list_enc{not_a_list};
    EXPECT_EQ(
        parse_list_metadata(not_a_list_enc).error(),
        DecodeError::TypeUnexpected);
}

TEST(Rlp, DecodeBytes32)
{
    byte_string encoding{0xa0};
    encoding += byte_string(31, 0x00);
    encoding += byte_string{0x01};
    byte_string_view enc{encoding};
    auto const decoding = decode_bytes32(enc);
    ASSERT_FALSE(decoding.has_error());
    bytes32_t expected{};
    expected.bytes[31] = 0x01;
    EXPECT_EQ(decoding.value(), expected);

    byte_string const short_encoding{0x81, 0xff};
    byte_string_view short_enc{short_encoding};
    EXPECT_EQ(
        decode_bytes32(short_enc).error(), DecodeError::ArrayLengthUnexpected);
}

TEST(Rlp, DecodeNonCanonical)
{
    // single byte below 0x80 wrapped in a string header
    {
        byte_string const encoding{0x81, 0x05};
        byte_string_view enc{encoding};
        EXPECT_EQ(
            decode_unsigned<uint64_t>(enc).error(),
            DecodeError::NonCanonicalSize);
    }
    {
        byte_string const encoding{0x81, 0x80};
        byte_string_view enc{encoding};
        auto const decoding = decode_unsigned<uint64_t>(enc);
        ASSERT_FALSE(decoding.has_error());
        EXPECT_EQ(decoding.value(), 0x80u);
    }

    // long form header for a short payload
    {
        byte_string const encoding{0xb8, 0x03, 'd', 'o', 'g'};
        byte_string_view enc{encoding};
        EXPECT_EQ(
            parse_string_metadata(enc).error(), DecodeError::NonCanonicalSize);
    }
    {
        byte_string const encoding{0xf8, 0x02, 0x80, 0x80};
        byte_string_view enc{encoding};
        EXPECT_EQ(
            parse_list_metadata(enc).error(), DecodeError::NonCanonicalSize);
    }

    // leading zero in the length of length
    {
        byte_string encoding{0xb9, 0x00, 0x38};
        encoding += byte_string(56, 'a');
        byte_string_view enc{encoding};
        EXPECT_EQ(parse_string_metadata(enc).error(), DecodeError::LeadingZero);
    }
}
