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

#pragma once

#include <edge/core/byte_string.hpp>
#include <edge/core/bytes.hpp>
#include <edge/core/int.hpp>
#include <edge/core/likely.h>
#include <edge/core/result.hpp>
#include <edge/core/rlp/config.hpp>
#include <edge/core/rlp/decode_error.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstring>

EDGE_RLP_NAMESPACE_BEGIN

template <unsigned_integral T>
Result<T> decode_raw_num(byte_string_view const enc)
{
    if (EDGE_UNLIKELY(enc.size() > sizeof(T))) {
        return DecodeError::Overflow;
    }
    if (enc.empty()) {
        return T{0};
    }
    if (EDGE_UNLIKELY(enc[0] == 0)) {
        return DecodeError::LeadingZero;
    }
    T result{0};
    for (auto const b : enc) {
        result = static_cast<T>((result << 8) | T{b});
    }
    return result;
}

inline Result<size_t> decode_length(byte_string_view const enc)
{
    return decode_raw_num<size_t>(enc);
}

// The parse functions consume one item from the front of `enc` and return
// its payload
inline Result<byte_string_view> parse_string_metadata(byte_string_view &enc)
{
    if (EDGE_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }
    if (EDGE_UNLIKELY(enc[0] >= 0xc0)) {
        return DecodeError::TypeUnexpected;
    }

    size_t i = 0;
    size_t length = 0;
    if (enc[0] < 0x80) { // [0x00, 0x7f]
        length = 1;
    }
    else if (enc[0] < 0xb8) { // [0x80, 0xb7]
        i = 1;
        length = enc[0] - 0x80;
    }
    else { // [0xb8, 0xbf]
        size_t const length_of_length = enc[0] - 0xb7;
        i = 1 + length_of_length;
        if (EDGE_UNLIKELY(i > enc.size())) {
            return DecodeError::InputTooShort;
        }
        length = BOOST_OUTCOME_TRYX(
            decode_length(enc.substr(1, length_of_length)));
        if (EDGE_UNLIKELY(length < 56)) {
            return DecodeError::NonCanonicalSize;
        }
    }

    if (EDGE_UNLIKELY(length > enc.size() - i)) {
        return DecodeError::InputTooShort;
    }
    // a single byte below 0x80 is its own encoding
    if (EDGE_UNLIKELY(i == 1 && length == 1 && enc[1] < 0x80)) {
        return DecodeError::NonCanonicalSize;
    }

    auto const payload = enc.substr(i, length);
    enc = enc.substr(i + length);
    return payload;
}

inline Result<byte_string_view> parse_list_metadata(byte_string_view &enc)
{
    if (EDGE_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }
    if (EDGE_UNLIKELY(enc[0] < 0xc0)) {
        return DecodeError::TypeUnexpected;
    }

    size_t i = 1;
    size_t length = 0;
    if (enc[0] < 0xf8) {
        length = enc[0] - 0xc0;
    }
    else {
        size_t const length_of_length = enc[0] - 0xf7;
        i += length_of_length;
        if (EDGE_UNLIKELY(i > enc.size())) {
            return DecodeError::InputTooShort;
        }
        length = BOOST_OUTCOME_TRYX(
            decode_length(enc.substr(1, length_of_length)));
        if (EDGE_UNLIKELY(length < 56)) {
            return DecodeError::NonCanonicalSize;
        }
    }

    if (EDGE_UNLIKELY(length > enc.size() - i)) {
        return DecodeError::InputTooShort;
    }

    auto const payload = enc.substr(i, length);
    enc = enc.substr(i + length);
    return payload;
}

template <unsigned_integral T>
Result<T> decode_unsigned(byte_string_view &enc)
{
    auto const payload = BOOST_OUTCOME_TRYX(parse_string_metadata(enc));
    return decode_raw_num<T>(payload);
}

inline Result<byte_string> decode_string(byte_string_view &enc)
{
    auto const payload = BOOST_OUTCOME_TRYX(parse_string_metadata(enc));
    return byte_string{payload};
}

template <size_t N>
Result<byte_string_fixed<N>> decode_byte_string_fixed(byte_string_view &enc)
{
    auto const payload = BOOST_OUTCOME_TRYX(parse_string_metadata(enc));
    if (EDGE_UNLIKELY(payload.size() != N)) {
        return DecodeError::ArrayLengthUnexpected;
    }
    byte_string_fixed<N> result;
    std::memcpy(result.data(), payload.data(), N);
    return result;
}

inline Result<bytes32_t> decode_bytes32(byte_string_view &enc)
{
    auto const payload = BOOST_OUTCOME_TRYX(parse_string_metadata(enc));
    if (EDGE_UNLIKELY(payload.size() != sizeof(bytes32_t))) {
        return DecodeError::ArrayLengthUnexpected;
    }
    bytes32_t result;
    std::memcpy(result.bytes, payload.data(), sizeof(bytes32_t));
    return result;
}

EDGE_RLP_NAMESPACE_END
