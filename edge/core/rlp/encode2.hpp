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
#include <edge/core/int.hpp>
#include <edge/core/rlp/config.hpp>

#include <intx/intx.hpp>

#include <concepts>
#include <cstddef>

EDGE_RLP_NAMESPACE_BEGIN

constexpr size_t length_length(size_t n) noexcept
{
    size_t result = 0;
    while (n) {
        ++result;
        n >>= 8;
    }
    return result;
}

// Header for a string (offset 0x80) or list (offset 0xc0) payload of length n
inline byte_string encode_length(size_t const n, unsigned char const offset)
{
    if (n <= 55) {
        return byte_string(1, static_cast<unsigned char>(offset + n));
    }
    auto const len = length_length(n);
    byte_string result(1 + len, 0);
    result[0] = static_cast<unsigned char>(offset + 55 + len);
    size_t m = n;
    for (size_t i = len; i > 0; --i) {
        result[i] = static_cast<unsigned char>(m & 0xff);
        m >>= 8;
    }
    return result;
}

constexpr byte_string_view zeroless_view(byte_string_view const s) noexcept
{
    size_t i = 0;
    while (i < s.size() && s[i] == 0) {
        ++i;
    }
    return s.substr(i);
}

inline byte_string encode_string2(byte_string_view const s)
{
    if (s.size() == 1 && s[0] < 0x80) {
        return byte_string{s};
    }
    byte_string result = encode_length(s.size(), 0x80);
    result += s;
    return result;
}

// Each argument is an already encoded item
inline byte_string
encode_list2(std::convertible_to<byte_string_view> auto const &...args)
{
    byte_string payload;
    (payload.append(byte_string_view{args}), ...);
    byte_string result = encode_length(payload.size(), 0xc0);
    result += payload;
    return result;
}

template <unsigned_integral T>
byte_string encode_unsigned(T const &n)
{
    byte_string_fixed<sizeof(T)> be{};
    intx::be::unsafe::store(be.data(), n);
    return encode_string2(zeroless_view(to_byte_string_view(be)));
}

EDGE_RLP_NAMESPACE_END
