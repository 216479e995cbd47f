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
#include <edge/core/config.hpp>
#include <edge/core/int.hpp>

#include <evmc/hex.hpp>

#include <optional>
#include <string>
#include <string_view>

EDGE_NAMESPACE_BEGIN

constexpr bool has_hex_prefix(std::string_view const s) noexcept
{
    return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

// Ethereum JSON-RPC QUANTITY: 0x followed by 1 to 64 hex digits
std::optional<uint256_t> parse_quantity(std::string_view);

// Ethereum JSON-RPC DATA: 0x followed by an even number of hex digits
std::optional<byte_string> parse_data(std::string_view);

// Fixed width DATA (address, hash). The width must match exactly, no padding.
template <class T>
std::optional<T> parse_fixed(std::string_view const s)
{
    if (!has_hex_prefix(s) || s.size() != 2 + 2 * sizeof(T::bytes)) {
        return std::nullopt;
    }
    return evmc::from_hex<T>(s.substr(2));
}

std::string to_hex(byte_string_view);

EDGE_NAMESPACE_END
