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
#include <edge/core/config.hpp>
#include <edge/core/hex.hpp>
#include <edge/core/int.hpp>

#include <evmc/hex.hpp>
#include <intx/intx.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

EDGE_NAMESPACE_BEGIN

namespace
{
    bool is_hex_digits(std::string_view const s)
    {
        return std::all_of(s.begin(), s.end(), [](char const c) {
            return std::isxdigit(static_cast<unsigned char>(c)) != 0;
        });
    }
}

std::optional<uint256_t> parse_quantity(std::string_view const s)
{
    if (!has_hex_prefix(s)) {
        return std::nullopt;
    }
    auto const digits = s.substr(2);
    if (digits.empty() || digits.size() > 2 * sizeof(uint256_t) ||
        !is_hex_digits(digits)) {
        return std::nullopt;
    }
    return intx::from_string<uint256_t>("0x" + std::string{digits});
}

std::optional<byte_string> parse_data(std::string_view const s)
{
    if (!has_hex_prefix(s)) {
        return std::nullopt;
    }
    auto const digits = s.substr(2);
    if (digits.size() % 2 != 0 || !is_hex_digits(digits)) {
        return std::nullopt;
    }
    return evmc::from_hex(digits);
}

std::string to_hex(byte_string_view const bytes)
{
    return "0x" + evmc::hex(bytes);
}

EDGE_NAMESPACE_END
