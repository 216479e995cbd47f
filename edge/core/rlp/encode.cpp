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
#include <edge/core/int.hpp>
#include <edge/core/rlp/config.hpp>
#include <edge/core/rlp/encode.hpp>
#include <edge/core/rlp/encode2.hpp>
#include <edge/core/rlp/node.hpp>

#include <concepts>
#include <cstdint>
#include <type_traits>
#include <variant>

EDGE_RLP_NAMESPACE_BEGIN

byte_string encode(Node const &node)
{
    return std::visit(
        []<class T>(T const &value) -> byte_string {
            if constexpr (std::same_as<T, Null>) {
                return encode_string2({});
            }
            else if constexpr (std::same_as<T, byte_string>) {
                return encode_string2(value);
            }
            else if constexpr (std::same_as<T, NodeList>) {
                return encode(value);
            }
            else {
                static_assert(unsigned_integral<T>);
                return encode_unsigned(value);
            }
        },
        node.value);
}

byte_string encode(NodeList const &nodes)
{
    byte_string payload;
    for (auto const &node : nodes) {
        payload += encode(node);
    }
    return encode_list2(payload);
}

EDGE_RLP_NAMESPACE_END
