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

#include <cstdint>
#include <variant>
#include <vector>

EDGE_RLP_NAMESPACE_BEGIN

// Explicit absence of a value. Encodes as the empty string, which is
// distinct from the encoding of any fixed width value such as an address.
struct Null
{
};

struct Node;

using NodeList = std::vector<Node>;

/**
 * A typed encoding node. Integers are encoded in minimal big endian form,
 * byte strings verbatim, and lists as the concatenation of their encoded
 * children.
 */
struct Node
{
    std::variant<Null, uint64_t, uint256_t, byte_string, NodeList> value;
};

EDGE_RLP_NAMESPACE_END
