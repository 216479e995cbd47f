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

#include <edge/core/config.hpp>
#include <edge/core/int.hpp>

EDGE_NAMESPACE_BEGIN

// Raw signature values as carried on the wire. For legacy and state
// transactions `v` may embed the chain id (EIP-155); for typed transactions
// it is the y parity.
struct SignatureValues
{
    uint256_t v{};
    uint256_t r{};
    uint256_t s{};

    friend bool
    operator==(SignatureValues const &, SignatureValues const &) = default;
};

EDGE_NAMESPACE_END
