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
#include <edge/core/config.hpp>
#include <edge/core/keccak.hpp>
#include <edge/ethereum/core/transaction.hpp>

EDGE_NAMESPACE_BEGIN

using DigestFn = hash256 (*)(byte_string_view);

// Canonical transaction hash. Chain compatibility requires keccak256, other
// digests are only useful in tests.
bytes32_t hash_transaction(Transaction const &, DigestFn = keccak256);

EDGE_NAMESPACE_END
