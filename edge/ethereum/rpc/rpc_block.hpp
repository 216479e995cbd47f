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

#include <edge/core/bytes.hpp>
#include <edge/ethereum/core/transaction.hpp>
#include <edge/ethereum/rpc/config.hpp>

#include <cstdint>
#include <vector>

EDGE_RPC_NAMESPACE_BEGIN

// A transaction as returned by a node, with the hash the node reported
struct RpcTransaction
{
    bytes32_t hash{};
    Transaction tx{};
};

/**
 * The part of an eth_getBlockByNumber result needed for verification.
 * `transaction_hashes` is always filled; `transactions` only when the block
 * was fetched with full transaction objects.
 */
struct RpcBlock
{
    uint64_t number{};
    bytes32_t hash{};
    bytes32_t parent_hash{};
    std::vector<bytes32_t> transaction_hashes{};
    std::vector<RpcTransaction> transactions{};
};

EDGE_RPC_NAMESPACE_END
