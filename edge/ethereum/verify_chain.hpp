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
#include <edge/core/result.hpp>
#include <edge/ethereum/rpc/rpc_block.hpp>
#include <edge/ethereum/signed_transaction.hpp>
#include <edge/ethereum/verify_error.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

EDGE_NAMESPACE_BEGIN

struct HashMismatch
{
    uint64_t block_number{};
    size_t index{};
    bytes32_t reported{};
    bytes32_t computed{};
};

struct ExpectedInclusion
{
    bytes32_t hash{};
    uint64_t block_number{};
};

struct VerifyOptions
{
    bytes32_t genesis_parent{};
    // captured eth_getRawTransactionByHash results
    std::unordered_map<bytes32_t, byte_string> raw_transactions{};
    // captured eth_getBlockByNumber(n, false) results, by block number
    std::unordered_map<uint64_t, rpc::RpcBlock> hash_only_blocks{};
    std::vector<ExpectedInclusion> expected_inclusions{};
};

struct Finding
{
    uint64_t block_number{};
    std::optional<bytes32_t> transaction{};
    VerifyError error{VerifyError::Success};
};

struct VerifyReport
{
    size_t blocks_checked{0};
    size_t transactions_checked{0};
    size_t cross_checked{0};
    std::vector<HashMismatch> hash_mismatches{};
    std::vector<Finding> findings{};

    bool ok() const noexcept
    {
        return hash_mismatches.empty() && findings.empty();
    }
};

// Checks that `child` directly extends `parent`
Result<void>
verify_parent(rpc::RpcBlock const &parent, rpc::RpcBlock const &child);

/**
 * Checks that the blocks form a chain. A block numbered 0 at the front must
 * have `genesis_parent` as its parent. Only reported hashes are compared,
 * headers are not rehashed.
 */
Result<void> verify_block_linkage(
    std::span<rpc::RpcBlock const>, bytes32_t const &genesis_parent);

std::vector<HashMismatch> verify_transaction_hashes(rpc::RpcBlock const &);

Result<void>
verify_transaction_count(rpc::RpcBlock const &, size_t expected_count);

Result<size_t> find_transaction(rpc::RpcBlock const &, bytes32_t const &);

// The reported hash, the hash of the RPC record, the hash of the record
// rebuilt from the decoded envelope and the hash of the raw envelope must
// all agree
Result<void>
cross_check(rpc::RpcTransaction const &, SignedTransaction const &);

VerifyReport
verify_chain(std::span<rpc::RpcBlock const>, VerifyOptions const &);

EDGE_NAMESPACE_END
