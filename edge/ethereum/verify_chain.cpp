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

#include <edge/core/bytes.hpp>
#include <edge/core/config.hpp>
#include <edge/core/fmt/bytes_fmt.hpp>
#include <edge/core/likely.h>
#include <edge/core/result.hpp>
#include <edge/ethereum/rpc/rpc_block.hpp>
#include <edge/ethereum/signed_transaction.hpp>
#include <edge/ethereum/transaction_hash.hpp>
#include <edge/ethereum/verify_chain.hpp>
#include <edge/ethereum/verify_error.hpp>

#include <boost/outcome/config.hpp>
#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <vector>

EDGE_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

namespace
{
    std::optional<VerifyError> linkage_error(
        rpc::RpcBlock const &parent, rpc::RpcBlock const &child)
    {
        if (EDGE_UNLIKELY(child.number != parent.number + 1)) {
            return VerifyError::NumberGap;
        }
        if (EDGE_UNLIKELY(child.parent_hash != parent.hash)) {
            return VerifyError::ParentHashMismatch;
        }
        return std::nullopt;
    }

    std::optional<VerifyError> genesis_error(
        rpc::RpcBlock const &block, bytes32_t const &genesis_parent)
    {
        if (block.number == 0 && block.parent_hash != genesis_parent) {
            return VerifyError::ParentHashMismatch;
        }
        return std::nullopt;
    }

    void add_finding(
        VerifyReport &report, uint64_t const block_number,
        std::optional<bytes32_t> const &transaction, VerifyError const error)
    {
        Result<void> const code{error};
        if (transaction.has_value()) {
            LOG_WARNING(
                "block {} tx {}: {}",
                block_number,
                *transaction,
                code.error().message().c_str());
        }
        else {
            LOG_WARNING(
                "block {}: {}", block_number, code.error().message().c_str());
        }
        report.findings.push_back(Finding{
            .block_number = block_number,
            .transaction = transaction,
            .error = error});
    }

    void cross_check_block(
        rpc::RpcBlock const &block, VerifyOptions const &options,
        VerifyReport &report)
    {
        for (auto const &txn : block.transactions) {
            auto const it = options.raw_transactions.find(txn.hash);
            if (it == options.raw_transactions.end()) {
                continue;
            }
            auto const signed_txn = SignedTransaction::decode(it->second);
            if (EDGE_UNLIKELY(signed_txn.has_error())) {
                LOG_DEBUG(
                    "raw tx {} decode failed: {}",
                    txn.hash,
                    signed_txn.error().message().c_str());
                add_finding(
                    report,
                    block.number,
                    txn.hash,
                    VerifyError::UndecodableRawTransaction);
                continue;
            }
            ++report.cross_checked;
            if (EDGE_UNLIKELY(
                    cross_check(txn, signed_txn.value()).has_error())) {
                add_finding(
                    report,
                    block.number,
                    txn.hash,
                    VerifyError::CrossPathMismatch);
            }
        }
    }
}

Result<void>
verify_parent(rpc::RpcBlock const &parent, rpc::RpcBlock const &child)
{
    if (auto const error = linkage_error(parent, child); error.has_value()) {
        return *error;
    }
    return success();
}

Result<void> verify_block_linkage(
    std::span<rpc::RpcBlock const> const blocks,
    bytes32_t const &genesis_parent)
{
    if (blocks.empty()) {
        return success();
    }
    if (auto const error = genesis_error(blocks.front(), genesis_parent);
        error.has_value()) {
        return *error;
    }
    for (size_t i = 1; i < blocks.size(); ++i) {
        BOOST_OUTCOME_TRYV(verify_parent(blocks[i - 1], blocks[i]));
    }
    return success();
}

std::vector<HashMismatch> verify_transaction_hashes(rpc::RpcBlock const &block)
{
    std::vector<HashMismatch> mismatches;
    for (size_t i = 0; i < block.transactions.size(); ++i) {
        auto const &txn = block.transactions[i];
        auto const computed = hash_transaction(txn.tx);
        if (EDGE_UNLIKELY(computed != txn.hash)) {
            mismatches.push_back(HashMismatch{
                .block_number = block.number,
                .index = i,
                .reported = txn.hash,
                .computed = computed});
        }
    }
    return mismatches;
}

Result<void> verify_transaction_count(
    rpc::RpcBlock const &block, size_t const expected_count)
{
    if (EDGE_UNLIKELY(block.transaction_hashes.size() != expected_count)) {
        return VerifyError::TransactionCountMismatch;
    }
    return success();
}

Result<size_t>
find_transaction(rpc::RpcBlock const &block, bytes32_t const &hash)
{
    auto const it = std::find(
        block.transaction_hashes.begin(), block.transaction_hashes.end(), hash);
    if (it == block.transaction_hashes.end()) {
        return VerifyError::TransactionNotFound;
    }
    return static_cast<size_t>(
        std::distance(block.transaction_hashes.begin(), it));
}

Result<void> cross_check(
    rpc::RpcTransaction const &rpc_txn, SignedTransaction const &signed_txn)
{
    auto const rpc_record_hash = hash_transaction(rpc_txn.tx);
    auto const library_record_hash =
        hash_transaction(transaction_from_signed(signed_txn));
    auto const library_hash = signed_txn.hash();
    if (EDGE_UNLIKELY(
            rpc_record_hash != rpc_txn.hash ||
            library_record_hash != rpc_txn.hash ||
            library_hash != rpc_txn.hash)) {
        LOG_DEBUG(
            "reported {} rpc record {} library record {} library {}",
            rpc_txn.hash,
            rpc_record_hash,
            library_record_hash,
            library_hash);
        return VerifyError::CrossPathMismatch;
    }
    return success();
}

VerifyReport verify_chain(
    std::span<rpc::RpcBlock const> const blocks, VerifyOptions const &options)
{
    VerifyReport report;
    LOG_INFO("verifying {} blocks", blocks.size());

    for (size_t i = 0; i < blocks.size(); ++i) {
        auto const &block = blocks[i];
        ++report.blocks_checked;

        auto const link_error = i == 0
                                    ? genesis_error(block, options.genesis_parent)
                                    : linkage_error(blocks[i - 1], block);
        if (link_error.has_value()) {
            add_finding(report, block.number, std::nullopt, *link_error);
        }

        if (auto const it = options.hash_only_blocks.find(block.number);
            it != options.hash_only_blocks.end() &&
            verify_transaction_count(
                block, it->second.transaction_hashes.size())
                .has_error()) {
            LOG_DEBUG(
                "block {} has {} transactions, hash only capture has {}",
                block.number,
                block.transaction_hashes.size(),
                it->second.transaction_hashes.size());
            add_finding(
                report,
                block.number,
                std::nullopt,
                VerifyError::TransactionCountMismatch);
        }

        for (auto const &mismatch : verify_transaction_hashes(block)) {
            LOG_WARNING(
                "block {} tx {}: reported {} computed {}",
                mismatch.block_number,
                mismatch.index,
                mismatch.reported,
                mismatch.computed);
            report.hash_mismatches.push_back(mismatch);
        }
        report.transactions_checked += block.transactions.size();

        cross_check_block(block, options, report);

        LOG_INFO(
            "block {} {} with {} transactions",
            block.number,
            block.hash,
            block.transaction_hashes.size());
    }

    for (auto const &expected : options.expected_inclusions) {
        auto const it = std::find_if(
            blocks.begin(), blocks.end(), [&](rpc::RpcBlock const &block) {
                return block.number == expected.block_number;
            });
        if (it == blocks.end() || find_transaction(*it, expected.hash)
                                      .has_error()) {
            add_finding(
                report,
                expected.block_number,
                expected.hash,
                VerifyError::TransactionNotFound);
        }
    }

    LOG_INFO(
        "checked {} blocks, {} transactions, {} cross path, {} findings",
        report.blocks_checked,
        report.transactions_checked,
        report.cross_checked,
        report.findings.size() + report.hash_mismatches.size());
    return report;
}

EDGE_NAMESPACE_END
