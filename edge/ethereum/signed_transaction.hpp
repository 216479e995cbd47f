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
#include <edge/core/int.hpp>
#include <edge/core/result.hpp>
#include <edge/ethereum/core/address.hpp>
#include <edge/ethereum/core/signature.hpp>
#include <edge/ethereum/core/transaction.hpp>

#include <cstdint>
#include <optional>

EDGE_NAMESPACE_BEGIN

/**
 * A transaction decoded from its raw wire bytes. The raw bytes are kept so
 * that the hash is computed over exactly what was received, independently
 * of the canonical record builder.
 */
class SignedTransaction
{
    byte_string raw_;
    Transaction txn_;

    SignedTransaction(byte_string raw, Transaction txn);

public:
    static Result<SignedTransaction> decode(byte_string_view raw);

    TransactionType type() const noexcept
    {
        return txn_.type;
    }

    uint64_t nonce() const noexcept
    {
        return txn_.nonce;
    }

    uint256_t const &gas_price() const noexcept
    {
        return txn_.gas_price;
    }

    uint64_t gas() const noexcept
    {
        return txn_.gas_limit;
    }

    std::optional<Address> const &to() const noexcept
    {
        return txn_.to;
    }

    uint256_t const &value() const noexcept
    {
        return txn_.value;
    }

    byte_string_view data() const noexcept
    {
        return txn_.data;
    }

    SignatureValues const &raw_signature_values() const noexcept
    {
        return txn_.sig;
    }

    // only carried on the wire by state transactions
    std::optional<Address> const &sender() const noexcept
    {
        return txn_.from;
    }

    uint256_t const &chain_id() const noexcept
    {
        return txn_.chain_id;
    }

    uint256_t const &gas_tip_cap() const noexcept
    {
        return txn_.max_priority_fee_per_gas;
    }

    uint256_t const &gas_fee_cap() const noexcept
    {
        return txn_.max_fee_per_gas;
    }

    AccessList const &access_list() const noexcept
    {
        return txn_.access_list;
    }

    byte_string_view raw() const noexcept
    {
        return raw_;
    }

    bytes32_t hash() const;
};

// Copies every field into a record for the canonical builder
Transaction transaction_from_signed(SignedTransaction const &);

EDGE_NAMESPACE_END
