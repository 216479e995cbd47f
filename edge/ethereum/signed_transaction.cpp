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
#include <edge/core/bytes.hpp>
#include <edge/core/config.hpp>
#include <edge/core/keccak.hpp>
#include <edge/core/likely.h>
#include <edge/core/result.hpp>
#include <edge/core/rlp/decode_error.hpp>
#include <edge/ethereum/core/rlp/transaction_rlp.hpp>
#include <edge/ethereum/core/transaction.hpp>
#include <edge/ethereum/signed_transaction.hpp>

#include <boost/outcome/try.hpp>

#include <utility>

EDGE_NAMESPACE_BEGIN

SignedTransaction::SignedTransaction(byte_string raw, Transaction txn)
    : raw_{std::move(raw)}
    , txn_{std::move(txn)}
{
}

Result<SignedTransaction> SignedTransaction::decode(byte_string_view const raw)
{
    auto enc = raw;
    auto txn = BOOST_OUTCOME_TRYX(rlp::decode_transaction(enc));
    if (EDGE_UNLIKELY(!enc.empty())) {
        return rlp::DecodeError::InputTooLong;
    }
    return SignedTransaction{byte_string{raw}, std::move(txn)};
}

bytes32_t SignedTransaction::hash() const
{
    // the state envelope prefix is not part of its digest
    byte_string_view enc{raw_};
    if (txn_.type == TransactionType::state) {
        enc.remove_prefix(1);
    }
    return to_bytes(keccak256(enc));
}

Transaction transaction_from_signed(SignedTransaction const &signed_txn)
{
    return Transaction{
        .type = signed_txn.type(),
        .nonce = signed_txn.nonce(),
        .gas_price = signed_txn.gas_price(),
        .gas_limit = signed_txn.gas(),
        .to = signed_txn.to(),
        .value = signed_txn.value(),
        .data = byte_string{signed_txn.data()},
        .sig = signed_txn.raw_signature_values(),
        .from = signed_txn.sender(),
        .chain_id = signed_txn.chain_id(),
        .max_priority_fee_per_gas = signed_txn.gas_tip_cap(),
        .max_fee_per_gas = signed_txn.gas_fee_cap(),
        .access_list = signed_txn.access_list()};
}

EDGE_NAMESPACE_END
