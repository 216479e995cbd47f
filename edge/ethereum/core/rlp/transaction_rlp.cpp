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

#include <edge/core/assert.h>
#include <edge/core/byte_string.hpp>
#include <edge/core/bytes.hpp>
#include <edge/core/int.hpp>
#include <edge/core/likely.h>
#include <edge/core/result.hpp>
#include <edge/core/rlp/config.hpp>
#include <edge/core/rlp/decode.hpp>
#include <edge/core/rlp/decode_error.hpp>
#include <edge/core/rlp/encode.hpp>
#include <edge/core/rlp/node.hpp>
#include <edge/ethereum/core/address.hpp>
#include <edge/ethereum/core/rlp/transaction_rlp.hpp>
#include <edge/ethereum/core/transaction.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <cstring>
#include <optional>
#include <utility>

EDGE_RLP_NAMESPACE_BEGIN

namespace
{
    Node address_node(Address const &a)
    {
        return Node{byte_string{a.bytes, sizeof(a.bytes)}};
    }

    Node to_node(std::optional<Address> const &to)
    {
        if (to.has_value()) {
            return address_node(*to);
        }
        return Node{Null{}};
    }

    Node access_list_node(AccessList const &access_list)
    {
        NodeList entries;
        entries.reserve(access_list.size());
        for (auto const &entry : access_list) {
            NodeList keys;
            keys.reserve(entry.keys.size());
            for (auto const &key : entry.keys) {
                keys.push_back(Node{byte_string{key.bytes, sizeof(key.bytes)}});
            }
            entries.push_back(
                Node{NodeList{address_node(entry.a), Node{std::move(keys)}}});
        }
        return Node{std::move(entries)};
    }

    byte_string with_type_prefix(TransactionType const type, byte_string enc)
    {
        enc.insert(enc.begin(), static_cast<unsigned char>(type));
        return enc;
    }

    Result<Transaction>
    decode_transaction_legacy(byte_string_view &enc, TransactionType const type)
    {
        auto payload = BOOST_OUTCOME_TRYX(parse_list_metadata(enc));

        Transaction txn{.type = type};
        txn.nonce = BOOST_OUTCOME_TRYX(decode_unsigned<uint64_t>(payload));
        txn.gas_price = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.gas_limit = BOOST_OUTCOME_TRYX(decode_unsigned<uint64_t>(payload));
        txn.to = BOOST_OUTCOME_TRYX(decode_optional_address(payload));
        txn.value = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.data = BOOST_OUTCOME_TRYX(decode_string(payload));
        txn.sig.v = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.sig.r = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.sig.s = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        if (type == TransactionType::state) {
            txn.from = BOOST_OUTCOME_TRYX(decode_address(payload));
        }

        if (EDGE_UNLIKELY(!payload.empty())) {
            return DecodeError::InputTooLong;
        }
        return txn;
    }

    Result<Transaction> decode_transaction_access_list(byte_string_view &enc)
    {
        auto payload = BOOST_OUTCOME_TRYX(parse_list_metadata(enc));

        Transaction txn{.type = TransactionType::access_list};
        txn.chain_id = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.nonce = BOOST_OUTCOME_TRYX(decode_unsigned<uint64_t>(payload));
        txn.gas_price = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.gas_limit = BOOST_OUTCOME_TRYX(decode_unsigned<uint64_t>(payload));
        txn.to = BOOST_OUTCOME_TRYX(decode_optional_address(payload));
        txn.value = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.data = BOOST_OUTCOME_TRYX(decode_string(payload));
        txn.access_list = BOOST_OUTCOME_TRYX(decode_access_list(payload));
        txn.sig.v = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.sig.r = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.sig.s = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));

        if (EDGE_UNLIKELY(!payload.empty())) {
            return DecodeError::InputTooLong;
        }
        return txn;
    }

    Result<Transaction> decode_transaction_dynamic_fee(byte_string_view &enc)
    {
        auto payload = BOOST_OUTCOME_TRYX(parse_list_metadata(enc));

        Transaction txn{.type = TransactionType::dynamic_fee};
        txn.chain_id = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.nonce = BOOST_OUTCOME_TRYX(decode_unsigned<uint64_t>(payload));
        txn.max_priority_fee_per_gas =
            BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.max_fee_per_gas =
            BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.gas_limit = BOOST_OUTCOME_TRYX(decode_unsigned<uint64_t>(payload));
        txn.to = BOOST_OUTCOME_TRYX(decode_optional_address(payload));
        txn.value = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.data = BOOST_OUTCOME_TRYX(decode_string(payload));
        txn.access_list = BOOST_OUTCOME_TRYX(decode_access_list(payload));
        txn.sig.v = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.sig.r = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));
        txn.sig.s = BOOST_OUTCOME_TRYX(decode_unsigned<uint256_t>(payload));

        if (EDGE_UNLIKELY(!payload.empty())) {
            return DecodeError::InputTooLong;
        }
        return txn;
    }
}

NodeList build_canonical_nodes(Transaction const &txn)
{
    switch (txn.type) {
    case TransactionType::legacy:
        return {
            Node{txn.nonce},
            Node{txn.gas_price},
            Node{txn.gas_limit},
            to_node(txn.to),
            Node{txn.value},
            Node{txn.data},
            Node{txn.sig.v},
            Node{txn.sig.r},
            Node{txn.sig.s}};
    case TransactionType::state:
        EDGE_ASSERT(txn.from.has_value());
        return {
            Node{txn.nonce},
            Node{txn.gas_price},
            Node{txn.gas_limit},
            to_node(txn.to),
            Node{txn.value},
            Node{txn.data},
            Node{txn.sig.v},
            Node{txn.sig.r},
            Node{txn.sig.s},
            address_node(*txn.from)};
    case TransactionType::access_list:
        return {
            Node{txn.chain_id},
            Node{txn.nonce},
            Node{txn.gas_price},
            Node{txn.gas_limit},
            to_node(txn.to),
            Node{txn.value},
            Node{txn.data},
            access_list_node(txn.access_list),
            Node{txn.sig.v},
            Node{txn.sig.r},
            Node{txn.sig.s}};
    case TransactionType::dynamic_fee:
        return {
            Node{txn.chain_id},
            Node{txn.nonce},
            Node{txn.max_priority_fee_per_gas},
            Node{txn.max_fee_per_gas},
            Node{txn.gas_limit},
            to_node(txn.to),
            Node{txn.value},
            Node{txn.data},
            access_list_node(txn.access_list),
            Node{txn.sig.v},
            Node{txn.sig.r},
            Node{txn.sig.s}};
    }
    EDGE_ABORT("invalid transaction type");
}

byte_string encode_transaction(Transaction const &txn)
{
    auto enc = encode(build_canonical_nodes(txn));
    if (is_eip2718(txn.type)) {
        return with_type_prefix(txn.type, std::move(enc));
    }
    return enc;
}

byte_string encode_transaction_envelope(Transaction const &txn)
{
    if (txn.type == TransactionType::state) {
        return with_type_prefix(txn.type, encode_transaction(txn));
    }
    return encode_transaction(txn);
}

Result<Address> decode_address(byte_string_view &enc)
{
    auto const bytes =
        BOOST_OUTCOME_TRYX(decode_byte_string_fixed<sizeof(Address)>(enc));
    Address a;
    std::memcpy(a.bytes, bytes.data(), sizeof(Address));
    return a;
}

Result<std::optional<Address>> decode_optional_address(byte_string_view &enc)
{
    auto const payload = BOOST_OUTCOME_TRYX(parse_string_metadata(enc));
    if (payload.empty()) {
        return std::optional<Address>{};
    }
    if (EDGE_UNLIKELY(payload.size() != sizeof(Address))) {
        return DecodeError::ArrayLengthUnexpected;
    }
    Address a;
    std::memcpy(a.bytes, payload.data(), sizeof(Address));
    return std::optional<Address>{a};
}

Result<AccessList> decode_access_list(byte_string_view &enc)
{
    auto payload = BOOST_OUTCOME_TRYX(parse_list_metadata(enc));

    AccessList access_list;
    while (!payload.empty()) {
        auto entry_payload = BOOST_OUTCOME_TRYX(parse_list_metadata(payload));

        AccessEntry entry;
        entry.a = BOOST_OUTCOME_TRYX(decode_address(entry_payload));
        auto keys_payload =
            BOOST_OUTCOME_TRYX(parse_list_metadata(entry_payload));
        while (!keys_payload.empty()) {
            auto const key = BOOST_OUTCOME_TRYX(decode_bytes32(keys_payload));
            entry.keys.push_back(key);
        }
        if (EDGE_UNLIKELY(!entry_payload.empty())) {
            return DecodeError::InputTooLong;
        }
        access_list.push_back(std::move(entry));
    }
    return access_list;
}

Result<Transaction> decode_transaction(byte_string_view &enc)
{
    if (EDGE_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }

    if (enc[0] >= 0xc0) {
        return decode_transaction_legacy(enc, TransactionType::legacy);
    }

    // eip 2718 typed envelope
    auto const type = to_transaction_type(enc[0]);
    if (EDGE_UNLIKELY(
            !type.has_value() || *type == TransactionType::legacy)) {
        return DecodeError::InvalidTxnType;
    }
    enc = enc.substr(1);

    switch (*type) {
    case TransactionType::access_list:
        return decode_transaction_access_list(enc);
    case TransactionType::dynamic_fee:
        return decode_transaction_dynamic_fee(enc);
    case TransactionType::state:
        return decode_transaction_legacy(enc, TransactionType::state);
    case TransactionType::legacy:
        break;
    }
    return DecodeError::InvalidTxnType;
}

EDGE_RLP_NAMESPACE_END
