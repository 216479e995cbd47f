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
#include <edge/core/result.hpp>
#include <edge/core/rlp/config.hpp>
#include <edge/core/rlp/node.hpp>
#include <edge/ethereum/core/address.hpp>
#include <edge/ethereum/core/transaction.hpp>

#include <optional>

EDGE_RLP_NAMESPACE_BEGIN

/**
 * Field sequence hashed for a transaction. The shape depends only on the
 * type:
 *   legacy       nonce, gas price, gas, to, value, data, v, r, s
 *   state        the legacy fields followed by from
 *   access list  chain id, the legacy fields up to data, access list, v, r, s
 *   dynamic fee  chain id, nonce, tip cap, fee cap, gas, to, value, data,
 *                access list, v, r, s
 * A missing recipient is Null. A state transaction must carry a sender.
 */
NodeList build_canonical_nodes(Transaction const &);

// Bytes fed to the digest. Access list and dynamic fee transactions are
// prefixed with their type byte, state transactions are not.
byte_string encode_transaction(Transaction const &);

// Bytes as carried on the wire. Every non legacy transaction is prefixed
// with its type byte.
byte_string encode_transaction_envelope(Transaction const &);

Result<Address> decode_address(byte_string_view &);
Result<std::optional<Address>> decode_optional_address(byte_string_view &);
Result<AccessList> decode_access_list(byte_string_view &);

// Consumes one wire envelope from the front of `enc`
Result<Transaction> decode_transaction(byte_string_view &enc);

EDGE_RLP_NAMESPACE_END
