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
#include <edge/ethereum/core/rlp/transaction_rlp.hpp>
#include <edge/ethereum/core/transaction.hpp>
#include <edge/ethereum/transaction_hash.hpp>

EDGE_NAMESPACE_BEGIN

bytes32_t hash_transaction(Transaction const &txn, DigestFn const digest)
{
    return to_bytes(digest(rlp::encode_transaction(txn)));
}

EDGE_NAMESPACE_END
