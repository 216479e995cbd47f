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

#include <edge/core/result.hpp>
#include <edge/ethereum/core/transaction.hpp>
#include <edge/ethereum/rpc/config.hpp>
#include <edge/ethereum/rpc/rpc_block.hpp>

#include <nlohmann/json_fwd.hpp>

EDGE_RPC_NAMESPACE_BEGIN

// Normalizes a JSON-RPC transaction object. An absent "type" is legacy and
// an absent or null "to" is a contract creation.
Result<Transaction> transaction_from_json(nlohmann::json const &);

Result<RpcTransaction> rpc_transaction_from_json(nlohmann::json const &);

// Accepts a block object or a response envelope carrying one in "result"
Result<RpcBlock> block_from_json(nlohmann::json const &);

EDGE_RPC_NAMESPACE_END
