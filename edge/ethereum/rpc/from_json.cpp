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
#include <edge/core/hex.hpp>
#include <edge/core/int.hpp>
#include <edge/core/likely.h>
#include <edge/core/result.hpp>
#include <edge/ethereum/core/address.hpp>
#include <edge/ethereum/core/transaction.hpp>
#include <edge/ethereum/rpc/config.hpp>
#include <edge/ethereum/rpc/from_json.hpp>
#include <edge/ethereum/rpc/rpc_block.hpp>
#include <edge/ethereum/rpc/rpc_error.hpp>

#include <boost/outcome/try.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

EDGE_RPC_NAMESPACE_BEGIN

namespace
{
    using json = nlohmann::json;

    bool has_field(json const &obj, char const *const key)
    {
        auto const it = obj.find(key);
        return it != obj.end() && !it->is_null();
    }

    Result<std::string_view> get_string(json const &value)
    {
        if (EDGE_UNLIKELY(!value.is_string())) {
            return RpcError::UnexpectedJsonType;
        }
        return std::string_view{value.get_ref<std::string const &>()};
    }

    Result<std::string_view> get_field(json const &obj, char const *const key)
    {
        auto const it = obj.find(key);
        if (EDGE_UNLIKELY(it == obj.end() || it->is_null())) {
            return RpcError::MissingField;
        }
        return get_string(*it);
    }

    Result<uint256_t> get_quantity(json const &obj, char const *const key)
    {
        auto const s = BOOST_OUTCOME_TRYX(get_field(obj, key));
        auto const quantity = parse_quantity(s);
        if (EDGE_UNLIKELY(!quantity.has_value())) {
            return RpcError::InvalidQuantity;
        }
        return *quantity;
    }

    Result<uint64_t> get_quantity64(json const &obj, char const *const key)
    {
        auto const quantity = BOOST_OUTCOME_TRYX(get_quantity(obj, key));
        if (EDGE_UNLIKELY(quantity > std::numeric_limits<uint64_t>::max())) {
            return RpcError::InvalidQuantity;
        }
        return static_cast<uint64_t>(quantity);
    }

    Result<byte_string> get_data(json const &obj, char const *const key)
    {
        auto const s = BOOST_OUTCOME_TRYX(get_field(obj, key));
        auto data = parse_data(s);
        if (EDGE_UNLIKELY(!data.has_value())) {
            return RpcError::InvalidData;
        }
        return std::move(*data);
    }

    Result<Address> to_address(json const &value)
    {
        auto const s = BOOST_OUTCOME_TRYX(get_string(value));
        auto const address = parse_fixed<Address>(s);
        if (EDGE_UNLIKELY(!address.has_value())) {
            return RpcError::InvalidAddress;
        }
        return *address;
    }

    Result<std::optional<Address>>
    get_optional_address(json const &obj, char const *const key)
    {
        if (!has_field(obj, key)) {
            return std::optional<Address>{};
        }
        auto const address = BOOST_OUTCOME_TRYX(to_address(obj.at(key)));
        return std::optional<Address>{address};
    }

    Result<bytes32_t> to_hash(json const &value)
    {
        auto const s = BOOST_OUTCOME_TRYX(get_string(value));
        auto const hash = parse_fixed<bytes32_t>(s);
        if (EDGE_UNLIKELY(!hash.has_value())) {
            return RpcError::InvalidHash;
        }
        return *hash;
    }

    Result<bytes32_t> get_hash(json const &obj, char const *const key)
    {
        if (EDGE_UNLIKELY(!has_field(obj, key))) {
            return RpcError::MissingField;
        }
        return to_hash(obj.at(key));
    }

    Result<AccessList> get_access_list(json const &obj)
    {
        AccessList access_list;
        if (!has_field(obj, "accessList")) {
            return access_list;
        }
        auto const &entries = obj.at("accessList");
        if (EDGE_UNLIKELY(!entries.is_array())) {
            return RpcError::UnexpectedJsonType;
        }
        for (auto const &entry_json : entries) {
            if (EDGE_UNLIKELY(!entry_json.is_object())) {
                return RpcError::UnexpectedJsonType;
            }
            if (EDGE_UNLIKELY(!has_field(entry_json, "address"))) {
                return RpcError::MissingField;
            }
            AccessEntry entry;
            entry.a = BOOST_OUTCOME_TRYX(to_address(entry_json.at("address")));
            if (has_field(entry_json, "storageKeys")) {
                auto const &keys = entry_json.at("storageKeys");
                if (EDGE_UNLIKELY(!keys.is_array())) {
                    return RpcError::UnexpectedJsonType;
                }
                for (auto const &key_json : keys) {
                    auto const key = BOOST_OUTCOME_TRYX(to_hash(key_json));
                    entry.keys.push_back(key);
                }
            }
            access_list.push_back(std::move(entry));
        }
        return access_list;
    }

    Result<TransactionType> get_type(json const &obj)
    {
        if (!has_field(obj, "type")) {
            return TransactionType::legacy;
        }
        auto const tag = BOOST_OUTCOME_TRYX(get_quantity(obj, "type"));
        if (EDGE_UNLIKELY(tag > 0xff)) {
            return RpcError::UnsupportedType;
        }
        auto const type = to_transaction_type(static_cast<uint64_t>(tag));
        if (EDGE_UNLIKELY(!type.has_value())) {
            return RpcError::UnsupportedType;
        }
        return *type;
    }
}

Result<Transaction> transaction_from_json(json const &obj)
{
    if (EDGE_UNLIKELY(!obj.is_object())) {
        return RpcError::UnexpectedJsonType;
    }

    Transaction txn;
    txn.type = BOOST_OUTCOME_TRYX(get_type(obj));
    txn.nonce = BOOST_OUTCOME_TRYX(get_quantity64(obj, "nonce"));
    txn.gas_limit = BOOST_OUTCOME_TRYX(get_quantity64(obj, "gas"));
    txn.to = BOOST_OUTCOME_TRYX(get_optional_address(obj, "to"));
    txn.value = BOOST_OUTCOME_TRYX(get_quantity(obj, "value"));
    txn.data = BOOST_OUTCOME_TRYX(get_data(obj, "input"));

    if (EDGE_UNLIKELY(
            !has_field(obj, "v") || !has_field(obj, "r") ||
            !has_field(obj, "s"))) {
        return RpcError::MissingSignature;
    }
    txn.sig.v = BOOST_OUTCOME_TRYX(get_quantity(obj, "v"));
    txn.sig.r = BOOST_OUTCOME_TRYX(get_quantity(obj, "r"));
    txn.sig.s = BOOST_OUTCOME_TRYX(get_quantity(obj, "s"));

    if (txn.type == TransactionType::state &&
        EDGE_UNLIKELY(!has_field(obj, "from"))) {
        return RpcError::MissingSender;
    }
    txn.from = BOOST_OUTCOME_TRYX(get_optional_address(obj, "from"));

    switch (txn.type) {
    case TransactionType::legacy:
    case TransactionType::state:
        txn.gas_price = BOOST_OUTCOME_TRYX(get_quantity(obj, "gasPrice"));
        break;
    case TransactionType::access_list:
        txn.chain_id = BOOST_OUTCOME_TRYX(get_quantity(obj, "chainId"));
        txn.gas_price = BOOST_OUTCOME_TRYX(get_quantity(obj, "gasPrice"));
        txn.access_list = BOOST_OUTCOME_TRYX(get_access_list(obj));
        break;
    case TransactionType::dynamic_fee:
        txn.chain_id = BOOST_OUTCOME_TRYX(get_quantity(obj, "chainId"));
        txn.max_priority_fee_per_gas =
            BOOST_OUTCOME_TRYX(get_quantity(obj, "maxPriorityFeePerGas"));
        txn.max_fee_per_gas =
            BOOST_OUTCOME_TRYX(get_quantity(obj, "maxFeePerGas"));
        txn.access_list = BOOST_OUTCOME_TRYX(get_access_list(obj));
        break;
    }
    return txn;
}

Result<RpcTransaction> rpc_transaction_from_json(json const &obj)
{
    if (EDGE_UNLIKELY(!obj.is_object())) {
        return RpcError::UnexpectedJsonType;
    }
    RpcTransaction result;
    result.hash = BOOST_OUTCOME_TRYX(get_hash(obj, "hash"));
    result.tx = BOOST_OUTCOME_TRYX(transaction_from_json(obj));
    return result;
}

Result<RpcBlock> block_from_json(json const &value)
{
    json const *block = &value;
    if (value.is_object() &&
        (value.contains("jsonrpc") || value.contains("result") ||
         value.contains("error"))) {
        if (has_field(value, "error")) {
            return RpcError::ErrorResponse;
        }
        if (!has_field(value, "result")) {
            return RpcError::MissingField;
        }
        block = &value.at("result");
    }
    if (EDGE_UNLIKELY(!block->is_object())) {
        return RpcError::UnexpectedJsonType;
    }

    RpcBlock result;
    result.number = BOOST_OUTCOME_TRYX(get_quantity64(*block, "number"));
    result.hash = BOOST_OUTCOME_TRYX(get_hash(*block, "hash"));
    result.parent_hash = BOOST_OUTCOME_TRYX(get_hash(*block, "parentHash"));

    if (EDGE_UNLIKELY(!has_field(*block, "transactions"))) {
        return RpcError::MissingField;
    }
    auto const &transactions = block->at("transactions");
    if (EDGE_UNLIKELY(!transactions.is_array())) {
        return RpcError::UnexpectedJsonType;
    }
    for (auto const &entry : transactions) {
        if (entry.is_string()) {
            auto const hash = BOOST_OUTCOME_TRYX(to_hash(entry));
            result.transaction_hashes.push_back(hash);
        }
        else {
            auto txn = BOOST_OUTCOME_TRYX(rpc_transaction_from_json(entry));
            result.transaction_hashes.push_back(txn.hash);
            result.transactions.push_back(std::move(txn));
        }
    }
    return result;
}

EDGE_RPC_NAMESPACE_END
