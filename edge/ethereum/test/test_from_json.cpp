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
#include <edge/ethereum/core/transaction.hpp>
#include <edge/ethereum/rpc/from_json.hpp>
#include <edge/ethereum/rpc/rpc_block.hpp>
#include <edge/ethereum/rpc/rpc_error.hpp>
#include <edge/ethereum/transaction_hash.hpp>

#include "test_transactions.hpp"

#include <evmc/evmc.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <test_resource_data.h>

#include <filesystem>
#include <fstream>

using namespace edge;
using namespace edge::rpc;
using namespace edge::test;
using namespace evmc::literals;

namespace
{
    nlohmann::json read_json(std::filesystem::path const &path)
    {
        std::ifstream in{path};
        return nlohmann::json::parse(in);
    }

    nlohmann::json eip155_json()
    {
        return nlohmann::json::parse(R"({
            "nonce": "0x9",
            "gasPrice": "0x4a817c800",
            "gas": "0x5208",
            "to": "0x3535353535353535353535353535353535353535",
            "value": "0xde0b6b3a7640000",
            "input": "0x",
            "v": "0x25",
            "r": "0x28ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276",
            "s": "0x67cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83",
            "hash": "0x33469b22e9f636356c4160a87eb19df52b7412e8eac32a4a55ffe88ea8350788"
        })");
    }
}

TEST(FromJson, LegacyTransaction)
{
    auto const txn = transaction_from_json(eip155_json());
    ASSERT_FALSE(txn.has_error());
    EXPECT_EQ(txn.value(), eip155_transaction());

    auto json = eip155_json();
    json["type"] = "0x0";
    auto const typed = transaction_from_json(json);
    ASSERT_FALSE(typed.has_error());
    EXPECT_EQ(typed.value(), eip155_transaction());
}

TEST(FromJson, MainnetBlock46147)
{
    auto const json = read_json(test_resource::mainnet_tx_46147);
    auto const txn = rpc_transaction_from_json(json);
    ASSERT_FALSE(txn.has_error());
    EXPECT_EQ(
        txn.value().hash,
        0x5c504ed432cb51138bcf09aa5e8a410dd4a1e204ef84bfed1be16dfba1b22060_bytes32);
    EXPECT_EQ(txn.value().tx, mainnet_46147_transaction());
    EXPECT_EQ(hash_transaction(txn.value().tx), txn.value().hash);
}

TEST(FromJson, ContractCreation)
{
    auto json = eip155_json();
    json["to"] = nullptr;
    auto const with_null = transaction_from_json(json);
    ASSERT_FALSE(with_null.has_error());
    EXPECT_FALSE(with_null.value().to.has_value());

    json.erase("to");
    auto const without = transaction_from_json(json);
    ASSERT_FALSE(without.has_error());
    EXPECT_EQ(with_null.value(), without.value());
}

TEST(FromJson, StateTransaction)
{
    auto json = eip155_json();
    json["type"] = "0x7f";
    auto const missing_sender = transaction_from_json(json);
    ASSERT_TRUE(missing_sender.has_error());
    EXPECT_EQ(missing_sender.error(), RpcError::MissingSender);

    json["from"] = "0xfffffffffffffffffffffffffffffffffffffffe";
    auto const txn = transaction_from_json(json);
    ASSERT_FALSE(txn.has_error());
    EXPECT_EQ(txn.value().type, TransactionType::state);
    EXPECT_EQ(
        txn.value().from, 0xfffffffffffffffffffffffffffffffffffffffe_address);
}

TEST(FromJson, DynamicFeeTransaction)
{
    auto const json = nlohmann::json::parse(R"({
        "type": "0x2",
        "chainId": "0x1",
        "nonce": "0x5",
        "gasPrice": "0xc1b710800",
        "maxPriorityFeePerGas": "0x77359400",
        "maxFeePerGas": "0x174876e800",
        "gas": "0x5208",
        "to": "0x5df9b87991262f6ba471f09758cde1c0fc1de734",
        "value": "0x7a69",
        "input": "0x",
        "accessList": [],
        "v": "0x1",
        "r": "0x3a8f9c2b1e4d5f60718293a4b5c6d7e8f90a1b2c3d4e5f60718293a4b5c6d7e8",
        "s": "0x102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20"
    })");
    auto const txn = transaction_from_json(json);
    ASSERT_FALSE(txn.has_error());
    // the effective gas price is not part of the record
    EXPECT_EQ(txn.value(), dynamic_fee_transaction());
}

TEST(FromJson, AccessListTransaction)
{
    auto const json = nlohmann::json::parse(R"({
        "type": "0x1",
        "chainId": "0x1",
        "nonce": "0x7",
        "gasPrice": "0x6fc23ac00",
        "gas": "0xc350",
        "to": "0xdac17f958d2ee523a2206206994597c13d831ec7",
        "value": "0x0",
        "input": "0xa9059cbb0000000000000000000000003535353535353535353535353535353535353535000000000000000000000000000000000000000000000000000000000000000a",
        "accessList": [
            {
                "address": "0xdac17f958d2ee523a2206206994597c13d831ec7",
                "storageKeys": [
                    "0x0000000000000000000000000000000000000000000000000000000000000001",
                    "0x0000000000000000000000000000000000000000000000000000000000000002"
                ]
            }
        ],
        "v": "0x0",
        "r": "0x7b2d1e0f3c4a5968778695a4b3c2d1e0f1e2d3c4b5a69788796a5b4c3d2e1f00",
        "s": "0x6c5d4e3f2a1b0c9d8e7f60514233241506f7e8d9cabbac9d8e7f605142332415"
    })");
    auto const txn = transaction_from_json(json);
    ASSERT_FALSE(txn.has_error());
    EXPECT_EQ(txn.value(), access_list_transaction());
}

TEST(FromJson, MissingSignature)
{
    for (auto const *const field : {"v", "r", "s"}) {
        auto json = eip155_json();
        json.erase(field);
        auto const txn = transaction_from_json(json);
        ASSERT_TRUE(txn.has_error());
        EXPECT_EQ(txn.error(), RpcError::MissingSignature);
    }

    // explicit zero values are a signature
    auto json = eip155_json();
    json["v"] = "0x0";
    json["r"] = "0x0";
    json["s"] = "0x0";
    EXPECT_FALSE(transaction_from_json(json).has_error());
}

TEST(FromJson, InvalidFields)
{
    {
        auto json = eip155_json();
        json.erase("nonce");
        EXPECT_EQ(
            transaction_from_json(json).error(), RpcError::MissingField);
    }
    {
        auto json = eip155_json();
        json["nonce"] = "9";
        EXPECT_EQ(
            transaction_from_json(json).error(), RpcError::InvalidQuantity);
    }
    {
        // nonce does not fit in 64 bits
        auto json = eip155_json();
        json["nonce"] = "0x10000000000000000";
        EXPECT_EQ(
            transaction_from_json(json).error(), RpcError::InvalidQuantity);
    }
    {
        auto json = eip155_json();
        json["gas"] = 21000;
        EXPECT_EQ(
            transaction_from_json(json).error(), RpcError::UnexpectedJsonType);
    }
    {
        auto json = eip155_json();
        json["input"] = "0x0";
        EXPECT_EQ(transaction_from_json(json).error(), RpcError::InvalidData);
    }
    {
        auto json = eip155_json();
        json["to"] = "0x3535";
        EXPECT_EQ(
            transaction_from_json(json).error(), RpcError::InvalidAddress);
    }
    {
        auto json = eip155_json();
        json["type"] = "0x3";
        EXPECT_EQ(
            transaction_from_json(json).error(), RpcError::UnsupportedType);
    }
    {
        auto json = eip155_json();
        json["hash"] = "0x33469b22";
        EXPECT_EQ(
            rpc_transaction_from_json(json).error(), RpcError::InvalidHash);
    }
    EXPECT_EQ(
        transaction_from_json(nlohmann::json::array()).error(),
        RpcError::UnexpectedJsonType);
}

TEST(FromJson, Block)
{
    auto const blocks = read_json(test_resource::chain_blocks);
    ASSERT_TRUE(blocks.is_array());
    ASSERT_EQ(blocks.size(), 3u);

    auto const block = block_from_json(blocks[0]);
    ASSERT_FALSE(block.has_error());
    EXPECT_EQ(block.value().number, 0u);
    EXPECT_EQ(block.value().parent_hash, bytes32_t{});
    ASSERT_EQ(block.value().transactions.size(), 2u);
    ASSERT_EQ(block.value().transaction_hashes.size(), 2u);

    auto expected = eip155_transaction();
    expected.from = 0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f_address;
    EXPECT_EQ(block.value().transactions[0].tx, expected);
    EXPECT_EQ(
        block.value().transaction_hashes[0],
        0x33469b22e9f636356c4160a87eb19df52b7412e8eac32a4a55ffe88ea8350788_bytes32);
    EXPECT_FALSE(block.value().transactions[1].tx.to.has_value());
}

TEST(FromJson, BlockResponseEnvelope)
{
    auto const blocks = read_json(test_resource::chain_blocks);
    ASSERT_TRUE(blocks[1].contains("result"));

    auto const block = block_from_json(blocks[1]);
    ASSERT_FALSE(block.has_error());
    EXPECT_EQ(block.value().number, 1u);
    ASSERT_EQ(block.value().transactions.size(), 2u);
    EXPECT_EQ(block.value().transactions[0].tx.type, TransactionType::state);
    EXPECT_EQ(
        block.value().transactions[1].tx.type, TransactionType::dynamic_fee);

    auto const error = nlohmann::json::parse(
        R"({"jsonrpc": "2.0", "id": 1, "error": {"code": -32000, "message": "header not found"}})");
    EXPECT_EQ(block_from_json(error).error(), RpcError::ErrorResponse);

    auto const null_result =
        nlohmann::json::parse(R"({"jsonrpc": "2.0", "id": 1, "result": null})");
    EXPECT_EQ(block_from_json(null_result).error(), RpcError::MissingField);
}

TEST(FromJson, BlockWithHashesOnly)
{
    auto const json = nlohmann::json::parse(R"({
        "number": "0x2",
        "hash": "0xeaf67aabffe70e563eb36945415e1e266af4643f238d29e833f0e829ae341fd1",
        "parentHash": "0x9576dacec5ac5c4352e1e5af5574db3893d46a7fe32670349612d94b043dcbe3",
        "transactions": [
            "0xb0fe80138909047ca1c19825d907ad6a555174603a821f82a1304befe50d4ea2"
        ]
    })");
    auto const block = block_from_json(json);
    ASSERT_FALSE(block.has_error());
    EXPECT_TRUE(block.value().transactions.empty());
    ASSERT_EQ(block.value().transaction_hashes.size(), 1u);
    EXPECT_EQ(
        block.value().transaction_hashes[0],
        0xb0fe80138909047ca1c19825d907ad6a555174603a821f82a1304befe50d4ea2_bytes32);

    auto missing = json;
    missing.erase("transactions");
    EXPECT_EQ(block_from_json(missing).error(), RpcError::MissingField);
}
