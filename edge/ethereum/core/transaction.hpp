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
#include <edge/ethereum/core/address.hpp>
#include <edge/ethereum/core/signature.hpp>

#include <cstdint>
#include <optional>
#include <vector>

EDGE_NAMESPACE_BEGIN

enum class TransactionType : uint8_t
{
    legacy = 0x00,
    access_list = 0x01, // EIP-2930
    dynamic_fee = 0x02, // EIP-1559
    state = 0x7f, // bridge state sync, sender is part of the hash
};

constexpr std::optional<TransactionType>
to_transaction_type(uint64_t const tag) noexcept
{
    switch (tag) {
    case 0x00:
        return TransactionType::legacy;
    case 0x01:
        return TransactionType::access_list;
    case 0x02:
        return TransactionType::dynamic_fee;
    case 0x7f:
        return TransactionType::state;
    default:
        return std::nullopt;
    }
}

// Typed kinds whose digest and envelope carry a leading type byte
constexpr bool is_eip2718(TransactionType const type) noexcept
{
    return type == TransactionType::access_list ||
           type == TransactionType::dynamic_fee;
}

struct AccessEntry
{
    Address a{};
    std::vector<bytes32_t> keys{};

    friend bool operator==(AccessEntry const &, AccessEntry const &) = default;
};

using AccessList = std::vector<AccessEntry>;

struct Transaction
{
    TransactionType type{TransactionType::legacy};
    uint64_t nonce{};
    uint256_t gas_price{};
    uint64_t gas_limit{};
    std::optional<Address> to{}; // nullopt for contract creation
    uint256_t value{};
    byte_string data{};
    SignatureValues sig{};
    std::optional<Address> from{}; // only hashed for state transactions

    // typed transactions
    uint256_t chain_id{};
    uint256_t max_priority_fee_per_gas{};
    uint256_t max_fee_per_gas{};
    AccessList access_list{};

    friend bool operator==(Transaction const &, Transaction const &) = default;
};

EDGE_NAMESPACE_END
