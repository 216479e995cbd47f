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

#include <edge/ethereum/rpc/config.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

EDGE_RPC_NAMESPACE_BEGIN

enum class RpcError
{
    Success = 0,
    MissingField,
    InvalidQuantity,
    InvalidData,
    InvalidAddress,
    InvalidHash,
    UnsupportedType,
    MissingSignature,
    MissingSender,
    UnexpectedJsonType,
    ErrorResponse,
};

EDGE_RPC_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<edge::rpc::RpcError>
    : quick_status_code_from_enum_defaults<edge::rpc::RpcError>
{
    static constexpr auto const domain_name = "Rpc Error";
    static constexpr auto const domain_uuid =
        "2d84c7e9-5b1a-4f36-8e0d-93a7f4c61b25";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
