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

#include <edge/ethereum/rpc/rpc_error.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<edge::rpc::RpcError>::mapping> const &
quick_status_code_from_enum<edge::rpc::RpcError>::value_mappings()
{
    using edge::rpc::RpcError;

    static std::initializer_list<mapping> const v = {
        {RpcError::Success, "success", {errc::success}},
        {RpcError::MissingField, "missing field", {}},
        {RpcError::InvalidQuantity, "invalid quantity", {}},
        {RpcError::InvalidData, "invalid data", {}},
        {RpcError::InvalidAddress, "invalid address", {}},
        {RpcError::InvalidHash, "invalid hash", {}},
        {RpcError::UnsupportedType, "unsupported transaction type", {}},
        {RpcError::MissingSignature, "missing signature", {}},
        {RpcError::MissingSender, "missing sender", {}},
        {RpcError::UnexpectedJsonType, "unexpected json type", {}},
        {RpcError::ErrorResponse, "error response", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
