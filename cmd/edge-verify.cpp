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
#include <edge/core/fmt/bytes_fmt.hpp>
#include <edge/core/hex.hpp>
#include <edge/core/likely.h>
#include <edge/core/log_level_map.hpp>
#include <edge/core/result.hpp>
#include <edge/ethereum/core/rlp/transaction_rlp.hpp>
#include <edge/ethereum/core/transaction.hpp>
#include <edge/ethereum/rpc/from_json.hpp>
#include <edge/ethereum/rpc/rpc_block.hpp>
#include <edge/ethereum/signed_transaction.hpp>
#include <edge/ethereum/transaction_hash.hpp>
#include <edge/ethereum/verify_chain.hpp>

#include <CLI/CLI.hpp>

#include <fmt/core.h>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

EDGE_NAMESPACE_BEGIN

namespace
{
    nlohmann::json read_json(fs::path const &path)
    {
        std::ifstream in{path};
        return nlohmann::json::parse(in);
    }

    std::optional<std::vector<rpc::RpcBlock>>
    load_blocks(nlohmann::json const &json)
    {
        std::vector<rpc::RpcBlock> blocks;
        auto const load = [&](nlohmann::json const &entry) {
            auto block = rpc::block_from_json(entry);
            if (EDGE_UNLIKELY(block.has_error())) {
                LOG_ERROR(
                    "block {} could not be read: {}",
                    blocks.size(),
                    block.error().message().c_str());
                return false;
            }
            blocks.push_back(std::move(block).value());
            return true;
        };
        if (json.is_array()) {
            for (auto const &entry : json) {
                if (!load(entry)) {
                    return std::nullopt;
                }
            }
        }
        else if (!load(json)) {
            return std::nullopt;
        }
        return blocks;
    }

    bool load_raw_transactions(
        nlohmann::json const &json,
        std::unordered_map<bytes32_t, byte_string> &raw_transactions)
    {
        if (EDGE_UNLIKELY(!json.is_object())) {
            LOG_ERROR("raw transactions must be an object of hash to hex");
            return false;
        }
        for (auto const &[key, value] : json.items()) {
            auto const hash = parse_fixed<bytes32_t>(key);
            auto raw = value.is_string()
                           ? parse_data(value.get<std::string>())
                           : std::nullopt;
            if (EDGE_UNLIKELY(!hash.has_value() || !raw.has_value())) {
                LOG_ERROR("invalid raw transaction entry {}", key);
                return false;
            }
            raw_transactions.emplace(*hash, std::move(*raw));
        }
        return true;
    }

    // HASH@NUMBER, the number in decimal or as a 0x quantity
    std::optional<ExpectedInclusion> parse_inclusion(std::string_view const s)
    {
        auto const at = s.find('@');
        if (at == std::string_view::npos) {
            return std::nullopt;
        }
        auto const hash = parse_fixed<bytes32_t>(s.substr(0, at));
        if (!hash.has_value()) {
            return std::nullopt;
        }
        auto const number = s.substr(at + 1);
        if (has_hex_prefix(number)) {
            auto const quantity = parse_quantity(number);
            if (!quantity.has_value() ||
                *quantity > std::numeric_limits<uint64_t>::max()) {
                return std::nullopt;
            }
            return ExpectedInclusion{
                .hash = *hash,
                .block_number = static_cast<uint64_t>(*quantity)};
        }
        uint64_t block_number = 0;
        auto const [ptr, ec] = std::from_chars(
            number.data(), number.data() + number.size(), block_number);
        if (ec != std::errc{} || ptr != number.data() + number.size() ||
            number.empty()) {
            return std::nullopt;
        }
        return ExpectedInclusion{.hash = *hash, .block_number = block_number};
    }

    int run_chain(
        fs::path const &blocks_path, fs::path const &raw_path,
        fs::path const &hash_blocks_path, std::string const &genesis_parent,
        std::vector<std::string> const &expected)
    {
        VerifyOptions options;

        auto const genesis = parse_fixed<bytes32_t>(genesis_parent);
        if (EDGE_UNLIKELY(!genesis.has_value())) {
            LOG_ERROR("invalid genesis parent {}", genesis_parent);
            return EXIT_FAILURE;
        }
        options.genesis_parent = *genesis;

        for (auto const &s : expected) {
            auto const inclusion = parse_inclusion(s);
            if (EDGE_UNLIKELY(!inclusion.has_value())) {
                LOG_ERROR("invalid expected transaction {}", s);
                return EXIT_FAILURE;
            }
            options.expected_inclusions.push_back(*inclusion);
        }

        if (!raw_path.empty() &&
            !load_raw_transactions(read_json(raw_path), options.raw_transactions)) {
            return EXIT_FAILURE;
        }

        if (!hash_blocks_path.empty()) {
            auto hash_blocks = load_blocks(read_json(hash_blocks_path));
            if (!hash_blocks.has_value()) {
                return EXIT_FAILURE;
            }
            for (auto &block : *hash_blocks) {
                auto const number = block.number;
                options.hash_only_blocks.insert_or_assign(
                    number, std::move(block));
            }
        }

        auto const blocks = load_blocks(read_json(blocks_path));
        if (!blocks.has_value()) {
            return EXIT_FAILURE;
        }

        auto const report = verify_chain(*blocks, options);
        fmt::print(
            "blocks {} transactions {} cross checked {} findings {}\n",
            report.blocks_checked,
            report.transactions_checked,
            report.cross_checked,
            report.findings.size() + report.hash_mismatches.size());
        return report.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    int run_tx(fs::path const &json_path, std::string const &raw_hex)
    {
        Transaction txn;
        std::optional<bytes32_t> raw_hash;
        if (!json_path.empty()) {
            auto result = rpc::transaction_from_json(read_json(json_path));
            if (EDGE_UNLIKELY(result.has_error())) {
                LOG_ERROR(
                    "transaction could not be read: {}",
                    result.error().message().c_str());
                return EXIT_FAILURE;
            }
            txn = std::move(result).value();
        }
        else {
            auto const raw = parse_data(raw_hex);
            if (EDGE_UNLIKELY(!raw.has_value())) {
                LOG_ERROR("invalid raw transaction hex");
                return EXIT_FAILURE;
            }
            auto const signed_txn = SignedTransaction::decode(*raw);
            if (EDGE_UNLIKELY(signed_txn.has_error())) {
                LOG_ERROR(
                    "raw transaction could not be decoded: {}",
                    signed_txn.error().message().c_str());
                return EXIT_FAILURE;
            }
            txn = transaction_from_signed(signed_txn.value());
            raw_hash = signed_txn.value().hash();
        }

        fmt::print("encoding {}\n", to_hex(rlp::encode_transaction(txn)));
        fmt::print("hash {}\n", hash_transaction(txn));
        if (raw_hash.has_value()) {
            fmt::print("raw hash {}\n", *raw_hash);
        }
        return EXIT_SUCCESS;
    }
}

EDGE_NAMESPACE_END

int main(int const argc, char const *argv[])
{
    using namespace edge;

    CLI::App cli{"edge-verify"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);
    cli.fallthrough();

    auto log_level = quill::LogLevel::Info;
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    fs::path blocks_path;
    fs::path raw_path;
    fs::path hash_blocks_path;
    std::string genesis_parent = fmt::format("{}", bytes32_t{});
    std::vector<std::string> expected;
    auto *const chain =
        cli.add_subcommand("chain", "verify captured eth_getBlockByNumber data");
    chain->add_option("--blocks", blocks_path, "blocks json file")
        ->required()
        ->check(CLI::ExistingFile);
    chain
        ->add_option(
            "--raw",
            raw_path,
            "json object mapping transaction hash to raw envelope hex")
        ->check(CLI::ExistingFile);
    chain
        ->add_option(
            "--hash_blocks",
            hash_blocks_path,
            "the same blocks fetched with transaction hashes only")
        ->check(CLI::ExistingFile);
    chain->add_option(
        "--genesis_parent", genesis_parent, "parent hash of block 0");
    chain->add_option(
        "--expect_tx",
        expected,
        "HASH@NUMBER, a transaction that must be included in block NUMBER");

    fs::path json_path;
    std::string raw_hex;
    auto *const tx =
        cli.add_subcommand("tx", "print the canonical encoding and hash");
    auto *const group = tx->add_option_group("source", "transaction source");
    group->add_option("--json", json_path, "transaction json file")
        ->check(CLI::ExistingFile);
    group->add_option("--raw", raw_hex, "raw envelope hex");
    group->require_option(1);

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::RequiredError const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    try {
        if (*chain) {
            return run_chain(
                blocks_path,
                raw_path,
                hash_blocks_path,
                genesis_parent,
                expected);
        }
        return run_tx(json_path, raw_hex);
    }
    catch (nlohmann::json::exception const &e) {
        LOG_ERROR("malformed json: {}", e.what());
        return EXIT_FAILURE;
    }
}
