/*
   Copyright 2023 The Bithash Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <CLI/CLI.hpp>
#include <boost/system/system_error.hpp>
#include <openssl/opensslv.h>

#include <bithash/app/digest.hpp>
#include <bithash/core/common/base.hpp>
#include <bithash/core/common/cast.hpp>
#include <bithash/core/common/misc.hpp>
#include <bithash/core/encoding/hex.hpp>
#include <bithash/infra/common/log.hpp>

#include "common.hpp"
#include "common/size_validator.hpp"

using namespace bithash;

namespace {

constexpr int kExitIoError{1};
constexpr int kExitInvalidInput{2};

struct HashCommand {
    app::Algorithm algorithm{app::Algorithm::kHash160};
    std::string hex_input;
    std::string text_input;
    std::string file_input;
    std::string chunk_size_str{"64KiB"};
};

struct ParseCommand {
    app::Algorithm algorithm{app::Algorithm::kHash160};
    std::string digest;
};

std::string do_hash(const HashCommand& command) {
    const auto label{app::algorithm_label(command.algorithm)};

    if (not command.file_input.empty()) {
        const std::filesystem::path path{command.file_input};
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (not file.is_open()) {
            throw std::filesystem::filesystem_error("Unable to open file", path,
                                                    std::make_error_code(std::errc::no_such_file_or_directory));
        }
        const auto chunk_size{parse_human_bytes(command.chunk_size_str).value()};
        LOG_DEBUG << "Hashing file " << path.string() << " algo=" << label
                  << " chunk=" << to_human_bytes(chunk_size, /*binary=*/true);
        const auto result{app::hash_stream_to_hex(command.algorithm, file, chunk_size)};
        if (result.has_error()) {
            throw std::filesystem::filesystem_error("Error reading file", path,
                                                    std::make_error_code(std::errc::io_error));
        }
        return result.value();
    }

    if (not command.hex_input.empty()) {
        const auto bytes{enc::hex::decode(command.hex_input)};
        if (bytes.has_error()) {
            throw std::invalid_argument("Invalid hex input " + abridge(command.hex_input, 32) + " : " +
                                        bytes.error().message());
        }
        LOG_DEBUG << "Hashing " << bytes.value().size() << " bytes algo=" << label;
        return app::hash_to_hex(command.algorithm, bytes.value());
    }

    LOG_DEBUG << "Hashing text \"" << abridge(command.text_input, 32) << "\" algo=" << label;
    return app::hash_to_hex(command.algorithm, string_view_to_byte_view(command.text_input));
}

int do_parse(const ParseCommand& command) {
    const auto label{app::algorithm_label(command.algorithm)};
    if (const auto length_check{app::check_digest_hex_length(command.algorithm, command.digest)};
        length_check.has_error()) {
        log::write(log::Level::kError, "Invalid digest", {"algo", label, "reason", length_check.error().to_string()});
        return kExitInvalidInput;
    }
    const auto bytes{enc::hex::decode(command.digest)};
    if (bytes.has_error()) {
        log::write(log::Level::kError, "Invalid digest",
                   {"input", abridge(command.digest, 48), "reason", bytes.error().message()});
        return kExitInvalidInput;
    }
    const auto normalized{app::normalize_digest(command.algorithm, bytes.value())};
    if (normalized.has_error()) {
        log::write(log::Level::kError, "Invalid digest", {"algo", label, "reason", normalized.error().to_string()});
        return kExitInvalidInput;
    }
    std::cout << normalized.value() << std::endl;
    return 0;
}

void do_info() {
    for (const auto& [label, algorithm] : app::get_algorithms_map()) {
        std::cout << label << " len=" << app::digest_length(algorithm) << " block_size=" << app::block_size(algorithm)
                  << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    const auto* build_info(get_buildinfo());
    CLI::App cli(std::string(build_info->project_name).append(" : fixed output hash calculator"));
    cli.get_formatter()->column_width(50);
    cli.require_subcommand(1);  // Exactly 1 subcommand is required
    cli.set_version_flag("--version", get_buildinfo_string());

    log::Settings log_settings{};
    log_settings.log_verbosity = log::Level::kWarning;
    cmd::add_logging_options(cli, log_settings);

    const auto algorithms{app::get_algorithms_map()};

    HashCommand hash_command{};
    auto* cmd_hash = cli.add_subcommand("hash", "Computes the digest of the input");
    cmd_hash->add_option("--algo", hash_command.algorithm, "Hash algorithm")
        ->capture_default_str()
        ->transform(CLI::Transformer(algorithms, CLI::ignore_case))
        ->default_val(hash_command.algorithm);
    auto& input_opts = *cmd_hash->add_option_group("Input", "Input data (one of)");
    input_opts.add_option("--hex", hash_command.hex_input, "Hex encoded input bytes (optional 0x prefix)");
    input_opts.add_option("--text", hash_command.text_input, "Text input (hashed as is)");
    input_opts.add_option("--file", hash_command.file_input, "Path to input file")->check(CLI::ExistingFile);
    input_opts.require_option(1);
    cmd_hash->add_option("--chunk", hash_command.chunk_size_str, "Read size for file inputs")
        ->capture_default_str()
        ->check(cmd::common::SizeValidator("1B", {"64MiB"}));

    ParseCommand parse_command{};
    auto* cmd_parse = cli.add_subcommand("parse", "Validates a hex encoded digest for the algorithm");
    cmd_parse->add_option("--algo", parse_command.algorithm, "Hash algorithm")
        ->capture_default_str()
        ->transform(CLI::Transformer(algorithms, CLI::ignore_case))
        ->default_val(parse_command.algorithm);
    cmd_parse->add_option("--digest", parse_command.digest, "Hex encoded digest")->required();

    auto* cmd_info = cli.add_subcommand("info", "Lists available algorithms with their sizes");

    try {
        cli.parse(argc, argv);

        log::init(log_settings);
        log::set_thread_name("main");
        LOG_DEBUG << "Using " << build_info->project_name << " version=" << get_buildinfo_string();
        LOG_DEBUG << "Using OpenSSL version=" << OPENSSL_VERSION_TEXT;

        if (*cmd_hash) {
            std::cout << do_hash(hash_command) << std::endl;
        } else if (*cmd_parse) {
            return do_parse(parse_command);
        } else if (*cmd_info) {
            do_info();
        }

    } catch (const CLI::ParseError& ex) {
        return cli.exit(ex);
    } catch (const std::filesystem::filesystem_error& ex) {
        LOG_ERROR << "Filesystem error : " << ex.what();
        return kExitIoError;
    } catch (const std::invalid_argument& ex) {
        LOG_ERROR << "Invalid argument : " << ex.what();
        return kExitInvalidInput;
    } catch (const boost::system::system_error& ex) {
        LOG_ERROR << "Unexpected error : " << ex.what();
        return kExitInvalidInput;
    } catch (const std::exception& ex) {
        LOG_ERROR << "Unexpected error : " << ex.what();
        return kExitIoError;
    }

    return 0;
}
