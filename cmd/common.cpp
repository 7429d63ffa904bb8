/*
   Copyright 2022 The Verisol Authors

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

#include "common.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace verisol::cmd {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->capture_default_str()
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log_settings.log_verbosity);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_verification_options(CLI::App& cli, VerificationSettings& settings) {
    cli.add_option("--contract", settings.contract_name, "Name of the contract to verify")->required();
    cli.add_option("--file", settings.file_path, "Source file path of the contract (required if ambiguous)");

    auto* creation_input{
        cli.add_option("--creation-tx-input", settings.creation_tx_input, "Contract creation transaction input as hex")};
    auto* creation_input_file{cli.add_option("--creation-tx-input-file", settings.creation_tx_input_file,
                                             "File holding the contract creation transaction input as hex")
                                  ->check(CLI::ExistingFile)};
    creation_input->excludes(creation_input_file);
    auto& creation_group = *cli.add_option_group("Creation input");
    creation_group.add_option(creation_input);
    creation_group.add_option(creation_input_file);
    creation_group.require_option(1);

    auto* deployed{cli.add_option("--deployed-bytecode", settings.deployed_bytecode, "Deployed bytecode as hex")};
    auto* deployed_file{cli.add_option("--deployed-bytecode-file", settings.deployed_bytecode_file,
                                       "File holding the deployed bytecode as hex")
                            ->check(CLI::ExistingFile)};
    deployed->excludes(deployed_file);
    auto& deployed_group = *cli.add_option_group("Deployed bytecode");
    deployed_group.add_option(deployed);
    deployed_group.add_option(deployed_file);
    deployed_group.require_option(1);

    cli.add_option("--compiler-output", settings.compiler_output_files,
                   "Compiler standard output JSON file, may be repeated (tried in order)")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_flag("--require-full-match", settings.require_full_match,
                 "Consider verified only contracts whose metadata matches too");
}

std::optional<int> parse_command_line(CLI::App& cli, int argc, const char* const* argv) {
    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& pe) {
        const int exit_code{cli.exit(pe)};
        return exit_code == 0 ? kVerified : kBadInput;
    }
    return std::nullopt;
}

static std::string read_hex_file(const std::filesystem::path& path) {
    std::ifstream in{path};
    if (!in.is_open()) {
        throw std::runtime_error("Could not open file " + path.string());
    }
    std::stringstream content;
    content << in.rdbuf();
    std::string hex{content.str()};
    // Trailing newline and the like
    const auto last{hex.find_last_not_of(" \t\r\n")};
    hex.erase(last == std::string::npos ? 0 : last + 1);
    const auto first{hex.find_first_not_of(" \t\r\n")};
    hex.erase(0, first == std::string::npos ? hex.size() : first);
    return hex;
}

void load_input_files(VerificationSettings& settings) {
    if (settings.creation_tx_input_file) {
        settings.creation_tx_input = read_hex_file(*settings.creation_tx_input_file);
    }
    if (settings.deployed_bytecode_file) {
        settings.deployed_bytecode = read_hex_file(*settings.deployed_bytecode_file);
    }
}

}  // namespace verisol::cmd
