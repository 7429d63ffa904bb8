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

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <verisol/common/log.hpp>
#include <verisol/common/settings.hpp>
#include <verisol/common/util.hpp>
#include <verisol/metadata/metadata.hpp>
#include <verisol/verification/candidates.hpp>
#include <verisol/verification/verifier.hpp>

#include "common.hpp"

using namespace verisol;

using cmd::kBadInput;
using cmd::kNotVerified;
using cmd::kVerificationFailed;
using cmd::kVerified;

static std::vector<Candidate> load_candidates(const std::vector<std::filesystem::path>& files) {
    std::vector<Candidate> candidates;
    for (const auto& path : files) {
        std::ifstream in{path};
        if (!in.is_open()) {
            throw std::runtime_error("Could not open file " + path.string());
        }
        const auto json = nlohmann::json::parse(in, /*cb=*/nullptr, /*allow_exceptions=*/false);
        auto output{CompilerOutput::from_json(json)};
        if (!output) {
            throw std::runtime_error("Not a compiler standard output JSON: " + path.string());
        }
        VERISOL_DEBUG << "Loaded " << path.string() << " with " << output->contracts.size() << " source file(s)";
        candidates.push_back({path.filename().string(), std::move(*output)});
    }
    return candidates;
}

static void print_metadata(const std::optional<metadata::Metadata>& metadata) {
    if (!metadata) {
        std::cout << "Metadata:        none" << std::endl;
        return;
    }
    std::cout << "Metadata:        " << to_hex(metadata->raw, /*with_prefix=*/true) << std::endl;
    const auto fields{metadata::decode_fields(*metadata)};
    if (!fields) {
        return;
    }
    if (fields->solc_version) {
        std::cout << "  solc:          " << *fields->solc_version << std::endl;
    }
    if (fields->vyper_version) {
        std::cout << "  vyper:         " << *fields->vyper_version << std::endl;
    }
    if (fields->ipfs) {
        std::cout << "  ipfs:          " << to_hex(*fields->ipfs, /*with_prefix=*/true) << std::endl;
    }
    if (fields->bzzr1) {
        std::cout << "  bzzr1:         " << to_hex(*fields->bzzr1, /*with_prefix=*/true) << std::endl;
    } else if (fields->bzzr0) {
        std::cout << "  bzzr0:         " << to_hex(*fields->bzzr0, /*with_prefix=*/true) << std::endl;
    }
    if (fields->experimental) {
        std::cout << "  experimental:  true" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    CLI::App cli{"Verifies smart contract source code against the bytecode deployed on chain"};

    log::Settings log_settings{};
    VerificationSettings settings{};
    cmd::add_logging_options(cli, log_settings);
    cmd::add_verification_options(cli, settings);

    if (const auto exit_code{cmd::parse_command_line(cli, argc, argv)}; exit_code) {
        return *exit_code;
    }

    std::vector<Candidate> candidates;
    try {
        log::init(log_settings);
        cmd::load_input_files(settings);
        candidates = load_candidates(settings.compiler_output_files);
    } catch (const std::exception& ex) {
        VERISOL_CRIT << ex.what();
        return kBadInput;
    }

    const auto verifier{Verifier::create(settings.contract_name, settings.file_path, settings.creation_tx_input,
                                         settings.deployed_bytecode)};
    if (!verifier) {
        VERISOL_ERROR << "Invalid verification request: " << to_string(verifier.error());
        return kVerificationFailed;
    }

    const auto& deployed{verifier->deployed_bytecode()};
    std::cout << "Contract:        " << verifier->contract_name() << std::endl;
    std::cout << "Code hash:       " << to_hex(deployed.code_hash(), /*with_prefix=*/true) << std::endl;
    print_metadata(deployed.metadata());
    if (const auto& args{verifier->creation_tx_input().constructor_args()}; args) {
        std::cout << "Constructor args: " << to_hex(*args, /*with_prefix=*/true) << std::endl;
    }

    const auto match{verify_candidates(*verifier, candidates)};
    if (!match) {
        VERISOL_ERROR << "Verification could not be performed: " << to_string(match.error());
        return kVerificationFailed;
    }

    const auto& outcome{match->outcome};
    std::cout << "Result:          " << to_string(outcome.type) << " (" << match->label << ")" << std::endl;
    if (outcome.type != MatchType::kFull && outcome.part) {
        std::cout << "Diverging part:  " << to_string(*outcome.part) << std::endl;
    }
    if (outcome.mismatch && outcome.type == MatchType::kPartial) {
        std::cout << "  submitted:     "
                  << (outcome.mismatch->expected ? to_hex(*outcome.mismatch->expected, true) : "none") << std::endl;
        std::cout << "  compiled:      "
                  << (outcome.mismatch->found ? to_hex(*outcome.mismatch->found, true) : "none") << std::endl;
    }

    return outcome.verified(settings.require_full_match) ? kVerified : kNotVerified;
}
