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

#include "verifier.hpp"

#include <utility>

namespace verisol {

std::string to_string(MatchType type) {
    switch (type) {
        case MatchType::kFull:
            return "full match";
        case MatchType::kPartial:
            return "partial match";
        case MatchType::kMismatch:
            return "mismatch";
    }
    return "unknown";
}

std::string to_string(BytecodePart part) {
    switch (part) {
        case BytecodePart::kDeployedCode:
            return "deployed code";
        case BytecodePart::kCreationCode:
            return "creation code";
        case BytecodePart::kMetadata:
            return "metadata";
    }
    return "unknown";
}

static std::optional<Bytes> raw_metadata(const std::optional<metadata::Metadata>& metadata) {
    if (!metadata) {
        return std::nullopt;
    }
    return metadata->raw;
}

tl::expected<Verifier, InitializationError> Verifier::create(std::string contract_name,
                                                             std::optional<std::string> file_path,
                                                             std::string_view creation_tx_input,
                                                             std::string_view deployed_bytecode) {
    auto deployed{DeployedBytecode::from_str(deployed_bytecode)};
    if (!deployed) {
        return tl::unexpected(deployed.error());
    }
    auto creation{BytecodeWithConstructorArgs::from_str(creation_tx_input, *deployed)};
    if (!creation) {
        return tl::unexpected(creation.error());
    }
    return Verifier{std::move(contract_name), std::move(file_path), std::move(*creation), std::move(*deployed)};
}

tl::expected<const CompiledContract*, VerificationError> Verifier::find_contract(const CompilerOutput& output) const {
    if (file_path_) {
        const auto file_it{output.contracts.find(*file_path_)};
        if (file_it == output.contracts.end()) {
            return tl::unexpected(VerificationError{VerificationError::Kind::kContractNotFound,
                                                    *file_path_ + ":" + contract_name_});
        }
        const auto contract_it{file_it->second.find(contract_name_)};
        if (contract_it == file_it->second.end()) {
            return tl::unexpected(VerificationError{VerificationError::Kind::kContractNotFound,
                                                    *file_path_ + ":" + contract_name_});
        }
        return &contract_it->second;
    }

    const CompiledContract* found{nullptr};
    std::string found_in;
    for (const auto& [path, file_contracts] : output.contracts) {
        const auto contract_it{file_contracts.find(contract_name_)};
        if (contract_it == file_contracts.end()) {
            continue;
        }
        if (found) {
            return tl::unexpected(VerificationError{VerificationError::Kind::kAmbiguousContractName,
                                                    contract_name_ + " in " + found_in + " and " + path});
        }
        found = &contract_it->second;
        found_in = path;
    }
    if (!found) {
        return tl::unexpected(VerificationError{VerificationError::Kind::kContractNotFound, contract_name_});
    }
    return found;
}

tl::expected<VerificationOutcome, VerificationError> Verifier::verify(const CompilerOutput& output) const {
    const auto contract{find_contract(output)};
    if (!contract) {
        return tl::unexpected(contract.error());
    }

    const auto compiled_deployed{DeployedBytecode::from_str((*contract)->runtime_code)};
    if (!compiled_deployed) {
        return tl::unexpected(VerificationError{VerificationError::Kind::kInvalidCompiledBytecode,
                                                "runtime code, " + to_string(compiled_deployed.error())});
    }
    const auto compiled_creation{BytecodeWithConstructorArgs::from_str((*contract)->creation_code, *compiled_deployed)};
    if (!compiled_creation) {
        return tl::unexpected(VerificationError{VerificationError::Kind::kInvalidCompiledBytecode,
                                                "creation code, " + to_string(compiled_creation.error())});
    }

    if (bc_deployed_bytecode_.code() != compiled_deployed->code()) {
        return VerificationOutcome{MatchType::kMismatch, BytecodePart::kDeployedCode,
                                   Mismatch<Bytes>{bc_deployed_bytecode_.code(), compiled_deployed->code()}};
    }
    // Without a metadata anchor the constructor arguments could not be split off the submitted creation input
    const ByteView submitted_creation{bc_creation_tx_input_.code()};
    const bool creation_matches{submitted_creation == ByteView{compiled_creation->code()} ||
                                (!bc_creation_tx_input_.metadata() &&
                                 submitted_creation.starts_with(ByteView{compiled_creation->code()}))};
    if (!creation_matches) {
        return VerificationOutcome{MatchType::kMismatch, BytecodePart::kCreationCode,
                                   Mismatch<Bytes>{bc_creation_tx_input_.code(), compiled_creation->code()}};
    }

    // Creation input metadata is known to be equal to the deployed one
    if (bc_deployed_bytecode_.metadata() != compiled_deployed->metadata()) {
        return VerificationOutcome{MatchType::kPartial, BytecodePart::kMetadata,
                                   Mismatch<Bytes>{raw_metadata(bc_deployed_bytecode_.metadata()),
                                                   raw_metadata(compiled_deployed->metadata())}};
    }
    return VerificationOutcome::full_match();
}

}  // namespace verisol
