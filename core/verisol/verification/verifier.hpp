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

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include <verisol/common/base.hpp>
#include <verisol/common/mismatch.hpp>
#include <verisol/verification/compiler_output.hpp>
#include <verisol/verification/creation_bytecode.hpp>
#include <verisol/verification/deployed_bytecode.hpp>
#include <verisol/verification/errors.hpp>

namespace verisol {

enum class MatchType {
    kFull,      // Identical code and metadata
    kPartial,   // Identical code, different metadata
    kMismatch,  // Different code
};

enum class BytecodePart {
    kDeployedCode,
    kCreationCode,
    kMetadata,
};

//! \brief Result of comparing the requester data against one compiler output
struct VerificationOutcome {
    MatchType type{MatchType::kMismatch};
    std::optional<BytecodePart> part;         // Diverging part, unset on full match
    std::optional<Mismatch<Bytes>> mismatch;  // Submitted (expected) and compiled (found) bytes of that part

    static VerificationOutcome full_match() { return {MatchType::kFull, std::nullopt, std::nullopt}; }

    //! \brief Whether the contract can be considered verified
    //! \param [in] require_full_match : when set partial matches are not enough
    bool verified(bool require_full_match = false) const {
        return type == MatchType::kFull || (type == MatchType::kPartial && !require_full_match);
    }

    friend bool operator==(const VerificationOutcome&, const VerificationOutcome&) = default;
};

std::string to_string(MatchType type);

std::string to_string(BytecodePart part);

//! \brief Verifier used in contract verification
//! \details Holds the input data provided by the requester, parsed and validated once, so that it can be checked
//! against the outputs of several compilations (e.g. one per candidate compiler version)
class Verifier {
  public:
    //! \brief Instantiates a new verifier with input data provided by the requester
    //! \param [in] contract_name : name of the contract to be verified
    //! \param [in] file_path : file the contract is located at (useful if several files define \p contract_name)
    //! \param [in] creation_tx_input : hex input of the contract creation transaction
    //! \param [in] deployed_bytecode : hex bytecode stored in the chain
    //! \remarks Deployed bytecode is parsed first as it is needed to parse the creation transaction input
    static tl::expected<Verifier, InitializationError> create(std::string contract_name,
                                                              std::optional<std::string> file_path,
                                                              std::string_view creation_tx_input,
                                                              std::string_view deployed_bytecode);

    //! \brief Compares the requester data against the bytecode compiled locally for the same contract
    //! \details Runtime and creation code must be identical for any match; metadata only decides between a full
    //! and a partial one. Constructor arguments are never compared.
    //! \return The comparison outcome or an error when the comparison cannot be performed at all
    tl::expected<VerificationOutcome, VerificationError> verify(const CompilerOutput& output) const;

    const std::string& contract_name() const { return contract_name_; }
    const std::optional<std::string>& file_path() const { return file_path_; }
    const BytecodeWithConstructorArgs& creation_tx_input() const { return bc_creation_tx_input_; }
    const DeployedBytecode& deployed_bytecode() const { return bc_deployed_bytecode_; }

  private:
    Verifier(std::string contract_name, std::optional<std::string> file_path,
             BytecodeWithConstructorArgs creation_tx_input, DeployedBytecode deployed_bytecode)
        : contract_name_{std::move(contract_name)},
          file_path_{std::move(file_path)},
          bc_creation_tx_input_{std::move(creation_tx_input)},
          bc_deployed_bytecode_{std::move(deployed_bytecode)} {}

    tl::expected<const CompiledContract*, VerificationError> find_contract(const CompilerOutput& output) const;

    std::string contract_name_;
    std::optional<std::string> file_path_;
    BytecodeWithConstructorArgs bc_creation_tx_input_;  // Bytecode used on the contract creation transaction
    DeployedBytecode bc_deployed_bytecode_;             // Bytecode stored in the chain and being used by EVM
};

}  // namespace verisol
