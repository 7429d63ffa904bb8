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
#include <utility>

#include <verisol/common/base.hpp>
#include <verisol/common/mismatch.hpp>

namespace verisol {

//! \brief Errors that may occur while setting up a Verifier with the data provided by the requester
struct InitializationError {
    enum class Kind {
        kInvalidCreationTxInput,   // Creation transaction input is empty or is not a valid hex string
        kInvalidDeployedBytecode,  // Deployed bytecode is empty or is not a valid hex string
        kMetadataHashMismatch,     // Creation transaction input does not embed the deployed metadata
    };

    Kind kind;
    std::string input;                        // Offending input as supplied (invalid hex errors)
    std::optional<Mismatch<Bytes>> mismatch;  // Expected and found metadata (metadata errors)

    static InitializationError invalid_creation_tx_input(std::string_view input) {
        return {Kind::kInvalidCreationTxInput, std::string{input}, std::nullopt};
    }
    static InitializationError invalid_deployed_bytecode(std::string_view input) {
        return {Kind::kInvalidDeployedBytecode, std::string{input}, std::nullopt};
    }
    static InitializationError metadata_hash_mismatch(Mismatch<Bytes> mismatch) {
        return {Kind::kMetadataHashMismatch, {}, std::move(mismatch)};
    }

    friend bool operator==(const InitializationError&, const InitializationError&) = default;
};

//! \brief Errors preventing the comparison of the requester data against a compiler output
//! \remarks A bytecode mismatch is not an error: it is reported by VerificationOutcome
struct VerificationError {
    enum class Kind {
        kContractNotFound,         // No contract with the requested name (and file) in the compiler output
        kAmbiguousContractName,    // Several files define the requested contract and no file path was given
        kInvalidCompiledBytecode,  // Compiled bytecode cannot be decomposed (empty, unlinked, malformed)
    };

    Kind kind;
    std::string detail;

    friend bool operator==(const VerificationError&, const VerificationError&) = default;
};

std::string to_string(const InitializationError& error);

std::string to_string(const VerificationError& error);

}  // namespace verisol
