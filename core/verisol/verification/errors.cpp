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

#include "errors.hpp"

#include <verisol/common/util.hpp>

namespace verisol {

// Hex strings echoed back in messages may be several kilobytes long
static constexpr size_t kMaxEchoedLength{128};

static std::string optional_to_hex(const std::optional<Bytes>& bytes) {
    return bytes ? to_hex(*bytes, /*with_prefix=*/true) : "none";
}

std::string to_string(const InitializationError& error) {
    switch (error.kind) {
        case InitializationError::Kind::kInvalidCreationTxInput:
            return "creation transaction input is invalid (either is empty or is not a valid hex string): " +
                   abridge(error.input, kMaxEchoedLength);
        case InitializationError::Kind::kInvalidDeployedBytecode:
            return "deployed bytecode is invalid (either is empty or is not a valid hex string): " +
                   abridge(error.input, kMaxEchoedLength);
        case InitializationError::Kind::kMetadataHashMismatch: {
            std::string message{"creation transaction input has different metadata hash to deployed bytecode."};
            if (error.mismatch) {
                message += " expected: " + optional_to_hex(error.mismatch->expected) +
                           ", found: " + optional_to_hex(error.mismatch->found);
            }
            return message;
        }
    }
    return "unknown initialization error";
}

std::string to_string(const VerificationError& error) {
    std::string message;
    switch (error.kind) {
        case VerificationError::Kind::kContractNotFound:
            message = "contract not found in compiler output";
            break;
        case VerificationError::Kind::kAmbiguousContractName:
            message = "contract name is defined in several files, file path required";
            break;
        case VerificationError::Kind::kInvalidCompiledBytecode:
            message = "compiled bytecode is invalid";
            break;
    }
    if (!error.detail.empty()) {
        message += ": " + error.detail;
    }
    return message;
}

}  // namespace verisol
