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

#include "deployed_bytecode.hpp"

#include <verisol/common/util.hpp>

namespace verisol {

tl::expected<DeployedBytecode, InitializationError> DeployedBytecode::from_str(std::string_view hex) {
    auto bytes{from_hex(hex)};
    if (!bytes) {
        return tl::unexpected(InitializationError::invalid_deployed_bytecode(hex));
    }

    auto extracted{metadata::try_extract_trailing(*bytes)};
    if (!extracted) {
        return DeployedBytecode{std::move(*bytes), std::nullopt};
    }

    auto& [trailing_metadata, total_length] = *extracted;
    if (total_length == bytes->size()) {
        // Nothing left to execute
        return tl::unexpected(InitializationError::invalid_deployed_bytecode(hex));
    }
    bytes->resize(bytes->size() - total_length);
    return DeployedBytecode{std::move(*bytes), std::move(trailing_metadata)};
}

evmc::bytes32 DeployedBytecode::code_hash() const {
    const ethash::hash256 hash{keccak256(code_)};
    return to_bytes32(ByteView{hash.bytes});
}

}  // namespace verisol
