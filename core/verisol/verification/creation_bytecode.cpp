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

#include "creation_bytecode.hpp"

#include <verisol/common/util.hpp>

namespace verisol {

tl::expected<BytecodeWithConstructorArgs, InitializationError> BytecodeWithConstructorArgs::from_str(
    std::string_view hex, const DeployedBytecode& deployed) {
    auto bytes{from_hex(hex)};
    if (!bytes) {
        return tl::unexpected(InitializationError::invalid_creation_tx_input(hex));
    }

    const auto& deployed_metadata{deployed.metadata()};
    if (!deployed_metadata) {
        return BytecodeWithConstructorArgs{std::move(*bytes), std::nullopt, std::nullopt};
    }

    const ByteView input{*bytes};
    const size_t metadata_start{input.rfind(ByteView{deployed_metadata->raw})};
    if (metadata_start == ByteView::npos) {
        return tl::unexpected(
            InitializationError::metadata_hash_mismatch(Mismatch<Bytes>::expected_only(deployed_metadata->raw)));
    }
    if (metadata_start == 0) {
        return tl::unexpected(InitializationError::invalid_creation_tx_input(hex));
    }

    std::optional<Bytes> constructor_args;
    const size_t args_start{metadata_start + deployed_metadata->total_length()};
    if (args_start < input.size()) {
        constructor_args = Bytes{input.substr(args_start)};
    }
    return BytecodeWithConstructorArgs{Bytes{input.substr(0, metadata_start)}, deployed_metadata,
                                       std::move(constructor_args)};
}

}  // namespace verisol
