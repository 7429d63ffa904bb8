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
#include <string_view>

#include <tl/expected.hpp>

#include <verisol/common/base.hpp>
#include <verisol/metadata/metadata.hpp>
#include <verisol/verification/errors.hpp>

namespace verisol {

//! \brief Bytecode stored in the chain and being executed by the EVM, split into its parts
//! \details Mirrors `evm.deployedBytecode` of the standard output JSON: the actual runtime code participating in
//! transaction execution and, optionally, the metadata appended by the compiler
class DeployedBytecode {
  public:
    //! \brief Decodes a hex string (optional 0x prefix) and splits the trailing metadata off it
    //! \return The decomposed bytecode or kInvalidDeployedBytecode carrying \p hex when it is empty or not hex
    static tl::expected<DeployedBytecode, InitializationError> from_str(std::string_view hex);

    //! Runtime code without metadata, never empty
    const Bytes& code() const { return code_; }

    const std::optional<metadata::Metadata>& metadata() const { return metadata_; }

    //! Keccak-256 of the runtime code without metadata
    evmc::bytes32 code_hash() const;

    friend bool operator==(const DeployedBytecode&, const DeployedBytecode&) = default;

  private:
    DeployedBytecode(Bytes code, std::optional<metadata::Metadata> metadata)
        : code_{std::move(code)}, metadata_{std::move(metadata)} {}

    Bytes code_;
    std::optional<metadata::Metadata> metadata_;
};

}  // namespace verisol
