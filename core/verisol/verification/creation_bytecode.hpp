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
#include <verisol/verification/deployed_bytecode.hpp>
#include <verisol/verification/errors.hpp>

namespace verisol {

//! \brief Input of a contract creation transaction split into its parts
//! \details Mirrors `evm.bytecode.object` of the standard output JSON excluding metadata, plus the ABI encoded
//! constructor arguments appended on contract creation (if any)
class BytecodeWithConstructorArgs {
  public:
    //! \brief Decodes a hex string (optional 0x prefix) and splits it using \p deployed as anchor
    //! \details The creation code embeds a copy of the runtime code followed by the very same metadata blob found
    //! at the end of the deployed bytecode. The last occurrence of that blob delimits the creation code from the
    //! constructor arguments, which carry no length prefix of their own.
    //! \remarks When \p deployed has no metadata the whole input is taken as code
    static tl::expected<BytecodeWithConstructorArgs, InitializationError> from_str(std::string_view hex,
                                                                                   const DeployedBytecode& deployed);

    //! Creation code up to the embedded metadata, never empty
    const Bytes& code() const { return code_; }

    const std::optional<metadata::Metadata>& metadata() const { return metadata_; }

    const std::optional<Bytes>& constructor_args() const { return constructor_args_; }

    friend bool operator==(const BytecodeWithConstructorArgs&, const BytecodeWithConstructorArgs&) = default;

  private:
    BytecodeWithConstructorArgs(Bytes code, std::optional<metadata::Metadata> metadata,
                                std::optional<Bytes> constructor_args)
        : code_{std::move(code)}, metadata_{std::move(metadata)}, constructor_args_{std::move(constructor_args)} {}

    Bytes code_;
    std::optional<metadata::Metadata> metadata_;
    std::optional<Bytes> constructor_args_;
};

using CreationBytecode = BytecodeWithConstructorArgs;

}  // namespace verisol
