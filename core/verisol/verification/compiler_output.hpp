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

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace verisol {

//! \brief Bytecode produced by the compiler for a single contract, as hex strings
struct CompiledContract {
    std::string creation_code;  // evm.bytecode.object
    std::string runtime_code;   // evm.deployedBytecode.object

    friend bool operator==(const CompiledContract&, const CompiledContract&) = default;
};

//! \brief The subset of the Solidity standard output JSON needed for verification
//! \see https://docs.soliditylang.org/en/latest/using-the-compiler.html#output-description
struct CompilerOutput {
    //! Source file path -> contract name -> compiled contract
    std::map<std::string, std::map<std::string, CompiledContract>> contracts;

    //! Messages of the reported errors having severity "error"
    std::vector<std::string> errors;

    //! \brief Builds the compiler output from standard output JSON
    //! \return std::nullopt when \p json has no "contracts" object
    //! \remarks Contracts lacking the bytecode objects (e.g. not requested in outputSelection) are skipped
    static std::optional<CompilerOutput> from_json(const nlohmann::json& json) noexcept;
};

}  // namespace verisol
