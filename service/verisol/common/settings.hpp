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
#ifndef VERISOL_COMMON_SETTINGS_HPP_
#define VERISOL_COMMON_SETTINGS_HPP_

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace verisol {

struct VerificationSettings {
    std::string contract_name;                                    // Name of the contract to verify
    std::optional<std::string> file_path;                         // Source file defining the contract (if ambiguous)
    std::string creation_tx_input;                                // Hex input of the creation transaction
    std::string deployed_bytecode;                                // Hex bytecode stored in the chain
    std::optional<std::filesystem::path> creation_tx_input_file;  // Read creation_tx_input from file
    std::optional<std::filesystem::path> deployed_bytecode_file;  // Read deployed_bytecode from file
    std::vector<std::filesystem::path> compiler_output_files;     // Standard output JSON, one per compilation
    bool require_full_match{false};                               // Whether partial matches count as verified
};

}  // namespace verisol

#endif  // VERISOL_COMMON_SETTINGS_HPP_
