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

#include "compiler_output.hpp"

namespace verisol {

static const nlohmann::json* find_member(const nlohmann::json& json, const char* key) {
    if (!json.is_object()) {
        return nullptr;
    }
    const auto it{json.find(key)};
    return it == json.end() ? nullptr : &*it;
}

static std::optional<std::string> read_bytecode_object(const nlohmann::json& evm, const char* key) {
    const auto* bytecode{find_member(evm, key)};
    if (!bytecode) {
        return std::nullopt;
    }
    const auto* object{find_member(*bytecode, "object")};
    if (!object || !object->is_string()) {
        return std::nullopt;
    }
    return object->get<std::string>();
}

std::optional<CompilerOutput> CompilerOutput::from_json(const nlohmann::json& json) noexcept {
    const auto* contracts{find_member(json, "contracts")};
    if (json.is_discarded() || !contracts || !contracts->is_object()) {
        return std::nullopt;
    }

    CompilerOutput output{};
    for (const auto& [file_path, file_contracts] : contracts->items()) {
        if (!file_contracts.is_object()) {
            continue;
        }
        for (const auto& [contract_name, contract] : file_contracts.items()) {
            const auto* evm{find_member(contract, "evm")};
            if (!evm) {
                continue;
            }
            auto creation_code{read_bytecode_object(*evm, "bytecode")};
            auto runtime_code{read_bytecode_object(*evm, "deployedBytecode")};
            if (!creation_code || !runtime_code) {
                continue;
            }
            output.contracts[file_path][contract_name] = {std::move(*creation_code), std::move(*runtime_code)};
        }
    }

    if (const auto* errors{find_member(json, "errors")}; errors && errors->is_array()) {
        for (const auto& error : *errors) {
            const auto* severity{find_member(error, "severity")};
            if (!severity || !severity->is_string() || severity->get<std::string>() != "error") {
                continue;
            }
            const auto* message{find_member(error, "formattedMessage")};
            if (!message || !message->is_string()) {
                message = find_member(error, "message");
            }
            if (message && message->is_string()) {
                output.errors.push_back(message->get<std::string>());
            }
        }
    }

    return output;
}

}  // namespace verisol
