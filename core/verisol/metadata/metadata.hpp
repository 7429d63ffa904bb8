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
#include <utility>

#include <verisol/common/base.hpp>

namespace verisol::metadata {

//! Maximum depth of nested CBOR containers accepted inside a metadata blob
inline constexpr size_t kMaxNestingDepth{16};

//! \brief Compiler metadata blob appended to the end of contract bytecode
//! \details The blob is a CBOR map followed by its length as a 2-byte big endian integer. \p raw holds both, so
//! its size is the total number of trailing bytes the blob occupies in the bytecode.
struct Metadata {
    Bytes raw;

    size_t total_length() const { return raw.size(); }

    //! The CBOR encoded map without the trailing length field
    ByteView encoded_map() const { return ByteView{raw}.substr(0, raw.size() - kMetadataLengthFieldSize); }

    friend bool operator==(const Metadata&, const Metadata&) = default;
};

//! \brief Well-known entries of Solidity and Vyper metadata
struct MetadataFields {
    std::optional<std::string> solc_version;   // "0.8.14" or the full prerelease string
    std::optional<std::string> vyper_version;  // "0.3.10"
    std::optional<Bytes> ipfs;                 // IPFS multihash of the metadata JSON
    std::optional<evmc::bytes32> bzzr0;        // Swarm hash (legacy)
    std::optional<evmc::bytes32> bzzr1;        // Swarm hash
    bool experimental{false};                  // Compiled with experimental features
};

//! \brief Checks that \p data holds exactly one well-formed CBOR map and nothing else
//! \remarks Only shortest-form headers with definite lengths are accepted; floating point items are rejected, as
//! are string lengths and item counts exceeding the size of \p data
bool is_well_formed_map(ByteView data);

//! \brief Tries to split a metadata blob off the tail of \p bytecode
//! \return The blob and its total length (CBOR map plus length field) or std::nullopt when the trailing bytes do
//! not describe a well-formed map. Bytecode compiled with metadata disabled simply yields std::nullopt.
std::optional<std::pair<Metadata, size_t>> try_extract_trailing(ByteView bytecode);

//! \brief Best-effort decoding of the well-known metadata entries
std::optional<MetadataFields> decode_fields(const Metadata& metadata);

}  // namespace verisol::metadata
