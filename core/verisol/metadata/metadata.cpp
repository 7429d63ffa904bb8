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

#include "metadata.hpp"

#include <limits>
#include <string>
#include <vector>

#include <cbor/cbor.h>
#include <cbor/listener.h>
#include <nlohmann/json.hpp>

#include <verisol/common/endian.hpp>
#include <verisol/common/util.hpp>

namespace verisol::metadata {

//! Number of bytes taken by a CBOR head whose argument is \p argument (shortest form)
static size_t head_size(uint64_t argument) {
    if (argument < 24) return 1;
    if (argument <= std::numeric_limits<uint8_t>::max()) return 2;
    if (argument <= std::numeric_limits<uint16_t>::max()) return 3;
    if (argument <= std::numeric_limits<uint32_t>::max()) return 5;
    return 9;
}

//! \brief Validates the shape of a CBOR document without building it
//! \details Keeps a stack of items still expected by each open container. The bottom entry stands for the
//! document itself which must be a single map. The encoded size of every item is summed up so that the caller can
//! tell whether the whole input was consumed.
class MapStructureListener : public cbor::listener {
  public:
    explicit MapStructureListener(size_t input_size) : input_size_{input_size} {}

    void on_integer(int value) override {
        const auto argument{value < 0 ? static_cast<uint64_t>(-(static_cast<int64_t>(value) + 1))
                                      : static_cast<uint64_t>(value)};
        scalar(head_size(argument));
    }

    void on_extra_integer(unsigned long long value, int) override {  // NOLINT(google-runtime-int)
        scalar(head_size(value));
    }

    void on_bytes(unsigned char*, int size) override {
        if (size < 0) {
            failed_ = true;
            return;
        }
        scalar(head_size(static_cast<uint64_t>(size)) + static_cast<size_t>(size));
    }

    void on_string(std::string& str) override { scalar(head_size(str.size()) + str.size()); }

    void on_array(int size) override {
        if (size < 0) {
            failed_ = true;
            return;
        }
        container(head_size(static_cast<uint64_t>(size)), static_cast<size_t>(size), /*is_map=*/false);
    }

    void on_map(int size) override {
        if (size < 0) {
            failed_ = true;
            return;
        }
        container(head_size(static_cast<uint64_t>(size)), 2 * static_cast<size_t>(size), /*is_map=*/true);
    }

    void on_tag(unsigned int tag) override { prefix(head_size(tag)); }

    void on_extra_tag(unsigned long long tag) override { prefix(head_size(tag)); }  // NOLINT(google-runtime-int)

    void on_special(unsigned int code) override { scalar(head_size(code)); }

    void on_bool(bool) override { scalar(1); }

    void on_null() override { scalar(1); }

    void on_undefined() override { scalar(1); }

    void on_float32(float) override { failed_ = true; }

    void on_double(double) override { failed_ = true; }

    void on_extra_special(unsigned long long) override { failed_ = true; }  // NOLINT(google-runtime-int)

    void on_error(const char*) override { failed_ = true; }

    bool success() const {
        return !failed_ && pending_.size() == 1 && pending_.front() == 0 && consumed_ == input_size_;
    }

  private:
    bool accept(size_t encoded_size, bool is_map) {
        if (failed_) return false;
        // Anything after the top-level map or a top-level item which is not a map
        if (pending_.back() == 0 || (pending_.size() == 1 && !is_map)) {
            failed_ = true;
            return false;
        }
        consumed_ += encoded_size;
        if (consumed_ > input_size_) {
            failed_ = true;
            return false;
        }
        --pending_.back();
        return true;
    }

    void scalar(size_t encoded_size) {
        if (accept(encoded_size, /*is_map=*/false)) {
            close_completed();
        }
    }

    void container(size_t encoded_size, size_t items, bool is_map) {
        if (!accept(encoded_size, is_map)) return;
        if (items == 0) {
            close_completed();
            return;
        }
        // Every item takes at least one byte
        if (pending_.size() > kMaxNestingDepth || items > input_size_ - consumed_) {
            failed_ = true;
            return;
        }
        pending_.push_back(items);
    }

    void prefix(size_t encoded_size) {
        if (failed_) return;
        if (pending_.back() == 0) {
            failed_ = true;
            return;
        }
        consumed_ += encoded_size;
    }

    void close_completed() {
        while (pending_.size() > 1 && pending_.back() == 0) {
            pending_.pop_back();
        }
    }

    const size_t input_size_;
    size_t consumed_{0};
    bool failed_{false};
    std::vector<size_t> pending_{1};
};

//! \brief Walks the CBOR heads of \p data checking every length and item count against the bytes left
//! \details The decoder allocates string buffers from the declared length before any listener callback runs, so
//! out of range lengths must be rejected beforehand. Reserved and indefinite-length heads are rejected as well.
static bool heads_within_bounds(ByteView data) {
    size_t pos{0};
    while (pos < data.size()) {
        const uint8_t initial{data[pos++]};
        const uint8_t major_type{static_cast<uint8_t>(initial >> 5)};
        const uint8_t additional{static_cast<uint8_t>(initial & 0x1f)};

        uint64_t argument{additional};
        if (additional >= 28) {
            return false;
        }
        if (additional >= 24) {
            const size_t argument_size{size_t{1} << (additional - 24)};
            if (argument_size > data.size() - pos) {
                return false;
            }
            argument = 0;
            for (size_t i{0}; i < argument_size; ++i) {
                argument = (argument << 8) | data[pos++];
            }
        }

        const size_t remaining{data.size() - pos};
        switch (major_type) {
            case 2:  // byte string
            case 3:  // text string
                if (argument > remaining) {
                    return false;
                }
                pos += static_cast<size_t>(argument);
                break;
            case 4:  // array
                if (argument > remaining) {
                    return false;
                }
                break;
            case 5:  // map
                if (argument > remaining / 2) {
                    return false;
                }
                break;
            default:
                break;
        }
    }
    return true;
}

bool is_well_formed_map(ByteView data) {
    if (data.empty() || data.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return false;
    }
    if (!heads_within_bounds(data)) {
        return false;
    }
    cbor::input input(data.data(), static_cast<int>(data.size()));
    MapStructureListener listener{data.size()};
    cbor::decoder decoder(input, listener);
    decoder.run();
    return listener.success();
}

std::optional<std::pair<Metadata, size_t>> try_extract_trailing(ByteView bytecode) {
    if (bytecode.size() < kMetadataLengthFieldSize) {
        return std::nullopt;
    }
    const size_t map_length{endian::load_big_u16(&bytecode[bytecode.size() - kMetadataLengthFieldSize])};
    const size_t total_length{map_length + kMetadataLengthFieldSize};
    if (map_length == 0 || total_length > bytecode.size()) {
        return std::nullopt;
    }

    const ByteView blob{bytecode.substr(bytecode.size() - total_length)};
    if (!is_well_formed_map(blob.substr(0, map_length))) {
        return std::nullopt;
    }
    return std::make_pair(Metadata{Bytes{blob}}, total_length);
}

static std::optional<std::string> version_from_json(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    std::vector<uint64_t> parts;
    if (value.is_binary()) {
        for (const auto b : value.get_binary()) {
            parts.push_back(b);
        }
    } else if (value.is_array()) {
        for (const auto& item : value) {
            if (!item.is_number_unsigned()) return std::nullopt;
            parts.push_back(item.get<uint64_t>());
        }
    }
    if (parts.size() != 3) {
        return std::nullopt;
    }
    return std::to_string(parts[0]) + "." + std::to_string(parts[1]) + "." + std::to_string(parts[2]);
}

static std::optional<evmc::bytes32> swarm_hash_from_json(const nlohmann::json& value) {
    if (!value.is_binary() || value.get_binary().size() != kHashLength) {
        return std::nullopt;
    }
    const auto& binary{value.get_binary()};
    return to_bytes32(ByteView{binary.data(), binary.size()});
}

std::optional<MetadataFields> decode_fields(const Metadata& metadata) {
    const ByteView map{metadata.encoded_map()};
    const auto json = nlohmann::json::from_cbor(map.begin(), map.end(), /*strict=*/true, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    MetadataFields fields{};
    if (json.contains("solc")) {
        fields.solc_version = version_from_json(json["solc"]);
    }
    if (json.contains("vyper")) {
        fields.vyper_version = version_from_json(json["vyper"]);
    }
    if (json.contains("ipfs") && json["ipfs"].is_binary()) {
        const auto& binary{json["ipfs"].get_binary()};
        fields.ipfs = Bytes{binary.data(), binary.size()};
    }
    if (json.contains("bzzr0")) {
        fields.bzzr0 = swarm_hash_from_json(json["bzzr0"]);
    }
    if (json.contains("bzzr1")) {
        fields.bzzr1 = swarm_hash_from_json(json["bzzr1"]);
    }
    if (json.contains("experimental") && json["experimental"].is_boolean()) {
        fields.experimental = json["experimental"].get<bool>();
    }
    return fields;
}

}  // namespace verisol::metadata
