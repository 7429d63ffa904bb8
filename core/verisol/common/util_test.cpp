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

#include "util.hpp"

#include <catch2/catch.hpp>

namespace verisol {

TEST_CASE("Hex") {
    CHECK(from_hex("0F") == Bytes{0x0f});
    CHECK(from_hex("0g").has_value() == false);

    CHECK(from_hex("").has_value() == false);
    CHECK(from_hex("0x").has_value() == false);
    CHECK(from_hex("0X").has_value() == false);
    CHECK(from_hex("0xg").has_value() == false);
    CHECK(from_hex("0xabcdefghij").has_value() == false);

    SECTION("odd number of digits") {
        CHECK(from_hex("0").has_value() == false);
        CHECK(from_hex("0xa").has_value() == false);
        CHECK(from_hex("0xa1f").has_value() == false);
    }

    Bytes expected_bytes{0x0a};
    auto parsed_bytes = from_hex("0x0a");
    CHECK((parsed_bytes.has_value() == true && parsed_bytes.value() == expected_bytes));

    expected_bytes = {0x0a, 0x1f};
    parsed_bytes = from_hex("0a1f");
    CHECK((parsed_bytes.has_value() == true && parsed_bytes.value() == expected_bytes));

    std::string src(24, '1');
    Bytes expected(12, 0x11);
    for (size_t i = 0; i < 24; ++i) {
        auto parsed = from_hex(src);
        CHECK((parsed.has_value() == true && parsed.value() == expected));
        src[i] = 'g';
        CHECK(from_hex(src).has_value() == false);
        src[i] = '1';
    }
}

TEST_CASE("Hex prefix and case insensitivity") {
    const std::string_view lower{"608060405234801561001057600080fd5b50"};
    const std::string upper{"608060405234801561001057600080FD5B50"};
    const auto plain{from_hex(lower)};
    REQUIRE(plain.has_value());

    CHECK(from_hex("0x" + std::string{lower}) == plain);
    CHECK(from_hex("0X" + std::string{lower}) == plain);
    CHECK(from_hex(upper) == plain);
    CHECK(from_hex("0x" + upper) == plain);

    CHECK(to_hex(*plain) == lower);
    CHECK(to_hex(*plain, /*with_prefix=*/true) == "0x" + std::string{lower});
}

TEST_CASE("Abridge") {
    CHECK(abridge("0x6080", 10) == "0x6080");
    CHECK(abridge("0x608060405234", 6) == "0x6080...");
}

TEST_CASE("to_bytes32") {
    CHECK(to_hex(to_bytes32(*from_hex("05"))) ==
          "0000000000000000000000000000000000000000000000000000000000000005");
    CHECK(to_bytes32(ByteView{}) == evmc::bytes32{});
}

TEST_CASE("Keccak-256") {
    CHECK(to_hex(to_bytes32({keccak256(ByteView{}).bytes, kHashLength})) ==
          "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

}  // namespace verisol
