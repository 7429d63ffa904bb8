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

#include "verifier.hpp"

#include <catch2/catch.hpp>

#include <verisol/common/test_util.hpp>
#include <verisol/common/util.hpp>

namespace verisol {

static Verifier default_verifier(std::optional<std::string> file_path = std::nullopt) {
    auto verifier{Verifier::create(std::string{test::kDefaultContractName}, std::move(file_path),
                                   test::default_creation_tx_input(), test::default_deployed_bytecode())};
    REQUIRE(verifier);
    return std::move(*verifier);
}

static CompilerOutput parse_output(const nlohmann::json& json) {
    auto output{CompilerOutput::from_json(json)};
    REQUIRE(output);
    return std::move(*output);
}

TEST_CASE("Verifier initialization") {
    const std::string contract_name{test::kDefaultContractName};

    SECTION("valid data without hex prefix") {
        const auto verifier{
            Verifier::create(contract_name, std::nullopt, test::default_creation_tx_input(),
                             test::default_deployed_bytecode())};
        REQUIRE(verifier);
        CHECK(verifier->contract_name() == contract_name);
        CHECK_FALSE(verifier->file_path());
        REQUIRE(verifier->creation_tx_input().constructor_args());
        CHECK(to_hex(*verifier->creation_tx_input().constructor_args()) == test::kDefaultConstructorArgs);
    }

    SECTION("valid data with hex prefix") {
        const auto verifier{Verifier::create(contract_name, std::string{test::kDefaultFilePath},
                                             "0x" + test::default_creation_tx_input(),
                                             "0x" + test::default_deployed_bytecode())};
        REQUIRE(verifier);
        CHECK(verifier->file_path() == std::string{test::kDefaultFilePath});
        CHECK(verifier->deployed_bytecode() == *DeployedBytecode::from_str(test::default_deployed_bytecode()));
    }

    SECTION("empty creation transaction input") {
        const auto verifier{Verifier::create(contract_name, std::nullopt, "", test::default_deployed_bytecode())};
        REQUIRE_FALSE(verifier);
        CHECK(verifier.error() == InitializationError::invalid_creation_tx_input(""));
    }

    SECTION("creation transaction input as invalid hex") {
        const std::string_view invalid_input{"0xabcdefghij"};
        const auto verifier{
            Verifier::create(contract_name, std::nullopt, invalid_input, test::default_deployed_bytecode())};
        REQUIRE_FALSE(verifier);
        CHECK(verifier.error() == InitializationError::invalid_creation_tx_input(invalid_input));
    }

    SECTION("empty deployed bytecode") {
        const auto verifier{Verifier::create(contract_name, std::nullopt, test::default_creation_tx_input(), "")};
        REQUIRE_FALSE(verifier);
        CHECK(verifier.error() == InitializationError::invalid_deployed_bytecode(""));
    }

    SECTION("deployed bytecode as invalid hex") {
        const std::string_view invalid_input{"0xabcdefghij"};
        const auto verifier{
            Verifier::create(contract_name, std::nullopt, test::default_creation_tx_input(), invalid_input)};
        REQUIRE_FALSE(verifier);
        CHECK(verifier.error() == InitializationError::invalid_deployed_bytecode(invalid_input));
    }

    SECTION("deployed bytecode is checked first") {
        const auto verifier{Verifier::create(contract_name, std::nullopt, "", "")};
        REQUIRE_FALSE(verifier);
        CHECK(verifier.error().kind == InitializationError::Kind::kInvalidDeployedBytecode);
    }

    SECTION("metadata hash mismatch") {
        const std::string creation_tx_input{std::string{test::kDefaultBytecodeWithoutMetadata} +
                                            std::string{test::kAnotherEncodedMetadata}};
        const auto verifier{
            Verifier::create(contract_name, std::nullopt, creation_tx_input, test::default_deployed_bytecode())};
        REQUIRE_FALSE(verifier);
        const auto& error{verifier.error()};
        CHECK(error == InitializationError::metadata_hash_mismatch(
                           Mismatch<Bytes>::expected_only(*from_hex(test::kDefaultEncodedMetadata))));
        CHECK(to_string(error).find("different metadata hash") != std::string::npos);
        CHECK(to_string(error).find("found: none") != std::string::npos);
    }
}

TEST_CASE("Verifier verification") {
    const Verifier verifier{default_verifier()};

    SECTION("full match") {
        const auto outcome{verifier.verify(parse_output(test::default_compiler_output_json()))};
        REQUIRE(outcome);
        CHECK(*outcome == VerificationOutcome::full_match());
        CHECK(outcome->verified());
        CHECK(outcome->verified(/*require_full_match=*/true));
    }

    SECTION("partial match on different metadata") {
        const auto outcome{verifier.verify(parse_output(test::default_compiler_output_json(test::kAnotherEncodedMetadata)))};
        REQUIRE(outcome);
        CHECK(outcome->type == MatchType::kPartial);
        CHECK(outcome->part == BytecodePart::kMetadata);
        REQUIRE(outcome->mismatch);
        CHECK(outcome->mismatch->expected == from_hex(test::kDefaultEncodedMetadata));
        CHECK(outcome->mismatch->found == from_hex(test::kAnotherEncodedMetadata));
        CHECK(outcome->verified());
        CHECK_FALSE(outcome->verified(/*require_full_match=*/true));
    }

    SECTION("different deployed code") {
        const std::string metadata{test::kDefaultEncodedMetadata};
        const auto output{parse_output(test::compiler_output_json(
            test::kDefaultFilePath, test::kDefaultContractName,
            std::string{test::kDefaultBytecodeWithoutMetadata} + metadata,
            "00" + std::string{test::kDefaultDeployedBytecodeWithoutMetadata} + metadata))};
        const auto outcome{verifier.verify(output)};
        REQUIRE(outcome);
        CHECK(outcome->type == MatchType::kMismatch);
        CHECK(outcome->part == BytecodePart::kDeployedCode);
        REQUIRE(outcome->mismatch);
        CHECK(outcome->mismatch->expected == from_hex(test::kDefaultDeployedBytecodeWithoutMetadata));
        CHECK(outcome->mismatch->found == from_hex("00" + std::string{test::kDefaultDeployedBytecodeWithoutMetadata}));
        CHECK_FALSE(outcome->verified());
    }

    SECTION("different creation code") {
        const std::string metadata{test::kDefaultEncodedMetadata};
        const auto output{parse_output(test::compiler_output_json(
            test::kDefaultFilePath, test::kDefaultContractName,
            "00" + std::string{test::kDefaultBytecodeWithoutMetadata} + metadata,
            std::string{test::kDefaultDeployedBytecodeWithoutMetadata} + metadata))};
        const auto outcome{verifier.verify(output)};
        REQUIRE(outcome);
        CHECK(outcome->type == MatchType::kMismatch);
        CHECK(outcome->part == BytecodePart::kCreationCode);
        REQUIRE(outcome->mismatch);
        CHECK(outcome->mismatch->expected == from_hex(test::kDefaultBytecodeWithoutMetadata));
        CHECK_FALSE(outcome->verified());
    }

    SECTION("different code and metadata reports the code") {
        const std::string metadata{test::kAnotherEncodedMetadata};
        const auto output{parse_output(test::compiler_output_json(
            test::kDefaultFilePath, test::kDefaultContractName,
            std::string{test::kDefaultBytecodeWithoutMetadata} + metadata,
            "fe" + std::string{test::kDefaultDeployedBytecodeWithoutMetadata} + metadata))};
        const auto outcome{verifier.verify(output)};
        REQUIRE(outcome);
        CHECK(outcome->type == MatchType::kMismatch);
        CHECK(outcome->part == BytecodePart::kDeployedCode);
    }

    SECTION("repeated verification gives the same outcome") {
        const auto output{parse_output(test::default_compiler_output_json(test::kAnotherEncodedMetadata))};
        const auto first{verifier.verify(output)};
        const auto second{verifier.verify(output)};
        REQUIRE((first && second));
        CHECK(*first == *second);
    }

    SECTION("contract not found") {
        const auto output{parse_output(test::compiler_output_json(
            test::kDefaultFilePath, "Other", test::default_creation_tx_input(), test::default_deployed_bytecode()))};
        const auto outcome{verifier.verify(output)};
        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().kind == VerificationError::Kind::kContractNotFound);
    }

    SECTION("invalid compiled bytecode") {
        const auto output{parse_output(
            test::compiler_output_json(test::kDefaultFilePath, test::kDefaultContractName, "", ""))};
        const auto outcome{verifier.verify(output)};
        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().kind == VerificationError::Kind::kInvalidCompiledBytecode);
    }

    SECTION("unlinked library placeholder") {
        const std::string metadata{test::kDefaultEncodedMetadata};
        const auto output{parse_output(test::compiler_output_json(
            test::kDefaultFilePath, test::kDefaultContractName,
            std::string{test::kDefaultBytecodeWithoutMetadata} + metadata,
            "73__$cb3c9e1ae9d8d56cc4a7bfb4cd0ae4a43b$__" + std::string{test::kDefaultDeployedBytecodeWithoutMetadata} +
                metadata))};
        const auto outcome{verifier.verify(output)};
        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().kind == VerificationError::Kind::kInvalidCompiledBytecode);
        CHECK(to_string(outcome.error()).find("runtime code") != std::string::npos);
    }
}

TEST_CASE("Verifier on bytecode compiled without metadata") {
    // Deployed code carries no metadata: the creation input cannot be split and keeps its constructor arguments
    const std::string creation_tx_input{std::string{test::kDefaultBytecodeWithoutMetadata} +
                                        std::string{test::kDefaultConstructorArgs}};
    const auto verifier{Verifier::create(std::string{test::kDefaultContractName}, std::nullopt, creation_tx_input,
                                         test::kDefaultDeployedBytecodeWithoutMetadata)};
    REQUIRE(verifier);
    CHECK_FALSE(verifier->deployed_bytecode().metadata());
    CHECK_FALSE(verifier->creation_tx_input().metadata());
    CHECK_FALSE(verifier->creation_tx_input().constructor_args());
    CHECK(to_hex(verifier->creation_tx_input().code()) == creation_tx_input);

    SECTION("compiled without metadata") {
        const auto outcome{verifier->verify(parse_output(test::compiler_output_json(
            test::kDefaultFilePath, test::kDefaultContractName, test::kDefaultBytecodeWithoutMetadata,
            test::kDefaultDeployedBytecodeWithoutMetadata)))};
        REQUIRE(outcome);
        CHECK(*outcome == VerificationOutcome::full_match());
    }

    SECTION("compiled with metadata") {
        const auto outcome{verifier->verify(parse_output(test::default_compiler_output_json()))};
        REQUIRE(outcome);
        CHECK(outcome->type == MatchType::kPartial);
        CHECK(outcome->part == BytecodePart::kMetadata);
        REQUIRE(outcome->mismatch);
        CHECK(*outcome->mismatch == Mismatch<Bytes>::found_only(*from_hex(test::kDefaultEncodedMetadata)));
    }

    SECTION("compiled creation code is not a prefix") {
        const auto outcome{verifier->verify(parse_output(test::compiler_output_json(
            test::kDefaultFilePath, test::kDefaultContractName,
            "00" + std::string{test::kDefaultBytecodeWithoutMetadata}, test::kDefaultDeployedBytecodeWithoutMetadata)))};
        REQUIRE(outcome);
        CHECK(outcome->type == MatchType::kMismatch);
        CHECK(outcome->part == BytecodePart::kCreationCode);
        REQUIRE(outcome->mismatch);
        CHECK(outcome->mismatch->expected == from_hex(creation_tx_input));
        CHECK(outcome->mismatch->found == from_hex("00" + std::string{test::kDefaultBytecodeWithoutMetadata}));
    }
}

TEST_CASE("Verifier against bytecode compiled without metadata") {
    const Verifier verifier{default_verifier()};
    const auto outcome{verifier.verify(parse_output(
        test::compiler_output_json(test::kDefaultFilePath, test::kDefaultContractName,
                                   test::kDefaultBytecodeWithoutMetadata, test::kDefaultDeployedBytecodeWithoutMetadata)))};
    REQUIRE(outcome);
    CHECK(outcome->type == MatchType::kPartial);
    CHECK(outcome->part == BytecodePart::kMetadata);
    REQUIRE(outcome->mismatch);
    CHECK(*outcome->mismatch == Mismatch<Bytes>::expected_only(*from_hex(test::kDefaultEncodedMetadata)));
}

TEST_CASE("Verifier contract lookup") {
    const std::string metadata{test::kDefaultEncodedMetadata};
    nlohmann::json json{test::default_compiler_output_json()};
    json["contracts"]["contracts/Other.sol"][std::string{test::kDefaultContractName}] =
        test::compiler_output_json("contracts/Other.sol", test::kDefaultContractName,
                                   "00" + std::string{test::kDefaultBytecodeWithoutMetadata} + metadata,
                                   "00" + std::string{test::kDefaultDeployedBytecodeWithoutMetadata} + metadata)
            ["contracts"]["contracts/Other.sol"][std::string{test::kDefaultContractName}];
    const CompilerOutput output{parse_output(json)};

    SECTION("ambiguous name without file path") {
        const auto outcome{default_verifier().verify(output)};
        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().kind == VerificationError::Kind::kAmbiguousContractName);
    }

    SECTION("file path disambiguates") {
        const auto matching{default_verifier(std::string{test::kDefaultFilePath}).verify(output)};
        REQUIRE(matching);
        CHECK(matching->type == MatchType::kFull);

        const auto other{default_verifier("contracts/Other.sol").verify(output)};
        REQUIRE(other);
        CHECK(other->type == MatchType::kMismatch);
    }

    SECTION("unknown file path") {
        const auto outcome{default_verifier("contracts/Missing.sol").verify(output)};
        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().kind == VerificationError::Kind::kContractNotFound);
        CHECK(outcome.error().detail == "contracts/Missing.sol:Contract");
    }
}

TEST_CASE("Verification outcome names") {
    CHECK(to_string(MatchType::kFull) == "full match");
    CHECK(to_string(MatchType::kPartial) == "partial match");
    CHECK(to_string(MatchType::kMismatch) == "mismatch");
    CHECK(to_string(BytecodePart::kMetadata) == "metadata");
}

}  // namespace verisol
