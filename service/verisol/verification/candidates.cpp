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

#include "candidates.hpp"

#include <optional>

#include <verisol/common/log.hpp>
#include <verisol/common/util.hpp>

namespace verisol {

tl::expected<CandidateMatch, VerificationError> verify_candidates(const Verifier& verifier,
                                                                  const std::vector<Candidate>& candidates) {
    if (candidates.empty()) {
        return tl::unexpected(
            VerificationError{VerificationError::Kind::kContractNotFound, "no compiler output to search"});
    }

    VERISOL_DEBUG << "Verifying " << verifier.contract_name() << " runtime code hash "
                  << to_hex(verifier.deployed_bytecode().code_hash(), /*with_prefix=*/true) << " against "
                  << candidates.size() << " candidate(s)";

    std::optional<CandidateMatch> partial_match;
    std::optional<CandidateMatch> last_mismatch;
    std::optional<VerificationError> last_error;

    for (size_t i{0}; i < candidates.size(); ++i) {
        const auto& candidate{candidates[i]};
        const auto outcome{verifier.verify(candidate.output)};
        if (!outcome) {
            log::Warning("Candidate not comparable", {"contract", verifier.contract_name(), "candidate",
                                                       candidate.label, "error", to_string(outcome.error())});
            for (const auto& message : candidate.output.errors) {
                VERISOL_DEBUG << "Compiler error in " << candidate.label << ": " << message;
            }
            last_error = outcome.error();
            continue;
        }

        log::Info("Candidate compared", {"contract", verifier.contract_name(), "candidate", candidate.label,
                                         "result", to_string(outcome->type)});
        if (outcome->type == MatchType::kMismatch && outcome->part) {
            VERISOL_DEBUG << "Diverging " << to_string(*outcome->part) << " for " << candidate.label;
        }

        switch (outcome->type) {
            case MatchType::kFull:
                return CandidateMatch{i, candidate.label, *outcome};
            case MatchType::kPartial:
                if (!partial_match) {
                    partial_match = CandidateMatch{i, candidate.label, *outcome};
                }
                break;
            case MatchType::kMismatch:
                last_mismatch = CandidateMatch{i, candidate.label, *outcome};
                break;
        }
    }

    if (partial_match) {
        return *partial_match;
    }
    if (last_mismatch) {
        return *last_mismatch;
    }
    return tl::unexpected(*last_error);
}

}  // namespace verisol
