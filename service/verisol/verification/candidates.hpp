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

#include <cstddef>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <verisol/verification/compiler_output.hpp>
#include <verisol/verification/errors.hpp>
#include <verisol/verification/verifier.hpp>

namespace verisol {

//! \brief One compilation of the candidate sources, e.g. with a given compiler version
struct Candidate {
    std::string label;
    CompilerOutput output;
};

struct CandidateMatch {
    size_t index{0};  // Position of the candidate in the input list
    std::string label;
    VerificationOutcome outcome;
};

//! \brief Verifies the requester data against several candidate compilations
//! \details Candidates are tried in order and the first full match stops the search. Otherwise the first partial
//! match is returned or, when no candidate matched, the last mismatch.
//! \return The selected candidate or the last error when no candidate could be compared at all
tl::expected<CandidateMatch, VerificationError> verify_candidates(const Verifier& verifier,
                                                                  const std::vector<Candidate>& candidates);

}  // namespace verisol
