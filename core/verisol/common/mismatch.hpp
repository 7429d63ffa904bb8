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
#include <utility>

namespace verisol {

//! \brief Pair of values that were supposed to agree but did not
//! \details Either side may be absent: a missing expected value means there was nothing to compare against, a
//! missing found value means the expected one does not exist in the inspected data
template <class T>
struct Mismatch {
    std::optional<T> expected;
    std::optional<T> found;

    static Mismatch<T> expected_only(T value) { return Mismatch<T>{std::move(value), std::nullopt}; }
    static Mismatch<T> found_only(T value) { return Mismatch<T>{std::nullopt, std::move(value)}; }

    friend bool operator==(const Mismatch<T>&, const Mismatch<T>&) = default;
};

}  // namespace verisol
