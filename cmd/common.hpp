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

#include <CLI/CLI.hpp>

#include <verisol/common/log.hpp>
#include <verisol/common/settings.hpp>

namespace verisol::cmd {

//! Process exit codes of the verisol tool
enum ExitCode : int {
    kVerified = 0,
    kNotVerified = 1,
    kVerificationFailed = 2,
    kBadInput = 3,
};

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up options describing the contract to verify and the compilations to check it against
void add_verification_options(CLI::App& cli, VerificationSettings& settings);

//! \brief Parses the command line into the options previously set up on \p cli
//! \return The code the process must exit with (help requested or bad command line), std::nullopt to go on
std::optional<int> parse_command_line(CLI::App& cli, int argc, const char* const* argv);

//! \brief Loads hex inputs given as files into \p settings
//! \throws std::runtime_error when a file cannot be read
void load_input_files(VerificationSettings& settings);

}  // namespace verisol::cmd
