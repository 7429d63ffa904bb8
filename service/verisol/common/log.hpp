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

#ifndef VERISOL_COMMON_LOG_HPP_
#define VERISOL_COMMON_LOG_HPP_

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace verisol::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Unconditional line without severity
    kCritical,  // The process cannot go on (e.g. unreadable input)
    kError,     // A request could not be served
    kWarning,   // A candidate could not be compared
    kInfo,      // Outcome of every comparison
    kDebug,     // Bytecode details (hashes, compiler messages)
    kTrace
};

//! \brief Holds logging configuration
struct Settings {
    bool log_std_out{false};            // Console lines go to std::cout instead of std::cerr
    bool log_utc{false};                // Timestamps in UTC instead of local time
    bool log_nocolor{false};            // Plain console lines
    Level log_verbosity{Level::kInfo};  // Most verbose level written out
    std::string log_file;               // Plain lines are also appended here when set
};

//! \brief Applies \p settings, replacing any previous configuration and tee file
//! \throws std::runtime_error when the tee file cannot be opened
void init(const Settings& settings);

void set_verbosity(Level level);

//! \brief Whether a line of the given level would be written out
bool test_verbosity(Level level);

//! \brief Appends plain log lines to \p path as well
//! \throws std::runtime_error when the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! \brief Accumulates one log line and writes it out on destruction
//! \details Lines read `LEVEL [timestamp] message key1=value1 key2=value2`. Colors are added on the console only.
class BufferBase {
  public:
    explicit BufferBase(Level level);
    //! \param [in] args : alternating keys and values
    BufferBase(Level level, std::string_view msg, const std::vector<std::string>& args);
    ~BufferBase() { flush(); }

    template <class T>
    BufferBase& operator<<(const T& t) {
        if (should_print_) body_ << t;
        return *this;
    }

  protected:
    //! \brief The complete line, optionally decorated with terminal colors
    std::string line(bool colorized) const;

    const Level level_;
    const bool should_print_;

  private:
    void flush();

    std::string timestamp_;
    std::stringstream body_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, std::vector<std::string> args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace verisol::log

#define VERISOL_LOGBUFFER(level_)                \
    if (!verisol::log::test_verbosity(level_)) { \
    } else                                       \
        verisol::log::LogBuffer<level_>()

#define VERISOL_TRACE VERISOL_LOGBUFFER(verisol::log::Level::kTrace)
#define VERISOL_DEBUG VERISOL_LOGBUFFER(verisol::log::Level::kDebug)
#define VERISOL_INFO VERISOL_LOGBUFFER(verisol::log::Level::kInfo)
#define VERISOL_WARN VERISOL_LOGBUFFER(verisol::log::Level::kWarning)
#define VERISOL_ERROR VERISOL_LOGBUFFER(verisol::log::Level::kError)
#define VERISOL_CRIT VERISOL_LOGBUFFER(verisol::log::Level::kCritical)
#define VERISOL_LOG VERISOL_LOGBUFFER(verisol::log::Level::kNone)

#endif  // !VERISOL_COMMON_LOG_HPP_
