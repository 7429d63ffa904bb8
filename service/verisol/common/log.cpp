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

#include "log.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace verisol::log {

static Settings settings_{};
static std::mutex out_mtx{};
static std::unique_ptr<std::ofstream> file_{nullptr};

// Width the message is padded to when followed by key/value pairs
static constexpr int kMessageWidth{30};

static constexpr const char* kColorReset{"\x1b[0m"};
static constexpr const char* kColorTimestamp{"\x1b[96m"};

struct LevelStyle {
    const char* label;
    const char* color;
};

static LevelStyle level_style(Level level) {
    switch (level) {
        case Level::kTrace:
            return {"TRACE", "\x1b[90m"};
        case Level::kDebug:
            return {"DEBUG", "\x1b[105m"};
        case Level::kInfo:
            return {" INFO", "\x1b[32m"};
        case Level::kWarning:
            return {" WARN", "\x1b[1;33m"};
        case Level::kError:
            return {"ERROR", "\x1b[91m"};
        case Level::kCritical:
            return {" CRIT", "\x1b[101m"};
        case Level::kNone:
            break;
    }
    return {"     ", kColorReset};
}

void init(const Settings& settings) {
    std::unique_lock out_lck{out_mtx};
    settings_ = settings;
    file_.reset();
    out_lck.unlock();
    if (!settings.log_file.empty()) {
        tee_file(settings.log_file);
    }
}

void tee_file(const std::filesystem::path& path) {
    auto file{std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app)};
    if (!file->is_open()) {
        throw std::runtime_error("Could not open log file " + path.string());
    }
    std::unique_lock out_lck{out_mtx};
    file_ = std::move(file);
}

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

BufferBase::BufferBase(Level level) : level_{level}, should_print_{test_verbosity(level)} {
    if (!should_print_) return;
    const absl::TimeZone tz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    timestamp_ = absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), tz);
}

BufferBase::BufferBase(Level level, std::string_view msg, const std::vector<std::string>& args) : BufferBase(level) {
    if (!should_print_) return;
    if (args.empty()) {
        body_ << msg;
        return;
    }
    body_ << std::left << std::setw(kMessageWidth) << std::setfill(' ') << msg;
    for (size_t i{0}; i < args.size(); i += 2) {
        body_ << ' ' << args[i];
        if (i + 1 < args.size()) {
            body_ << '=' << args[i + 1];
        }
    }
}

std::string BufferBase::line(bool colorized) const {
    const auto [label, color] = level_style(level_);
    std::string out;
    if (colorized) {
        out.append(color).append(label).append(kColorReset);
        out.append(" ").append(kColorTimestamp).append("[" + timestamp_ + "]").append(kColorReset);
    } else {
        out.append(label).append(" [" + timestamp_ + "]");
    }
    return out + " " + body_.str();
}

void BufferBase::flush() {
    if (!should_print_) return;
    std::unique_lock out_lck{out_mtx};
    auto& console{settings_.log_std_out ? std::cout : std::cerr};
    console << line(!settings_.log_nocolor) << std::endl;
    if (file_) {
        *file_ << line(/*colorized=*/false) << std::endl;
    }
}

}  // namespace verisol::log
