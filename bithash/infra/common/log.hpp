/*
   Copyright 2023 The Bithash Authors

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
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace bithash::log {

//! \brief Severity of a log line. A line is emitted when its level is <= the configured verbosity
enum class Level {
    kNone,  // Always emitted (e.g. build info)
    kCritical,
    kError,
    kWarning,
    kInfo,
    kDebug,
    kTrace,
};

//! \brief Logging configuration as populated from the command line
struct Settings {
    Level log_verbosity{Level::kInfo};
    std::string log_timezone{"UTC"};  // UTC or an IANA time zone name (e.g. Europe/Rome)
    bool log_std_out{false};          // Console output to stdout instead of stderr
    bool log_nocolor{false};          // Never colorize console output
    bool log_threads{false};          // Add the thread name to each line
    std::string log_file;             // When not empty lines are also appended (uncolored) to this file
};

//! \brief Applies settings. Lines emitted afterwards honor them
//! \remarks Failing to open the log file is reported on stderr and does not prevent console logging
void init(const Settings& settings);

//! \brief Whether a line of the given level would be emitted
[[nodiscard]] bool test_verbosity(Level level) noexcept;

//! \brief Names the calling thread in log lines (when log_threads is set)
void set_thread_name(std::string_view name);

//! \brief Emits a line made of a message followed by key=value pairs
//! \param args Alternating keys and values
void write(Level level, std::string_view message, const std::vector<std::string>& args = {});

//! \brief Collects a stream-style line and emits it when going out of scope
class Line {
  public:
    explicit Line(Level level);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <class T>
    Line& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

  private:
    const Level level_;
    std::ostringstream stream_;
};

}  // namespace bithash::log

#define BITHASH_LOG(level_)                      \
    if (!bithash::log::test_verbosity(level_)) { \
    } else                                       \
        bithash::log::Line(level_)

#define LOG_TRACE BITHASH_LOG(bithash::log::Level::kTrace)
#define LOG_DEBUG BITHASH_LOG(bithash::log::Level::kDebug)
#define LOG_INFO BITHASH_LOG(bithash::log::Level::kInfo)
#define LOG_WARNING BITHASH_LOG(bithash::log::Level::kWarning)
#define LOG_ERROR BITHASH_LOG(bithash::log::Level::kError)
#define LOG_CRITICAL BITHASH_LOG(bithash::log::Level::kCritical)
