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

#include "log.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <regex>
#include <thread>

#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <boost/algorithm/string/predicate.hpp>

#include <bithash/infra/os/terminal.hpp>

namespace bithash::log {

namespace {

    struct Sink {
        Settings settings{};
        absl::TimeZone time_zone{absl::UTCTimeZone()};
        bool colors{false};
        std::ofstream file;
        std::mutex mutex;
    };

    Sink& sink() {
        static Sink instance;
        return instance;
    }

    thread_local std::string thread_name;

    struct LevelStyle {
        const char* tag;
        const char* color;
    };

    LevelStyle style_of(Level level) {
        switch (level) {
            using enum Level;
            case kCritical:
                return {" CRIT", kBackgroundRed};
            case kError:
                return {"ERROR", kColorRed};
            case kWarning:
                return {" WARN", kColorYellow};
            case kInfo:
                return {" INFO", kColorGreen};
            case kDebug:
                return {"DEBUG", kBackgroundPurple};
            case kTrace:
                return {"TRACE", kColorCoal};
            default:
                return {"     ", kColorReset};
        }
    }

    absl::TimeZone load_time_zone(const std::string& name) {
        absl::TimeZone ret{absl::UTCTimeZone()};
        if (name.empty() or boost::iequals(name, "UTC")) return ret;
        if (not absl::LoadTimeZone(name, &ret)) {
            std::cerr << "Unknown log time zone " << name << " : using UTC" << std::endl;
        }
        return ret;
    }

    std::string strip_colors(const std::string& line) {
        static const std::regex escape_sequence(R"(\x1b\[[0-9;]+m)");
        return std::regex_replace(line, escape_sequence, "");
    }

    //! \brief Renders a line (colored) and dispatches it to console and file
    void emit(Level level, const std::string& body) {
        auto& out_sink{sink()};
        const auto [tag, color] = style_of(level);

        std::ostringstream line;
        line << color << tag << kColorReset << " " << kColorCyan
             << absl::FormatTime("[%m-%d|%H:%M:%E3S]", absl::Now(), out_sink.time_zone) << kColorReset << " ";
        if (out_sink.settings.log_threads) {
            if (thread_name.empty()) {
                std::ostringstream id;
                id << std::this_thread::get_id();
                thread_name = id.str();
            }
            line << "[" << thread_name << "] ";
        }
        line << body;

        const std::string colored{line.str()};
        const std::string plain{strip_colors(colored)};

        const std::lock_guard lock{out_sink.mutex};
        (out_sink.settings.log_std_out ? std::cout : std::cerr) << (out_sink.colors ? colored : plain) << std::endl;
        if (out_sink.file.is_open()) {
            out_sink.file << plain << std::endl;
        }
    }

}  // namespace

void init(const Settings& settings) {
    auto& out_sink{sink()};
    const std::lock_guard lock{out_sink.mutex};
    out_sink.settings = settings;
    out_sink.time_zone = load_time_zone(settings.log_timezone);
    out_sink.colors = not settings.log_nocolor and console_supports_colors(settings.log_std_out);
    if (out_sink.file.is_open()) out_sink.file.close();
    if (not settings.log_file.empty()) {
        out_sink.file.open(settings.log_file, std::ios::out | std::ios::app);
        if (not out_sink.file.is_open()) {
            std::cerr << "Unable to open log file " << settings.log_file << std::endl;
        }
    }
}

bool test_verbosity(Level level) noexcept { return level <= sink().settings.log_verbosity; }

void set_thread_name(std::string_view name) { thread_name.assign(name); }

void write(Level level, std::string_view message, const std::vector<std::string>& args) {
    if (not test_verbosity(level)) return;
    std::ostringstream body;
    body << std::left << std::setw(24) << message;
    for (size_t i{0}; i < args.size(); ++i) {
        if (i % 2 == 0) {
            body << " " << kColorGreen << args[i] << kColorReset << "=";
        } else {
            body << kColorWhite << args[i] << kColorReset;
        }
    }
    emit(level, body.str());
}

Line::Line(Level level) : level_{level} {}

Line::~Line() {
    if (test_verbosity(level_)) emit(level_, stream_.str());
}

}  // namespace bithash::log
