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

#include "common.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

#include <absl/time/time.h>
#include <boost/algorithm/string/predicate.hpp>
#include <magic_enum.hpp>

namespace bithash::cmd {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    const auto level_label = [](log::Level level) {
        std::string ret{magic_enum::enum_name(level)};
        ret.erase(0, 1);
        std::ranges::transform(ret, ret.begin(), [](unsigned char c) { return std::tolower(c); });
        return ret;
    };

    std::map<std::string, log::Level, std::less<>> level_mapping;
    for (const auto enumerator : magic_enum::enum_values<log::Level>()) {
        level_mapping.try_emplace(level_label(enumerator), enumerator);
    }

    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->capture_default_str()
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log_settings.log_verbosity);

    log_opts.add_option("--log.timezone", log_settings.log_timezone, "Sets log timezone. If not specified UTC is used")
        ->capture_default_str()
        ->check(TimeZoneValidator(/*allow_empty=*/false))
        ->default_val(log_settings.log_timezone);

    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

TimeZoneValidator::TimeZoneValidator(bool allow_empty) {
    description("a valid time zone name");
    func_ = [allow_empty](const std::string& value) -> std::string {
        if (value.empty()) {
            return allow_empty ? std::string{} : std::string("Time zone cannot be empty");
        }
        if (boost::iequals(value, "UTC")) return {};
        absl::TimeZone time_zone;
        if (not absl::LoadTimeZone(value, &time_zone)) {
            return "Value \"" + value + "\" is not a known time zone";
        }
        return {};
    };
}

}  // namespace bithash::cmd
