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

#include <limits>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include <bithash/core/common/misc.hpp>

namespace bithash::cmd::common {

//! \brief Accepts human readable sizes (e.g. "64KiB") within [min..max]
struct SizeValidator : public CLI::Validator {
    explicit SizeValidator(const std::string& min, std::optional<std::string> max = std::nullopt,
                           const std::string& validator_name = std::string{})
        : CLI::Validator{validator_name} {
        const std::string range{"[" + min + ".." + max.value_or("max") + "]"};
        description(" in " + range);

        func_ = [min, max, range](const std::string& value) -> std::string {
            const auto parsed_size{parse_human_bytes(value)};
            if (parsed_size.has_error()) {
                return "Value \"" + value + "\" is not a parseable size";
            }
            const auto min_size{parse_human_bytes(min).value()};
            const auto max_size{max.has_value() ? parse_human_bytes(*max).value()
                                                : std::numeric_limits<uint64_t>::max()};
            if (parsed_size.value() < min_size or parsed_size.value() > max_size) {
                return "Value \"" + value + "\" not in range " + range;
            }
            return {};
        };
    }
};
}  // namespace bithash::cmd::common
