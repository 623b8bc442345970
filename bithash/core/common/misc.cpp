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

#include "misc.hpp"

#include <array>
#include <limits>
#include <regex>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/format.hpp>
#include <gsl/gsl_util>

#include <bithash/core/encoding/errors.hpp>

namespace bithash {

std::string abridge(std::string_view input, size_t length) {
    if (length == 0U or input.length() <= length) return std::string(input);
    return std::string(input.substr(0, length)) + "...";
}

outcome::result<uint64_t> parse_human_bytes(std::string_view input) {
    if (input.empty()) return 0ULL;

    static const std::regex pattern{R"(^(\d{1,15})\ *(B|KB|MB|GB|KiB|MiB|GiB)?$)", std::regex_constants::icase};
    const std::string input_str{input};
    std::smatch matches;
    if (not std::regex_match(input_str, matches, pattern)) {
        return enc::Error::kInvalidInput;
    }

    static const std::array<std::pair<std::string_view, uint64_t>, 7> multipliers{{
        {"B", 1},
        {"KB", kKB},
        {"MB", kMB},
        {"GB", kGB},
        {"KiB", kKiB},
        {"MiB", kMiB},
        {"GiB", kGiB},
    }};

    uint64_t multiplier{1};
    if (const std::string suffix{matches[2].str()}; not suffix.empty()) {
        const auto it{std::ranges::find_if(
            multipliers, [&suffix](const auto& item) { return boost::iequals(item.first, suffix); })};
        if (it == multipliers.end()) return enc::Error::kInvalidInput;
        multiplier = it->second;
    }

    const uint64_t value{std::stoull(matches[1].str())};
    if (value > std::numeric_limits<uint64_t>::max() / multiplier) {
        return enc::Error::kInputTooLarge;
    }
    return value * multiplier;
}

std::string to_human_bytes(const size_t input, bool binary) {
    static const std::array<const char*, 4> suffixes{"B", "KB", "MB", "GB"};             // Must have same ..
    static const std::array<const char*, 4> binary_suffixes{"B", "KiB", "MiB", "GiB"};  // ...number of items
    const auto divisor{gsl::narrow_cast<double>(binary ? kKiB : kKB)};
    size_t index{0};
    auto value{static_cast<double>(input)};
    while (value >= divisor and index < suffixes.size() - 1) {
        value /= divisor;
        ++index;
    }
    const std::string formatter{index > 0U ? "%.02f %s" : "%.0f %s"};
    return boost::str(boost::format(formatter) % value % (binary ? binary_suffixes[index] : suffixes[index]));
}

}  // namespace bithash
