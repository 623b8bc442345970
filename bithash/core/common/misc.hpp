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

#include <string>
#include <string_view>

#include <bithash/core/common/base.hpp>
#include <bithash/core/common/outcome.hpp>

namespace bithash {

//! \brief Abridges a string to given length and eventually adds an ellipsis if input length is gt required length
//! \remarks Should length be equal to zero then no abridging occurs
[[nodiscard]] std::string abridge(std::string_view input, size_t length);

//! \brief Parses a string input value representing a size in human-readable format with qualifiers. eg "64KiB"
//! \remarks Only whole numbers are accepted. Suffix matching is case insensitive. No suffix means bytes
[[nodiscard]] outcome::result<uint64_t> parse_human_bytes(std::string_view input);

//! \brief Transforms a size value into it's decimal string representation with suffix (optional binary)
[[nodiscard]] std::string to_human_bytes(size_t input, bool binary = false);

}  // namespace bithash
