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
#include <bithash/core/encoding/errors.hpp>

namespace bithash::enc::hex {

//! \brief Whether provided string begins with "0x" prefix (case insensitive)
//! \param [in] source : string input
//! \return true/false
[[nodiscard]] inline bool has_prefix(std::string_view source) noexcept {
    return source.length() >= 2 && source[0] == '0' && (source[1] == 'x' || source[1] == 'X');
}

//! \brief Returns a string of ascii chars with the (lowercase) hexadecimal representation of input
//! \remark If provided an empty input the return string is empty as well (with prefix if requested)
[[nodiscard]] std::string encode(ByteView bytes, bool with_prefix = false) noexcept;

//! \brief Returns the bytes string obtained by decoding an hexadecimal ascii input
//! \remarks An optional "0x" prefix is skipped. Odd length inputs are treated as having a leading zero nibble
[[nodiscard]] outcome::result<Bytes> decode(std::string_view source) noexcept;

//! \brief Returns the integer value corresponding to the ascii hex digit provided
[[nodiscard]] outcome::result<uint8_t> decode_digit(char input) noexcept;

}  // namespace bithash::enc::hex
