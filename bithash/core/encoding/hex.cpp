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

#include "hex.hpp"

#include <array>

namespace bithash::enc::hex {

namespace {
    constexpr std::string_view kHexDigits{"0123456789abcdef"};

    // Maps an ascii char to its nibble value or 0xff when not an hex digit
    constexpr std::array<uint8_t, 256> kUnhexTable{[]() {
        std::array<uint8_t, 256> table{};
        table.fill(0xff);
        for (uint8_t i{0}; i < 10; ++i) table['0' + i] = i;
        for (uint8_t i{0}; i < 6; ++i) {
            table['a' + i] = static_cast<uint8_t>(10 + i);
            table['A' + i] = static_cast<uint8_t>(10 + i);
        }
        return table;
    }()};
}  // namespace

std::string encode(ByteView bytes, bool with_prefix) noexcept {
    std::string ret(bytes.length() * 2 + (with_prefix ? 2 : 0), '\0');
    auto* dest{ret.data()};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto byte : bytes) {
        *dest++ = kHexDigits[byte >> 4];
        *dest++ = kHexDigits[byte & 0x0f];
    }
    return ret;
}

outcome::result<uint8_t> decode_digit(char input) noexcept {
    const auto value{kUnhexTable[static_cast<uint8_t>(input)]};
    if (value == 0xff) return Error::kIllegalHexDigit;
    return value;
}

outcome::result<Bytes> decode(std::string_view source) noexcept {
    if (has_prefix(source)) source.remove_prefix(2);
    if (source.empty()) return Bytes{};

    const size_t pos{source.length() & 1};  // "[0x]1" is legit and has to be treated as "[0x]01"
    Bytes ret((source.length() + pos) / 2, 0);
    auto* dest{ret.data()};

    if (pos != 0U) {
        const auto nibble{decode_digit(source.front())};
        if (not nibble) return nibble.error();
        *dest++ = nibble.value();
        source.remove_prefix(1);
    }

    for (size_t i{0}; i < source.length(); i += 2) {
        const auto hi{decode_digit(source[i])};
        if (not hi) return hi.error();
        const auto lo{decode_digit(source[i + 1])};
        if (not lo) return lo.error();
        *dest++ = static_cast<uint8_t>((hi.value() << 4) | lo.value());
    }
    return ret;
}

}  // namespace bithash::enc::hex
