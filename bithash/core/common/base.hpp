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

// clang-format off
#include <bithash/core/common/preprocessor.hpp>  // Must be first
// clang-format on

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <bithash/buildinfo.h>

namespace bithash {

//! \brief Used to allow passing string literals as template arguments
template <size_t N>
struct StringLiteral {
    constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }  // NOLINT(*-explicit-constructor)
    char value[N]{};
};

//! \brief Returns build information
const buildinfo* get_buildinfo() noexcept;

//! \brief Returns build information as string
std::string get_buildinfo_string() noexcept;

//! \brief Stores and manipulates arbitrary long byte sequences
using Bytes = std::basic_string<uint8_t>;

//! \brief Represents a non-owning view of a byte sequence
class ByteView : public std::basic_string_view<uint8_t> {
  public:
    constexpr ByteView() noexcept = default;

    constexpr ByteView(const std::basic_string_view<uint8_t>& other) noexcept
        : std::basic_string_view<uint8_t>{other.data(), other.length()} {}

    constexpr ByteView(const Bytes& str) noexcept : std::basic_string_view<uint8_t>{str.data(), str.length()} {}

    constexpr ByteView(const uint8_t* data, size_type length) noexcept
        : std::basic_string_view<uint8_t>{data, length} {}

    template <std::size_t N>
    constexpr ByteView(const uint8_t (&array)[N]) noexcept : std::basic_string_view<uint8_t>{array, N} {}

    template <std::size_t N>
    constexpr ByteView(const std::array<uint8_t, N>& array) noexcept
        : std::basic_string_view<uint8_t>{array.data(), N} {}
};

// Sizes base 10
static constexpr uint64_t kKB{1'000};        // 10^{3} bytes
static constexpr uint64_t kMB{kKB * 1'000};  // 10^{6} bytes
static constexpr uint64_t kGB{kMB * 1'000};  // 10^{9} bytes

// Sizes base 2 https://en.wikipedia.org/wiki/Binary_prefix
static constexpr uint64_t kKiB{1024};        // 2^{10} bytes
static constexpr uint64_t kMiB{kKiB << 10};  // 2^{20} bytes
static constexpr uint64_t kGiB{kMiB << 10};  // 2^{30} bytes

// Literals for sizes base 2
constexpr uint64_t operator"" _KiB(unsigned long long value) { return value * kKiB; }
constexpr uint64_t operator"" _MiB(unsigned long long value) { return value * kMiB; }

}  // namespace bithash
