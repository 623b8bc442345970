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
#include <algorithm>
#include <array>
#include <compare>
#include <cstring>
#include <ostream>
#include <string>

#include <bithash/core/common/assert.hpp>
#include <bithash/core/common/base.hpp>
#include <bithash/core/common/outcome.hpp>
#include <bithash/core/crypto/errors.hpp>
#include <bithash/core/encoding/hex.hpp>

namespace bithash {

//! \brief A Hash is a fixed size sequence of bytes holding the output of a digest algorithm
//! \remarks Equality and ordering are byte-wise. A Hash can only be obtained by finalizing a hasher engine or by
//! validated construction out of a buffer of the exact size (see from_slice). The latter does not (and cannot)
//! verify the bytes are actually the product of any digest algorithm
template <uint32_t BITS>
class Hash {
  public:
    static_assert(BITS && (BITS & 7) == 0, "Must be a multiple of 8");
    enum : uint32_t {
        kSize = BITS / 8
    };

    using const_iterator_type = typename std::array<uint8_t, kSize>::const_iterator;

    //! \brief An all zeroes Hash
    Hash() = default;

    //! \brief Creates a Hash from a statically sized array
    explicit Hash(const std::array<uint8_t, kSize>& bytes) noexcept : bytes_{bytes} {}

    //! \brief Creates a Hash copying the provided bytes
    //! \remarks Fails with InvalidLength if input size is not exactly kSize
    static outcome::result<Hash<BITS>, crypto::InvalidLength> from_slice(ByteView input) noexcept {
        if (input.size() != kSize) {
            return outcome::failure(crypto::InvalidLength{kSize, input.size()});
        }
        Hash<BITS> ret;
        std::memcpy(ret.bytes_.data(), input.data(), kSize);
        return ret;
    }

    //! \brief Checks a hex string (optional 0x prefix) carries exactly 2 * kSize digits
    //! \remarks On failure actual is the number of whole bytes the digits account for
    static outcome::result<void, crypto::InvalidLength> check_hex_length(std::string_view input) noexcept {
        if (enc::hex::has_prefix(input)) input.remove_prefix(2);
        if (input.length() != 2 * kSize) {
            return outcome::failure(crypto::InvalidLength{kSize, input.length() / 2});
        }
        return outcome::success();
    }

    //! \brief Returns a hash loaded from a hex string (optional 0x prefix)
    //! \remarks Fails with crypto::Error::kInvalidLength unless there are exactly 2 * kSize digits (no implicit
    //! leading zero nibble) or with an enc::Error on illegal digits
    static outcome::result<Hash<BITS>> from_hex(std::string_view input) {
        if (const auto length_check{check_hex_length(input)}; length_check.has_error()) {
            return crypto::make_error_code(length_check.error());
        }
        const auto parsed_bytes{enc::hex::decode(input)};
        if (parsed_bytes.has_error()) return parsed_bytes.error();
        return from_slice(parsed_bytes.value()).value();
    }

    //! \brief Returns the (lowercase) hexadecimal representation of this hash
    //! \param with_prefix If true, the returned string will have the 0x prefix
    [[nodiscard]] std::string to_hex(bool with_prefix = false) const noexcept {
        return enc::hex::encode(view(), with_prefix);
    }

    //! \brief An alias for to_hex with no prefix
    [[nodiscard]] std::string to_string() const noexcept { return to_hex(); }

    //! \brief The size of a Hash
    static constexpr size_t size() noexcept { return kSize; }

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }

    [[nodiscard]] ByteView view() const noexcept { return ByteView{bytes_}; }

    const_iterator_type begin() const noexcept { return bytes_.cbegin(); }

    const_iterator_type end() const noexcept { return bytes_.cend(); }

    //! \brief Read-only access to the byte at given position
    //! \remarks Out of range accesses abort the process
    const uint8_t& operator[](size_t index) const {
        ASSERT_PRE(index < kSize);
        return bytes_[index];
    }

    std::strong_ordering operator<=>(const Hash<BITS>& other) const noexcept {
        const auto result{std::memcmp(bytes_.data(), other.bytes_.data(), kSize)};
        if (result < 0) return std::strong_ordering::less;
        if (result > 0) return std::strong_ordering::greater;
        return std::strong_ordering::equal;
    }

    bool operator==(const Hash<BITS>& other) const noexcept { return *this <=> other == 0; }

    //! \brief Whether any of the bytes is not zero
    explicit operator bool() const noexcept {
        return std::ranges::any_of(bytes_, [](const auto byte) { return byte != 0; });
    }

  private:
    alignas(uint32_t) std::array<uint8_t, kSize> bytes_{0};
};

//! \brief Renders the hash as lowercase hex (no prefix)
template <uint32_t BITS>
std::ostream& operator<<(std::ostream& out, const Hash<BITS>& hash) {
    return out << hash.to_hex();
}

using h160 = Hash<160>;
using h256 = Hash<256>;

}  // namespace bithash
