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

#include <map>
#include <sstream>

#include <catch2/catch.hpp>

#include <bithash/core/types/hash.hpp>

namespace bithash {

TEST_CASE("Hash", "[types]") {
    const h160 hash;
    CHECK_FALSE(hash);  // Is empty
    CHECK(h160::size() == 20);
    CHECK(h256::size() == 32);

    // Empty hash hex
    CHECK(hash.to_hex() == std::string(40, '0'));

    // Exact length valid hex
    std::string input_hex{"0xda0b3452b06fe341626ad0949c183fbda5676826"};
    auto parsed_hash = h160::from_hex(input_hex);
    REQUIRE_FALSE(parsed_hash.has_error());
    CHECK(parsed_hash.value()[0] == 0xda);
    CHECK(parsed_hash.value()[19] == 0x26);
    CHECK(parsed_hash.value().to_hex(/*with_prefix=*/true) == input_hex);
    CHECK(parsed_hash.value().to_string() == input_hex.substr(2));

    // Exact length invalid hex
    input_hex = "0xda0b3452b06fe341626ad0949c183fbda567zzzz";
    parsed_hash = h160::from_hex(input_hex);
    REQUIRE(parsed_hash.has_error());
    CHECK(parsed_hash.error() == enc::make_error_code(enc::Error::kIllegalHexDigit));

    // Oversize length
    input_hex = "0xda0b3452b06fe341626ad0949c183fbda567682600";
    parsed_hash = h160::from_hex(input_hex);
    REQUIRE(parsed_hash.has_error());
    CHECK(parsed_hash.error() == crypto::make_error_code(crypto::Error::kInvalidLength));

    // Odd number of digits decoding to kSize bytes
    input_hex = "da0b3452b06fe341626ad0949c183fbda567682";
    REQUIRE(enc::hex::decode(input_hex).value().size() == h160::size());
    parsed_hash = h160::from_hex(input_hex);
    REQUIRE(parsed_hash.has_error());
    CHECK(parsed_hash.error() == crypto::make_error_code(crypto::Error::kInvalidLength));
    parsed_hash = h160::from_hex("0x" + input_hex);
    CHECK(parsed_hash.has_error());

    const auto length_check{h160::check_hex_length(input_hex)};
    REQUIRE(length_check.has_error());
    CHECK(length_check.error() == crypto::InvalidLength{20, 19});
    CHECK(h160::check_hex_length("0xda0b3452b06fe341626ad0949c183fbda5676826").has_value());

    STATIC_REQUIRE_FALSE(noexcept(h160::from_hex(input_hex)));

    // Shorter length
    input_hex = "da0b";
    parsed_hash = h160::from_hex(input_hex);
    REQUIRE(parsed_hash.has_error());
    CHECK(parsed_hash.error() == crypto::make_error_code(crypto::Error::kInvalidLength));
}

TEST_CASE("Hash from slice", "[types]") {
    const Bytes input(32, 0x01);
    const auto hash{h256::from_slice(input)};
    REQUIRE(hash);
    CHECK(hash.value());  // Not empty
    CHECK(hash.value().view() == ByteView{input});

    const auto failed{h256::from_slice(ByteView{input}.substr(1))};
    REQUIRE(failed.has_error());
    CHECK(failed.error().expected == 32);
    CHECK(failed.error().actual == 31);
}

TEST_CASE("Hash comparison", "[types]") {
    const auto hash1{h160::from_hex("0000000000000000000000000000000000000001")};
    const auto hash2{h160::from_hex("0000000000000000000000000000000000000002")};
    const auto hash3{h160::from_hex("0100000000000000000000000000000000000000")};
    REQUIRE((hash1 and hash2 and hash3));

    CHECK(hash1.value() != hash2.value());
    CHECK(hash1.value() < hash2.value());
    CHECK(hash2.value() < hash3.value());  // Leading bytes are most significant
    CHECK(hash3.value() >= hash1.value());
    CHECK(hash1.value() == h160::from_hex("0x0000000000000000000000000000000000000001").value());

    // Usable as ordered key
    std::map<h160, int> map;
    map.emplace(hash3.value(), 3);
    map.emplace(hash1.value(), 1);
    map.emplace(hash2.value(), 2);
    CHECK(map.begin()->second == 1);
    CHECK(map.rbegin()->second == 3);
}

TEST_CASE("Hash formatting", "[types]") {
    const std::array<uint8_t, 20> bytes{0xda, 0x0b, 0x34, 0x52, 0xb0, 0x6f, 0xe3, 0x41, 0x62, 0x6a,
                                        0xd0, 0x94, 0x9c, 0x18, 0x3f, 0xbd, 0xa5, 0x67, 0x68, 0x26};
    const h160 hash{bytes};
    std::ostringstream stream;
    stream << hash;
    CHECK(stream.str() == "da0b3452b06fe341626ad0949c183fbda5676826");
    CHECK(stream.str() == hash.to_hex());

    size_t index{0};
    for (const auto byte : hash) {
        CHECK(byte == bytes[index++]);
    }
    CHECK(index == h160::size());
}
}  // namespace bithash
