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

#include <algorithm>
#include <array>
#include <vector>

#include <catch2/catch.hpp>

#include <bithash/core/crypto/hash160.hpp>
#include <bithash/core/crypto/md_test.hpp>

namespace bithash::crypto {

namespace {
    // Uncompressed public key of a Bitcoin key and its hash160 as reported by validateaddress
    constexpr std::string_view kPubKeyHex{
        "04a149d76c5de27a2ddbfaa1246c4adcd2b6f7aa2954c2e25303f55154caad9152e4f7e4b85df169c18a3c697fbb2dc4ecef94ac55fe81"
        "64ccf982a138691a5519"};
    constexpr std::string_view kPubKeyHash160Hex{"da0b3452b06fe341626ad0949c183fbda5676826"};
    const std::array<uint8_t, 20> kPubKeyHash160{0xda, 0x0b, 0x34, 0x52, 0xb0, 0x6f, 0xe3, 0x41, 0x62, 0x6a,
                                                 0xd0, 0x94, 0x9c, 0x18, 0x3f, 0xbd, 0xa5, 0x67, 0x68, 0x26};

    // Known hash of empty input
    constexpr std::string_view kEmptyHash160Hex{"b472a266d0bd89c13706a4132ccfb16f7c3b9fcb"};
}  // namespace

TEST_CASE("Bitcoin Hash160", "[crypto]") {
    STATIC_REQUIRE(Hash160::len() == 20);
    STATIC_REQUIRE(Hash160::block_size() == 64);
    STATIC_REQUIRE(std::is_same_v<Hash160::Engine, Sha256Engine>);
    STATIC_REQUIRE(std::is_same_v<Hash160::Digest, h160>);

    const std::vector<std::string> inputs{
        "",                                                          // Test 1
        "abc",                                                       // Test 2
        "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq",  // Test 3
        std::string(1'000'000, 'a'),                                 // Test 4
    };

    const std::vector<std::string> digests{
        std::string(kEmptyHash160Hex),               // Test 1
        "bb1be98c142444d7a56aa3981c3942a978e4dc33",  // Test 2
        "69dda8a60e0cfc2353aa776864092c0e5ccb4834",  // Test 3
        "f9be0e104ef2ed83a7ddb4765780951405e56ba4",  // Test 4
    };

    run_algorithm_tests<Hash160>(inputs, digests);
}

TEST_CASE("Hash160 of public key", "[crypto]") {
    const auto input{enc::hex::decode(kPubKeyHex)};
    REQUIRE(input);
    REQUIRE(input.value().size() == 65);

    // Hash through high-level API, check hex encoding/decoding
    const h160 hash{Hash160::hash(input.value())};
    const auto from_hex{h160::from_hex(kPubKeyHash160Hex)};
    REQUIRE(from_hex);
    CHECK(hash == from_hex.value());
    CHECK(hash == h160(kPubKeyHash160));
    CHECK(hash.to_hex() == kPubKeyHash160Hex);
    CHECK(hash.to_hex().length() == 40);
    for (size_t i{0}; i < h160::size(); ++i) {
        CHECK(hash[i] == kPubKeyHash160[i]);
    }

    // Hash through engine, checking that we can input byte by byte
    auto engine{Hash160::engine()};
    for (const auto byte : input.value()) {
        engine.update(ByteView{&byte, 1});
    }
    CHECK(engine.ingested_size() == 65);
    const h160 manual_hash{Hash160::from_engine(std::move(engine))};
    CHECK(hash == manual_hash);

    // Deterministic
    CHECK(Hash160::hash(input.value()) == hash);
}

TEST_CASE("Hash160 is ripemd160 of sha256", "[crypto]") {
    const std::string_view data{"The quick brown fox jumps over the lazy dog"};
    const auto intermediate{Sha256::hash(data)};
    CHECK(Hash160::hash(data) == Ripemd160::hash(intermediate.view()));
    CHECK(Hash160::hash(data) != Ripemd160::hash(data));
}

TEST_CASE("Hash160 of empty input", "[crypto]") {
    const auto one_shot{Hash160::hash(ByteView{})};
    CHECK(one_shot.to_hex() == kEmptyHash160Hex);

    // An engine which never received data
    const auto streamed{Hash160::from_engine(Hash160::engine())};
    CHECK(streamed == one_shot);

    // Empty chunks do not alter the result
    auto engine{Hash160::engine()};
    engine.update(ByteView{});
    engine.update(std::string_view{});
    CHECK(Hash160::from_engine(std::move(engine)) == one_shot);
}

TEST_CASE("Hash160 chunk invariance", "[crypto]") {
    const auto input{enc::hex::decode(kPubKeyHex).value()};
    const auto expected{Hash160::hash(input)};
    const ByteView input_view{input};

    // Every possible two-way split
    for (size_t split{0}; split <= input_view.size(); ++split) {
        auto engine{Hash160::engine()};
        engine.update(input_view.substr(0, split));
        engine.update(input_view.substr(split));
        CHECK(Hash160::from_engine(std::move(engine)) == expected);
    }

    // Fixed size chunks
    for (size_t chunk_size : {3U, 7U, 64U, 65U}) {
        auto engine{Hash160::engine()};
        for (size_t offset{0}; offset < input_view.size(); offset += chunk_size) {
            engine.update(input_view.substr(offset, chunk_size));
        }
        CHECK(Hash160::from_engine(std::move(engine)) == expected);
    }
}

TEST_CASE("Hash160 from_slice", "[crypto]") {
    // Exact length : accepted with no verification of provenance
    const Bytes arbitrary(20, 0x5a);
    const auto parsed{Hash160::from_slice(arbitrary)};
    REQUIRE(parsed.has_value());
    CHECK(std::ranges::equal(parsed.value(), arbitrary));

    for (const size_t length : {0U, 1U, 19U, 21U, 32U, 65U}) {
        INFO("Length " << length);
        const Bytes input(length, 0x00);
        const auto result{Hash160::from_slice(input)};
        REQUIRE(result.has_error());
        CHECK(result.error().expected == 20);
        CHECK(result.error().actual == length);
        CHECK(make_error_code(result.error()) == make_error_code(Error::kInvalidLength));
        CHECK_THROWS_AS(result.value(), boost::system::system_error);
    }

    // Hex round trip
    const auto hash{Hash160::hash(std::string_view{"round trip"})};
    const auto decoded{enc::hex::decode(hash.to_hex())};
    REQUIRE(decoded);
    const auto rebuilt{Hash160::from_slice(decoded.value())};
    REQUIRE(rebuilt);
    CHECK(rebuilt.value() == hash);
}
}  // namespace bithash::crypto
