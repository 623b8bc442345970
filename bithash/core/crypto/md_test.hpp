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
#include <random>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include <bithash/core/common/cast.hpp>
#include <bithash/core/crypto/hasher.hpp>
#include <bithash/core/encoding/hex.hpp>

namespace bithash::crypto {

//! \brief Feeds the engine with input split in chunks of random size
template <typename Engine>
void update_in_random_chunks(Engine& engine, ByteView input) {
    static std::random_device rd;
    static std::mt19937_64 rng(rd());

    while (!input.empty()) {
        std::uniform_int_distribution<size_t> uni(1ULL, (input.size() / 2) + 1);
        const size_t chunk_size{std::min(uni(rng), input.size())};
        engine.update(input.substr(0, chunk_size));
        input.remove_prefix(chunk_size);
    }
}

template <typename Hasher>
void run_hasher_tests(Hasher& hasher, const std::vector<std::string>& inputs, const std::vector<std::string>& digests) {
    REQUIRE(inputs.size() == digests.size());

    for (size_t i{0}; i < inputs.size(); ++i) {
        hasher.init();
        const auto input(string_view_to_byte_view(inputs[i]));

        // Consume input in pieces to ensure partial updates don't break anything
        update_in_random_chunks(hasher, input);

        const auto hash{hasher.finalize()};
        CHECK(hasher.ingested_size() == input.size());
        CHECK(hash.size() == hasher.digest_size());
        CHECK(enc::hex::encode(hash) == digests[i]);
    }
}

//! \brief Checks an algorithm against known vectors through both the one-shot and the engine interfaces
template <HashAlgorithm Algorithm>
void run_algorithm_tests(const std::vector<std::string>& inputs, const std::vector<std::string>& digests) {
    REQUIRE(inputs.size() == digests.size());

    for (size_t i{0}; i < inputs.size(); ++i) {
        INFO("Input #" << i);
        const auto input(string_view_to_byte_view(inputs[i]));

        const auto one_shot{Algorithm::hash(input)};
        CHECK(one_shot.to_hex() == digests[i]);

        auto engine{Algorithm::engine()};
        update_in_random_chunks(engine, input);
        const auto streamed{Algorithm::from_engine(std::move(engine))};
        CHECK(streamed == one_shot);
    }
}
}  // namespace bithash::crypto
