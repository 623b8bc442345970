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

#include <concepts>
#include <utility>

#include <bithash/core/common/assert.hpp>
#include <bithash/core/common/base.hpp>
#include <bithash/core/common/outcome.hpp>
#include <bithash/core/crypto/errors.hpp>
#include <bithash/core/crypto/md.hpp>
#include <bithash/core/types/hash.hpp>

namespace bithash::crypto {

//! \brief The contract of a fixed output length hash algorithm
//! \details An algorithm exposes:
//! - an Engine type : the streaming accumulator. It is fed by update() in chunks of any size and the result
//!   does not depend on how the input has been split
//! - a Digest type : the fixed size output
//! - engine() : returns a fresh Engine in the algorithm's initial state
//! - from_engine() : consumes the Engine and returns the finalized Digest
//! - from_slice() : builds a Digest out of raw bytes of the exact size (no verification of provenance)
//! - hash() : one-shot computation equivalent to engine() + update() + from_engine()
//! - len() : the fixed size of the Digest in bytes
//! - block_size() : the size in bytes of an input block of the compression function (informational only)
template <typename T>
concept HashAlgorithm = requires(typename T::Engine engine, ByteView data) {
    typename T::Digest;
    { T::engine() } -> std::same_as<typename T::Engine>;
    engine.update(data);
    { T::from_engine(std::move(engine)) } -> std::same_as<typename T::Digest>;
    { T::from_slice(data) } -> std::same_as<outcome::result<typename T::Digest, InvalidLength>>;
    { T::hash(data) } -> std::same_as<typename T::Digest>;
    { T::len() } -> std::same_as<size_t>;
    { T::block_size() } -> std::same_as<size_t>;
};

//! \brief Provides the parts of the HashAlgorithm contract which only depend on Engine and Digest types
//! \remarks Derived must provide engine(), from_engine() and block_size()
template <typename Derived, typename EngineType, typename DigestType>
struct AlgorithmBase {
    using Engine = EngineType;
    using Digest = DigestType;

    static outcome::result<Digest, InvalidLength> from_slice(ByteView data) noexcept {
        return Digest::from_slice(data);
    }

    static Digest hash(ByteView data) {
        auto engine{Derived::engine()};
        engine.update(data);
        return Derived::from_engine(std::move(engine));
    }

    static Digest hash(std::string_view data) { return hash(string_view_to_byte_view(data)); }

    static constexpr size_t len() noexcept { return Digest::size(); }
};

//! \brief A single pass hash algorithm computed by the OpenSSL digest named NAME
template <StringLiteral NAME, uint32_t BITS, size_t BLOCK_SIZE>
struct Digester : public AlgorithmBase<Digester<NAME, BITS, BLOCK_SIZE>, MessageDigest<NAME>, Hash<BITS>> {
    using Engine = MessageDigest<NAME>;
    using Digest = Hash<BITS>;

    static Engine engine() { return Engine(); }

    static Digest from_engine(Engine&& engine) {
        Engine consumed{std::move(engine)};
        const Bytes digest{consumed.finalize()};
        auto ret{Digest::from_slice(digest)};
        ASSERT_POST(ret.has_value());  // OpenSSL produces exactly digest_size() bytes or nothing
        return ret.value();
    }

    static constexpr size_t block_size() noexcept { return BLOCK_SIZE; }
};

using Sha256 = Digester<"SHA256", 256, 64>;
using Ripemd160 = Digester<"RIPEMD160", 160, 64>;

static_assert(HashAlgorithm<Sha256>);
static_assert(HashAlgorithm<Ripemd160>);

}  // namespace bithash::crypto
