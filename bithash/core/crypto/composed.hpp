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

#include <utility>

#include <bithash/core/crypto/hasher.hpp>

namespace bithash::crypto {

//! \brief A two stage hash algorithm : Second applied to the full finalized output of First
//! \details Streaming happens on First's own engine : no further state is layered on top of it. On finalization
//! First's digest is computed and fed, as is and in one shot, to Second. The digest of Second is the result.
//! The internal block size is the one of First, the output length is the one of Second
template <HashAlgorithm First, HashAlgorithm Second>
struct Composed
    : public AlgorithmBase<Composed<First, Second>, typename First::Engine, typename Second::Digest> {
    using Engine = typename First::Engine;
    using Digest = typename Second::Digest;

    static Engine engine() { return First::engine(); }

    static Digest from_engine(Engine&& engine) {
        const auto intermediate{First::from_engine(std::move(engine))};
        return Second::hash(intermediate.view());
    }

    static constexpr size_t block_size() noexcept { return First::block_size(); }
};

}  // namespace bithash::crypto
