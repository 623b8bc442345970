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

#include <bithash/core/crypto/composed.hpp>

namespace bithash::crypto {

//! \brief Bitcoin's 160-bit hash : RIPEMD-160 of the SHA-256 digest of the input
//! \details Hash160::engine() is a plain SHA-256 engine. Hash160::len() == 20, Hash160::block_size() == 64
//! \code
//!     auto engine{Hash160::engine()};
//!     engine.update(chunk1);
//!     engine.update(chunk2);
//!     const h160 fingerprint{Hash160::from_engine(std::move(engine))};
//! \endcode
using Hash160 = Composed<Sha256, Ripemd160>;

static_assert(HashAlgorithm<Hash160>);

}  // namespace bithash::crypto
