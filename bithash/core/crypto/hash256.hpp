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

//! \brief Bitcoin's 256 bit hash (double Sha256)
using Hash256 = Composed<Sha256, Sha256>;

static_assert(HashAlgorithm<Hash256>);

}  // namespace bithash::crypto
