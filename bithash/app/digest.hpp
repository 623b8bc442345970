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
#include <functional>
#include <istream>
#include <map>
#include <string>
#include <string_view>

#include <bithash/core/common/base.hpp>
#include <bithash/core/common/outcome.hpp>
#include <bithash/core/crypto/errors.hpp>

namespace bithash::app {

//! \brief The hash algorithms selectable at runtime
enum class Algorithm {
    kHash160,    // RIPEMD-160(SHA-256(x))
    kHash256,    // SHA-256(SHA-256(x))
    kSha256,     //
    kRipemd160,  //
};

//! \brief Returns the lowercase label of an algorithm (e.g. "hash160")
std::string algorithm_label(Algorithm algorithm);

//! \brief Maps labels to algorithms (for command line parsing)
std::map<std::string, Algorithm, std::less<>> get_algorithms_map();

//! \brief The size in bytes of the algorithm's output
size_t digest_length(Algorithm algorithm);

//! \brief The size in bytes of an input block of the algorithm
size_t block_size(Algorithm algorithm);

//! \brief Computes the digest of data in one shot and returns it hex encoded
std::string hash_to_hex(Algorithm algorithm, ByteView data);

//! \brief Streams the whole content of a stream into an engine in chunks of chunk_size bytes
//! \return The hex encoded digest or an io_error if the stream went bad
outcome::result<std::string> hash_stream_to_hex(Algorithm algorithm, std::istream& stream, size_t chunk_size);

//! \brief Checks a hex encoded digest (optional 0x prefix) has exactly 2 * digest_length digits
//! \remarks Odd digit counts are refused : no implicit leading zero nibble for digests
outcome::result<void, crypto::InvalidLength> check_digest_hex_length(Algorithm algorithm, std::string_view hex);

//! \brief Validates raw bytes as a digest of the algorithm
//! \return The normalized (lowercase) hex representation or InvalidLength when bytes count does not match
outcome::result<std::string, crypto::InvalidLength> normalize_digest(Algorithm algorithm, ByteView data);

}  // namespace bithash::app
