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

#include "digest.hpp"

#include <algorithm>
#include <cctype>
#include <source_location>
#include <type_traits>
#include <vector>

#include <magic_enum.hpp>

#include <bithash/core/common/assert.hpp>
#include <bithash/core/common/cast.hpp>
#include <bithash/core/crypto/hash160.hpp>
#include <bithash/core/crypto/hash256.hpp>

namespace bithash::app {

namespace {

    //! \brief Invokes func with a std::type_identity of the algorithm's type
    template <typename Func>
    decltype(auto) visit_algorithm(Algorithm algorithm, Func&& func) {
        using enum Algorithm;
        switch (algorithm) {
            case kHash160:
                return func(std::type_identity<crypto::Hash160>{});
            case kHash256:
                return func(std::type_identity<crypto::Hash256>{});
            case kSha256:
                return func(std::type_identity<crypto::Sha256>{});
            case kRipemd160:
                return func(std::type_identity<crypto::Ripemd160>{});
        }
        abort_due_to_assertion_failure("Unknown algorithm", std::source_location::current());
    }

}  // namespace

std::string algorithm_label(Algorithm algorithm) {
    std::string ret{magic_enum::enum_name(algorithm)};
    ret.erase(0, 1);  // Drop the leading "k"
    std::ranges::transform(ret, ret.begin(), [](unsigned char c) { return std::tolower(c); });
    return ret;
}

std::map<std::string, Algorithm, std::less<>> get_algorithms_map() {
    std::map<std::string, Algorithm, std::less<>> ret;
    for (const auto enumerator : magic_enum::enum_values<Algorithm>()) {
        ret.try_emplace(algorithm_label(enumerator), enumerator);
    }
    return ret;
}

size_t digest_length(Algorithm algorithm) {
    return visit_algorithm(algorithm, []<typename A>(std::type_identity<A>) { return A::len(); });
}

size_t block_size(Algorithm algorithm) {
    return visit_algorithm(algorithm, []<typename A>(std::type_identity<A>) { return A::block_size(); });
}

std::string hash_to_hex(Algorithm algorithm, ByteView data) {
    return visit_algorithm(algorithm, [data]<typename A>(std::type_identity<A>) { return A::hash(data).to_hex(); });
}

outcome::result<std::string> hash_stream_to_hex(Algorithm algorithm, std::istream& stream, size_t chunk_size) {
    chunk_size = std::max<size_t>(chunk_size, 1U);
    return visit_algorithm(
        algorithm, [&stream, chunk_size]<typename A>(std::type_identity<A>) -> outcome::result<std::string> {
            auto engine{A::engine()};
            std::vector<char> buffer(chunk_size);
            while (stream) {
                stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto count{static_cast<size_t>(stream.gcount())};
                if (count == 0) break;
                engine.update(ByteView{byte_ptr_cast(buffer.data()), count});
            }
            if (stream.bad()) {
                return boost::system::errc::make_error_code(boost::system::errc::io_error);
            }
            return A::from_engine(std::move(engine)).to_hex();
        });
}

outcome::result<void, crypto::InvalidLength> check_digest_hex_length(Algorithm algorithm, std::string_view hex) {
    return visit_algorithm(algorithm, [hex]<typename A>(std::type_identity<A>) {
        return A::Digest::check_hex_length(hex);
    });
}

outcome::result<std::string, crypto::InvalidLength> normalize_digest(Algorithm algorithm, ByteView data) {
    return visit_algorithm(
        algorithm, [data]<typename A>(std::type_identity<A>) -> outcome::result<std::string, crypto::InvalidLength> {
            const auto digest{A::from_slice(data)};
            if (digest.has_error()) return outcome::failure(digest.error());
            return digest.value().to_hex();
        });
}

}  // namespace bithash::app
