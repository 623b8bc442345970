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
#include <cstddef>
#include <ostream>
#include <string>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <magic_enum.hpp>

namespace bithash::crypto {

enum class Error {
    kSuccess,        // Not actually an error
    kInvalidLength,  // A digest was built from a buffer of the wrong size
};

class ErrorCategory final : public boost::system::error_category {
  public:
    virtual ~ErrorCategory() noexcept = default;
    const char* name() const noexcept override { return "CryptoError"; }
    std::string message(int err_code) const override {
        std::string desc{"Unknown error"};
        if (const auto enumerator = magic_enum::enum_cast<crypto::Error>(err_code); enumerator.has_value()) {
            desc.assign(std::string(magic_enum::enum_name<crypto::Error>(*enumerator)));
            desc.erase(0, 1);  // Remove the constant `k` prefix
        }
        return desc;
    }
    boost::system::error_condition default_error_condition(int err_code) const noexcept override {
        const auto enumerator = magic_enum::enum_cast<crypto::Error>(err_code);
        if (not enumerator.has_value()) {
            return {err_code, *this};  // No conversion
        }
        switch (*enumerator) {
            using enum Error;
            case kSuccess:
                return make_error_condition(boost::system::errc::success);
            case kInvalidLength:
                return make_error_condition(boost::system::errc::invalid_argument);
            default:
                return {err_code, *this};
        }
    }
};

inline boost::system::error_code make_error_code(crypto::Error err_code) {
    static crypto::ErrorCategory category{};
    return {static_cast<int>(err_code), category};
}

//! \brief The error payload returned when a digest is built out of a buffer of unexpected size
//! \remarks Carries both the size the digest type requires and the size actually provided
struct InvalidLength {
    size_t expected{0};
    size_t actual{0};

    bool operator==(const InvalidLength& other) const noexcept = default;

    [[nodiscard]] std::string to_string() const {
        return "InvalidLength(expected=" + std::to_string(expected) + ", actual=" + std::to_string(actual) + ")";
    }
};

inline std::ostream& operator<<(std::ostream& out, const InvalidLength& error) { return out << error.to_string(); }

// Found via ADL by outcome so that results carrying an InvalidLength payload behave as error_code results
inline boost::system::error_code make_error_code(const InvalidLength& /*error*/) {
    return make_error_code(Error::kInvalidLength);
}

// Invoked by outcome when .value() is called on a failed result carrying an InvalidLength payload
[[noreturn]] inline void outcome_throw_as_system_error_with_payload(const InvalidLength& error) {
    throw boost::system::system_error(make_error_code(error), error.to_string());
}

}  // namespace bithash::crypto

namespace boost::system {
template <>
struct is_error_code_enum<bithash::crypto::Error> : public std::true_type {};
}  // namespace boost::system
