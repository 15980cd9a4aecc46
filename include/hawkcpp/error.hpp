#pragma once

#include <cstdint>
#include <system_error>
#include <type_traits>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp {

enum class error : std::uint8_t {
    header_parse = 1,
    unknown_attribute,
    missing_attributes,
    invalid_timestamp,
    base64_decode,
    invalid_bewit_format,
    invalid_bewit_id,
    invalid_bewit_exp,
    invalid_bewit_mac,
    invalid_bewit_ext,
    multiple_bewits,
    invalid_url,
    crypto,
    unsupported_digest,
    unauthenticated,
};

[[nodiscard]] const std::error_category &error_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(error err) noexcept {
    return {static_cast<int>(err), error_category()};
}

} // namespace hawkcpp

template <> struct std::is_error_code_enum<hawkcpp::error> : std::true_type {};

//
#include "hawkcpp/internal/macro-end.hpp"
