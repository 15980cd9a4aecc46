#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp::meta {

template <typename T>
concept is_aliasing_type =
    std::is_same_v<T, unsigned char> || std::is_same_v<T, char> || std::is_same_v<T, std::byte>;

template <typename T, typename U>
T safe_reinterpret_cast(U &&rhs)
    requires std::is_pointer_v<T> && std::is_pointer_v<U> &&
             is_aliasing_type<std::remove_cvref_t<std::remove_pointer_t<T>>> &&
             is_aliasing_type<std::remove_cvref_t<std::remove_pointer_t<U>>>
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return reinterpret_cast<T>(std::forward<U>(rhs));
}

[[nodiscard]] inline std::span<const unsigned char> as_bytes(std::string_view str) {
    return {safe_reinterpret_cast<const unsigned char *>(str.data()), str.size()};
}

[[nodiscard]] inline std::string_view as_string_view(std::span<const unsigned char> bytes) {
    return {safe_reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

} // namespace hawkcpp::meta

//
#include "hawkcpp/internal/macro-end.hpp"
