#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hawkcpp::_internal {

[[nodiscard]] inline std::optional<std::span<const std::uint8_t>>
optional_span(const std::optional<std::vector<std::uint8_t>> &value) {
    if (!value) {
        return std::nullopt;
    }
    return std::span<const std::uint8_t>{*value};
}

[[nodiscard]] inline std::optional<std::string_view> optional_view(const std::optional<std::string> &value) {
    if (!value) {
        return std::nullopt;
    }
    return std::string_view{*value};
}

} // namespace hawkcpp::_internal
