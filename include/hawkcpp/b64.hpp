#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp::b64 {

// standard alphabet, padded; used for mac and hash attributes
[[nodiscard]] std::string encode(std::span<const std::uint8_t> input);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> decode(std::string_view input);

// url-safe alphabet, no padding; used for the bewit token
[[nodiscard]] std::string encode_url(std::span<const std::uint8_t> input);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> decode_url(std::string_view input);

} // namespace hawkcpp::b64

//
#include "hawkcpp/internal/macro-end.hpp"
