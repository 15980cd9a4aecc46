#include "hawkcpp/b64.hpp"

#include <algorithm>
#include <botan/base64.h>
#include <botan/exceptn.h>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hawkcpp::b64 {

std::string encode(std::span<const std::uint8_t> input) { return Botan::base64_encode(input.data(), input.size()); }

std::optional<std::vector<std::uint8_t>> decode(std::string_view input) {
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }
    try {
        const auto decoded = Botan::base64_decode(input, false);
        return std::vector<std::uint8_t>{decoded.begin(), decoded.end()};
    } catch (const Botan::Exception &) {
        return std::nullopt;
    }
}

std::string encode_url(std::span<const std::uint8_t> input) {
    std::string ret = encode(input);
    while (!ret.empty() && ret.back() == '=') {
        ret.pop_back();
    }
    std::ranges::replace(ret, '+', '-');
    std::ranges::replace(ret, '/', '_');
    return ret;
}

std::optional<std::vector<std::uint8_t>> decode_url(std::string_view input) {
    // a single trailing symbol carries fewer than 8 bits
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }
    std::string standard;
    standard.reserve(input.size() + 3);
    for (const char chr : input) {
        switch (chr) {
        case '+':
        case '/':
        case '=':
            return std::nullopt;
        case '-':
            standard.push_back('+');
            break;
        case '_':
            standard.push_back('/');
            break;
        default:
            standard.push_back(chr);
        }
    }
    standard.append((4 - standard.size() % 4) % 4, '=');
    return decode(standard);
}

} // namespace hawkcpp::b64
