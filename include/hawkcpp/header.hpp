#pragma once

#include "hawkcpp/mac.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp {

struct HeaderFields {
    std::optional<std::string> id;
    std::optional<std::chrono::sys_seconds> ts;
    std::optional<std::string> nonce;
    std::optional<Mac> mac;
    std::optional<std::string> ext;
    std::optional<std::vector<std::uint8_t>> hash;
    std::optional<std::string> app;
    std::optional<std::string> dlg;

    friend bool operator==(const HeaderFields &lhs, const HeaderFields &rhs) = default;
};

// attribute list of an Authorization or Server-Authorization header, without the "Hawk " scheme
// all attributes are optional here, validation decides which are required
class Header {
private:
    HeaderFields fields_;

public:
    Header() = default;
    // throws std::invalid_argument if a string attribute contains '"'
    explicit Header(HeaderFields fields);

    [[nodiscard]] static std::expected<Header, std::error_code> parse(std::string_view attributes);

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] const std::optional<std::string> &id() const { return fields_.id; }
    [[nodiscard]] const std::optional<std::chrono::sys_seconds> &ts() const { return fields_.ts; }
    [[nodiscard]] const std::optional<std::string> &nonce() const { return fields_.nonce; }
    [[nodiscard]] const std::optional<Mac> &mac() const { return fields_.mac; }
    [[nodiscard]] const std::optional<std::string> &ext() const { return fields_.ext; }
    [[nodiscard]] const std::optional<std::vector<std::uint8_t>> &hash() const { return fields_.hash; }
    [[nodiscard]] const std::optional<std::string> &app() const { return fields_.app; }
    [[nodiscard]] const std::optional<std::string> &dlg() const { return fields_.dlg; }

    friend bool operator==(const Header &lhs, const Header &rhs) = default;
};

// "Hawk " followed by the attribute list, as sent in Authorization and Server-Authorization
[[nodiscard]] std::string authorization_value(const Header &header);

[[nodiscard]] std::expected<Header, std::error_code> parse_authorization(std::string_view value);

} // namespace hawkcpp

template <> struct std::formatter<hawkcpp::Header> {
    [[nodiscard]] constexpr static auto parse(std::format_parse_context &ctx) { return ctx.begin(); }

    static auto format(const hawkcpp::Header &header, std::format_context &ctx) {
        return std::format_to(ctx.out(), "{}", header.to_string());
    }
};

//
#include "hawkcpp/internal/macro-end.hpp"
