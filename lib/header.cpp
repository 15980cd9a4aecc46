#include "hawkcpp/header.hpp"

#include "hawkcpp/b64.hpp"
#include "hawkcpp/error.hpp"
#include "hawkcpp/mac.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <expected>
#include <format>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace hawkcpp {

namespace {

constexpr std::string_view whitespace = " \t\r\n";
constexpr std::string_view separators = ", \t\r\n";

void check_component(const std::optional<std::string> &value, std::string_view name) {
    if (value && value->contains('"')) {
        throw std::invalid_argument{std::format("Hawk attribute {} may not contain '\"'", name)};
    }
}

[[nodiscard]] std::string_view trim(std::string_view value) {
    if (const auto begin = value.find_first_not_of(whitespace); begin != std::string_view::npos) {
        value = value.substr(begin);
    } else {
        return {};
    }
    if (const auto end = value.find_last_not_of(whitespace); end != std::string_view::npos) {
        value = value.substr(0, end + 1);
    }
    return value;
}

[[nodiscard]] std::string_view trim_leading(std::string_view value, std::string_view chars) {
    const auto begin = value.find_first_not_of(chars);
    return begin == std::string_view::npos ? std::string_view{} : value.substr(begin);
}

template <typename T>
[[nodiscard]] bool assign_once(std::optional<T> &field, T value) {
    if (field) {
        return false;
    }
    field = std::move(value);
    return true;
}

} // namespace

Header::Header(HeaderFields fields) : fields_{std::move(fields)} {
    check_component(fields_.id, "id");
    check_component(fields_.nonce, "nonce");
    check_component(fields_.ext, "ext");
    check_component(fields_.app, "app");
    check_component(fields_.dlg, "dlg");
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::expected<Header, std::error_code> Header::parse(std::string_view attributes) {
    HeaderFields fields;
    std::string_view rest = attributes;

    while (true) {
        rest = trim_leading(rest, separators);
        if (rest.empty()) {
            break;
        }

        const auto eq = rest.find('=');
        if (eq == std::string_view::npos) {
            return std::unexpected{make_error_code(error::header_parse)};
        }
        const std::string_view name = trim(rest.substr(0, eq));
        if (name.empty()) {
            return std::unexpected{make_error_code(error::header_parse)};
        }

        rest = trim_leading(rest.substr(eq + 1), whitespace);
        if (!rest.starts_with('"')) {
            return std::unexpected{make_error_code(error::header_parse)};
        }
        rest.remove_prefix(1);
        // no escapes: a value runs up to the next '"'
        const auto end = rest.find('"');
        if (end == std::string_view::npos) {
            return std::unexpected{make_error_code(error::header_parse)};
        }
        const std::string_view value = rest.substr(0, end);
        rest.remove_prefix(end + 1);

        bool fresh = true;
        if (name == "id") {
            fresh = assign_once(fields.id, std::string{value});
        } else if (name == "ts") {
            std::int64_t seconds{};
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                return std::unexpected{make_error_code(error::invalid_timestamp)};
            }
            fresh = assign_once(fields.ts, std::chrono::sys_seconds{std::chrono::seconds{seconds}});
        } else if (name == "nonce") {
            fresh = assign_once(fields.nonce, std::string{value});
        } else if (name == "mac") {
            auto decoded = b64::decode(value);
            if (!decoded) {
                return std::unexpected{make_error_code(error::base64_decode)};
            }
            fresh = assign_once(fields.mac, Mac{std::move(decoded.value())});
        } else if (name == "ext") {
            fresh = assign_once(fields.ext, std::string{value});
        } else if (name == "hash") {
            auto decoded = b64::decode(value);
            if (!decoded) {
                return std::unexpected{make_error_code(error::base64_decode)};
            }
            fresh = assign_once(fields.hash, std::move(decoded.value()));
        } else if (name == "app") {
            fresh = assign_once(fields.app, std::string{value});
        } else if (name == "dlg") {
            fresh = assign_once(fields.dlg, std::string{value});
        } else {
            return std::unexpected{make_error_code(error::unknown_attribute)};
        }

        if (!fresh) {
            return std::unexpected{make_error_code(error::header_parse)};
        }
    }

    // values cannot contain '"' by construction of the grammar
    return Header{std::move(fields)};
}

std::string Header::to_string() const {
    std::string ret;
    auto out = std::back_inserter(ret);
    std::string_view sep;

    const auto append = [&](std::string_view name, std::string_view value) {
        std::format_to(out, "{}{}=\"{}\"", sep, name, value);
        sep = ", ";
    };

    if (fields_.id) {
        append("id", *fields_.id);
    }
    if (fields_.ts) {
        append("ts", std::to_string(fields_.ts->time_since_epoch().count()));
    }
    if (fields_.nonce) {
        append("nonce", *fields_.nonce);
    }
    if (fields_.mac) {
        append("mac", b64::encode(fields_.mac->bytes()));
    }
    if (fields_.ext) {
        append("ext", *fields_.ext);
    }
    if (fields_.hash) {
        append("hash", b64::encode(*fields_.hash));
    }
    if (fields_.app) {
        append("app", *fields_.app);
    }
    if (fields_.dlg) {
        append("dlg", *fields_.dlg);
    }

    return ret;
}

std::string authorization_value(const Header &header) { return std::format("Hawk {}", header); }

std::expected<Header, std::error_code> parse_authorization(std::string_view value) {
    constexpr std::string_view scheme = "Hawk ";
    if (!value.starts_with(scheme)) {
        return std::unexpected{make_error_code(error::header_parse)};
    }
    return Header::parse(value.substr(scheme.size()));
}

} // namespace hawkcpp
