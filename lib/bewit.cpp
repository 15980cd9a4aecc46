#include "hawkcpp/bewit.hpp"

#include "hawkcpp/b64.hpp"
#include "hawkcpp/error.hpp"
#include "hawkcpp/mac.hpp"
#include "hawkcpp/meta.hpp"

#include <boost/locale/encoding_errors.hpp>
#include <boost/locale/encoding_utf.hpp>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace hawkcpp {

namespace {

constexpr char delimiter = '\\';
constexpr std::string_view prefix = "bewit=";

[[nodiscard]] bool is_utf8(std::string_view value) {
    try {
        // stop on the first malformed sequence instead of skipping it
        static_cast<void>(boost::locale::conv::utf_to_utf<char>(value.data(), value.data() + value.size(),
                                                               boost::locale::conv::stop));
    } catch (const boost::locale::conv::conversion_error &) {
        return false;
    }
    return true;
}

[[nodiscard]] std::vector<std::string_view> split(std::string_view value, std::string_view delimiters) {
    std::vector<std::string_view> ret;
    while (true) {
        const auto pos = value.find_first_of(delimiters);
        ret.push_back(value.substr(0, pos));
        if (pos == std::string_view::npos) {
            break;
        }
        value.remove_prefix(pos + 1);
    }
    return ret;
}

} // namespace

Bewit::Bewit(std::string id, std::chrono::sys_seconds exp, Mac mac, std::optional<std::string> ext)
    : id_{std::move(id)}, exp_{exp}, mac_{std::move(mac)}, ext_{std::move(ext)} {
    if (id_.contains(delimiter) || (ext_ && ext_->contains(delimiter))) {
        throw std::invalid_argument{"bewit id and ext may not contain '\\'"};
    }
    // encoded as an unsigned integer
    if (exp_ < std::chrono::sys_seconds{}) {
        throw std::invalid_argument{"bewit exp may not precede the epoch"};
    }
    if (ext_ && ext_->empty()) {
        ext_.reset();
    }
}

std::expected<Bewit, std::error_code> Bewit::from_str(std::string_view bewit) {
    const auto decoded = b64::decode_url(bewit);
    if (!decoded) {
        return std::unexpected{make_error_code(error::base64_decode)};
    }

    const std::vector<std::string_view> parts = split(meta::as_string_view(*decoded), {&delimiter, 1});
    if (parts.size() != 4) {
        return std::unexpected{make_error_code(error::invalid_bewit_format)};
    }

    if (!is_utf8(parts[0])) {
        return std::unexpected{make_error_code(error::invalid_bewit_id)};
    }

    std::uint64_t exp{};
    if (const auto res = std::from_chars(parts[1].data(), parts[1].data() + parts[1].size(), exp);
        res.ec != std::errc{} || res.ptr != parts[1].data() + parts[1].size() ||
        exp > static_cast<std::uint64_t>(std::numeric_limits<std::chrono::seconds::rep>::max())) {
        return std::unexpected{make_error_code(error::invalid_bewit_exp)};
    }

    if (!is_utf8(parts[2])) {
        return std::unexpected{make_error_code(error::invalid_bewit_mac)};
    }
    auto mac = b64::decode(parts[2]);
    if (!mac) {
        return std::unexpected{make_error_code(error::invalid_bewit_mac)};
    }

    std::optional<std::string> ext;
    if (!parts[3].empty()) {
        if (!is_utf8(parts[3])) {
            return std::unexpected{make_error_code(error::invalid_bewit_ext)};
        }
        ext = std::string{parts[3]};
    }

    return Bewit{std::string{parts[0]},
                 std::chrono::sys_seconds{std::chrono::seconds{static_cast<std::chrono::seconds::rep>(exp)}},
                 Mac{std::move(mac.value())}, std::move(ext)};
}

std::expected<std::optional<Bewit>, std::error_code> Bewit::from_path(std::string &path) {
    // not a query string parser, other parameters pass through untouched
    std::vector<std::string_view> components;
    std::vector<std::string_view> bewits;
    for (const std::string_view component : split(path, "&?")) {
        if (component.starts_with(prefix)) {
            bewits.push_back(component.substr(prefix.size()));
        } else {
            components.push_back(component);
        }
    }

    if (bewits.empty()) {
        return std::nullopt;
    }
    if (bewits.size() > 1) {
        return std::unexpected{make_error_code(error::multiple_bewits)};
    }

    auto bewit = from_str(bewits.front());
    if (!bewit) {
        return std::unexpected{bewit.error()};
    }

    std::string stripped;
    for (std::size_t i = 0; i < components.size(); i++) {
        if (i == 0) {
            stripped.append(components[i]);
            continue;
        }
        stripped.append(i == 1 ? "?" : "&");
        stripped.append(components[i]);
    }
    path = std::move(stripped);

    return std::move(bewit.value());
}

std::string Bewit::to_str() const {
    const std::string raw = std::format("{}\\{}\\{}\\{}", id_, exp_.time_since_epoch().count(),
                                        b64::encode(mac_.bytes()), ext_.value_or(""));
    return b64::encode_url(meta::as_bytes(raw));
}

} // namespace hawkcpp
