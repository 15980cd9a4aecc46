#include "hawkcpp/request.hpp"

#include "hawkcpp/bewit.hpp"
#include "hawkcpp/credentials.hpp"
#include "hawkcpp/error.hpp"
#include "hawkcpp/header.hpp"
#include "hawkcpp/mac.hpp"
#include "hawkcpp/response.hpp"
#include "hawkcpp/state.hpp"
#include "mac_input.hpp"

#include <boost/url/parse.hpp>
#include <boost/url/scheme.hpp>
#include <boost/url/url_view.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace hawkcpp {

namespace {

void check_component(const std::optional<std::string> &value, std::string_view name) {
    if (value && value->contains('"')) {
        throw std::invalid_argument{std::format("request {} may not contain '\"'", name)};
    }
}

// |now - ts| <= skew for any pair of timestamps, the difference is taken modulo 2^64
[[nodiscard]] bool within_skew(std::chrono::sys_seconds ts, std::chrono::sys_seconds now,
                               std::chrono::seconds skew) {
    if (skew < std::chrono::seconds::zero()) {
        return false;
    }
    const auto lhs = static_cast<std::uint64_t>(ts.time_since_epoch().count());
    const auto rhs = static_cast<std::uint64_t>(now.time_since_epoch().count());
    const std::uint64_t distance = ts < now ? rhs - lhs : lhs - rhs;
    return distance <= static_cast<std::uint64_t>(skew.count());
}

} // namespace

std::expected<RequestParams, std::error_code> RequestParams::from_url(std::string_view method,
                                                                      std::string_view url) {
    const auto parsed = boost::urls::parse_uri(url);
    if (!parsed) {
        return std::unexpected{make_error_code(error::invalid_url)};
    }
    const boost::urls::url_view &view = parsed.value();

    RequestParams ret;
    ret.method = method;

    ret.host = view.host();
    if (!view.has_authority() || ret.host.empty()) {
        return std::unexpected{make_error_code(error::invalid_url)};
    }

    if (view.has_port() && !view.port().empty()) {
        ret.port = view.port_number();
        // port_number() is 0 for ports that do not fit
        if (ret.port == 0) {
            return std::unexpected{make_error_code(error::invalid_url)};
        }
    } else {
        switch (view.scheme_id()) {
        case boost::urls::scheme::http:
            ret.port = 80;
            break;
        case boost::urls::scheme::https:
            ret.port = 443;
            break;
        default:
            return std::unexpected{make_error_code(error::invalid_url)};
        }
    }

    ret.path = static_cast<std::string_view>(view.encoded_path());
    if (ret.path.empty()) {
        ret.path = "/";
    }
    if (view.has_query()) {
        ret.path.append("?");
        ret.path.append(static_cast<std::string_view>(view.encoded_query()));
    }

    return ret;
}

Request::Request(RequestParams params) : params_{std::move(params)} {
    check_component(params_.ext, "ext");
    check_component(params_.app, "app");
    check_component(params_.dlg, "dlg");
}

std::expected<Header, std::error_code> Request::make_header(const Credentials &credentials) const {
    const auto state = RequestState::generate(credentials.key.cryptographer());
    if (!state) {
        return std::unexpected{state.error()};
    }
    return make_header_full(credentials, *state);
}

std::expected<Header, std::error_code> Request::make_header_full(const Credentials &credentials,
                                                                 const RequestState &state) const {
    auto mac = compute_mac(MacType::header, credentials.key,
                           MacInput{.ts = state.ts,
                                    .nonce = state.nonce,
                                    .method = params_.method,
                                    .host = params_.host,
                                    .port = params_.port,
                                    .path = params_.path,
                                    .hash = _internal::optional_span(params_.hash),
                                    .ext = _internal::optional_view(params_.ext)});
    if (!mac) {
        return std::unexpected{mac.error()};
    }

    return Header{HeaderFields{.id = credentials.id,
                               .ts = state.ts,
                               .nonce = state.nonce,
                               .mac = std::move(mac.value()),
                               .ext = params_.ext,
                               .hash = params_.hash,
                               .app = params_.app,
                               .dlg = params_.dlg}};
}

std::expected<Bewit, std::error_code> Request::make_bewit(const Credentials &credentials,
                                                          std::chrono::sys_seconds exp) const {
    // a bewit has no nonce and its expiry takes the place of the timestamp
    auto mac = compute_mac(MacType::header, credentials.key,
                           MacInput{.ts = exp,
                                    .nonce = "",
                                    .method = params_.method,
                                    .host = params_.host,
                                    .port = params_.port,
                                    .path = params_.path,
                                    .hash = std::nullopt,
                                    .ext = _internal::optional_view(params_.ext)});
    if (!mac) {
        return std::unexpected{mac.error()};
    }
    return Bewit{credentials.id, exp, std::move(mac.value()), params_.ext};
}

std::expected<Bewit, std::error_code> Request::make_bewit_with_ttl(const Credentials &credentials,
                                                                   std::chrono::seconds ttl) const {
    const auto now = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
    return make_bewit(credentials, now + ttl);
}

bool Request::validate_header(const Header &header, const Key &key, std::chrono::seconds ts_skew) const {
    return validate_header(header, key, ts_skew,
                           std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now()));
}

bool Request::validate_header(const Header &header, const Key &key, std::chrono::seconds ts_skew,
                              std::chrono::sys_seconds now) const {
    if (!header.ts() || !header.nonce() || !header.mac()) {
        return false;
    }

    const auto calculated = compute_mac(MacType::header, key,
                                        MacInput{.ts = *header.ts(),
                                                 .nonce = *header.nonce(),
                                                 .method = params_.method,
                                                 .host = params_.host,
                                                 .port = params_.port,
                                                 .path = params_.path,
                                                 .hash = _internal::optional_span(header.hash()),
                                                 .ext = _internal::optional_view(header.ext())});
    if (!calculated) {
        return false;
    }
    if (!key.cryptographer().constant_time_compare(calculated->bytes(), header.mac()->bytes())) {
        return false;
    }

    // an unsolicited hash is covered by the MAC but not otherwise checked
    if (params_.hash) {
        if (!header.hash() || !key.cryptographer().constant_time_compare(*params_.hash, *header.hash())) {
            return false;
        }
    }

    return within_skew(*header.ts(), now, ts_skew);
}

bool Request::validate_bewit(const Bewit &bewit, const Key &key) const {
    return validate_bewit(bewit, key,
                          std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now()));
}

bool Request::validate_bewit(const Bewit &bewit, const Key &key, std::chrono::sys_seconds now) const {
    const auto calculated = compute_mac(MacType::header, key,
                                        MacInput{.ts = bewit.exp(),
                                                 .nonce = "",
                                                 .method = params_.method,
                                                 .host = params_.host,
                                                 .port = params_.port,
                                                 .path = params_.path,
                                                 .hash = std::nullopt,
                                                 .ext = _internal::optional_view(bewit.ext())});
    if (!calculated) {
        return false;
    }
    if (!key.cryptographer().constant_time_compare(calculated->bytes(), bewit.mac().bytes())) {
        return false;
    }

    return now <= bewit.exp();
}

Response Request::make_response(const RequestState &state, ResponseParams params) const {
    return Response{params_.method, params_.host, params_.port, params_.path, state, std::move(params)};
}

} // namespace hawkcpp
