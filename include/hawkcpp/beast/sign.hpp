#pragma once

#include "hawkcpp/credentials.hpp"
#include "hawkcpp/error.hpp"
#include "hawkcpp/header.hpp"
#include "hawkcpp/request.hpp"
#include "hawkcpp/state.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp::beast {

namespace _internal {

// host and port from the Host field, path from the request target
[[nodiscard]] std::expected<RequestParams, std::error_code> request_params(std::string_view method_string,
                                                                           std::string_view target,
                                                                           std::string_view host_field,
                                                                           std::uint16_t default_port);

} // namespace _internal

// sets the Authorization field of a request that already carries its Host field
// throws std::invalid_argument if ext, the credentials id or the state nonce contain '"'
template <typename HttpRequest>
[[nodiscard]] std::expected<void, std::error_code>
sign_request(HttpRequest &request, const Credentials &credentials, const RequestState &state,
             std::uint16_t default_port, std::optional<std::vector<std::uint8_t>> hash = std::nullopt,
             std::optional<std::string> ext = std::nullopt) {
    auto params = _internal::request_params(request.method_string(), request.target(),
                                            request[boost::beast::http::field::host], default_port);
    if (!params) {
        return std::unexpected{params.error()};
    }
    params->hash = std::move(hash);
    params->ext = std::move(ext);

    const auto header = Request{std::move(params.value())}.make_header_full(credentials, state);
    if (!header) {
        return std::unexpected{header.error()};
    }
    request.set(boost::beast::http::field::authorization, authorization_value(*header));
    return {};
}

// hash is the payload hash of the received body; any failure is error::unauthenticated
template <typename HttpRequest>
[[nodiscard]] std::expected<Header, std::error_code>
authenticate_request(const HttpRequest &request, const Key &key, std::chrono::seconds ts_skew,
                     std::uint16_t default_port, std::optional<std::vector<std::uint8_t>> hash = std::nullopt) {
    const auto unauthenticated = make_error_code(error::unauthenticated);

    const auto authorization = request.find(boost::beast::http::field::authorization);
    if (authorization == request.end()) {
        return std::unexpected{unauthenticated};
    }
    auto header = parse_authorization(authorization->value());
    if (!header) {
        return std::unexpected{unauthenticated};
    }

    auto params = _internal::request_params(request.method_string(), request.target(),
                                            request[boost::beast::http::field::host], default_port);
    if (!params) {
        return std::unexpected{unauthenticated};
    }
    params->hash = std::move(hash);

    if (!Request{std::move(params.value())}.validate_header(*header, key, ts_skew)) {
        return std::unexpected{unauthenticated};
    }
    return header;
}

} // namespace hawkcpp::beast

//
#include "hawkcpp/internal/macro-end.hpp"
