#pragma once

#include "hawkcpp/bewit.hpp"
#include "hawkcpp/credentials.hpp"
#include "hawkcpp/crypto/cryptographer.hpp"
#include "hawkcpp/header.hpp"
#include "hawkcpp/response.hpp"
#include "hawkcpp/state.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp {

struct RequestParams {
    std::string method;
    std::string host;
    std::uint16_t port{};
    // path including the query string, if any
    std::string path;
    std::optional<std::vector<std::uint8_t>> hash;
    std::optional<std::string> ext;
    std::optional<std::string> app;
    std::optional<std::string> dlg;

    // host, port (explicit or the scheme default) and path+query from an absolute http(s) URL
    [[nodiscard]] static std::expected<RequestParams, std::error_code> from_url(std::string_view method,
                                                                                std::string_view url);
};

// what a Hawk MAC covers for one HTTP request, used to sign on the client and to validate on the server
class Request {
private:
    RequestParams params_;

public:
    // throws std::invalid_argument if ext, app or dlg contain '"'
    explicit Request(RequestParams params);

    [[nodiscard]] const RequestParams &params() const { return params_; }

    // signs with a freshly generated RequestState
    [[nodiscard]] std::expected<Header, std::error_code> make_header(const Credentials &credentials) const;

    [[nodiscard]] std::expected<Header, std::error_code> make_header_full(const Credentials &credentials,
                                                                          const RequestState &state) const;

    // throws std::invalid_argument if the credentials id or ext contain '\' or exp is before the epoch
    [[nodiscard]] std::expected<Bewit, std::error_code> make_bewit(const Credentials &credentials,
                                                                   std::chrono::sys_seconds exp) const;

    // throws like make_bewit
    [[nodiscard]] std::expected<Bewit, std::error_code> make_bewit_with_ttl(const Credentials &credentials,
                                                                            std::chrono::seconds ttl) const;

    // requires ts, nonce and mac; the MAC covers the local method/host/port/path and the header's ext and hash,
    // a local hash must equal the header's, and |now - ts| must not exceed ts_skew
    [[nodiscard]] bool validate_header(const Header &header, const Key &key, std::chrono::seconds ts_skew) const;
    [[nodiscard]] bool validate_header(const Header &header, const Key &key, std::chrono::seconds ts_skew,
                                       std::chrono::sys_seconds now) const;

    // the MAC must match and the bewit must not have expired
    [[nodiscard]] bool validate_bewit(const Bewit &bewit, const Key &key) const;
    [[nodiscard]] bool validate_bewit(const Bewit &bewit, const Key &key, std::chrono::sys_seconds now) const;

    [[nodiscard]] Response make_response(const RequestState &state, ResponseParams params = {}) const;
};

} // namespace hawkcpp

//
#include "hawkcpp/internal/macro-end.hpp"
