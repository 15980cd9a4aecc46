#pragma once

#include "hawkcpp/credentials.hpp"
#include "hawkcpp/header.hpp"
#include "hawkcpp/state.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp {

struct ResponseParams {
    // always computed from the response payload, never copied from a header
    std::optional<std::vector<std::uint8_t>> hash;
    // only meaningful on the server, the client takes ext from the received header
    std::optional<std::string> ext;
};

// server side: creates the Server-Authorization header, client side: validates it
class Response {
private:
    std::string method_;
    std::string host_;
    std::uint16_t port_;
    std::string path_;
    RequestState state_;
    ResponseParams params_;

public:
    // throws std::invalid_argument if ext contains '"'
    Response(std::string method, std::string host, std::uint16_t port, std::string path, RequestState state,
             ResponseParams params = {});

    // only mac, ext and hash are populated
    [[nodiscard]] std::expected<Header, std::error_code> make_header(const Key &key) const;

    // the timestamp is the locally generated one, so it is not checked
    [[nodiscard]] bool validate_header(const Header &header, const Key &key) const;
};

} // namespace hawkcpp

//
#include "hawkcpp/internal/macro-end.hpp"
