#pragma once

#include "hawkcpp/crypto/cryptographer.hpp"
#include "hawkcpp/header.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <system_error>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp {

// nonce and timestamp of one request attempt, shared by the request and response MACs
struct RequestState {
    std::string nonce;
    std::chrono::sys_seconds ts;

    // 10 random bytes as url-safe base64, and the current time truncated to seconds
    [[nodiscard]] static std::expected<RequestState, std::error_code>
    generate(const crypto::Cryptographer &cryptographer);

    // server side: recover the state from a received Authorization header
    [[nodiscard]] static std::expected<RequestState, std::error_code> from_header(const Header &header);

    friend bool operator==(const RequestState &lhs, const RequestState &rhs) = default;
};

} // namespace hawkcpp

//
#include "hawkcpp/internal/macro-end.hpp"
