#include "hawkcpp/state.hpp"

#include "hawkcpp/b64.hpp"
#include "hawkcpp/crypto/cryptographer.hpp"
#include "hawkcpp/error.hpp"
#include "hawkcpp/header.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <system_error>

namespace hawkcpp {

namespace {

constexpr std::size_t nonce_bytes = 10;

}

std::expected<RequestState, std::error_code> RequestState::generate(const crypto::Cryptographer &cryptographer) {
    std::array<std::uint8_t, nonce_bytes> random{};
    if (const auto res = cryptographer.rand_bytes(random); !res) {
        return std::unexpected{res.error()};
    }
    return RequestState{.nonce = b64::encode_url(random),
                        .ts = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now())};
}

std::expected<RequestState, std::error_code> RequestState::from_header(const Header &header) {
    if (!header.nonce() || !header.ts()) {
        return std::unexpected{make_error_code(error::missing_attributes)};
    }
    return RequestState{.nonce = *header.nonce(), .ts = *header.ts()};
}

} // namespace hawkcpp
