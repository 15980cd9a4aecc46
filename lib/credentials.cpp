#include "hawkcpp/credentials.hpp"

#include "hawkcpp/crypto/cryptographer.hpp"
#include "hawkcpp/meta.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace hawkcpp {

Key::Key(std::shared_ptr<const crypto::Cryptographer> cryptographer, std::shared_ptr<const crypto::HmacKey> hmac,
         crypto::DigestAlgorithm algorithm)
    : cryptographer_{std::move(cryptographer)}, hmac_{std::move(hmac)}, algorithm_{algorithm} {}

std::expected<Key, std::error_code> Key::create(std::shared_ptr<const crypto::Cryptographer> cryptographer,
                                                crypto::DigestAlgorithm algorithm,
                                                std::span<const std::uint8_t> secret) {
    auto hmac = cryptographer->new_key(algorithm, secret);
    if (!hmac) {
        return std::unexpected{hmac.error()};
    }
    return Key{std::move(cryptographer), std::shared_ptr<const crypto::HmacKey>{std::move(hmac.value())},
               algorithm};
}

std::expected<Key, std::error_code> Key::create(std::shared_ptr<const crypto::Cryptographer> cryptographer,
                                                crypto::DigestAlgorithm algorithm, std::string_view secret) {
    return create(std::move(cryptographer), algorithm, meta::as_bytes(secret));
}

std::expected<std::vector<std::uint8_t>, std::error_code> Key::sign(std::span<const std::uint8_t> data) const {
    return hmac_->sign(data);
}

} // namespace hawkcpp
