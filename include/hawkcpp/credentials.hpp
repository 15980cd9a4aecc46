#pragma once

#include "hawkcpp/crypto/cryptographer.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp {

// shared secret bound to a digest algorithm; the secret is not retrievable, copies share the backend key
class Key {
private:
    std::shared_ptr<const crypto::Cryptographer> cryptographer_;
    std::shared_ptr<const crypto::HmacKey> hmac_;
    crypto::DigestAlgorithm algorithm_;

    Key(std::shared_ptr<const crypto::Cryptographer> cryptographer, std::shared_ptr<const crypto::HmacKey> hmac,
        crypto::DigestAlgorithm algorithm);

public:
    [[nodiscard]] static std::expected<Key, std::error_code>
    create(std::shared_ptr<const crypto::Cryptographer> cryptographer, crypto::DigestAlgorithm algorithm,
           std::span<const std::uint8_t> secret);

    // the bytes of the string are used as the secret
    [[nodiscard]] static std::expected<Key, std::error_code>
    create(std::shared_ptr<const crypto::Cryptographer> cryptographer, crypto::DigestAlgorithm algorithm,
           std::string_view secret);

    [[nodiscard]] std::expected<std::vector<std::uint8_t>, std::error_code>
    sign(std::span<const std::uint8_t> data) const;

    [[nodiscard]] crypto::DigestAlgorithm algorithm() const { return algorithm_; }
    [[nodiscard]] const crypto::Cryptographer &cryptographer() const { return *cryptographer_; }
};

struct Credentials {
    std::string id;
    Key key;
};

} // namespace hawkcpp

//
#include "hawkcpp/internal/macro-end.hpp"
