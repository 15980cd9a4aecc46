#pragma once

#include "hawkcpp/crypto/cryptographer.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <system_error>
#include <vector>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp::crypto {

class BotanCryptographer final : public Cryptographer {
public:
    [[nodiscard]] std::expected<std::unique_ptr<HmacKey>, std::error_code>
    new_key(DigestAlgorithm algorithm, std::span<const std::uint8_t> secret) const override;

    [[nodiscard]] std::expected<std::unique_ptr<Hasher>, std::error_code>
    new_hasher(DigestAlgorithm algorithm) const override;

    [[nodiscard]] std::expected<void, std::error_code> rand_bytes(std::span<std::uint8_t> output) const override;

    [[nodiscard]] bool constant_time_compare(std::span<const std::uint8_t> lhs,
                                             std::span<const std::uint8_t> rhs) const override;
};

[[nodiscard]] std::shared_ptr<const Cryptographer> make_botan_cryptographer();

} // namespace hawkcpp::crypto

//
#include "hawkcpp/internal/macro-end.hpp"
