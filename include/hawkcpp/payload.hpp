#pragma once

#include "hawkcpp/crypto/cryptographer.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp {

// hash attribute of an entity body: "hawk.1.payload\n", content type, "\n", body chunks in order, "\n"
class PayloadHasher {
private:
    std::unique_ptr<crypto::Hasher> hasher_;

    explicit PayloadHasher(std::unique_ptr<crypto::Hasher> hasher);

public:
    [[nodiscard]] static std::expected<PayloadHasher, std::error_code>
    create(std::string_view content_type, crypto::DigestAlgorithm algorithm,
           const crypto::Cryptographer &cryptographer);

    [[nodiscard]] static std::expected<std::vector<std::uint8_t>, std::error_code>
    hash(std::string_view content_type, crypto::DigestAlgorithm algorithm, const crypto::Cryptographer &cryptographer,
         std::span<const std::uint8_t> payload);

    [[nodiscard]] static std::expected<std::vector<std::uint8_t>, std::error_code>
    hash(std::string_view content_type, crypto::DigestAlgorithm algorithm, const crypto::Cryptographer &cryptographer,
         std::string_view payload);

    [[nodiscard]] std::expected<void, std::error_code> update(std::span<const std::uint8_t> data);
    [[nodiscard]] std::expected<void, std::error_code> update(std::string_view data);

    // consumes the hasher; any later use throws std::logic_error
    [[nodiscard]] std::expected<std::vector<std::uint8_t>, std::error_code> finish() &&;
};

} // namespace hawkcpp

//
#include "hawkcpp/internal/macro-end.hpp"
