#include "hawkcpp/payload.hpp"

#include "hawkcpp/crypto/cryptographer.hpp"
#include "hawkcpp/meta.hpp"

#include <cstdint>
#include <expected>
#include <initializer_list>
#include <memory>
#include <span>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace hawkcpp {

PayloadHasher::PayloadHasher(std::unique_ptr<crypto::Hasher> hasher) : hasher_{std::move(hasher)} {}

std::expected<PayloadHasher, std::error_code> PayloadHasher::create(std::string_view content_type,
                                                                    crypto::DigestAlgorithm algorithm,
                                                                    const crypto::Cryptographer &cryptographer) {
    auto hasher = cryptographer.new_hasher(algorithm);
    if (!hasher) {
        return std::unexpected{hasher.error()};
    }
    PayloadHasher ret{std::move(hasher.value())};

    for (const std::string_view preamble :
         std::initializer_list<std::string_view>{"hawk.1.payload\n", content_type, "\n"}) {
        if (const auto res = ret.update(preamble); !res) {
            return std::unexpected{res.error()};
        }
    }
    return ret;
}

std::expected<std::vector<std::uint8_t>, std::error_code>
PayloadHasher::hash(std::string_view content_type, crypto::DigestAlgorithm algorithm,
                    const crypto::Cryptographer &cryptographer, std::span<const std::uint8_t> payload) {
    auto hasher = create(content_type, algorithm, cryptographer);
    if (!hasher) {
        return std::unexpected{hasher.error()};
    }
    if (const auto res = hasher->update(payload); !res) {
        return std::unexpected{res.error()};
    }
    return std::move(hasher.value()).finish();
}

std::expected<std::vector<std::uint8_t>, std::error_code>
PayloadHasher::hash(std::string_view content_type, crypto::DigestAlgorithm algorithm,
                    const crypto::Cryptographer &cryptographer, std::string_view payload) {
    return hash(content_type, algorithm, cryptographer, meta::as_bytes(payload));
}

std::expected<void, std::error_code> PayloadHasher::update(std::span<const std::uint8_t> data) {
    if (hasher_ == nullptr) {
        throw std::logic_error{"PayloadHasher used after finish()"};
    }
    return hasher_->update(data);
}

std::expected<void, std::error_code> PayloadHasher::update(std::string_view data) {
    return update(meta::as_bytes(data));
}

std::expected<std::vector<std::uint8_t>, std::error_code> PayloadHasher::finish() && {
    if (hasher_ == nullptr) {
        throw std::logic_error{"PayloadHasher finished twice"};
    }
    const std::unique_ptr<crypto::Hasher> hasher = std::move(hasher_);
    if (const auto res = hasher->update(meta::as_bytes("\n")); !res) {
        return std::unexpected{res.error()};
    }
    return hasher->finish();
}

} // namespace hawkcpp
