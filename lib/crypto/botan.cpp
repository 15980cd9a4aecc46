#include "hawkcpp/crypto/botan.hpp"

#include "hawkcpp/crypto/cryptographer.hpp"
#include "hawkcpp/error.hpp"

#include <botan/exceptn.h>
#include <botan/hash.h>
#include <botan/mac.h>
#include <botan/mem_ops.h>
#include <botan/secmem.h>
#include <botan/system_rng.h>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace hawkcpp::crypto {

namespace {

[[nodiscard]] std::optional<std::string_view> botan_hash_name(DigestAlgorithm algorithm) {
    switch (algorithm) {
    case DigestAlgorithm::sha256:
        return "SHA-256";
    case DigestAlgorithm::sha384:
        return "SHA-384";
    case DigestAlgorithm::sha512:
        return "SHA-512";
    }
    return std::nullopt;
}

class BotanHmacKey final : public HmacKey {
private:
    std::string mac_name_;
    Botan::secure_vector<std::uint8_t> secret_;

public:
    BotanHmacKey(std::string mac_name, std::span<const std::uint8_t> secret)
        : mac_name_{std::move(mac_name)}, secret_{secret.begin(), secret.end()} {}

    [[nodiscard]] std::expected<std::vector<std::uint8_t>, std::error_code>
    sign(std::span<const std::uint8_t> data) const override {
        // a fresh MAC object per call, Botan MACs carry state between update() and final()
        try {
            auto hmac = Botan::MessageAuthenticationCode::create_or_throw(mac_name_);
            hmac->set_key(secret_);
            hmac->update(data);
            return hmac->final_stdvec();
        } catch (const Botan::Exception &) {
            return std::unexpected{make_error_code(error::crypto)};
        }
    }
};

class BotanHasher final : public Hasher {
private:
    std::unique_ptr<Botan::HashFunction> hash_;

public:
    explicit BotanHasher(std::unique_ptr<Botan::HashFunction> hash) : hash_{std::move(hash)} {}

    [[nodiscard]] std::expected<void, std::error_code> update(std::span<const std::uint8_t> data) override {
        if (hash_ == nullptr) {
            return std::unexpected{make_error_code(error::crypto)};
        }
        hash_->update(data);
        return {};
    }

    [[nodiscard]] std::expected<std::vector<std::uint8_t>, std::error_code> finish() override {
        if (hash_ == nullptr) {
            return std::unexpected{make_error_code(error::crypto)};
        }
        auto digest = hash_->final_stdvec();
        hash_.reset();
        return digest;
    }
};

} // namespace

std::expected<std::unique_ptr<HmacKey>, std::error_code>
BotanCryptographer::new_key(DigestAlgorithm algorithm, std::span<const std::uint8_t> secret) const {
    const auto hash_name = botan_hash_name(algorithm);
    if (!hash_name) {
        return std::unexpected{make_error_code(error::unsupported_digest)};
    }
    return std::make_unique<BotanHmacKey>(std::format("HMAC({})", *hash_name), secret);
}

std::expected<std::unique_ptr<Hasher>, std::error_code>
BotanCryptographer::new_hasher(DigestAlgorithm algorithm) const {
    const auto hash_name = botan_hash_name(algorithm);
    if (!hash_name) {
        return std::unexpected{make_error_code(error::unsupported_digest)};
    }
    try {
        return std::make_unique<BotanHasher>(Botan::HashFunction::create_or_throw(*hash_name));
    } catch (const Botan::Exception &) {
        return std::unexpected{make_error_code(error::crypto)};
    }
}

std::expected<void, std::error_code> BotanCryptographer::rand_bytes(std::span<std::uint8_t> output) const {
    try {
        // the system RNG is safe to share between threads
        Botan::system_rng().randomize(output);
    } catch (const Botan::Exception &) {
        return std::unexpected{make_error_code(error::crypto)};
    }
    return {};
}

bool BotanCryptographer::constant_time_compare(std::span<const std::uint8_t> lhs,
                                               std::span<const std::uint8_t> rhs) const {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return Botan::constant_time_compare(lhs.data(), rhs.data(), lhs.size());
}

std::shared_ptr<const Cryptographer> make_botan_cryptographer() {
    return std::make_shared<const BotanCryptographer>();
}

} // namespace hawkcpp::crypto
