#pragma once

#include <boost/describe/enum.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <system_error>
#include <vector>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp::crypto {

enum class DigestAlgorithm : std::uint8_t { sha256, sha384, sha512 };
BOOST_DESCRIBE_ENUM(DigestAlgorithm, sha256, sha384, sha512);

// output length in bytes of both the digest and the HMAC built on it
[[nodiscard]] constexpr std::size_t digest_size(DigestAlgorithm algorithm) {
    switch (algorithm) {
    case DigestAlgorithm::sha256:
        return 32;
    case DigestAlgorithm::sha384:
        return 48;
    case DigestAlgorithm::sha512:
        return 64;
    }
    return 0;
}

// keyed HMAC, sign() may be called concurrently
class HmacKey {
public:
    HmacKey() = default;
    HmacKey(const HmacKey &) = delete;
    HmacKey &operator=(const HmacKey &) = delete;
    virtual ~HmacKey() = default;

    [[nodiscard]] virtual std::expected<std::vector<std::uint8_t>, std::error_code>
    sign(std::span<const std::uint8_t> data) const = 0;
};

// streaming digest, finish() may be called once
class Hasher {
public:
    Hasher() = default;
    Hasher(const Hasher &) = delete;
    Hasher &operator=(const Hasher &) = delete;
    virtual ~Hasher() = default;

    [[nodiscard]] virtual std::expected<void, std::error_code> update(std::span<const std::uint8_t> data) = 0;
    [[nodiscard]] virtual std::expected<std::vector<std::uint8_t>, std::error_code> finish() = 0;
};

// HMAC, digest, RNG and comparison backend; shared between threads
class Cryptographer {
public:
    Cryptographer() = default;
    Cryptographer(const Cryptographer &) = delete;
    Cryptographer &operator=(const Cryptographer &) = delete;
    virtual ~Cryptographer() = default;

    [[nodiscard]] virtual std::expected<std::unique_ptr<HmacKey>, std::error_code>
    new_key(DigestAlgorithm algorithm, std::span<const std::uint8_t> secret) const = 0;

    [[nodiscard]] virtual std::expected<std::unique_ptr<Hasher>, std::error_code>
    new_hasher(DigestAlgorithm algorithm) const = 0;

    [[nodiscard]] virtual std::expected<void, std::error_code> rand_bytes(std::span<std::uint8_t> output) const = 0;

    // must not leak the position of the first mismatch through timing
    [[nodiscard]] virtual bool constant_time_compare(std::span<const std::uint8_t> lhs,
                                                     std::span<const std::uint8_t> rhs) const = 0;
};

} // namespace hawkcpp::crypto

//
#include "hawkcpp/internal/macro-end.hpp"
