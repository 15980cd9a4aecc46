#include "hawkcpp/b64.hpp"
#include "hawkcpp/crypto/botan.hpp"
#include "hawkcpp/crypto/cryptographer.hpp"
#include "hawkcpp/payload.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    const auto cryptographer = hawkcpp::crypto::make_botan_cryptographer();
    using hawkcpp::crypto::DigestAlgorithm;

    const std::vector<std::uint8_t> hash_chk{94, 16,  18,  216, 211, 65, 209, 208, 179, 220, 77,
                                             56, 116, 162, 71,  244, 214, 10, 7,   3,   156, 125,
                                             202, 174, 255, 95,  42,  66, 142, 115, 102, 101};

    const auto hash =
        hawkcpp::PayloadHasher::hash("text/plain", DigestAlgorithm::sha256, *cryptographer, "payload").value();
    if (hash != hash_chk) {
        std::cerr << "hash failed, got " << hawkcpp::b64::encode(hash) << "\n";
        return 1;
    }

    // chunking does not matter
    {
        auto hasher = hawkcpp::PayloadHasher::create("text/plain", DigestAlgorithm::sha256, *cryptographer).value();
        for (const auto *chunk : {"pay", "", "lo", "ad"}) {
            if (!hasher.update(chunk)) {
                std::cerr << "update failed\n";
                return 1;
            }
        }
        const auto chunked = std::move(hasher).finish().value();
        if (chunked != hash_chk) {
            std::cerr << "chunked hash failed, got " << hawkcpp::b64::encode(chunked) << "\n";
            return 1;
        }
    }

    // order does
    {
        auto hasher = hawkcpp::PayloadHasher::create("text/plain", DigestAlgorithm::sha256, *cryptographer).value();
        if (!hasher.update("load") || !hasher.update("pay")) {
            std::cerr << "update failed\n";
            return 1;
        }
        if (std::move(hasher).finish().value() == hash_chk) {
            std::cerr << "reordered chunks hashed like the payload\n";
            return 1;
        }
    }

    {
        const auto empty =
            hawkcpp::PayloadHasher::hash("text/plain", DigestAlgorithm::sha256, *cryptographer, "").value();
        if (hawkcpp::b64::encode(empty) != "q/t+NNAkQZNlq/aAD6PlexImwQTxwgT2MahfTa9XRLA=") {
            std::cerr << "empty payload hash failed, got " << hawkcpp::b64::encode(empty) << "\n";
            return 1;
        }
    }

    {
        const auto sha384 = hawkcpp::PayloadHasher::hash("application/json", DigestAlgorithm::sha384,
                                                         *cryptographer, R"({"a":1})")
                                .value();
        if (hawkcpp::b64::encode(sha384) != "bPFdMB0bCYnyd3r4p6WAD0rJKwdVTadQ0G8Tr9TETjkBuawqtD+WT+/Eue3XCyvS") {
            std::cerr << "sha384 payload hash failed, got " << hawkcpp::b64::encode(sha384) << "\n";
            return 1;
        }
    }

    if (hawkcpp::PayloadHasher::hash("text/html", DigestAlgorithm::sha256, *cryptographer, "payload").value() ==
        hash_chk) {
        std::cerr << "content type is not covered by the hash\n";
        return 1;
    }

    {
        auto hasher = hawkcpp::PayloadHasher::create("text/plain", DigestAlgorithm::sha256, *cryptographer).value();
        static_cast<void>(std::move(hasher).finish());
        bool threw = false;
        try {
            // NOLINTNEXTLINE(bugprone-use-after-move)
            static_cast<void>(hasher.update("more"));
        } catch (const std::logic_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "update after finish did not throw\n";
            return 1;
        }
    }
}
