#pragma once

#include "hawkcpp/credentials.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp {

// selects the first line of the canonical string
enum class MacType : std::uint8_t { header, response };

// equality is constant-time
class Mac {
private:
    std::vector<std::uint8_t> bytes_;

public:
    Mac() = default;
    explicit Mac(std::vector<std::uint8_t> bytes) : bytes_{std::move(bytes)} {}

    [[nodiscard]] std::span<const std::uint8_t> bytes() const { return bytes_; }
    [[nodiscard]] std::size_t size() const { return bytes_.size(); }

    friend bool operator==(const Mac &lhs, const Mac &rhs);
};

struct MacInput {
    std::chrono::sys_seconds ts;
    std::string_view nonce;
    std::string_view method;
    std::string_view host;
    std::uint16_t port{};
    std::string_view path;
    std::optional<std::span<const std::uint8_t>> hash;
    std::optional<std::string_view> ext;
};

// the exact bytes that are signed
[[nodiscard]] std::string canonical_string(MacType type, const MacInput &input);

[[nodiscard]] std::expected<Mac, std::error_code> compute_mac(MacType type, const Key &key, const MacInput &input);

} // namespace hawkcpp

//
#include "hawkcpp/internal/macro-end.hpp"
