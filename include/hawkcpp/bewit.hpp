#pragma once

#include "hawkcpp/mac.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

//
#include "hawkcpp/internal/macro-begin.hpp"

namespace hawkcpp {

// url-safe base64 of `id\exp\base64(mac)\ext`, carried in the bewit query parameter
// an empty ext is the same as no ext
class Bewit {
private:
    std::string id_;
    std::chrono::sys_seconds exp_;
    Mac mac_;
    std::optional<std::string> ext_;

public:
    // throws std::invalid_argument if id or ext contain '\' or exp is before the epoch
    Bewit(std::string id, std::chrono::sys_seconds exp, Mac mac, std::optional<std::string> ext);

    [[nodiscard]] static std::expected<Bewit, std::error_code> from_str(std::string_view bewit);

    // removes the single bewit= component from path and decodes it; nullopt and path untouched without one,
    // error::multiple_bewits with more than one
    [[nodiscard]] static std::expected<std::optional<Bewit>, std::error_code> from_path(std::string &path);

    [[nodiscard]] std::string to_str() const;

    [[nodiscard]] const std::string &id() const { return id_; }
    [[nodiscard]] std::chrono::sys_seconds exp() const { return exp_; }
    [[nodiscard]] const Mac &mac() const { return mac_; }
    [[nodiscard]] const std::optional<std::string> &ext() const { return ext_; }

    friend bool operator==(const Bewit &lhs, const Bewit &rhs) = default;
};

} // namespace hawkcpp

//
#include "hawkcpp/internal/macro-end.hpp"
