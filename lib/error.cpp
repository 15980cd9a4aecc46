#include "hawkcpp/error.hpp"

#include <format>
#include <string>
#include <system_error>

namespace hawkcpp {

namespace {

class ErrorCategory final : public std::error_category {
public:
    [[nodiscard]] const char *name() const noexcept override { return "hawk"; }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<error>(value)) {
        case error::header_parse:
            return "unparseable Hawk header";
        case error::unknown_attribute:
            return "unknown Hawk header attribute";
        case error::missing_attributes:
            return "required Hawk attributes are missing";
        case error::invalid_timestamp:
            return "invalid Hawk timestamp";
        case error::base64_decode:
            return "invalid base64 value";
        case error::invalid_bewit_format:
            return "invalid bewit format";
        case error::invalid_bewit_id:
            return "invalid bewit id";
        case error::invalid_bewit_exp:
            return "invalid bewit exp";
        case error::invalid_bewit_mac:
            return "invalid bewit mac";
        case error::invalid_bewit_ext:
            return "invalid bewit ext";
        case error::multiple_bewits:
            return "multiple bewits in URL";
        case error::invalid_url:
            return "host, port or path cannot be derived from URL";
        case error::crypto:
            return "cryptographic backend failure";
        case error::unsupported_digest:
            return "unsupported digest algorithm";
        case error::unauthenticated:
            return "unauthenticated";
        }
        return std::format("unknown hawk error {}", value);
    }
};

} // namespace

const std::error_category &error_category() noexcept {
    static const ErrorCategory category;
    return category;
}

} // namespace hawkcpp
