#include "hawkcpp/beast/sign.hpp"

#include "hawkcpp/error.hpp"
#include "hawkcpp/request.hpp"

#include <boost/url/authority_view.hpp>
#include <boost/url/parse.hpp>
#include <cstdint>
#include <expected>
#include <string_view>
#include <system_error>

namespace hawkcpp::beast::_internal {

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
std::expected<RequestParams, std::error_code> request_params(std::string_view method_string, std::string_view target,
                                                             std::string_view host_field,
                                                             std::uint16_t default_port) {
    const auto authority = boost::urls::parse_authority(host_field);
    if (!authority || authority->has_userinfo()) {
        return std::unexpected{make_error_code(error::invalid_url)};
    }

    RequestParams ret;
    ret.method = method_string;
    ret.host = authority->host();
    if (ret.host.empty()) {
        return std::unexpected{make_error_code(error::invalid_url)};
    }

    ret.port = default_port;
    if (authority->has_port() && !authority->port().empty()) {
        ret.port = authority->port_number();
        if (ret.port == 0) {
            return std::unexpected{make_error_code(error::invalid_url)};
        }
    }

    ret.path = target.empty() ? std::string_view{"/"} : target;
    return ret;
}

} // namespace hawkcpp::beast::_internal
