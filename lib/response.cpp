#include "hawkcpp/response.hpp"

#include "hawkcpp/credentials.hpp"
#include "hawkcpp/header.hpp"
#include "hawkcpp/mac.hpp"
#include "hawkcpp/state.hpp"
#include "mac_input.hpp"

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace hawkcpp {

Response::Response(std::string method, std::string host, std::uint16_t port, std::string path, RequestState state,
                   ResponseParams params)
    : method_{std::move(method)}, host_{std::move(host)}, port_{port}, path_{std::move(path)},
      state_{std::move(state)}, params_{std::move(params)} {
    if (params_.ext && params_.ext->contains('"')) {
        throw std::invalid_argument{"response ext may not contain '\"'"};
    }
}

std::expected<Header, std::error_code> Response::make_header(const Key &key) const {
    auto mac = compute_mac(MacType::response, key,
                           MacInput{.ts = state_.ts,
                                    .nonce = state_.nonce,
                                    .method = method_,
                                    .host = host_,
                                    .port = port_,
                                    .path = path_,
                                    .hash = _internal::optional_span(params_.hash),
                                    .ext = _internal::optional_view(params_.ext)});
    if (!mac) {
        return std::unexpected{mac.error()};
    }

    return Header{HeaderFields{.mac = std::move(mac.value()), .ext = params_.ext, .hash = params_.hash}};
}

bool Response::validate_header(const Header &header, const Key &key) const {
    if (!header.mac()) {
        return false;
    }

    const auto calculated = compute_mac(MacType::response, key,
                                        MacInput{.ts = state_.ts,
                                                 .nonce = state_.nonce,
                                                 .method = method_,
                                                 .host = host_,
                                                 .port = port_,
                                                 .path = path_,
                                                 .hash = _internal::optional_span(header.hash()),
                                                 .ext = _internal::optional_view(header.ext())});
    if (!calculated) {
        return false;
    }
    if (!key.cryptographer().constant_time_compare(calculated->bytes(), header.mac()->bytes())) {
        return false;
    }

    if (params_.hash) {
        return header.hash() && key.cryptographer().constant_time_compare(*params_.hash, *header.hash());
    }
    return true;
}

} // namespace hawkcpp
