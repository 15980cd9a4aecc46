#include "hawkcpp/mac.hpp"

#include "hawkcpp/b64.hpp"
#include "hawkcpp/credentials.hpp"
#include "hawkcpp/meta.hpp"

#include <botan/mem_ops.h>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace hawkcpp {

bool operator==(const Mac &lhs, const Mac &rhs) {
    if (lhs.bytes_.size() != rhs.bytes_.size()) {
        return false;
    }
    return Botan::constant_time_compare(lhs.bytes_.data(), rhs.bytes_.data(), lhs.bytes_.size());
}

std::string canonical_string(MacType type, const MacInput &input) {
    std::string ret;
    ret.reserve(256);

    ret.append(type == MacType::header ? "hawk.1.header\n" : "hawk.1.response\n");
    std::format_to(std::back_inserter(ret), "{}\n", input.ts.time_since_epoch().count());
    std::format_to(std::back_inserter(ret), "{}\n", input.nonce);
    std::format_to(std::back_inserter(ret), "{}\n", input.method);
    std::format_to(std::back_inserter(ret), "{}\n", input.path);
    std::format_to(std::back_inserter(ret), "{}\n", input.host);
    std::format_to(std::back_inserter(ret), "{}\n", input.port);
    if (input.hash) {
        ret.append(b64::encode(*input.hash));
    }
    ret.append("\n");
    if (input.ext) {
        ret.append(*input.ext);
    }
    ret.append("\n");

    return ret;
}

std::expected<Mac, std::error_code> compute_mac(MacType type, const Key &key, const MacInput &input) {
    const std::string canonical = canonical_string(type, input);
    auto signature = key.sign(meta::as_bytes(canonical));
    if (!signature) {
        return std::unexpected{signature.error()};
    }
    return Mac{std::move(signature.value())};
}

} // namespace hawkcpp
