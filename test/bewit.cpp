#include "hawkcpp/b64.hpp"
#include "hawkcpp/bewit.hpp"
#include "hawkcpp/error.hpp"
#include "hawkcpp/mac.hpp"
#include "hawkcpp/meta.hpp"

#include <chrono>
#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

const hawkcpp::Mac mac{{126, 44,  184, 123, 156, 1,  117, 170, 67,  55,  17,  199, 120, 13, 124, 54,
                        180, 171, 83,  85,  55,  137, 46, 186, 130, 109, 23, 141, 50,  105, 99, 37}};
const std::chrono::sys_seconds expiry{std::chrono::seconds{1353832834}};

constexpr std::string_view bewit_chk =
    "bWVcMTM1MzgzMjgzNFxmaXk0ZTV3QmRhcEROeEhIZUExOE5yU3JVMVUzaVM2NmdtMFhqVEpwWXlVPVw";
constexpr std::string_view bewit_ext_chk =
    "bWVcMTM1MzgzMjgzNFxmaXk0ZTV3QmRhcEROeEhIZUExOE5yU3JVMVUzaVM2NmdtMFhqVEpwWXlVPVxhYmNk";

[[nodiscard]] std::string encode_raw(std::string_view raw) {
    return hawkcpp::b64::encode_url(hawkcpp::meta::as_bytes(raw));
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    const hawkcpp::Bewit bewit{"me", expiry, mac, std::nullopt};
    if (bewit.to_str() != bewit_chk) {
        std::cerr << "to_str failed, got " << bewit.to_str() << "\n";
        return 1;
    }

    const hawkcpp::Bewit bewit_ext{"me", expiry, mac, "abcd"};
    if (bewit_ext.to_str() != bewit_ext_chk) {
        std::cerr << "to_str with ext failed, got " << bewit_ext.to_str() << "\n";
        return 1;
    }

    for (const auto &candidate : {bewit, bewit_ext}) {
        if (hawkcpp::Bewit::from_str(candidate.to_str()) != candidate) {
            std::cerr << "from_str did not round trip " << candidate.to_str() << "\n";
            return 1;
        }
    }

    if (hawkcpp::Bewit{"me", expiry, mac, ""} != bewit ||
        hawkcpp::Bewit::from_str(hawkcpp::Bewit{"me", expiry, mac, ""}.to_str())->ext()) {
        std::cerr << "empty ext was not treated as absent\n";
        return 1;
    }

    {
        const auto decoded = hawkcpp::Bewit::from_str(bewit_chk);
        if (!decoded || decoded->id() != "me" || decoded->exp() != expiry || decoded->mac() != mac || decoded->ext()) {
            std::cerr << "from_str failed\n";
            return 1;
        }
    }

    const std::string mac_b64 = hawkcpp::b64::encode(mac.bytes());
    const std::vector<std::pair<std::string, hawkcpp::error>> failures{
        {"!!!", hawkcpp::error::base64_decode},
        {encode_raw("me\\1353832834\\" + mac_b64), hawkcpp::error::invalid_bewit_format},
        {encode_raw("me\\1353832834\\" + mac_b64 + "\\ext\\more"), hawkcpp::error::invalid_bewit_format},
        {encode_raw("m\xff\\1353832834\\" + mac_b64 + "\\"), hawkcpp::error::invalid_bewit_id},
        {encode_raw("me\\-1\\" + mac_b64 + "\\"), hawkcpp::error::invalid_bewit_exp},
        {encode_raw("me\\12a\\" + mac_b64 + "\\"), hawkcpp::error::invalid_bewit_exp},
        {encode_raw("me\\\\" + mac_b64 + "\\"), hawkcpp::error::invalid_bewit_exp},
        {encode_raw("me\\99999999999999999999\\" + mac_b64 + "\\"), hawkcpp::error::invalid_bewit_exp},
        {encode_raw("me\\1353832834\\not-base64\\"), hawkcpp::error::invalid_bewit_mac},
        {encode_raw("me\\1353832834\\" + mac_b64 + "\\\xc3"), hawkcpp::error::invalid_bewit_ext},
    };
    for (const auto &[input, code] : failures) {
        const auto decoded = hawkcpp::Bewit::from_str(input);
        if (decoded || decoded.error() != hawkcpp::make_error_code(code)) {
            std::cerr << "from_str of " << input << " did not fail with " << hawkcpp::make_error_code(code).message()
                      << "\n";
            return 1;
        }
    }

    {
        std::string path = "/v1/api?a=1&b=2";
        const auto extracted = hawkcpp::Bewit::from_path(path);
        if (!extracted || extracted->has_value() || path != "/v1/api?a=1&b=2") {
            std::cerr << "from_path changed a path without bewit\n";
            return 1;
        }
    }

    const std::vector<std::pair<std::string, std::string>> paths{
        {std::format("/v1/api?bewit={}", bewit_chk), "/v1/api"},
        {std::format("/v1/api?a=1&bewit={}", bewit_chk), "/v1/api?a=1"},
        {std::format("/v1/api?bewit={}&a=1&b=2", bewit_chk), "/v1/api?a=1&b=2"},
        {std::format("/v1/api?a=1&bewit={}&b=2", bewit_chk), "/v1/api?a=1&b=2"},
    };
    for (const auto &[input, stripped_chk] : paths) {
        std::string path = input;
        const auto extracted = hawkcpp::Bewit::from_path(path);
        if (!extracted || !extracted->has_value() || **extracted != bewit || path != stripped_chk) {
            std::cerr << "from_path of " << input << " failed, path is now " << path << "\n";
            return 1;
        }
    }

    {
        std::string path = std::format("/v1/api?bewit={}&bewit={}", bewit_chk, bewit_chk);
        const std::string original = path;
        const auto extracted = hawkcpp::Bewit::from_path(path);
        if (extracted || extracted.error() != hawkcpp::make_error_code(hawkcpp::error::multiple_bewits) ||
            path != original) {
            std::cerr << "from_path accepted multiple bewits\n";
            return 1;
        }
    }

    {
        std::string path = "/v1/api?bewit=!!!";
        if (hawkcpp::Bewit::from_path(path) || path != "/v1/api?bewit=!!!") {
            std::cerr << "from_path accepted an invalid bewit\n";
            return 1;
        }
    }

    const std::vector<std::pair<std::string, std::string>> invalid{{"m\\e", "x"}, {"me", "x\\y"}};
    for (const auto &[id, ext] : invalid) {
        bool threw = false;
        try {
            static_cast<void>(hawkcpp::Bewit{id, expiry, mac, ext});
        } catch (const std::invalid_argument &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "a backslash in a bewit was accepted\n";
            return 1;
        }
    }

    {
        // exp is encoded unsigned, so a negative one could never be parsed back
        bool threw = false;
        try {
            const std::chrono::sys_seconds before_epoch{std::chrono::seconds{-5}};
            static_cast<void>(hawkcpp::Bewit{"me", before_epoch, mac, std::nullopt});
        } catch (const std::invalid_argument &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "a bewit expiring before the epoch was accepted\n";
            return 1;
        }
    }
}
