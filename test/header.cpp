#include "hawkcpp/error.hpp"
#include "hawkcpp/header.hpp"
#include "hawkcpp/mac.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

const hawkcpp::Mac mac{{8,  35, 182, 149, 42,  111, 33,  192, 19,  22,  94,  43, 118, 176, 65, 69,
                        86, 4,  156, 184, 85,  107, 249, 242, 172, 200, 66, 209, 57, 63, 38, 83}};

[[nodiscard]] hawkcpp::HeaderFields few_fields() {
    return hawkcpp::HeaderFields{.id = "dh37fgj492je",
                                 .ts = std::chrono::sys_seconds{std::chrono::seconds{1353832234}},
                                 .nonce = "j4h3g2",
                                 .mac = mac};
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    const hawkcpp::Header few{few_fields()};
    constexpr std::string_view few_chk =
        R"---(id="dh37fgj492je", ts="1353832234", nonce="j4h3g2", mac="CCO2lSpvIcATFl4rdrBBRVYEnLhVa/nyrMhC0Tk/JlM=")---";
    if (few.to_string() != few_chk) {
        std::cerr << "to_string failed, got \n" << few.to_string() << "\n";
        return 1;
    }

    auto maximal_fields = few_fields();
    maximal_fields.ext = "my-ext-value";
    maximal_fields.hash = std::vector<std::uint8_t>{1, 2, 3, 4};
    maximal_fields.app = "my-app";
    maximal_fields.dlg = "my-dlg";
    const hawkcpp::Header maximal{maximal_fields};
    constexpr std::string_view maximal_chk =
        R"---(id="dh37fgj492je", ts="1353832234", nonce="j4h3g2", mac="CCO2lSpvIcATFl4rdrBBRVYEnLhVa/nyrMhC0Tk/JlM=", ext="my-ext-value", hash="AQIDBA==", app="my-app", dlg="my-dlg")---";
    if (std::format("{}", maximal) != maximal_chk) {
        std::cerr << "format failed, got \n" << std::format("{}", maximal) << "\n";
        return 1;
    }

    for (const auto &header : {few, maximal, hawkcpp::Header{}}) {
        const auto parsed = hawkcpp::Header::parse(header.to_string());
        if (!parsed || *parsed != header) {
            std::cerr << "parse did not round trip \n" << header.to_string() << "\n";
            return 1;
        }
    }

    {
        const auto parsed =
            hawkcpp::Header::parse(R"(  id="xyz" ,ts="1353832234",   nonce="abc",mac="6R4rV5iE+NPoym+WwjeHzjAGXUtLNIxmo1vpMofpLAE=", ext="", )");
        const hawkcpp::Mac mac_chk{{233, 30, 43, 87, 152, 132, 248, 211, 232, 202, 111, 150, 194, 55,  135, 206,
                                    48,  6,  93, 75, 75,  52,  140, 102, 163, 91,  233, 50,  135, 233, 44,  1}};
        if (!parsed || parsed->id() != "xyz" ||
            parsed->ts() != std::chrono::sys_seconds{std::chrono::seconds{1353832234}} || parsed->nonce() != "abc" ||
            parsed->mac() != mac_chk || parsed->ext() != "" || parsed->hash() || parsed->app() || parsed->dlg()) {
            std::cerr << "parse with irregular whitespace failed\n";
            return 1;
        }
    }

    {
        auto fields = few_fields();
        fields.ts = std::chrono::sys_seconds{std::chrono::seconds{-1}};
        const hawkcpp::Header before_epoch{fields};
        const auto formatted = before_epoch.to_string();
        const auto parsed = hawkcpp::Header::parse(formatted);
        if (!formatted.contains(R"(ts="-1")") || !parsed || *parsed != before_epoch) {
            std::cerr << "negative timestamp did not round trip \n" << formatted << "\n";
            return 1;
        }
        const auto bare = hawkcpp::Header::parse(R"(ts="-1")");
        if (!bare || bare->ts() != std::chrono::sys_seconds{std::chrono::seconds{-1}}) {
            std::cerr << "parse of a negative timestamp failed\n";
            return 1;
        }
    }

    {
        // no attribute is required at this level
        const auto parsed = hawkcpp::Header::parse(R"(id="dh37fgj492je", ts="1353832234", nonce="j4h3g2")");
        if (!parsed || parsed->mac()) {
            std::cerr << "parse without mac failed\n";
            return 1;
        }
    }

    const std::vector<std::pair<std::string_view, hawkcpp::error>> failures{
        {R"(id="a", bogus="b")", hawkcpp::error::unknown_attribute},
        {R"(id="a", id="b")", hawkcpp::error::header_parse},
        {R"(id=a)", hawkcpp::error::header_parse},
        {R"(id="a)", hawkcpp::error::header_parse},
        {R"(id)", hawkcpp::error::header_parse},
        {R"(="a")", hawkcpp::error::header_parse},
        {R"(ts="12x")", hawkcpp::error::invalid_timestamp},
        {R"(ts="")", hawkcpp::error::invalid_timestamp},
        {R"(mac="not base64")", hawkcpp::error::base64_decode},
        {R"(hash="AQIDBA=")", hawkcpp::error::base64_decode},
    };
    for (const auto &[input, code] : failures) {
        const auto parsed = hawkcpp::Header::parse(input);
        if (parsed || parsed.error() != hawkcpp::make_error_code(code)) {
            std::cerr << "parse of " << input << " did not fail with "
                      << hawkcpp::make_error_code(code).message() << "\n";
            return 1;
        }
    }

    {
        const auto value = hawkcpp::authorization_value(few);
        if (value != std::format("Hawk {}", few_chk)) {
            std::cerr << "authorization_value failed, got " << value << "\n";
            return 1;
        }
        if (hawkcpp::parse_authorization(value) != few) {
            std::cerr << "parse_authorization failed\n";
            return 1;
        }
        if (hawkcpp::parse_authorization(few_chk)) {
            std::cerr << "parse_authorization accepted a value without scheme\n";
            return 1;
        }
    }

    for (const auto field : {&hawkcpp::HeaderFields::id, &hawkcpp::HeaderFields::nonce, &hawkcpp::HeaderFields::ext,
                             &hawkcpp::HeaderFields::app, &hawkcpp::HeaderFields::dlg}) {
        auto fields = few_fields();
        fields.*field = R"(a"b)";
        bool threw = false;
        try {
            static_cast<void>(hawkcpp::Header{fields});
        } catch (const std::invalid_argument &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "a quote in a header attribute was accepted\n";
            return 1;
        }
    }
}
