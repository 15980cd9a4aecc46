#include "hawkcpp/crypto/botan.hpp"
#include "hawkcpp/crypto/cryptographer.hpp"
#include "hawkcpp/credentials.hpp"
#include "hawkcpp/header.hpp"
#include "hawkcpp/payload.hpp"
#include "hawkcpp/request.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/describe/enum_from_string.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <ostream>
#include <print>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace {

[[nodiscard]] std::string file_to_string(const std::filesystem::path &path) {
    const std::ifstream stream{path, std::ios::binary};
    std::stringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

struct Options {
    std::string id;
    std::string key;
    hawkcpp::crypto::DigestAlgorithm algorithm{};
    std::string method;
    std::string url;
    std::optional<std::string> ext;
    std::optional<std::string> payload;
    std::string content_type;
    std::optional<std::chrono::seconds> bewit_ttl;
};

[[nodiscard]] Options parse_opts(int argc, char **argv) {

    Options ret;
    std::string key_file;

    boost::program_options::options_description descr{"Options"};
    // clang-format off
    descr.add_options()
        ("help,h", "print this help")
        ("id,i", boost::program_options::value<std::string>(&ret.id)->required(), "credentials id")
        ("key-file,k", boost::program_options::value<std::string>(&key_file)->required(), "path to shared key file")
        ("algorithm,a", boost::program_options::value<std::string>()->default_value("sha256"), "digest algorithm (sha256, sha384 or sha512)")
        ("method,m", boost::program_options::value<std::string>(&ret.method)->default_value("GET"), "HTTP method")
        ("url,u", boost::program_options::value<std::string>(&ret.url)->required(), "absolute request URL")
        ("ext", boost::program_options::value<std::string>(), "application specific data")
        ("payload-file", boost::program_options::value<std::string>(), "hash the contents of this file into the header")
        ("content-type", boost::program_options::value<std::string>(&ret.content_type)->default_value("text/plain"), "content type of the payload")
        ("bewit-ttl", boost::program_options::value<std::int64_t>(), "print a bewit URL valid for this many seconds instead of a header")
    ;
    // clang-format on

    boost::program_options::variables_map varmap;
    boost::program_options::store(boost::program_options::parse_command_line(argc, argv, descr), varmap);
    if (varmap.contains("help")) {
        std::println("sign a request with Hawk\n"
                     "prints the Authorization header value, or a URL carrying a bewit\n");
        std::cout << descr << '\n';
        exit(0);
    }
    boost::program_options::notify(varmap);

    const std::string algorithm_str = varmap["algorithm"].as<std::string>();
    if (!boost::describe::enum_from_string(algorithm_str.c_str(), ret.algorithm)) {
        std::println(std::cerr, "Invalid algorithm '{}'. Must be sha256, sha384 or sha512.", algorithm_str);
        exit(1);
    }

    if (varmap.contains("ext")) {
        ret.ext = varmap["ext"].as<std::string>();
    }
    if (varmap.contains("payload-file")) {
        ret.payload = file_to_string(varmap["payload-file"].as<std::string>());
    }
    if (varmap.contains("bewit-ttl")) {
        ret.bewit_ttl = std::chrono::seconds{varmap["bewit-ttl"].as<std::int64_t>()};
        if (ret.bewit_ttl->count() <= 0) {
            std::println(std::cerr, "bewit TTL must be positive");
            exit(1);
        }
        if (ret.payload) {
            std::println(std::cerr, "a bewit cannot carry a payload hash");
            exit(1);
        }
    }

    ret.key = file_to_string(key_file);
    boost::algorithm::trim(ret.key);

    return ret;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
    Options options = parse_opts(argc, argv);

    const auto cryptographer = hawkcpp::crypto::make_botan_cryptographer();

    auto key = hawkcpp::Key::create(cryptographer, options.algorithm, std::string_view{options.key});
    if (!key) {
        std::println(std::cerr, "failed to create key: {}", key.error().message());
        return 1;
    }
    const hawkcpp::Credentials credentials{.id = std::move(options.id), .key = std::move(key.value())};

    auto params = hawkcpp::RequestParams::from_url(options.method, options.url);
    if (!params) {
        std::println(std::cerr, "failed to parse URL {}: {}", options.url, params.error().message());
        return 1;
    }
    params->ext = std::move(options.ext);

    if (options.payload) {
        auto hash = hawkcpp::PayloadHasher::hash(options.content_type, options.algorithm, *cryptographer,
                                                 std::string_view{*options.payload});
        if (!hash) {
            std::println(std::cerr, "failed to hash payload: {}", hash.error().message());
            return 1;
        }
        params->hash = std::move(hash.value());
    }

    const hawkcpp::Request request{std::move(params.value())};

    if (options.bewit_ttl) {
        const auto bewit = request.make_bewit_with_ttl(credentials, *options.bewit_ttl);
        if (!bewit) {
            std::println(std::cerr, "failed to create bewit: {}", bewit.error().message());
            return 1;
        }
        const char separator = options.url.contains('?') ? '&' : '?';
        std::println("{}{}bewit={}", options.url, separator, bewit->to_str());
        return 0;
    }

    const auto header = request.make_header(credentials);
    if (!header) {
        std::println(std::cerr, "failed to sign request: {}", header.error().message());
        return 1;
    }
    std::println("{}", hawkcpp::authorization_value(*header));
}
