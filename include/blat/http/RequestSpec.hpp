#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace blat {

/**
 * Client-side TLS settings applied to the OpenSSL context of a transfer.
 * Empty strings mean "library default".
 */
struct TlsOptions {
    std::string ca_file;
    std::string ca_path;
    std::string client_cert;     // PEM certificate for mutual TLS
    std::string client_key;      // PEM private key matching client_cert
    std::string cipher_list;     // TLS 1.2 cipher list, OpenSSL syntax
    int min_version = 0;         // e.g. TLS1_2_VERSION, 0 = library default
};

/**
 * Declarative description of one HTTP request. Applied to an executor by
 * RequestExecutor::configure().
 */
struct RequestSpec {
    std::string url;
    std::string method = "GET";
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<std::string> body;

    bool follow_location = true;
    long max_redirects = 10;

    std::chrono::milliseconds connect_timeout{0};   // 0 = transport default
    std::chrono::milliseconds timeout{0};           // 0 = no overall limit

    std::string user_agent;
    bool verify_peer = true;
    std::optional<TlsOptions> tls;
};

} // namespace blat
