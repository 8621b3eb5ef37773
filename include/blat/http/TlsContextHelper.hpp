#pragma once

#include "blat/http/RequestSpec.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <string>

namespace blat {

/**
 * Applies client-side TLS settings to an OpenSSL context.
 *
 * libcurl hands its SSL_CTX to CurlExecutor through CURLOPT_SSL_CTX_FUNCTION
 * before the handshake; this helper does the actual configuration:
 * - minimum protocol version
 * - TLS 1.2 cipher list
 * - extra trust anchors (CA file / CA directory)
 * - client certificate and key for mutual TLS, checked against each other
 */
class TlsContextHelper {
public:
    /**
     * @param ctx Context owned by the caller (libcurl)
     * @return true on success, false on failure (details are logged)
     */
    static bool configureClientContext(SSL_CTX* ctx, const TlsOptions& options);

    /**
     * Pop every queued OpenSSL error into one readable string.
     */
    static std::string drainErrors();

private:
    static bool loadTrustAnchors(SSL_CTX* ctx, const TlsOptions& options);
    static bool loadClientCertificate(SSL_CTX* ctx, const TlsOptions& options);
};

} // namespace blat
