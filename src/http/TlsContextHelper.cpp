#include "blat/http/TlsContextHelper.hpp"
#include "blat/logger/Logger.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <filesystem>

namespace blat {

bool TlsContextHelper::configureClientContext(SSL_CTX* ctx, const TlsOptions& options) {
    Logger& logger = Logger::getInstance();

    if (!ctx) {
        logger.logError("TlsContextHelper: No SSL context to configure");
        return false;
    }

    if (options.min_version != 0) {
        if (SSL_CTX_set_min_proto_version(ctx, options.min_version) != 1) {
            logger.logError("TlsContextHelper: Failed to set minimum protocol version " +
                            std::to_string(options.min_version) + ": " + drainErrors());
            return false;
        }
    }

    if (!options.cipher_list.empty()) {
        if (!SSL_CTX_set_cipher_list(ctx, options.cipher_list.c_str())) {
            logger.logError("TlsContextHelper: Failed to set cipher list '" + options.cipher_list +
                            "': " + drainErrors());
            return false;
        }
    }

    if (!loadTrustAnchors(ctx, options)) {
        return false;
    }

    if (!loadClientCertificate(ctx, options)) {
        return false;
    }

    return true;
}

std::string TlsContextHelper::drainErrors() {
    std::string out;
    unsigned long err;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!out.empty()) {
            out += "; ";
        }
        out += buf;
    }
    if (out.empty()) {
        out = "no OpenSSL error queued";
    }
    return out;
}

bool TlsContextHelper::loadTrustAnchors(SSL_CTX* ctx, const TlsOptions& options) {
    if (options.ca_file.empty() && options.ca_path.empty()) {
        return true;
    }

    const char* file = options.ca_file.empty() ? nullptr : options.ca_file.c_str();
    const char* dir = options.ca_path.empty() ? nullptr : options.ca_path.c_str();

    if (SSL_CTX_load_verify_locations(ctx, file, dir) != 1) {
        Logger::getInstance().logError("TlsContextHelper: Failed to load CA locations (file='" +
                                       options.ca_file + "', path='" + options.ca_path + "'): " +
                                       drainErrors());
        return false;
    }
    return true;
}

bool TlsContextHelper::loadClientCertificate(SSL_CTX* ctx, const TlsOptions& options) {
    Logger& logger = Logger::getInstance();
    namespace fs = std::filesystem;

    if (options.client_cert.empty() && options.client_key.empty()) {
        return true;
    }
    if (options.client_cert.empty() || options.client_key.empty()) {
        logger.logError("TlsContextHelper: Client certificate and key must be given together");
        return false;
    }

    if (!fs::exists(options.client_cert)) {
        logger.logError("TlsContextHelper: Client certificate not found: " + options.client_cert);
        return false;
    }
    if (SSL_CTX_use_certificate_chain_file(ctx, options.client_cert.c_str()) != 1) {
        logger.logError("TlsContextHelper: Failed to load client certificate from: " +
                        options.client_cert + ": " + drainErrors());
        return false;
    }

    if (!fs::exists(options.client_key)) {
        logger.logError("TlsContextHelper: Client key not found: " + options.client_key);
        return false;
    }
    if (SSL_CTX_use_PrivateKey_file(ctx, options.client_key.c_str(), SSL_FILETYPE_PEM) != 1) {
        logger.logError("TlsContextHelper: Failed to load client key from: " +
                        options.client_key + ": " + drainErrors());
        return false;
    }

    // Verify that the private key matches the certificate
    if (!SSL_CTX_check_private_key(ctx)) {
        logger.logError("TlsContextHelper: Client key does not match the certificate public key");
        return false;
    }

    return true;
}

} // namespace blat
