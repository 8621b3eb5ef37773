#include <gtest/gtest.h>
#include "blat/Errors.hpp"
#include "blat/http/CurlExecutor.hpp"
#include "blat/http/TlsContextHelper.hpp"
#include "util/LoopbackHttpServer.hpp"

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <cstdio>
#include <filesystem>
#include <string>

using namespace blat;
using blat::testing::LoopbackHttpServer;
namespace fs = std::filesystem;

class TlsContextHelperTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "blat_tls_helper_test";
        fs::create_directories(test_dir_);

        ctx_ = SSL_CTX_new(TLS_client_method());
        ASSERT_NE(ctx_, nullptr);
    }

    void TearDown() override {
        SSL_CTX_free(ctx_);
        fs::remove_all(test_dir_);
    }

    // Self-signed certificate plus key, written as PEM files
    void writeKeyPair(const fs::path& cert_path, const fs::path& key_path) {
        EVP_PKEY* key = EVP_RSA_gen(2048);
        ASSERT_NE(key, nullptr);

        X509* cert = X509_new();
        ASSERT_NE(cert, nullptr);
        ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert), 0);
        X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
        X509_set_pubkey(cert, key);
        X509_NAME* name = X509_get_subject_name(cert);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("blat-test"), -1, -1, 0);
        X509_set_issuer_name(cert, name);
        ASSERT_GT(X509_sign(cert, key, EVP_sha256()), 0);

        FILE* cert_file = std::fopen(cert_path.c_str(), "w");
        ASSERT_NE(cert_file, nullptr);
        PEM_write_X509(cert_file, cert);
        std::fclose(cert_file);

        FILE* key_file = std::fopen(key_path.c_str(), "w");
        ASSERT_NE(key_file, nullptr);
        PEM_write_PrivateKey(key_file, key, nullptr, nullptr, 0, nullptr, nullptr);
        std::fclose(key_file);

        X509_free(cert);
        EVP_PKEY_free(key);
    }

    fs::path test_dir_;
    SSL_CTX* ctx_ = nullptr;
};

TEST_F(TlsContextHelperTest, DefaultOptionsSucceed) {
    EXPECT_TRUE(TlsContextHelper::configureClientContext(ctx_, TlsOptions{}));
}

TEST_F(TlsContextHelperTest, NullContextFails) {
    EXPECT_FALSE(TlsContextHelper::configureClientContext(nullptr, TlsOptions{}));
}

TEST_F(TlsContextHelperTest, MinimumVersionIsApplied) {
    TlsOptions options;
    options.min_version = TLS1_2_VERSION;
    ASSERT_TRUE(TlsContextHelper::configureClientContext(ctx_, options));
    EXPECT_EQ(SSL_CTX_get_min_proto_version(ctx_), TLS1_2_VERSION);
}

TEST_F(TlsContextHelperTest, InvalidCipherListFails) {
    TlsOptions options;
    options.cipher_list = "NOT-A-CIPHER";
    EXPECT_FALSE(TlsContextHelper::configureClientContext(ctx_, options));
}

TEST_F(TlsContextHelperTest, MissingCaFileFails) {
    TlsOptions options;
    options.ca_file = (test_dir_ / "absent-ca.pem").string();
    EXPECT_FALSE(TlsContextHelper::configureClientContext(ctx_, options));
}

TEST_F(TlsContextHelperTest, CertificateWithoutKeyFails) {
    TlsOptions options;
    options.client_cert = (test_dir_ / "cert.pem").string();
    EXPECT_FALSE(TlsContextHelper::configureClientContext(ctx_, options));
}

TEST_F(TlsContextHelperTest, MissingCertificateFileFails) {
    TlsOptions options;
    options.client_cert = (test_dir_ / "absent-cert.pem").string();
    options.client_key = (test_dir_ / "absent-key.pem").string();
    EXPECT_FALSE(TlsContextHelper::configureClientContext(ctx_, options));
}

TEST_F(TlsContextHelperTest, MatchingCertificateAndKeyLoad) {
    fs::path cert = test_dir_ / "cert.pem";
    fs::path key = test_dir_ / "key.pem";
    writeKeyPair(cert, key);

    TlsOptions options;
    options.client_cert = cert.string();
    options.client_key = key.string();
    options.ca_file = cert.string();
    EXPECT_TRUE(TlsContextHelper::configureClientContext(ctx_, options));
}

TEST_F(TlsContextHelperTest, MismatchedKeyFails) {
    fs::path cert_a = test_dir_ / "a-cert.pem";
    fs::path key_a = test_dir_ / "a-key.pem";
    fs::path cert_b = test_dir_ / "b-cert.pem";
    fs::path key_b = test_dir_ / "b-key.pem";
    writeKeyPair(cert_a, key_a);
    writeKeyPair(cert_b, key_b);

    TlsOptions options;
    options.client_cert = cert_a.string();
    options.client_key = key_b.string();
    EXPECT_FALSE(TlsContextHelper::configureClientContext(ctx_, options));
}

TEST_F(TlsContextHelperTest, DrainErrorsWhenQueueEmpty) {
    ERR_clear_error();
    EXPECT_EQ(TlsContextHelper::drainErrors(), "no OpenSSL error queued");
}

TEST_F(TlsContextHelperTest, ExecutorReportsContextFailure) {
    LoopbackHttpServer server(LoopbackHttpServer::response(200, "OK", ""));

    RequestSpec spec;
    spec.url = "https://127.0.0.1:" + std::to_string(server.port()) + "/";
    spec.tls = TlsOptions{};
    spec.tls->cipher_list = "NOT-A-CIPHER";

    CurlExecutor executor;
    executor.configure(spec);
    try {
        executor.perform();
        FAIL() << "perform() should have failed";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.stage(), TransferError::Stage::PERFORM);
        EXPECT_EQ(e.code(), static_cast<int>(CURLE_SSL_CERTPROBLEM));
    }
}
