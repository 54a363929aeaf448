#ifndef EMTLS_TEST_CERTIFICATES_H
#define EMTLS_TEST_CERTIFICATES_H

#include <openssl/evp.h>
#include <openssl/x509.h>
#include <memory>
#include <string>

namespace emtls {
namespace test {

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct X509Deleter {
    void operator()(X509* cert) const { X509_free(cert); }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;

/**
 * Test Certificate Infrastructure
 *
 * Self-signed Ed25519 server identity generated at run time, for
 * interoperability tests against OpenSSL. Testing purposes only.
 */
struct TestCertificates {
    EvpPkeyPtr private_key;
    X509Ptr certificate;

    /** Create a fresh identity; both members are null on failure. */
    static TestCertificates create_self_signed(const std::string& common_name = "localhost");

    bool is_valid() const noexcept { return private_key && certificate; }
};

} // namespace test
} // namespace emtls

#endif // EMTLS_TEST_CERTIFICATES_H
