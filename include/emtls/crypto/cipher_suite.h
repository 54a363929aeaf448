#ifndef EMTLS_CRYPTO_CIPHER_SUITE_H
#define EMTLS_CRYPTO_CIPHER_SUITE_H

#include <emtls/types.h>
#include <cstddef>

namespace emtls {
namespace v13 {
namespace crypto {

/**
 * Compile-time cipher suite descriptions.
 *
 * A connection, its key schedule and its configuration are all
 * parameterized by one of these traits types, so key, IV and hash sizes are
 * constants and every secret lives in a fixed-size array.
 */
struct Aes128GcmSha256 {
    static constexpr CipherSuite CODE = CipherSuite::TLS_AES_128_GCM_SHA256;
    static constexpr HashAlgorithm HASH = HashAlgorithm::SHA256;
    static constexpr AEADCipher AEAD = AEADCipher::AES_128_GCM;
    static constexpr size_t KEY_LENGTH = 16;
    static constexpr size_t IV_LENGTH = 12;
    static constexpr size_t TAG_LENGTH = 16;
    static constexpr size_t HASH_LENGTH = 32;
};

struct Aes256GcmSha384 {
    static constexpr CipherSuite CODE = CipherSuite::TLS_AES_256_GCM_SHA384;
    static constexpr HashAlgorithm HASH = HashAlgorithm::SHA384;
    static constexpr AEADCipher AEAD = AEADCipher::AES_256_GCM;
    static constexpr size_t KEY_LENGTH = 32;
    static constexpr size_t IV_LENGTH = 12;
    static constexpr size_t TAG_LENGTH = 16;
    static constexpr size_t HASH_LENGTH = 48;
};

struct ChaCha20Poly1305Sha256 {
    static constexpr CipherSuite CODE = CipherSuite::TLS_CHACHA20_POLY1305_SHA256;
    static constexpr HashAlgorithm HASH = HashAlgorithm::SHA256;
    static constexpr AEADCipher AEAD = AEADCipher::CHACHA20_POLY1305;
    static constexpr size_t KEY_LENGTH = 32;
    static constexpr size_t IV_LENGTH = 12;
    static constexpr size_t TAG_LENGTH = 16;
    static constexpr size_t HASH_LENGTH = 32;
};

} // namespace crypto
} // namespace v13
} // namespace emtls

#endif // EMTLS_CRYPTO_CIPHER_SUITE_H
