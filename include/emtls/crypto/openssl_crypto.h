#ifndef EMTLS_CRYPTO_OPENSSL_CRYPTO_H
#define EMTLS_CRYPTO_OPENSSL_CRYPTO_H

#include <emtls/config.h>
#include <emtls/result.h>
#include <emtls/types.h>
#include <emtls/memory/buffer.h>
#include <array>
#include <cstdint>
#include <string_view>

// Forward declaration to avoid pulling OpenSSL headers into every user
typedef struct evp_pkey_st EVP_PKEY;

namespace emtls {
namespace v13 {
namespace crypto {

using memory::BufferView;
using memory::MutableBufferView;

constexpr size_t MAX_HASH_LENGTH = 48;

/** Digest size in bytes of a supported hash algorithm. */
EMTLS_API size_t hash_length(HashAlgorithm algorithm) noexcept;

/** Fill the buffer from the OpenSSL CSPRNG. */
EMTLS_API Result<void> random_bytes(uint8_t* out, size_t length);

/** One-shot digest. `out` must hold hash_length(algorithm) bytes. */
EMTLS_API Result<void> hash(HashAlgorithm algorithm, BufferView data, uint8_t* out);

/** One-shot HMAC. `out` must hold hash_length(algorithm) bytes. */
EMTLS_API Result<void> hmac(HashAlgorithm algorithm, BufferView key, BufferView data, uint8_t* out);

/**
 * HKDF-Extract (RFC 5869). An empty salt is replaced by hash_length zero
 * bytes. `prk_out` must hold hash_length(algorithm) bytes.
 */
EMTLS_API Result<void> hkdf_extract(HashAlgorithm algorithm,
                                    BufferView salt,
                                    BufferView ikm,
                                    uint8_t* prk_out);

/** HKDF-Expand (RFC 5869) into `out`. */
EMTLS_API Result<void> hkdf_expand(HashAlgorithm algorithm,
                                   BufferView prk,
                                   BufferView info,
                                   uint8_t* out,
                                   size_t out_length);

/** HKDF-Expand-Label (RFC 8446 section 7.1), label given without the "tls13 " prefix. */
EMTLS_API Result<void> hkdf_expand_label(HashAlgorithm algorithm,
                                         BufferView secret,
                                         std::string_view label,
                                         BufferView context,
                                         uint8_t* out,
                                         size_t out_length);

/**
 * Encrypt `in_out` in place and write the authentication tag to `tag_out`.
 * @param cipher AEAD algorithm
 * @param key Traffic key
 * @param nonce Per-record nonce
 * @param aad Additional authenticated data
 * @param in_out Plaintext on input, ciphertext on output
 * @param tag_out Tag destination, 16 bytes
 */
EMTLS_API Result<void> aead_seal(AEADCipher cipher,
                                 BufferView key,
                                 BufferView nonce,
                                 BufferView aad,
                                 MutableBufferView in_out,
                                 uint8_t* tag_out);

/** Decrypt `in_out` in place. Tag mismatch yields DECRYPT_ERROR. */
EMTLS_API Result<void> aead_open(AEADCipher cipher,
                                 BufferView key,
                                 BufferView nonce,
                                 BufferView aad,
                                 MutableBufferView in_out,
                                 BufferView tag);

/** Length-checked constant-time comparison. */
EMTLS_API bool constant_time_equals(BufferView a, BufferView b) noexcept;

/**
 * Ephemeral X25519 key pair. The private key is supplied by the caller's
 * entropy source so the library never chooses its own randomness.
 */
class EMTLS_API X25519KeyPair {
public:
    X25519KeyPair() noexcept : pkey_(nullptr) {}
    ~X25519KeyPair();

    X25519KeyPair(const X25519KeyPair&) = delete;
    X25519KeyPair& operator=(const X25519KeyPair&) = delete;
    X25519KeyPair(X25519KeyPair&& other) noexcept;
    X25519KeyPair& operator=(X25519KeyPair&& other) noexcept;

    static Result<X25519KeyPair> from_private_key(BufferView private_key);

    template<typename EntropySource>
    static Result<X25519KeyPair> generate(EntropySource& entropy) {
        std::array<uint8_t, X25519_KEY_LENGTH> private_key{};
        auto fill_result = entropy.fill_bytes(private_key.data(), private_key.size());
        if (!fill_result) {
            return fill_result.error();
        }
        auto key_pair = from_private_key(private_key);
        secure_zero(private_key.data(), private_key.size());
        return key_pair;
    }

    bool is_valid() const noexcept { return pkey_ != nullptr; }

    Result<void> public_key(std::array<uint8_t, X25519_KEY_LENGTH>& out) const;

    /** Shared secret with the peer's public key; a degenerate result yields INVALID_KEY_SHARE. */
    Result<void> derive_shared_secret(BufferView peer_public_key,
                                      std::array<uint8_t, X25519_KEY_LENGTH>& out) const;

private:
    explicit X25519KeyPair(EVP_PKEY* pkey) noexcept : pkey_(pkey) {}
    static void secure_zero(uint8_t* data, size_t length) noexcept;

    EVP_PKEY* pkey_;
};

} // namespace crypto
} // namespace v13
} // namespace emtls

#endif // EMTLS_CRYPTO_OPENSSL_CRYPTO_H
