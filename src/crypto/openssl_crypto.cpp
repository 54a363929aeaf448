#include <emtls/crypto/openssl_crypto.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <climits>
#include <cstring>

namespace emtls {
namespace v13 {
namespace crypto {

namespace {

const EVP_MD* get_evp_md(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA256: return EVP_sha256();
        case HashAlgorithm::SHA384: return EVP_sha384();
    }
    return nullptr;
}

const EVP_CIPHER* get_evp_cipher(AEADCipher cipher) {
    switch (cipher) {
        case AEADCipher::AES_128_GCM: return EVP_aes_128_gcm();
        case AEADCipher::AES_256_GCM: return EVP_aes_256_gcm();
        case AEADCipher::CHACHA20_POLY1305: return EVP_chacha20_poly1305();
    }
    return nullptr;
}

constexpr size_t AEAD_TAG_LENGTH = 16;

// HkdfLabel: uint16 length, opaque label<7..255>, opaque context<0..255>
constexpr size_t MAX_HKDF_LABEL_LENGTH = 2 + 1 + 255 + 1 + 255;
constexpr std::string_view TLS13_LABEL_PREFIX = "tls13 ";

} // anonymous namespace

size_t hash_length(HashAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case HashAlgorithm::SHA256: return 32;
        case HashAlgorithm::SHA384: return 48;
    }
    return 0;
}

Result<void> random_bytes(uint8_t* out, size_t length) {
    if (length == 0) {
        return make_result();
    }
    if (out == nullptr || length > static_cast<size_t>(INT_MAX)) {
        return TLSError::INVALID_PARAMETER;
    }
    if (RAND_bytes(out, static_cast<int>(length)) != 1) {
        return TLSError::RANDOM_GENERATION_FAILED;
    }
    return make_result();
}

Result<void> hash(HashAlgorithm algorithm, BufferView data, uint8_t* out) {
    const EVP_MD* md = get_evp_md(algorithm);
    if (!md || out == nullptr) {
        return TLSError::INVALID_PARAMETER;
    }

    unsigned int digest_length = 0;
    if (EVP_Digest(data.data(), data.size(), out, &digest_length, md, nullptr) != 1) {
        return TLSError::CRYPTO_ERROR;
    }
    return make_result();
}

Result<void> hmac(HashAlgorithm algorithm, BufferView key, BufferView data, uint8_t* out) {
    const EVP_MD* md = get_evp_md(algorithm);
    if (!md || out == nullptr || key.empty()) {
        return TLSError::INVALID_PARAMETER;
    }

    unsigned int mac_length = 0;
    if (HMAC(md, key.data(), static_cast<int>(key.size()),
             data.data(), data.size(), out, &mac_length) == nullptr) {
        return TLSError::CRYPTO_ERROR;
    }
    return make_result();
}

Result<void> hkdf_extract(HashAlgorithm algorithm,
                          BufferView salt,
                          BufferView ikm,
                          uint8_t* prk_out) {
    const size_t length = hash_length(algorithm);
    if (length == 0) {
        return TLSError::INVALID_PARAMETER;
    }

    std::array<uint8_t, MAX_HASH_LENGTH> zero_salt{};
    if (salt.empty()) {
        salt = BufferView(zero_salt.data(), length);
    }

    auto result = hmac(algorithm, salt, ikm, prk_out);
    if (!result) {
        return TLSError::KEY_DERIVATION_FAILED;
    }
    return make_result();
}

Result<void> hkdf_expand(HashAlgorithm algorithm,
                         BufferView prk,
                         BufferView info,
                         uint8_t* out,
                         size_t out_length) {
    const EVP_MD* md = get_evp_md(algorithm);
    if (!md || prk.empty() || out == nullptr || out_length == 0) {
        return TLSError::INVALID_PARAMETER;
    }

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx) {
        return TLSError::CRYPTO_ERROR;
    }

    size_t derived_length = out_length;
    int result = 1;

    if (result == 1) {
        result = EVP_PKEY_derive_init(pctx);
    }

    if (result == 1) {
        result = EVP_PKEY_CTX_set_hkdf_mode(pctx, EVP_PKEY_HKDEF_MODE_EXPAND_ONLY);
    }

    if (result == 1) {
        result = EVP_PKEY_CTX_set_hkdf_md(pctx, md);
    }

    // In expand-only mode the key is the PRK
    if (result == 1) {
        result = EVP_PKEY_CTX_set1_hkdf_key(pctx, prk.data(), static_cast<int>(prk.size()));
    }

    if (result == 1 && !info.empty()) {
        result = EVP_PKEY_CTX_add1_hkdf_info(pctx, info.data(), static_cast<int>(info.size()));
    }

    if (result == 1) {
        result = EVP_PKEY_derive(pctx, out, &derived_length);
    }

    EVP_PKEY_CTX_free(pctx);

    if (result != 1 || derived_length != out_length) {
        return TLSError::KEY_DERIVATION_FAILED;
    }
    return make_result();
}

Result<void> hkdf_expand_label(HashAlgorithm algorithm,
                               BufferView secret,
                               std::string_view label,
                               BufferView context,
                               uint8_t* out,
                               size_t out_length) {
    const size_t full_label_length = TLS13_LABEL_PREFIX.size() + label.size();
    if (full_label_length > 255 || context.size() > 255 || out_length > 0xFFFF) {
        return TLSError::INVALID_PARAMETER;
    }

    std::array<uint8_t, MAX_HKDF_LABEL_LENGTH> hkdf_label{};
    size_t offset = 0;

    hkdf_label[offset++] = static_cast<uint8_t>(out_length >> 8);
    hkdf_label[offset++] = static_cast<uint8_t>(out_length);

    hkdf_label[offset++] = static_cast<uint8_t>(full_label_length);
    std::memcpy(hkdf_label.data() + offset, TLS13_LABEL_PREFIX.data(), TLS13_LABEL_PREFIX.size());
    offset += TLS13_LABEL_PREFIX.size();
    std::memcpy(hkdf_label.data() + offset, label.data(), label.size());
    offset += label.size();

    hkdf_label[offset++] = static_cast<uint8_t>(context.size());
    if (!context.empty()) {
        std::memcpy(hkdf_label.data() + offset, context.data(), context.size());
        offset += context.size();
    }

    return hkdf_expand(algorithm, secret, BufferView(hkdf_label.data(), offset), out, out_length);
}

Result<void> aead_seal(AEADCipher cipher,
                       BufferView key,
                       BufferView nonce,
                       BufferView aad,
                       MutableBufferView in_out,
                       uint8_t* tag_out) {
    const EVP_CIPHER* evp_cipher = get_evp_cipher(cipher);
    if (!evp_cipher || tag_out == nullptr) {
        return TLSError::INVALID_PARAMETER;
    }
    if (key.size() != static_cast<size_t>(EVP_CIPHER_key_length(evp_cipher))) {
        return TLSError::INVALID_PARAMETER;
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return TLSError::CRYPTO_ERROR;
    }

    int outlen = 0;
    int result = 1;

    if (result == 1) {
        result = EVP_EncryptInit_ex(ctx, evp_cipher, nullptr, nullptr, nullptr);
    }

    if (result == 1 && cipher != AEADCipher::CHACHA20_POLY1305) {
        result = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN,
                                     static_cast<int>(nonce.size()), nullptr);
    }

    if (result == 1) {
        result = EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data());
    }

    if (result == 1 && !aad.empty()) {
        result = EVP_EncryptUpdate(ctx, nullptr, &outlen, aad.data(), static_cast<int>(aad.size()));
    }

    // GCM and ChaCha20-Poly1305 are stream modes: in-place output has the same length
    if (result == 1 && !in_out.empty()) {
        result = EVP_EncryptUpdate(ctx, in_out.data(), &outlen,
                                   in_out.data(), static_cast<int>(in_out.size()));
    }

    if (result == 1) {
        int final_len = 0;
        result = EVP_EncryptFinal_ex(ctx, in_out.data() + in_out.size(), &final_len);
    }

    if (result == 1) {
        result = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG,
                                     static_cast<int>(AEAD_TAG_LENGTH), tag_out);
    }

    EVP_CIPHER_CTX_free(ctx);

    if (result != 1) {
        return TLSError::CRYPTO_ERROR;
    }
    return make_result();
}

Result<void> aead_open(AEADCipher cipher,
                       BufferView key,
                       BufferView nonce,
                       BufferView aad,
                       MutableBufferView in_out,
                       BufferView tag) {
    const EVP_CIPHER* evp_cipher = get_evp_cipher(cipher);
    if (!evp_cipher || tag.size() != AEAD_TAG_LENGTH) {
        return TLSError::INVALID_PARAMETER;
    }
    if (key.size() != static_cast<size_t>(EVP_CIPHER_key_length(evp_cipher))) {
        return TLSError::INVALID_PARAMETER;
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return TLSError::CRYPTO_ERROR;
    }

    // Copy the tag so the const view is never handed to OpenSSL as mutable
    std::array<uint8_t, AEAD_TAG_LENGTH> expected_tag{};
    std::memcpy(expected_tag.data(), tag.data(), AEAD_TAG_LENGTH);

    int outlen = 0;
    int result = 1;

    if (result == 1) {
        result = EVP_DecryptInit_ex(ctx, evp_cipher, nullptr, nullptr, nullptr);
    }

    if (result == 1 && cipher != AEADCipher::CHACHA20_POLY1305) {
        result = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN,
                                     static_cast<int>(nonce.size()), nullptr);
    }

    if (result == 1) {
        result = EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data());
    }

    if (result == 1 && !aad.empty()) {
        result = EVP_DecryptUpdate(ctx, nullptr, &outlen, aad.data(), static_cast<int>(aad.size()));
    }

    if (result == 1 && !in_out.empty()) {
        result = EVP_DecryptUpdate(ctx, in_out.data(), &outlen,
                                   in_out.data(), static_cast<int>(in_out.size()));
    }

    if (result == 1) {
        result = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG,
                                     static_cast<int>(AEAD_TAG_LENGTH), expected_tag.data());
    }

    if (result != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return TLSError::CRYPTO_ERROR;
    }

    int final_len = 0;
    result = EVP_DecryptFinal_ex(ctx, in_out.data() + in_out.size(), &final_len);
    EVP_CIPHER_CTX_free(ctx);

    if (result <= 0) {
        // Never release unauthenticated plaintext
        in_out.zero();
        return TLSError::DECRYPT_ERROR;
    }
    return make_result();
}

bool constant_time_equals(BufferView a, BufferView b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// X25519KeyPair implementation

X25519KeyPair::~X25519KeyPair() {
    if (pkey_) {
        EVP_PKEY_free(pkey_);
    }
}

X25519KeyPair::X25519KeyPair(X25519KeyPair&& other) noexcept : pkey_(other.pkey_) {
    other.pkey_ = nullptr;
}

X25519KeyPair& X25519KeyPair::operator=(X25519KeyPair&& other) noexcept {
    if (this != &other) {
        if (pkey_) {
            EVP_PKEY_free(pkey_);
        }
        pkey_ = other.pkey_;
        other.pkey_ = nullptr;
    }
    return *this;
}

Result<X25519KeyPair> X25519KeyPair::from_private_key(BufferView private_key) {
    if (private_key.size() != X25519_KEY_LENGTH) {
        return TLSError::INVALID_PARAMETER;
    }

    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                                  private_key.data(), private_key.size());
    if (!pkey) {
        return TLSError::CRYPTO_ERROR;
    }
    return X25519KeyPair(pkey);
}

Result<void> X25519KeyPair::public_key(std::array<uint8_t, X25519_KEY_LENGTH>& out) const {
    if (!pkey_) {
        return TLSError::INVALID_STATE;
    }

    size_t length = out.size();
    if (EVP_PKEY_get_raw_public_key(pkey_, out.data(), &length) != 1 ||
        length != X25519_KEY_LENGTH) {
        return TLSError::CRYPTO_ERROR;
    }
    return make_result();
}

Result<void> X25519KeyPair::derive_shared_secret(BufferView peer_public_key,
                                                 std::array<uint8_t, X25519_KEY_LENGTH>& out) const {
    if (!pkey_) {
        return TLSError::INVALID_STATE;
    }
    if (peer_public_key.size() != X25519_KEY_LENGTH) {
        return TLSError::INVALID_KEY_SHARE;
    }

    EVP_PKEY* peer = EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                                 peer_public_key.data(), peer_public_key.size());
    if (!peer) {
        return TLSError::INVALID_KEY_SHARE;
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(pkey_, nullptr);
    if (!ctx) {
        EVP_PKEY_free(peer);
        return TLSError::CRYPTO_ERROR;
    }

    size_t length = out.size();
    int result = 1;

    if (result == 1) {
        result = EVP_PKEY_derive_init(ctx);
    }

    if (result == 1) {
        result = EVP_PKEY_derive_set_peer(ctx, peer);
    }

    // Fails on an all-zero shared secret (small-order peer point)
    if (result == 1) {
        result = EVP_PKEY_derive(ctx, out.data(), &length);
    }

    EVP_PKEY_CTX_free(ctx);
    EVP_PKEY_free(peer);

    if (result != 1 || length != X25519_KEY_LENGTH) {
        return TLSError::INVALID_KEY_SHARE;
    }
    return make_result();
}

void X25519KeyPair::secure_zero(uint8_t* data, size_t length) noexcept {
    OPENSSL_cleanse(data, length);
}

} // namespace crypto
} // namespace v13
} // namespace emtls
