#include <emtls/crypto/transcript_hash.h>
#include <emtls/crypto/openssl_crypto.h>
#include <openssl/evp.h>

namespace emtls {
namespace v13 {
namespace crypto {

TranscriptHash::~TranscriptHash() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

TranscriptHash::TranscriptHash(TranscriptHash&& other) noexcept
    : ctx_(other.ctx_), algorithm_(other.algorithm_) {
    other.ctx_ = nullptr;
}

TranscriptHash& TranscriptHash::operator=(TranscriptHash&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
        ctx_ = other.ctx_;
        algorithm_ = other.algorithm_;
        other.ctx_ = nullptr;
    }
    return *this;
}

Result<TranscriptHash> TranscriptHash::create(HashAlgorithm algorithm) {
    const EVP_MD* md = nullptr;
    switch (algorithm) {
        case HashAlgorithm::SHA256: md = EVP_sha256(); break;
        case HashAlgorithm::SHA384: md = EVP_sha384(); break;
    }
    if (!md) {
        return TLSError::INVALID_PARAMETER;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return TLSError::CRYPTO_ERROR;
    }
    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return TLSError::CRYPTO_ERROR;
    }
    return TranscriptHash(ctx, algorithm);
}

Result<void> TranscriptHash::update(memory::BufferView data) {
    if (!ctx_) {
        return TLSError::INVALID_STATE;
    }
    if (data.empty()) {
        return make_result();
    }
    if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        return TLSError::CRYPTO_ERROR;
    }
    return make_result();
}

Result<void> TranscriptHash::snapshot(uint8_t* out) const {
    if (!ctx_ || out == nullptr) {
        return TLSError::INVALID_STATE;
    }

    EVP_MD_CTX* copy = EVP_MD_CTX_new();
    if (!copy) {
        return TLSError::CRYPTO_ERROR;
    }

    int result = EVP_MD_CTX_copy_ex(copy, ctx_);
    if (result == 1) {
        unsigned int length = 0;
        result = EVP_DigestFinal_ex(copy, out, &length);
    }
    EVP_MD_CTX_free(copy);

    if (result != 1) {
        return TLSError::CRYPTO_ERROR;
    }
    return make_result();
}

size_t TranscriptHash::digest_length() const noexcept {
    return hash_length(algorithm_);
}

} // namespace crypto
} // namespace v13
} // namespace emtls
