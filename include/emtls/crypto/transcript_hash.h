#ifndef EMTLS_CRYPTO_TRANSCRIPT_HASH_H
#define EMTLS_CRYPTO_TRANSCRIPT_HASH_H

#include <emtls/config.h>
#include <emtls/result.h>
#include <emtls/types.h>
#include <emtls/memory/buffer.h>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace emtls {
namespace v13 {
namespace crypto {

/**
 * Running hash over the handshake messages exchanged so far.
 *
 * snapshot() yields the hash of everything absorbed up to now without
 * finalizing the running state, as needed for Derive-Secret and Finished.
 */
class EMTLS_API TranscriptHash {
public:
    TranscriptHash() noexcept : ctx_(nullptr), algorithm_(HashAlgorithm::SHA256) {}
    ~TranscriptHash();

    TranscriptHash(const TranscriptHash&) = delete;
    TranscriptHash& operator=(const TranscriptHash&) = delete;
    TranscriptHash(TranscriptHash&& other) noexcept;
    TranscriptHash& operator=(TranscriptHash&& other) noexcept;

    static Result<TranscriptHash> create(HashAlgorithm algorithm);

    Result<void> update(memory::BufferView data);

    /** Write the current digest to `out`, which must hold digest_length() bytes. */
    Result<void> snapshot(uint8_t* out) const;

    size_t digest_length() const noexcept;
    HashAlgorithm algorithm() const noexcept { return algorithm_; }

private:
    TranscriptHash(EVP_MD_CTX* ctx, HashAlgorithm algorithm) noexcept
        : ctx_(ctx), algorithm_(algorithm) {}

    EVP_MD_CTX* ctx_;
    HashAlgorithm algorithm_;
};

} // namespace crypto
} // namespace v13
} // namespace emtls

#endif // EMTLS_CRYPTO_TRANSCRIPT_HASH_H
