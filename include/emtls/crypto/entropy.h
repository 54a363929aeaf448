#ifndef EMTLS_CRYPTO_ENTROPY_H
#define EMTLS_CRYPTO_ENTROPY_H

#include <emtls/config.h>
#include <emtls/result.h>
#include <cstddef>
#include <cstdint>

namespace emtls {
namespace v13 {
namespace crypto {

/*
 * Entropy sources are template parameters. A type qualifies when it provides
 *
 *     Result<void> fill_bytes(uint8_t* out, size_t length);
 *
 * filling the whole buffer with cryptographically secure random bytes or
 * failing. Embedded targets plug in their hardware RNG this way.
 */

// Operating system CSPRNG through OpenSSL RAND_bytes
class EMTLS_API OsEntropySource {
public:
    Result<void> fill_bytes(uint8_t* out, size_t length);
};

} // namespace crypto
} // namespace v13
} // namespace emtls

#endif // EMTLS_CRYPTO_ENTROPY_H
