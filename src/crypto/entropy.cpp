#include <emtls/crypto/entropy.h>
#include <emtls/crypto/openssl_crypto.h>

namespace emtls {
namespace v13 {
namespace crypto {

Result<void> OsEntropySource::fill_bytes(uint8_t* out, size_t length) {
    return random_bytes(out, length);
}

} // namespace crypto
} // namespace v13
} // namespace emtls
