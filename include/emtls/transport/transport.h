#ifndef EMTLS_TRANSPORT_TRANSPORT_H
#define EMTLS_TRANSPORT_TRANSPORT_H

#include <emtls/result.h>
#include <cstddef>
#include <cstdint>

namespace emtls {
namespace v13 {
namespace transport {

/*
 * Transports are template parameters of the record codec, the handshake
 * and the connection. A blocking byte-stream transport provides
 *
 *     Result<size_t> read(uint8_t* buffer, size_t length);
 *         Blocks until at least one byte is available and returns the number
 *         of bytes read (1..length), or fails. A peer that closed the stream
 *         is reported as TRANSPORT_CLOSED.
 *
 *     Result<void> write(const uint8_t* data, size_t length);
 *         Transmits all bytes or fails.
 *
 * Timeouts and cancellation belong to the transport.
 */

/** Read exactly `length` bytes, issuing as many transport reads as needed. */
template<typename Transport>
Result<void> read_exact(Transport& transport, uint8_t* buffer, size_t length) {
    size_t received = 0;
    while (received < length) {
        auto result = transport.read(buffer + received, length - received);
        if (!result) {
            return result.error();
        }
        if (*result == 0) {
            return TLSError::TRANSPORT_CLOSED;
        }
        received += *result;
    }
    return make_result();
}

} // namespace transport
} // namespace v13
} // namespace emtls

#endif // EMTLS_TRANSPORT_TRANSPORT_H
