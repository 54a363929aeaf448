#ifndef EMTLS_TRANSPORT_TCP_TRANSPORT_H
#define EMTLS_TRANSPORT_TCP_TRANSPORT_H

#include <emtls/config.h>
#include <emtls/result.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace emtls {
namespace v13 {
namespace transport {

/**
 * Blocking TCP stream transport owning one socket descriptor.
 *
 * Interrupted system calls are retried. When an I/O timeout is set, a
 * read or write that makes no progress within it fails with TIMEOUT.
 */
class EMTLS_API TcpTransport {
public:
    TcpTransport() noexcept : fd_(-1) {}
    ~TcpTransport();

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;
    TcpTransport(TcpTransport&& other) noexcept;
    TcpTransport& operator=(TcpTransport&& other) noexcept;

    /** Resolve `host` and connect to the first reachable address. */
    static Result<TcpTransport> connect(const std::string& host, uint16_t port);

    /** Take ownership of an already connected stream socket. */
    static Result<TcpTransport> from_fd(int fd);

    Result<void> set_io_timeout(std::chrono::milliseconds timeout);

    Result<size_t> read(uint8_t* buffer, size_t length);
    Result<void> write(const uint8_t* data, size_t length);

    bool is_open() const noexcept { return fd_ >= 0; }
    int native_handle() const noexcept { return fd_; }
    void close() noexcept;

private:
    explicit TcpTransport(int fd) noexcept : fd_(fd) {}

    int fd_;
};

} // namespace transport
} // namespace v13
} // namespace emtls

#endif // EMTLS_TRANSPORT_TCP_TRANSPORT_H
