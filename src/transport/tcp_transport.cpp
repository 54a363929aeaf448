#include <emtls/transport/tcp_transport.h>
#include <emtls/error_reporter.h>

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace emtls {
namespace v13 {
namespace transport {

namespace {

bool is_timeout_error(int error) {
    return error == EAGAIN || error == EWOULDBLOCK;
}

bool is_peer_gone_error(int error) {
    return error == EPIPE || error == ECONNRESET;
}

} // anonymous namespace

TcpTransport::~TcpTransport() {
    close();
}

TcpTransport::TcpTransport(TcpTransport&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

TcpTransport& TcpTransport::operator=(TcpTransport&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Result<TcpTransport> TcpTransport::connect(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addresses = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &addresses);
    if (rc != 0) {
        EMTLS_LOG_ERROR("transport", "Cannot resolve " << host << ": " << gai_strerror(rc));
        return TLSError::IO_ERROR;
    }

    int fd = -1;
    for (addrinfo* ai = addresses; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }

        int result;
        do {
            result = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        } while (result != 0 && errno == EINTR);

        if (result == 0) {
            break;
        }
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(addresses);

    if (fd < 0) {
        EMTLS_LOG_ERROR("transport", "Cannot connect to " << host << ":" << port);
        return TLSError::IO_ERROR;
    }

    // Records are written whole; do not let Nagle hold back the last segment
    int enable = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable)) != 0) {
        EMTLS_LOG_DEBUG("transport", "TCP_NODELAY not applied: " << std::strerror(errno));
    }

    EMTLS_LOG_DEBUG("transport", "Connected to " << host << ":" << port);
    return TcpTransport(fd);
}

Result<TcpTransport> TcpTransport::from_fd(int fd) {
    if (fd < 0) {
        return TLSError::INVALID_PARAMETER;
    }
    return TcpTransport(fd);
}

Result<void> TcpTransport::set_io_timeout(std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        return TLSError::INVALID_STATE;
    }
    if (timeout.count() < 0) {
        return TLSError::INVALID_PARAMETER;
    }

    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        return TLSError::IO_ERROR;
    }
    return make_result();
}

Result<size_t> TcpTransport::read(uint8_t* buffer, size_t length) {
    if (fd_ < 0) {
        return TLSError::INVALID_STATE;
    }
    if (length == 0) {
        return TLSError::INVALID_PARAMETER;
    }

    for (;;) {
        ssize_t received = ::recv(fd_, buffer, length, 0);
        if (received > 0) {
            return static_cast<size_t>(received);
        }
        if (received == 0) {
            return TLSError::TRANSPORT_CLOSED;
        }

        const int error = errno;
        if (error == EINTR) {
            continue;
        }
        if (is_timeout_error(error)) {
            return TLSError::TIMEOUT;
        }
        if (is_peer_gone_error(error)) {
            return TLSError::TRANSPORT_CLOSED;
        }
        EMTLS_LOG_ERROR("transport", "recv failed: " << std::strerror(error));
        return TLSError::IO_ERROR;
    }
}

Result<void> TcpTransport::write(const uint8_t* data, size_t length) {
    if (fd_ < 0) {
        return TLSError::INVALID_STATE;
    }

    size_t sent = 0;
    while (sent < length) {
        ssize_t result = ::send(fd_, data + sent, length - sent, MSG_NOSIGNAL);
        if (result > 0) {
            sent += static_cast<size_t>(result);
            continue;
        }

        const int error = errno;
        if (result < 0 && error == EINTR) {
            continue;
        }
        if (result < 0 && is_timeout_error(error)) {
            return TLSError::TIMEOUT;
        }
        if (result < 0 && is_peer_gone_error(error)) {
            return TLSError::TRANSPORT_CLOSED;
        }
        EMTLS_LOG_ERROR("transport", "send failed: " << std::strerror(error));
        return TLSError::IO_ERROR;
    }
    return make_result();
}

void TcpTransport::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace transport
} // namespace v13
} // namespace emtls
