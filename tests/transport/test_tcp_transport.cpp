#include <gtest/gtest.h>
#include <emtls/transport/tcp_transport.h>
#include <emtls/transport/transport.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <array>
#include <chrono>
#include <cstring>
#include <string>

using namespace emtls::v13;
using namespace emtls::v13::transport;

class TcpTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds_), 0);
    }

    void TearDown() override {
        for (int fd : fds_) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }

    // Transfers ownership of one end of the pair to a TcpTransport
    TcpTransport adopt(int index) {
        auto transport = TcpTransport::from_fd(fds_[index]);
        EXPECT_TRUE(transport);
        fds_[index] = -1;
        return std::move(*transport);
    }

    int fds_[2] = {-1, -1};
};

TEST_F(TcpTransportTest, WriteThenRead) {
    TcpTransport client = adopt(0);
    TcpTransport server = adopt(1);
    EXPECT_TRUE(client.is_open());

    const std::string message = "record bytes";
    ASSERT_TRUE(client.write(reinterpret_cast<const uint8_t*>(message.data()), message.size()));

    std::array<uint8_t, 64> out{};
    auto received = server.read(out.data(), out.size());
    ASSERT_TRUE(received);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(out.data()), *received), message);
}

TEST_F(TcpTransportTest, ReadExactAcrossWrites) {
    TcpTransport client = adopt(0);
    TcpTransport server = adopt(1);

    const uint8_t first[] = {1, 2, 3};
    const uint8_t second[] = {4, 5};
    ASSERT_TRUE(client.write(first, sizeof(first)));
    ASSERT_TRUE(client.write(second, sizeof(second)));

    std::array<uint8_t, 5> out{};
    ASSERT_TRUE(read_exact(server, out.data(), out.size()));
    EXPECT_EQ(out, (std::array<uint8_t, 5>{1, 2, 3, 4, 5}));
}

TEST_F(TcpTransportTest, PeerCloseIsTransportClosed) {
    TcpTransport server = adopt(1);
    ::close(fds_[0]);
    fds_[0] = -1;

    std::array<uint8_t, 8> out{};
    EXPECT_EQ(server.read(out.data(), out.size()).error(), TLSError::TRANSPORT_CLOSED);

    const uint8_t byte = 0x17;
    EXPECT_EQ(server.write(&byte, 1).error(), TLSError::TRANSPORT_CLOSED);
}

TEST_F(TcpTransportTest, ReadTimeout) {
    TcpTransport server = adopt(1);
    ASSERT_TRUE(server.set_io_timeout(std::chrono::milliseconds(50)));

    std::array<uint8_t, 8> out{};
    EXPECT_EQ(server.read(out.data(), out.size()).error(), TLSError::TIMEOUT);
}

TEST_F(TcpTransportTest, InvalidArguments) {
    EXPECT_EQ(TcpTransport::from_fd(-1).error(), TLSError::INVALID_PARAMETER);

    TcpTransport server = adopt(1);
    uint8_t byte = 0;
    EXPECT_EQ(server.read(&byte, 0).error(), TLSError::INVALID_PARAMETER);
    EXPECT_EQ(server.set_io_timeout(std::chrono::milliseconds(-1)).error(), TLSError::INVALID_PARAMETER);
}

TEST_F(TcpTransportTest, ClosedTransport) {
    TcpTransport server = adopt(1);
    server.close();
    EXPECT_FALSE(server.is_open());

    uint8_t byte = 0;
    EXPECT_EQ(server.read(&byte, 1).error(), TLSError::INVALID_STATE);
    EXPECT_EQ(server.write(&byte, 1).error(), TLSError::INVALID_STATE);
    EXPECT_EQ(server.set_io_timeout(std::chrono::milliseconds(10)).error(), TLSError::INVALID_STATE);

    TcpTransport unopened;
    EXPECT_FALSE(unopened.is_open());
    EXPECT_EQ(unopened.native_handle(), -1);
}

TEST_F(TcpTransportTest, MoveTransfersSocket) {
    TcpTransport original = adopt(0);
    const int fd = original.native_handle();

    TcpTransport moved(std::move(original));
    EXPECT_FALSE(original.is_open());
    EXPECT_EQ(moved.native_handle(), fd);

    TcpTransport assigned;
    assigned = std::move(moved);
    EXPECT_FALSE(moved.is_open());
    EXPECT_EQ(assigned.native_handle(), fd);
}

class TcpConnectTest : public ::testing::Test {
protected:
    void SetUp() override {
        listener_ = ::socket(AF_INET, SOCK_STREAM, 0);
        ASSERT_GE(listener_, 0);

        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;
        ASSERT_EQ(::bind(listener_, reinterpret_cast<sockaddr*>(&address), sizeof(address)), 0);
        ASSERT_EQ(::listen(listener_, 1), 0);

        socklen_t length = sizeof(address);
        ASSERT_EQ(::getsockname(listener_, reinterpret_cast<sockaddr*>(&address), &length), 0);
        port_ = ntohs(address.sin_port);
    }

    void TearDown() override {
        if (listener_ >= 0) {
            ::close(listener_);
        }
    }

    int listener_ = -1;
    uint16_t port_ = 0;
};

TEST_F(TcpConnectTest, ConnectsToLoopback) {
    auto client = TcpTransport::connect("127.0.0.1", port_);
    ASSERT_TRUE(client);

    int accepted = ::accept(listener_, nullptr, nullptr);
    ASSERT_GE(accepted, 0);
    auto server = TcpTransport::from_fd(accepted);
    ASSERT_TRUE(server);

    const uint8_t hello[] = {0x16, 0x03, 0x01};
    ASSERT_TRUE(client->write(hello, sizeof(hello)));
    std::array<uint8_t, 3> out{};
    ASSERT_TRUE(read_exact(*server, out.data(), out.size()));
    EXPECT_EQ(std::memcmp(out.data(), hello, sizeof(hello)), 0);
}

TEST_F(TcpConnectTest, RefusedConnection) {
    ::close(listener_);
    listener_ = -1;
    EXPECT_EQ(TcpTransport::connect("127.0.0.1", port_).error(), TLSError::IO_ERROR);
}

TEST_F(TcpConnectTest, UnresolvableHost) {
    EXPECT_EQ(TcpTransport::connect("host.invalid", port_).error(), TLSError::IO_ERROR);
}
