/**
 * Blocking TLS 1.3 Client Example
 *
 * Connects to an HTTPS server, sends a minimal HTTP/1.0 request, prints
 * the first record of the response and closes the connection.
 *
 * Usage: emtls_blocking_client <host> [port] [--verbose]
 */

#include <emtls/connection.h>
#include <emtls/crypto/cipher_suite.h>
#include <emtls/crypto/entropy.h>
#include <emtls/error_reporter.h>
#include <emtls/transport/tcp_transport.h>

#include <array>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace emtls::v13;

namespace {

using Suite = crypto::Aes128GcmSha256;
using ClientConnection = Connection<transport::TcpTransport, crypto::OsEntropySource, Suite>;

// Record buffer large enough for a full 16 KiB record from the server
std::array<uint8_t, 16384 + 256> g_record_storage;

void enable_verbose_logging() {
    auto config = ErrorReporter::instance().get_configuration();
    config.minimum_level = ErrorReporter::LogLevel::DEBUG;
    config.output = &std::cerr;
    if (!ErrorReporter::instance().update_configuration(config)) {
        std::cerr << "Failed to enable verbose logging" << std::endl;
    }
}

int fail(const char* step, TLSError error) {
    std::cerr << step << " failed: " << to_string(error) << std::endl;
    return EXIT_FAILURE;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <host> [port] [--verbose]" << std::endl;
        return EXIT_FAILURE;
    }

    const std::string host = argv[1];
    uint16_t port = 443;
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verbose") == 0) {
            enable_verbose_logging();
        } else {
            port = static_cast<uint16_t>(std::atoi(argv[i]));
        }
    }

    ClientConfig<Suite> config;
    config.with_server_name(host);
    if (auto valid = config.validate(); !valid) {
        return fail("Configuration", valid.error());
    }

    std::cout << "Connecting to " << host << ":" << port << std::endl;
    auto transport = transport::TcpTransport::connect(host, port);
    if (!transport) {
        return fail("Connect", transport.error());
    }
    if (auto timeout = transport->set_io_timeout(std::chrono::seconds(10)); !timeout) {
        return fail("Socket timeout", timeout.error());
    }

    ClientConnection connection(
        ClientConnection::ContextType(config, crypto::OsEntropySource(),
                                      memory::RecordBuffer(g_record_storage.data(), g_record_storage.size())),
        std::move(*transport));

    if (auto opened = connection.open(); !opened) {
        return fail("Handshake", opened.error());
    }
    std::cout << "Handshake complete using " << to_string(Suite::CODE) << std::endl;

    const std::string request = "GET / HTTP/1.0\r\nHost: " + host + "\r\n\r\n";
    auto written = connection.write(memory::BufferView(reinterpret_cast<const uint8_t*>(request.data()),
                                                       request.size()));
    if (!written) {
        return fail("Write", written.error());
    }

    std::array<uint8_t, 16384> response{};
    auto received = connection.read(response);
    if (!received) {
        return fail("Read", received.error());
    }
    std::cout << std::string(reinterpret_cast<const char*>(response.data()), *received) << std::endl;

    auto closed = std::move(connection).close();
    if (!closed) {
        return fail("Close", closed.error());
    }
    std::cout << "Connection closed" << std::endl;
    return EXIT_SUCCESS;
}
