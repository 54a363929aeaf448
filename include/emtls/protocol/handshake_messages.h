#ifndef EMTLS_PROTOCOL_HANDSHAKE_MESSAGES_H
#define EMTLS_PROTOCOL_HANDSHAKE_MESSAGES_H

#include <emtls/config.h>
#include <emtls/result.h>
#include <emtls/types.h>
#include <emtls/memory/buffer.h>
#include <emtls/protocol/wire.h>
#include <array>
#include <optional>
#include <string_view>

namespace emtls::v13::protocol {

// Hello retry request marker (RFC 8446 Section 4.1.3): SHA-256("HelloRetryRequest")
constexpr Random HELLO_RETRY_REQUEST_RANDOM = {
    0xCF, 0x21, 0xAD, 0x74, 0xE5, 0x9A, 0x61, 0x11,
    0xBE, 0x1D, 0x8C, 0x02, 0x1E, 0x65, 0xB8, 0x91,
    0xC2, 0xA2, 0x11, 0x16, 0x7A, 0xBB, 0x8C, 0x5E,
    0x07, 0x9E, 0x09, 0xE2, 0xC8, 0xA8, 0x33, 0x9C
};

// psk_dhe_ke, the only PSK mode offered
constexpr uint8_t PSK_DHE_KE_MODE = 1;

/**
 * One handshake message inside a record: the 4-byte header plus body.
 * Views point into the record buffer and are only valid until it is reused.
 */
struct HandshakeMessageView {
    HandshakeType type = HandshakeType::CLIENT_HELLO;
    memory::BufferView raw;   // header and body, as hashed into the transcript
    memory::BufferView body;

    /**
     * Split the next complete message off `reader`. A message whose body
     * runs past the end of the record yields INVALID_HANDSHAKE.
     */
    static Result<HandshakeMessageView> parse_next(WireReader& reader);
};

// Inputs of the ClientHello encoder
struct ClientHelloParams {
    Random random{};
    std::array<uint8_t, X25519_KEY_LENGTH> key_share{};
    CipherSuite cipher_suite = CipherSuite::TLS_AES_128_GCM_SHA256;
    std::string_view server_name;
    std::optional<MaxFragmentLength> max_fragment_length;
    bool enable_rsa_signatures = true;
};

// Encoders write the complete handshake message, header included, and return its length

EMTLS_API Result<size_t> encode_client_hello(const ClientHelloParams& params,
                                             memory::MutableBufferView out);

EMTLS_API Result<size_t> encode_finished(memory::BufferView verify_data,
                                         memory::MutableBufferView out);

// Certificate message with no entries, sent when the server requests a client certificate
EMTLS_API Result<size_t> encode_empty_certificate(memory::BufferView request_context,
                                                  memory::MutableBufferView out);

// Parsers take the message body

struct ServerHello {
    ProtocolVersion legacy_version = 0;
    Random random{};
    memory::BufferView legacy_session_id;
    CipherSuite cipher_suite = CipherSuite::TLS_AES_128_GCM_SHA256;
    ProtocolVersion selected_version = 0;
    std::optional<NamedGroup> key_share_group;
    memory::BufferView key_share;
    bool is_hello_retry_request = false;

    static Result<ServerHello> parse(memory::BufferView body);
};

struct EncryptedExtensions {
    std::optional<MaxFragmentLength> max_fragment_length;
    bool server_name_acknowledged = false;
    size_t extension_count = 0;

    static Result<EncryptedExtensions> parse(memory::BufferView body);
};

struct CertificateRequest {
    memory::BufferView request_context;

    static Result<CertificateRequest> parse(memory::BufferView body);
};

// Certificate chains are not validated; only the structure is checked
struct Certificate {
    memory::BufferView request_context;
    size_t entry_count = 0;

    static Result<Certificate> parse(memory::BufferView body);
};

struct CertificateVerify {
    SignatureScheme scheme = SignatureScheme::ED25519;
    memory::BufferView signature;

    static Result<CertificateVerify> parse(memory::BufferView body);
};

struct NewSessionTicket {
    uint32_t lifetime = 0;
    uint32_t age_add = 0;
    memory::BufferView nonce;
    memory::BufferView ticket;
    memory::BufferView extensions;

    static Result<NewSessionTicket> parse(memory::BufferView body);
};

}  // namespace emtls::v13::protocol

#endif // EMTLS_PROTOCOL_HANDSHAKE_MESSAGES_H
