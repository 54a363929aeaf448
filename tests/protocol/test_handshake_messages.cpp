#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <emtls/protocol/handshake_messages.h>
#include "../test_infrastructure/test_utilities.h"
#include <array>
#include <vector>

using namespace emtls::v13;
using namespace emtls::v13::memory;
using namespace emtls::v13::protocol;
using namespace emtls::test;

namespace {

Bytes body_of(const Bytes& message) {
    return Bytes(message.begin() + HANDSHAKE_HEADER_LENGTH, message.end());
}

} // anonymous namespace

class ClientHelloTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (size_t i = 0; i < params_.random.size(); ++i) {
            params_.random[i] = static_cast<uint8_t>(i);
        }
        params_.key_share.fill(0x99);
    }

    ParsedClientHello encode_and_parse() {
        std::array<uint8_t, 1024> out{};
        auto length = encode_client_hello(params_, out);
        EXPECT_TRUE(length);
        if (!length) {
            return ParsedClientHello{};
        }

        WireReader reader(BufferView(out.data(), *length));
        auto message = HandshakeMessageView::parse_next(reader);
        EXPECT_TRUE(message);
        EXPECT_TRUE(reader.empty());
        EXPECT_EQ(message->type, HandshakeType::CLIENT_HELLO);
        EXPECT_EQ(message->raw.size(), *length);

        auto parsed = parse_client_hello(message->body);
        EXPECT_TRUE(parsed);
        return parsed ? *parsed : ParsedClientHello{};
    }

    ClientHelloParams params_;
};

TEST_F(ClientHelloTest, MinimalLayout) {
    ParsedClientHello hello = encode_and_parse();

    EXPECT_EQ(hello.legacy_version, TLS_V12);
    EXPECT_EQ(hello.random, params_.random);
    EXPECT_TRUE(hello.session_id.empty());
    EXPECT_EQ(hello.cipher_suites, std::vector<uint16_t>{0x1301});
    EXPECT_EQ(hello.compression_methods, Bytes{0x00});

    // No SNI or max_fragment_length when not configured
    EXPECT_THAT(hello.extension_order, ::testing::ElementsAre(10, 13, 43, 45, 51));

    EXPECT_EQ(hello.supported_groups, std::vector<uint16_t>{29});
    EXPECT_EQ(hello.supported_versions, std::vector<uint16_t>{TLS_V13});
    EXPECT_EQ(hello.psk_modes, Bytes{PSK_DHE_KE_MODE});
    EXPECT_EQ(hello.key_share_group, 29);
    EXPECT_EQ(hello.key_share, Bytes(32, 0x99));
}

TEST_F(ClientHelloTest, SignatureSchemesWithRsa) {
    ParsedClientHello hello = encode_and_parse();
    const std::vector<uint16_t> expected = {
        0x0403, 0x0503, 0x0807,
        0x0804, 0x0805, 0x0806,
        0x0401, 0x0501, 0x0601
    };
    EXPECT_EQ(hello.signature_schemes, expected);
}

TEST_F(ClientHelloTest, SignatureSchemesWithoutRsa) {
    params_.enable_rsa_signatures = false;
    ParsedClientHello hello = encode_and_parse();
    const std::vector<uint16_t> expected = {0x0403, 0x0503, 0x0807};
    EXPECT_EQ(hello.signature_schemes, expected);
}

TEST_F(ClientHelloTest, ServerNameAndFragmentLength) {
    params_.server_name = "example.com";
    params_.max_fragment_length = MaxFragmentLength::LENGTH_2048;
    params_.cipher_suite = CipherSuite::TLS_CHACHA20_POLY1305_SHA256;
    ParsedClientHello hello = encode_and_parse();

    EXPECT_THAT(hello.extension_order, ::testing::ElementsAre(0, 1, 10, 13, 43, 45, 51));
    EXPECT_EQ(hello.server_name, "example.com");
    ASSERT_TRUE(hello.max_fragment_length.has_value());
    EXPECT_EQ(*hello.max_fragment_length, 3);
    EXPECT_EQ(hello.cipher_suites, std::vector<uint16_t>{0x1303});
}

TEST_F(ClientHelloTest, OutputTooSmall) {
    std::array<uint8_t, 64> out{};
    EXPECT_EQ(encode_client_hello(params_, out).error(), TLSError::ENCODE_ERROR);
}

TEST_F(ClientHelloTest, ServerNameTooLong) {
    std::string name(256, 'a');
    params_.server_name = name;
    std::array<uint8_t, 1024> out{};
    EXPECT_EQ(encode_client_hello(params_, out).error(), TLSError::INVALID_PARAMETER);
}

class ClientMessagesTest : public ::testing::Test {};

TEST_F(ClientMessagesTest, Finished) {
    Bytes verify_data(32, 0x3c);
    std::array<uint8_t, 64> out{};
    auto length = encode_finished(verify_data, out);
    ASSERT_TRUE(length);
    EXPECT_EQ(BufferView(out.data(), *length), BufferView(encode_handshake(HandshakeType::FINISHED, verify_data)));
}

TEST_F(ClientMessagesTest, EmptyCertificateEchoesContext) {
    std::array<uint8_t, 32> out{};
    auto length = encode_empty_certificate(from_hex("2a2b"), out);
    ASSERT_TRUE(length);
    EXPECT_EQ(BufferView(out.data(), *length), BufferView(from_hex("0b000006022a2b000000")));

    auto parsed = Certificate::parse(BufferView(out.data() + HANDSHAKE_HEADER_LENGTH,
                                                *length - HANDSHAKE_HEADER_LENGTH));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->entry_count, 0u);
    EXPECT_EQ(parsed->request_context, BufferView(from_hex("2a2b")));
}

class HandshakeMessageViewTest : public ::testing::Test {};

TEST_F(HandshakeMessageViewTest, SplitsCoalescedMessages) {
    Bytes content = encode_handshake(HandshakeType::ENCRYPTED_EXTENSIONS, from_hex("0000"));
    Bytes second = encode_handshake(HandshakeType::FINISHED, Bytes(32, 0x01));
    content.insert(content.end(), second.begin(), second.end());

    WireReader reader(content);
    auto first = HandshakeMessageView::parse_next(reader);
    ASSERT_TRUE(first);
    EXPECT_EQ(first->type, HandshakeType::ENCRYPTED_EXTENSIONS);
    EXPECT_EQ(first->raw.size(), 6u);
    EXPECT_EQ(first->body.size(), 2u);

    auto next = HandshakeMessageView::parse_next(reader);
    ASSERT_TRUE(next);
    EXPECT_EQ(next->type, HandshakeType::FINISHED);
    EXPECT_EQ(next->body.size(), 32u);
    EXPECT_TRUE(reader.empty());
}

TEST_F(HandshakeMessageViewTest, TruncatedMessage) {
    Bytes content = from_hex("14000020aabb");
    WireReader reader(content);
    EXPECT_EQ(HandshakeMessageView::parse_next(reader).error(), TLSError::INVALID_HANDSHAKE);

    Bytes header_only = from_hex("1400");
    WireReader short_reader(header_only);
    EXPECT_EQ(HandshakeMessageView::parse_next(short_reader).error(), TLSError::INVALID_HANDSHAKE);
}

class ServerHelloTest : public ::testing::Test {
protected:
    void SetUp() override {
        fields_.random.fill(0x11);
        fields_.key_share = Bytes(32, 0x22);
    }

    Result<ServerHello> parse() {
        body_ = body_of(encode_server_hello(fields_));
        return ServerHello::parse(body_);
    }

    ServerHelloFields fields_;
    Bytes body_;
};

TEST_F(ServerHelloTest, ParsesFields) {
    auto hello = parse();
    ASSERT_TRUE(hello);
    EXPECT_EQ(hello->legacy_version, TLS_V12);
    EXPECT_EQ(hello->random, fields_.random);
    EXPECT_TRUE(hello->legacy_session_id.empty());
    EXPECT_EQ(hello->cipher_suite, CipherSuite::TLS_AES_128_GCM_SHA256);
    EXPECT_EQ(hello->selected_version, TLS_V13);
    ASSERT_TRUE(hello->key_share_group.has_value());
    EXPECT_EQ(*hello->key_share_group, NamedGroup::X25519);
    EXPECT_EQ(hello->key_share, BufferView(fields_.key_share));
    EXPECT_FALSE(hello->is_hello_retry_request);
}

TEST_F(ServerHelloTest, DetectsHelloRetryRequest) {
    fields_.random = HELLO_RETRY_REQUEST_RANDOM;
    fields_.key_share.clear();
    auto hello = parse();
    ASSERT_TRUE(hello);
    EXPECT_TRUE(hello->is_hello_retry_request);
    EXPECT_TRUE(hello->key_share.empty());
}

TEST_F(ServerHelloTest, MissingSupportedVersions) {
    fields_.selected_version.reset();
    auto hello = parse();
    ASSERT_TRUE(hello);
    EXPECT_EQ(hello->selected_version, 0);
}

TEST_F(ServerHelloTest, SessionIdTooLong) {
    fields_.session_id = Bytes(33, 0x01);
    EXPECT_EQ(parse().error(), TLSError::INVALID_SESSION_ID);
}

TEST_F(ServerHelloTest, TruncatedKeyShare) {
    body_ = body_of(encode_server_hello(fields_));
    // Shorten the key_exchange length field inside the last extension
    body_[body_.size() - 34] = 0x00;
    body_[body_.size() - 33] = 0x10;
    EXPECT_EQ(ServerHello::parse(body_).error(), TLSError::INVALID_KEY_SHARE);
}

TEST_F(ServerHelloTest, TrailingBytes) {
    body_ = body_of(encode_server_hello(fields_));
    body_.push_back(0x00);
    EXPECT_EQ(ServerHello::parse(body_).error(), TLSError::DECODE_ERROR);
}

TEST_F(ServerHelloTest, Truncated) {
    EXPECT_EQ(ServerHello::parse(from_hex("0303")).error(), TLSError::DECODE_ERROR);
}

class ServerFlightMessagesTest : public ::testing::Test {};

TEST_F(ServerFlightMessagesTest, EncryptedExtensions) {
    auto empty = EncryptedExtensions::parse(body_of(encode_encrypted_extensions(std::nullopt, false)));
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty->extension_count, 0u);
    EXPECT_FALSE(empty->max_fragment_length.has_value());
    EXPECT_FALSE(empty->server_name_acknowledged);

    auto full = EncryptedExtensions::parse(body_of(encode_encrypted_extensions(uint8_t{4}, true)));
    ASSERT_TRUE(full);
    EXPECT_EQ(full->extension_count, 2u);
    EXPECT_TRUE(full->server_name_acknowledged);
    ASSERT_TRUE(full->max_fragment_length.has_value());
    EXPECT_EQ(*full->max_fragment_length, MaxFragmentLength::LENGTH_4096);

    EXPECT_EQ(EncryptedExtensions::parse(body_of(encode_encrypted_extensions(uint8_t{9}, false))).error(),
              TLSError::INVALID_EXTENSIONS_LENGTH);
    EXPECT_EQ(EncryptedExtensions::parse(from_hex("0004000a")).error(),
              TLSError::INVALID_EXTENSIONS_LENGTH);
}

TEST_F(ServerFlightMessagesTest, CertificateRequest) {
    const Bytes body = body_of(encode_certificate_request(from_hex("0102")));
    auto request = CertificateRequest::parse(body);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->request_context, BufferView(from_hex("0102")));

    EXPECT_EQ(CertificateRequest::parse(from_hex("00")).error(), TLSError::INVALID_CERTIFICATE_REQUEST);
}

TEST_F(ServerFlightMessagesTest, Certificate) {
    const Bytes body = body_of(encode_certificate({from_hex("3082"), from_hex("308201")}));
    auto certificate = Certificate::parse(body);
    ASSERT_TRUE(certificate);
    EXPECT_EQ(certificate->entry_count, 2u);
    EXPECT_TRUE(certificate->request_context.empty());

    // Zero-length certificate entry
    EXPECT_EQ(Certificate::parse(body_of(encode_certificate({Bytes{}}))).error(),
              TLSError::INVALID_CERTIFICATE);
    EXPECT_EQ(Certificate::parse(from_hex("00000005")).error(), TLSError::INVALID_CERTIFICATE);
}

TEST_F(ServerFlightMessagesTest, CertificateVerify) {
    const Bytes body = body_of(encode_certificate_verify(SignatureScheme::ED25519, Bytes(64, 0x5a)));
    auto verify = CertificateVerify::parse(body);
    ASSERT_TRUE(verify);
    EXPECT_EQ(verify->scheme, SignatureScheme::ED25519);
    EXPECT_EQ(verify->signature.size(), 64u);

    EXPECT_EQ(CertificateVerify::parse(from_hex("080700")).error(), TLSError::DECODE_ERROR);
}

TEST_F(ServerFlightMessagesTest, NewSessionTicket) {
    const Bytes body = body_of(encode_new_session_ticket(7200, 0xdeadbeef, from_hex("00"), to_bytes("ticket")));
    auto ticket = NewSessionTicket::parse(body);
    ASSERT_TRUE(ticket);
    EXPECT_EQ(ticket->lifetime, 7200u);
    EXPECT_EQ(ticket->age_add, 0xdeadbeefu);
    EXPECT_EQ(ticket->nonce, BufferView(from_hex("00")));
    EXPECT_EQ(ticket->ticket, BufferView(to_bytes("ticket")));
    EXPECT_TRUE(ticket->extensions.empty());
}

TEST_F(ServerFlightMessagesTest, NewSessionTicketMalformed) {
    // Empty ticket
    EXPECT_EQ(NewSessionTicket::parse(
                  body_of(encode_new_session_ticket(1, 2, from_hex("00"), Bytes{}))).error(),
              TLSError::INVALID_TICKET);
    EXPECT_EQ(NewSessionTicket::parse(from_hex("00000e10")).error(), TLSError::INVALID_TICKET);
}
