#include <emtls/protocol/handshake_messages.h>
#include <algorithm>

namespace emtls::v13::protocol {

namespace {

// Propagate the error of a Result<T> while unwrapping it into `var`
#define EMTLS_WIRE_READ(var, expr, error_code) \
    auto var##_result = (expr); \
    if (!var##_result) { \
        return error_code; \
    } \
    auto var = *var##_result

constexpr SignatureScheme BASE_SIGNATURE_SCHEMES[] = {
    SignatureScheme::ECDSA_SECP256R1_SHA256,
    SignatureScheme::ECDSA_SECP384R1_SHA384,
    SignatureScheme::ED25519
};

constexpr SignatureScheme RSA_SIGNATURE_SCHEMES[] = {
    SignatureScheme::RSA_PSS_RSAE_SHA256,
    SignatureScheme::RSA_PSS_RSAE_SHA384,
    SignatureScheme::RSA_PSS_RSAE_SHA512,
    SignatureScheme::RSA_PKCS1_SHA256,
    SignatureScheme::RSA_PKCS1_SHA384,
    SignatureScheme::RSA_PKCS1_SHA512
};

Result<size_t> begin_extension(WireWriter& writer, ExtensionType type) {
    EMTLS_TRY_VOID(writer.write_u16(static_cast<uint16_t>(type)));
    return writer.begin_length(2);
}

Result<void> write_client_extensions(const ClientHelloParams& params, WireWriter& writer) {
    if (!params.server_name.empty()) {
        auto ext = begin_extension(writer, ExtensionType::SERVER_NAME);
        if (!ext) return ext.error();
        auto list = writer.begin_length(2);
        if (!list) return list.error();
        EMTLS_TRY_VOID(writer.write_u8(0));  // host_name
        auto name = writer.begin_length(2);
        if (!name) return name.error();
        EMTLS_TRY_VOID(writer.write_bytes(memory::BufferView(
            reinterpret_cast<const uint8_t*>(params.server_name.data()), params.server_name.size())));
        EMTLS_TRY_VOID(writer.end_length(*name, 2));
        EMTLS_TRY_VOID(writer.end_length(*list, 2));
        EMTLS_TRY_VOID(writer.end_length(*ext, 2));
    }

    if (params.max_fragment_length) {
        auto ext = begin_extension(writer, ExtensionType::MAX_FRAGMENT_LENGTH);
        if (!ext) return ext.error();
        EMTLS_TRY_VOID(writer.write_u8(static_cast<uint8_t>(*params.max_fragment_length)));
        EMTLS_TRY_VOID(writer.end_length(*ext, 2));
    }

    {
        auto ext = begin_extension(writer, ExtensionType::SUPPORTED_GROUPS);
        if (!ext) return ext.error();
        auto list = writer.begin_length(2);
        if (!list) return list.error();
        EMTLS_TRY_VOID(writer.write_u16(static_cast<uint16_t>(NamedGroup::X25519)));
        EMTLS_TRY_VOID(writer.end_length(*list, 2));
        EMTLS_TRY_VOID(writer.end_length(*ext, 2));
    }

    {
        auto ext = begin_extension(writer, ExtensionType::SIGNATURE_ALGORITHMS);
        if (!ext) return ext.error();
        auto list = writer.begin_length(2);
        if (!list) return list.error();
        for (auto scheme : BASE_SIGNATURE_SCHEMES) {
            EMTLS_TRY_VOID(writer.write_u16(static_cast<uint16_t>(scheme)));
        }
        if (params.enable_rsa_signatures) {
            for (auto scheme : RSA_SIGNATURE_SCHEMES) {
                EMTLS_TRY_VOID(writer.write_u16(static_cast<uint16_t>(scheme)));
            }
        }
        EMTLS_TRY_VOID(writer.end_length(*list, 2));
        EMTLS_TRY_VOID(writer.end_length(*ext, 2));
    }

    {
        auto ext = begin_extension(writer, ExtensionType::SUPPORTED_VERSIONS);
        if (!ext) return ext.error();
        auto list = writer.begin_length(1);
        if (!list) return list.error();
        EMTLS_TRY_VOID(writer.write_u16(TLS_V13));
        EMTLS_TRY_VOID(writer.end_length(*list, 1));
        EMTLS_TRY_VOID(writer.end_length(*ext, 2));
    }

    {
        auto ext = begin_extension(writer, ExtensionType::PSK_KEY_EXCHANGE_MODES);
        if (!ext) return ext.error();
        auto list = writer.begin_length(1);
        if (!list) return list.error();
        EMTLS_TRY_VOID(writer.write_u8(PSK_DHE_KE_MODE));
        EMTLS_TRY_VOID(writer.end_length(*list, 1));
        EMTLS_TRY_VOID(writer.end_length(*ext, 2));
    }

    {
        auto ext = begin_extension(writer, ExtensionType::KEY_SHARE);
        if (!ext) return ext.error();
        auto shares = writer.begin_length(2);
        if (!shares) return shares.error();
        EMTLS_TRY_VOID(writer.write_u16(static_cast<uint16_t>(NamedGroup::X25519)));
        auto key = writer.begin_length(2);
        if (!key) return key.error();
        EMTLS_TRY_VOID(writer.write_bytes(params.key_share));
        EMTLS_TRY_VOID(writer.end_length(*key, 2));
        EMTLS_TRY_VOID(writer.end_length(*shares, 2));
        EMTLS_TRY_VOID(writer.end_length(*ext, 2));
    }

    return make_result();
}

// Walks an extensions block, handing each (type, data) pair to `visit`
template<typename Visitor>
Result<size_t> for_each_extension(memory::BufferView block, Visitor&& visit) {
    WireReader reader(block);
    size_t count = 0;
    while (!reader.empty()) {
        auto type = reader.read_u16();
        if (!type) {
            return TLSError::INVALID_EXTENSIONS_LENGTH;
        }
        auto data = reader.read_vector16();
        if (!data) {
            return TLSError::INVALID_EXTENSIONS_LENGTH;
        }
        EMTLS_TRY_VOID(visit(*type, *data));
        ++count;
    }
    return count;
}

} // anonymous namespace

Result<HandshakeMessageView> HandshakeMessageView::parse_next(WireReader& reader) {
    const memory::BufferView rest = reader.rest();

    auto type = reader.read_u8();
    auto length = reader.read_u24();
    if (!type || !length) {
        return TLSError::INVALID_HANDSHAKE;
    }
    auto body = reader.read_bytes(*length);
    if (!body) {
        return TLSError::INVALID_HANDSHAKE;
    }

    HandshakeMessageView message;
    message.type = static_cast<HandshakeType>(*type);
    message.raw = rest.slice(0, HANDSHAKE_HEADER_LENGTH + *length);
    message.body = *body;
    return message;
}

Result<size_t> encode_client_hello(const ClientHelloParams& params, memory::MutableBufferView out) {
    if (params.server_name.size() > 255) {
        return TLSError::INVALID_PARAMETER;
    }

    WireWriter writer(out);
    EMTLS_TRY_VOID(writer.write_u8(static_cast<uint8_t>(HandshakeType::CLIENT_HELLO)));
    auto message = writer.begin_length(3);
    if (!message) return message.error();

    EMTLS_TRY_VOID(writer.write_u16(TLS_V12));
    EMTLS_TRY_VOID(writer.write_bytes(params.random));
    EMTLS_TRY_VOID(writer.write_u8(0));  // empty legacy_session_id

    EMTLS_TRY_VOID(writer.write_u16(2));
    EMTLS_TRY_VOID(writer.write_u16(static_cast<uint16_t>(params.cipher_suite)));

    EMTLS_TRY_VOID(writer.write_u8(1));  // legacy_compression_methods: null
    EMTLS_TRY_VOID(writer.write_u8(0));

    auto extensions = writer.begin_length(2);
    if (!extensions) return extensions.error();
    EMTLS_TRY_VOID(write_client_extensions(params, writer));
    EMTLS_TRY_VOID(writer.end_length(*extensions, 2));

    EMTLS_TRY_VOID(writer.end_length(*message, 3));
    return writer.position();
}

Result<size_t> encode_finished(memory::BufferView verify_data, memory::MutableBufferView out) {
    WireWriter writer(out);
    EMTLS_TRY_VOID(writer.write_u8(static_cast<uint8_t>(HandshakeType::FINISHED)));
    EMTLS_TRY_VOID(writer.write_u24(static_cast<uint32_t>(verify_data.size())));
    EMTLS_TRY_VOID(writer.write_bytes(verify_data));
    return writer.position();
}

Result<size_t> encode_empty_certificate(memory::BufferView request_context, memory::MutableBufferView out) {
    if (request_context.size() > 255) {
        return TLSError::INVALID_PARAMETER;
    }

    WireWriter writer(out);
    EMTLS_TRY_VOID(writer.write_u8(static_cast<uint8_t>(HandshakeType::CERTIFICATE)));
    auto message = writer.begin_length(3);
    if (!message) return message.error();
    EMTLS_TRY_VOID(writer.write_u8(static_cast<uint8_t>(request_context.size())));
    EMTLS_TRY_VOID(writer.write_bytes(request_context));
    EMTLS_TRY_VOID(writer.write_u24(0));  // certificate_list
    EMTLS_TRY_VOID(writer.end_length(*message, 3));
    return writer.position();
}

Result<ServerHello> ServerHello::parse(memory::BufferView body) {
    WireReader reader(body);
    ServerHello hello;

    EMTLS_WIRE_READ(version, reader.read_u16(), TLSError::DECODE_ERROR);
    hello.legacy_version = version;

    EMTLS_WIRE_READ(random, reader.read_bytes(RANDOM_LENGTH), TLSError::DECODE_ERROR);
    std::copy(random.begin(), random.end(), hello.random.begin());
    hello.is_hello_retry_request = (hello.random == HELLO_RETRY_REQUEST_RANDOM);

    EMTLS_WIRE_READ(session_id, reader.read_vector8(), TLSError::DECODE_ERROR);
    if (session_id.size() > MAX_SESSION_ID_LENGTH) {
        return TLSError::INVALID_SESSION_ID;
    }
    hello.legacy_session_id = session_id;

    EMTLS_WIRE_READ(suite, reader.read_u16(), TLSError::DECODE_ERROR);
    hello.cipher_suite = static_cast<CipherSuite>(suite);

    EMTLS_WIRE_READ(compression, reader.read_u8(), TLSError::DECODE_ERROR);
    if (compression != 0) {
        return TLSError::DECODE_ERROR;
    }

    EMTLS_WIRE_READ(extensions, reader.read_vector16(), TLSError::INVALID_EXTENSIONS_LENGTH);
    if (!reader.empty()) {
        return TLSError::DECODE_ERROR;
    }

    const bool retry = hello.is_hello_retry_request;
    auto count = for_each_extension(extensions,
        [&hello, retry](uint16_t type, memory::BufferView data) -> Result<void> {
            WireReader ext(data);
            switch (static_cast<ExtensionType>(type)) {
                case ExtensionType::SUPPORTED_VERSIONS: {
                    auto version = ext.read_u16();
                    if (!version || !ext.empty()) {
                        return TLSError::INVALID_SUPPORTED_VERSIONS;
                    }
                    hello.selected_version = *version;
                    break;
                }
                case ExtensionType::KEY_SHARE: {
                    auto group = ext.read_u16();
                    if (!group) {
                        return TLSError::INVALID_KEY_SHARE;
                    }
                    hello.key_share_group = static_cast<NamedGroup>(*group);
                    if (!retry) {
                        auto key = ext.read_vector16();
                        if (!key) {
                            return TLSError::INVALID_KEY_SHARE;
                        }
                        hello.key_share = *key;
                    }
                    if (!ext.empty()) {
                        return TLSError::INVALID_KEY_SHARE;
                    }
                    break;
                }
                default:
                    break;
            }
            return make_result();
        });
    if (!count) {
        return count.error();
    }

    return hello;
}

Result<EncryptedExtensions> EncryptedExtensions::parse(memory::BufferView body) {
    WireReader reader(body);
    EMTLS_WIRE_READ(extensions, reader.read_vector16(), TLSError::INVALID_EXTENSIONS_LENGTH);
    if (!reader.empty()) {
        return TLSError::INVALID_EXTENSIONS_LENGTH;
    }

    EncryptedExtensions ee;
    auto count = for_each_extension(extensions,
        [&ee](uint16_t type, memory::BufferView data) -> Result<void> {
            switch (static_cast<ExtensionType>(type)) {
                case ExtensionType::SERVER_NAME:
                    if (!data.empty()) {
                        return TLSError::INVALID_EXTENSIONS_LENGTH;
                    }
                    ee.server_name_acknowledged = true;
                    break;
                case ExtensionType::MAX_FRAGMENT_LENGTH:
                    if (data.size() != 1 || data[0] < 1 || data[0] > 4) {
                        return TLSError::INVALID_EXTENSIONS_LENGTH;
                    }
                    ee.max_fragment_length = static_cast<MaxFragmentLength>(data[0]);
                    break;
                default:
                    break;
            }
            return make_result();
        });
    if (!count) {
        return count.error();
    }
    ee.extension_count = *count;
    return ee;
}

Result<CertificateRequest> CertificateRequest::parse(memory::BufferView body) {
    WireReader reader(body);
    EMTLS_WIRE_READ(context, reader.read_vector8(), TLSError::INVALID_CERTIFICATE_REQUEST);
    EMTLS_WIRE_READ(extensions, reader.read_vector16(), TLSError::INVALID_CERTIFICATE_REQUEST);
    if (!reader.empty()) {
        return TLSError::INVALID_CERTIFICATE_REQUEST;
    }

    auto count = for_each_extension(extensions,
        [](uint16_t, memory::BufferView) -> Result<void> { return make_result(); });
    if (!count) {
        return TLSError::INVALID_CERTIFICATE_REQUEST;
    }

    CertificateRequest request;
    request.request_context = context;
    return request;
}

Result<Certificate> Certificate::parse(memory::BufferView body) {
    WireReader reader(body);
    EMTLS_WIRE_READ(context, reader.read_vector8(), TLSError::INVALID_CERTIFICATE);
    EMTLS_WIRE_READ(list, reader.read_vector24(), TLSError::INVALID_CERTIFICATE);
    if (!reader.empty()) {
        return TLSError::INVALID_CERTIFICATE;
    }

    Certificate certificate;
    certificate.request_context = context;

    WireReader entries(list);
    while (!entries.empty()) {
        auto cert_data = entries.read_vector24();
        auto extensions = entries.read_vector16();
        if (!cert_data || !extensions || cert_data->empty()) {
            return TLSError::INVALID_CERTIFICATE;
        }
        ++certificate.entry_count;
    }
    return certificate;
}

Result<CertificateVerify> CertificateVerify::parse(memory::BufferView body) {
    WireReader reader(body);
    EMTLS_WIRE_READ(scheme, reader.read_u16(), TLSError::DECODE_ERROR);
    EMTLS_WIRE_READ(signature, reader.read_vector16(), TLSError::DECODE_ERROR);
    if (!reader.empty()) {
        return TLSError::DECODE_ERROR;
    }

    CertificateVerify verify;
    verify.scheme = static_cast<SignatureScheme>(scheme);
    verify.signature = signature;
    return verify;
}

Result<NewSessionTicket> NewSessionTicket::parse(memory::BufferView body) {
    WireReader reader(body);
    EMTLS_WIRE_READ(lifetime, reader.read_u32(), TLSError::INVALID_TICKET);
    EMTLS_WIRE_READ(age_add, reader.read_u32(), TLSError::INVALID_TICKET);
    EMTLS_WIRE_READ(nonce, reader.read_vector8(), TLSError::INVALID_TICKET);
    EMTLS_WIRE_READ(ticket, reader.read_vector16(), TLSError::INVALID_TICKET);
    EMTLS_WIRE_READ(extensions, reader.read_vector16(), TLSError::INVALID_TICKET);
    if (!reader.empty() || ticket.empty()) {
        return TLSError::INVALID_TICKET;
    }

    NewSessionTicket nst;
    nst.lifetime = lifetime;
    nst.age_add = age_add;
    nst.nonce = nonce;
    nst.ticket = ticket;
    nst.extensions = extensions;
    return nst;
}

#undef EMTLS_WIRE_READ

}  // namespace emtls::v13::protocol
