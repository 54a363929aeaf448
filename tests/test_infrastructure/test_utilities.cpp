#include "test_utilities.h"

#include <emtls/protocol/wire.h>
#include <algorithm>
#include <stdexcept>

namespace emtls {
namespace test {

namespace {

void put_u8(Bytes& out, uint8_t value) {
    out.push_back(value);
}

void put_u16(Bytes& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

void put_u24(Bytes& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

void put_u32(Bytes& out, uint32_t value) {
    put_u16(out, static_cast<uint16_t>(value >> 16));
    put_u16(out, static_cast<uint16_t>(value));
}

void put_bytes(Bytes& out, memory::BufferView data) {
    out.insert(out.end(), data.begin(), data.end());
}

void put_extension(Bytes& out, ExtensionType type, const Bytes& data) {
    put_u16(out, static_cast<uint16_t>(type));
    put_u16(out, static_cast<uint16_t>(data.size()));
    put_bytes(out, data);
}

Result<std::vector<uint16_t>> read_u16_list(memory::BufferView data) {
    protocol::WireReader reader(data);
    std::vector<uint16_t> values;
    while (!reader.empty()) {
        auto value = reader.read_u16();
        if (!value) {
            return value.error();
        }
        values.push_back(*value);
    }
    return values;
}

Result<void> parse_extension(ParsedClientHello& hello, uint16_t type, memory::BufferView data) {
    protocol::WireReader ext(data);
    switch (static_cast<ExtensionType>(type)) {
        case ExtensionType::SERVER_NAME: {
            auto list = ext.read_vector16();
            if (!list) return list.error();
            protocol::WireReader names(*list);
            auto name_type = names.read_u8();
            auto name = names.read_vector16();
            if (!name_type || !name || *name_type != 0) {
                return TLSError::DECODE_ERROR;
            }
            hello.server_name.assign(name->begin(), name->end());
            break;
        }
        case ExtensionType::MAX_FRAGMENT_LENGTH: {
            auto value = ext.read_u8();
            if (!value) return value.error();
            hello.max_fragment_length = *value;
            break;
        }
        case ExtensionType::SUPPORTED_GROUPS: {
            auto list = ext.read_vector16();
            if (!list) return list.error();
            auto groups = read_u16_list(*list);
            if (!groups) return groups.error();
            hello.supported_groups = *groups;
            break;
        }
        case ExtensionType::SIGNATURE_ALGORITHMS: {
            auto list = ext.read_vector16();
            if (!list) return list.error();
            auto schemes = read_u16_list(*list);
            if (!schemes) return schemes.error();
            hello.signature_schemes = *schemes;
            break;
        }
        case ExtensionType::SUPPORTED_VERSIONS: {
            auto list = ext.read_vector8();
            if (!list) return list.error();
            auto versions = read_u16_list(*list);
            if (!versions) return versions.error();
            hello.supported_versions = *versions;
            break;
        }
        case ExtensionType::PSK_KEY_EXCHANGE_MODES: {
            auto list = ext.read_vector8();
            if (!list) return list.error();
            hello.psk_modes.assign(list->begin(), list->end());
            break;
        }
        case ExtensionType::KEY_SHARE: {
            auto shares = ext.read_vector16();
            if (!shares) return shares.error();
            protocol::WireReader entry(*shares);
            auto group = entry.read_u16();
            auto key = entry.read_vector16();
            if (!group || !key) {
                return TLSError::DECODE_ERROR;
            }
            hello.key_share_group = *group;
            hello.key_share.assign(key->begin(), key->end());
            break;
        }
        default:
            break;
    }
    return make_result();
}

} // anonymous namespace

Bytes from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("odd-length hex string");
    }
    auto nibble = [](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::invalid_argument("invalid hex digit");
    };

    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    }
    return out;
}

Bytes to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

Result<ParsedClientHello> parse_client_hello(memory::BufferView body) {
    protocol::WireReader reader(body);
    ParsedClientHello hello;

    auto version = reader.read_u16();
    if (!version) return version.error();
    hello.legacy_version = *version;

    auto random = reader.read_bytes(RANDOM_LENGTH);
    if (!random) return random.error();
    std::copy(random->begin(), random->end(), hello.random.begin());

    auto session_id = reader.read_vector8();
    if (!session_id) return session_id.error();
    hello.session_id.assign(session_id->begin(), session_id->end());

    auto suites = reader.read_vector16();
    if (!suites) return suites.error();
    auto suite_list = read_u16_list(*suites);
    if (!suite_list) return suite_list.error();
    hello.cipher_suites = *suite_list;

    auto compression = reader.read_vector8();
    if (!compression) return compression.error();
    hello.compression_methods.assign(compression->begin(), compression->end());

    auto extensions = reader.read_vector16();
    if (!extensions) return extensions.error();
    if (!reader.empty()) {
        return TLSError::DECODE_ERROR;
    }

    protocol::WireReader ext_reader(*extensions);
    while (!ext_reader.empty()) {
        auto type = ext_reader.read_u16();
        auto data = ext_reader.read_vector16();
        if (!type || !data) {
            return TLSError::INVALID_EXTENSIONS_LENGTH;
        }
        hello.extension_order.push_back(*type);
        EMTLS_TRY_VOID(parse_extension(hello, *type, *data));
    }
    return hello;
}

Bytes encode_handshake(HandshakeType type, memory::BufferView body) {
    Bytes out;
    put_u8(out, static_cast<uint8_t>(type));
    put_u24(out, static_cast<uint32_t>(body.size()));
    put_bytes(out, body);
    return out;
}

Bytes encode_server_hello(const ServerHelloFields& fields) {
    Bytes body;
    put_u16(body, fields.legacy_version);
    put_bytes(body, fields.random);
    put_u8(body, static_cast<uint8_t>(fields.session_id.size()));
    put_bytes(body, fields.session_id);
    put_u16(body, fields.cipher_suite);
    put_u8(body, 0);

    Bytes extensions;
    if (fields.selected_version) {
        Bytes version;
        put_u16(version, *fields.selected_version);
        put_extension(extensions, ExtensionType::SUPPORTED_VERSIONS, version);
    }
    Bytes share;
    put_u16(share, fields.key_share_group);
    // A HelloRetryRequest names only the selected group
    if (!fields.key_share.empty()) {
        put_u16(share, static_cast<uint16_t>(fields.key_share.size()));
        put_bytes(share, fields.key_share);
    }
    put_extension(extensions, ExtensionType::KEY_SHARE, share);

    put_u16(body, static_cast<uint16_t>(extensions.size()));
    put_bytes(body, extensions);
    return encode_handshake(HandshakeType::SERVER_HELLO, body);
}

Bytes encode_encrypted_extensions(std::optional<uint8_t> max_fragment_length, bool acknowledge_server_name) {
    Bytes extensions;
    if (acknowledge_server_name) {
        put_extension(extensions, ExtensionType::SERVER_NAME, Bytes{});
    }
    if (max_fragment_length) {
        put_extension(extensions, ExtensionType::MAX_FRAGMENT_LENGTH, Bytes{*max_fragment_length});
    }

    Bytes body;
    put_u16(body, static_cast<uint16_t>(extensions.size()));
    put_bytes(body, extensions);
    return encode_handshake(HandshakeType::ENCRYPTED_EXTENSIONS, body);
}

Bytes encode_certificate_request(memory::BufferView request_context) {
    Bytes schemes;
    put_u16(schemes, 2);
    put_u16(schemes, static_cast<uint16_t>(SignatureScheme::ED25519));

    Bytes extensions;
    put_extension(extensions, ExtensionType::SIGNATURE_ALGORITHMS, schemes);

    Bytes body;
    put_u8(body, static_cast<uint8_t>(request_context.size()));
    put_bytes(body, request_context);
    put_u16(body, static_cast<uint16_t>(extensions.size()));
    put_bytes(body, extensions);
    return encode_handshake(HandshakeType::CERTIFICATE_REQUEST, body);
}

Bytes encode_certificate(const std::vector<Bytes>& certificates) {
    Bytes list;
    for (const auto& cert : certificates) {
        put_u24(list, static_cast<uint32_t>(cert.size()));
        put_bytes(list, cert);
        put_u16(list, 0);
    }

    Bytes body;
    put_u8(body, 0);
    put_u24(body, static_cast<uint32_t>(list.size()));
    put_bytes(body, list);
    return encode_handshake(HandshakeType::CERTIFICATE, body);
}

Bytes encode_certificate_verify(SignatureScheme scheme, memory::BufferView signature) {
    Bytes body;
    put_u16(body, static_cast<uint16_t>(scheme));
    put_u16(body, static_cast<uint16_t>(signature.size()));
    put_bytes(body, signature);
    return encode_handshake(HandshakeType::CERTIFICATE_VERIFY, body);
}

Bytes encode_new_session_ticket(uint32_t lifetime, uint32_t age_add,
                                memory::BufferView nonce, memory::BufferView ticket) {
    Bytes body;
    put_u32(body, lifetime);
    put_u32(body, age_add);
    put_u8(body, static_cast<uint8_t>(nonce.size()));
    put_bytes(body, nonce);
    put_u16(body, static_cast<uint16_t>(ticket.size()));
    put_bytes(body, ticket);
    put_u16(body, 0);
    return encode_handshake(HandshakeType::NEW_SESSION_TICKET, body);
}

Bytes plaintext_record(ContentType type, memory::BufferView payload, ProtocolVersion version) {
    Bytes out;
    put_u8(out, static_cast<uint8_t>(type));
    put_u16(out, version);
    put_u16(out, static_cast<uint16_t>(payload.size()));
    put_bytes(out, payload);
    return out;
}

Bytes alert_bytes(const protocol::Alert& alert) {
    return Bytes{static_cast<uint8_t>(alert.level()), static_cast<uint8_t>(alert.description())};
}

} // namespace test
} // namespace emtls
