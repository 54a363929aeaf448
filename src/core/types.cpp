#include <emtls/types.h>
#include <sstream>
#include <unordered_map>

namespace emtls {
namespace v13 {

std::string to_string(ContentType type) {
    switch (type) {
        case ContentType::INVALID: return "INVALID";
        case ContentType::CHANGE_CIPHER_SPEC: return "CHANGE_CIPHER_SPEC";
        case ContentType::ALERT: return "ALERT";
        case ContentType::HANDSHAKE: return "HANDSHAKE";
        case ContentType::APPLICATION_DATA: return "APPLICATION_DATA";
    }

    std::ostringstream oss;
    oss << "UNKNOWN_CONTENT_TYPE(" << static_cast<unsigned>(type) << ")";
    return oss.str();
}

std::string to_string(HandshakeType type) {
    static const std::unordered_map<HandshakeType, std::string> handshake_type_names = {
        {HandshakeType::CLIENT_HELLO, "CLIENT_HELLO"},
        {HandshakeType::SERVER_HELLO, "SERVER_HELLO"},
        {HandshakeType::NEW_SESSION_TICKET, "NEW_SESSION_TICKET"},
        {HandshakeType::END_OF_EARLY_DATA, "END_OF_EARLY_DATA"},
        {HandshakeType::ENCRYPTED_EXTENSIONS, "ENCRYPTED_EXTENSIONS"},
        {HandshakeType::CERTIFICATE, "CERTIFICATE"},
        {HandshakeType::CERTIFICATE_REQUEST, "CERTIFICATE_REQUEST"},
        {HandshakeType::CERTIFICATE_VERIFY, "CERTIFICATE_VERIFY"},
        {HandshakeType::FINISHED, "FINISHED"},
        {HandshakeType::KEY_UPDATE, "KEY_UPDATE"},
        {HandshakeType::MESSAGE_HASH, "MESSAGE_HASH"}
    };

    auto it = handshake_type_names.find(type);
    if (it != handshake_type_names.end()) {
        return it->second;
    }

    std::ostringstream oss;
    oss << "UNKNOWN_HANDSHAKE_TYPE(" << static_cast<unsigned>(type) << ")";
    return oss.str();
}

std::string to_string(AlertLevel level) {
    switch (level) {
        case AlertLevel::WARNING: return "WARNING";
        case AlertLevel::FATAL: return "FATAL";
    }

    std::ostringstream oss;
    oss << "UNKNOWN_ALERT_LEVEL(" << static_cast<unsigned>(level) << ")";
    return oss.str();
}

std::string to_string(AlertDescription desc) {
    static const std::unordered_map<AlertDescription, std::string> alert_desc_names = {
        {AlertDescription::CLOSE_NOTIFY, "CLOSE_NOTIFY"},
        {AlertDescription::UNEXPECTED_MESSAGE, "UNEXPECTED_MESSAGE"},
        {AlertDescription::BAD_RECORD_MAC, "BAD_RECORD_MAC"},
        {AlertDescription::RECORD_OVERFLOW, "RECORD_OVERFLOW"},
        {AlertDescription::HANDSHAKE_FAILURE, "HANDSHAKE_FAILURE"},
        {AlertDescription::BAD_CERTIFICATE, "BAD_CERTIFICATE"},
        {AlertDescription::UNSUPPORTED_CERTIFICATE, "UNSUPPORTED_CERTIFICATE"},
        {AlertDescription::CERTIFICATE_REVOKED, "CERTIFICATE_REVOKED"},
        {AlertDescription::CERTIFICATE_EXPIRED, "CERTIFICATE_EXPIRED"},
        {AlertDescription::CERTIFICATE_UNKNOWN, "CERTIFICATE_UNKNOWN"},
        {AlertDescription::ILLEGAL_PARAMETER, "ILLEGAL_PARAMETER"},
        {AlertDescription::UNKNOWN_CA, "UNKNOWN_CA"},
        {AlertDescription::ACCESS_DENIED, "ACCESS_DENIED"},
        {AlertDescription::DECODE_ERROR, "DECODE_ERROR"},
        {AlertDescription::DECRYPT_ERROR, "DECRYPT_ERROR"},
        {AlertDescription::PROTOCOL_VERSION, "PROTOCOL_VERSION"},
        {AlertDescription::INSUFFICIENT_SECURITY, "INSUFFICIENT_SECURITY"},
        {AlertDescription::INTERNAL_ERROR, "INTERNAL_ERROR"},
        {AlertDescription::INAPPROPRIATE_FALLBACK, "INAPPROPRIATE_FALLBACK"},
        {AlertDescription::USER_CANCELED, "USER_CANCELED"},
        {AlertDescription::MISSING_EXTENSION, "MISSING_EXTENSION"},
        {AlertDescription::UNSUPPORTED_EXTENSION, "UNSUPPORTED_EXTENSION"},
        {AlertDescription::UNRECOGNIZED_NAME, "UNRECOGNIZED_NAME"},
        {AlertDescription::BAD_CERTIFICATE_STATUS_RESPONSE, "BAD_CERTIFICATE_STATUS_RESPONSE"},
        {AlertDescription::UNKNOWN_PSK_IDENTITY, "UNKNOWN_PSK_IDENTITY"},
        {AlertDescription::CERTIFICATE_REQUIRED, "CERTIFICATE_REQUIRED"},
        {AlertDescription::NO_APPLICATION_PROTOCOL, "NO_APPLICATION_PROTOCOL"}
    };

    auto it = alert_desc_names.find(desc);
    if (it != alert_desc_names.end()) {
        return it->second;
    }

    std::ostringstream oss;
    oss << "UNKNOWN_ALERT_DESCRIPTION(" << static_cast<unsigned>(desc) << ")";
    return oss.str();
}

std::string to_string(CipherSuite suite) {
    switch (suite) {
        case CipherSuite::TLS_AES_128_GCM_SHA256: return "TLS_AES_128_GCM_SHA256";
        case CipherSuite::TLS_AES_256_GCM_SHA384: return "TLS_AES_256_GCM_SHA384";
        case CipherSuite::TLS_CHACHA20_POLY1305_SHA256: return "TLS_CHACHA20_POLY1305_SHA256";
    }

    std::ostringstream oss;
    oss << "UNKNOWN_CIPHER_SUITE(0x" << std::hex << static_cast<unsigned>(suite) << ")";
    return oss.str();
}

} // namespace v13
} // namespace emtls
