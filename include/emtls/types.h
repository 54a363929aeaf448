#ifndef EMTLS_TYPES_H
#define EMTLS_TYPES_H

#include <emtls/config.h>
#include <cstdint>
#include <cstddef>
#include <array>
#include <string>

namespace emtls {
namespace v13 {

// Basic protocol types
using ProtocolVersion = uint16_t;
using SequenceNumber = uint64_t;

// TLS version constants
constexpr ProtocolVersion TLS_V10 = 0x0301;
constexpr ProtocolVersion TLS_V12 = 0x0303;
constexpr ProtocolVersion TLS_V13 = 0x0304;

// Content types
enum class ContentType : uint8_t {
    INVALID = 0,
    CHANGE_CIPHER_SPEC = 20,
    ALERT = 21,
    HANDSHAKE = 22,
    APPLICATION_DATA = 23
};

// Handshake message types
enum class HandshakeType : uint8_t {
    CLIENT_HELLO = 1,
    SERVER_HELLO = 2,
    NEW_SESSION_TICKET = 4,
    END_OF_EARLY_DATA = 5,
    ENCRYPTED_EXTENSIONS = 8,
    CERTIFICATE = 11,
    CERTIFICATE_REQUEST = 13,
    CERTIFICATE_VERIFY = 15,
    FINISHED = 20,
    KEY_UPDATE = 24,
    MESSAGE_HASH = 254
};

// Alert levels
enum class AlertLevel : uint8_t {
    WARNING = 1,
    FATAL = 2
};

// Alert descriptions
enum class AlertDescription : uint8_t {
    CLOSE_NOTIFY = 0,
    UNEXPECTED_MESSAGE = 10,
    BAD_RECORD_MAC = 20,
    RECORD_OVERFLOW = 22,
    HANDSHAKE_FAILURE = 40,
    BAD_CERTIFICATE = 42,
    UNSUPPORTED_CERTIFICATE = 43,
    CERTIFICATE_REVOKED = 44,
    CERTIFICATE_EXPIRED = 45,
    CERTIFICATE_UNKNOWN = 46,
    ILLEGAL_PARAMETER = 47,
    UNKNOWN_CA = 48,
    ACCESS_DENIED = 49,
    DECODE_ERROR = 50,
    DECRYPT_ERROR = 51,
    PROTOCOL_VERSION = 70,
    INSUFFICIENT_SECURITY = 71,
    INTERNAL_ERROR = 80,
    INAPPROPRIATE_FALLBACK = 86,
    USER_CANCELED = 90,
    MISSING_EXTENSION = 109,
    UNSUPPORTED_EXTENSION = 110,
    UNRECOGNIZED_NAME = 112,
    BAD_CERTIFICATE_STATUS_RESPONSE = 113,
    UNKNOWN_PSK_IDENTITY = 115,
    CERTIFICATE_REQUIRED = 116,
    NO_APPLICATION_PROTOCOL = 120
};

// Cipher suites
enum class CipherSuite : uint16_t {
    TLS_AES_128_GCM_SHA256 = 0x1301,
    TLS_AES_256_GCM_SHA384 = 0x1302,
    TLS_CHACHA20_POLY1305_SHA256 = 0x1303
};

// Named groups (key exchange)
enum class NamedGroup : uint16_t {
    SECP256R1 = 23,
    SECP384R1 = 24,
    X25519 = 29
};

// Signature algorithms
enum class SignatureScheme : uint16_t {
    // RSASSA-PKCS1-v1_5 algorithms
    RSA_PKCS1_SHA256 = 0x0401,
    RSA_PKCS1_SHA384 = 0x0501,
    RSA_PKCS1_SHA512 = 0x0601,

    // ECDSA algorithms
    ECDSA_SECP256R1_SHA256 = 0x0403,
    ECDSA_SECP384R1_SHA384 = 0x0503,

    // RSASSA-PSS algorithms
    RSA_PSS_RSAE_SHA256 = 0x0804,
    RSA_PSS_RSAE_SHA384 = 0x0805,
    RSA_PSS_RSAE_SHA512 = 0x0806,

    // EdDSA algorithms
    ED25519 = 0x0807
};

// Hash algorithms
enum class HashAlgorithm : uint8_t {
    SHA256 = 4,
    SHA384 = 5
};

// AEAD cipher algorithms
enum class AEADCipher : uint8_t {
    AES_128_GCM = 1,
    AES_256_GCM = 2,
    CHACHA20_POLY1305 = 3
};

// Extension types
enum class ExtensionType : uint16_t {
    SERVER_NAME = 0,
    MAX_FRAGMENT_LENGTH = 1,
    SUPPORTED_GROUPS = 10,
    SIGNATURE_ALGORITHMS = 13,
    APPLICATION_LAYER_PROTOCOL_NEGOTIATION = 16,
    EARLY_DATA = 42,
    SUPPORTED_VERSIONS = 43,
    PSK_KEY_EXCHANGE_MODES = 45,
    KEY_SHARE = 51
};

// Maximum fragment length negotiation (RFC 6066)
enum class MaxFragmentLength : uint8_t {
    LENGTH_512 = 1,
    LENGTH_1024 = 2,
    LENGTH_2048 = 3,
    LENGTH_4096 = 4
};

// Random value (32 bytes)
using Random = std::array<uint8_t, 32>;

// Utility functions
EMTLS_API std::string to_string(ContentType type);
EMTLS_API std::string to_string(HandshakeType type);
EMTLS_API std::string to_string(AlertLevel level);
EMTLS_API std::string to_string(AlertDescription desc);
EMTLS_API std::string to_string(CipherSuite suite);

// Size constants
constexpr size_t RECORD_HEADER_LENGTH = 5;
constexpr size_t MAX_PLAINTEXT_LENGTH = 16384;
constexpr size_t MAX_CIPHERTEXT_LENGTH = MAX_PLAINTEXT_LENGTH + 256;
constexpr size_t HANDSHAKE_HEADER_LENGTH = 4;
constexpr size_t RANDOM_LENGTH = 32;
constexpr size_t MAX_SESSION_ID_LENGTH = 32;
constexpr size_t X25519_KEY_LENGTH = 32;

// Space reserved in the record buffer for header, inner content type,
// padding and AEAD tag. The usable chunk is capacity minus this value.
constexpr size_t TLS_RECORD_OVERHEAD = 128;

} // namespace v13
} // namespace emtls

#endif // EMTLS_TYPES_H
