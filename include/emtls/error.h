#ifndef EMTLS_ERROR_H
#define EMTLS_ERROR_H

#include <emtls/config.h>
#include <system_error>
#include <string>
#include <cstdint>

namespace emtls {
namespace v13 {

// TLS client error codes
enum class TLSError : int {
    SUCCESS = 0,

    // General errors (1-19)
    INTERNAL_ERROR = 1,
    INVALID_PARAMETER = 2,
    INVALID_STATE = 3,
    INSUFFICIENT_SPACE = 4,
    ENCODE_ERROR = 5,
    DECODE_ERROR = 6,
    RECORD_QUEUE_FULL = 7,

    // Connection errors (20-29)
    MISSING_HANDSHAKE = 20,
    CONNECTION_CLOSED = 21,

    // Transport errors (30-39)
    IO_ERROR = 30,
    TRANSPORT_CLOSED = 31,
    TIMEOUT = 32,

    // Record layer errors (40-49)
    INVALID_RECORD = 40,
    UNKNOWN_CONTENT_TYPE = 41,
    RECORD_OVERFLOW = 42,
    UNEXPECTED_MESSAGE = 43,

    // Handshake errors (50-69)
    INVALID_HANDSHAKE = 50,
    INVALID_CIPHER_SUITE = 51,
    INVALID_SUPPORTED_VERSIONS = 52,
    INVALID_KEY_SHARE = 53,
    INVALID_SESSION_ID = 54,
    INVALID_EXTENSIONS_LENGTH = 55,
    INVALID_CERTIFICATE = 56,
    INVALID_CERTIFICATE_REQUEST = 57,
    INVALID_FINISHED = 58,
    HANDSHAKE_ABORTED = 59,
    HELLO_RETRY_NOT_SUPPORTED = 60,
    INVALID_TICKET = 61,

    // Cryptographic errors (70-79)
    CRYPTO_ERROR = 70,
    DECRYPT_ERROR = 71,
    RANDOM_GENERATION_FAILED = 72,
    KEY_DERIVATION_FAILED = 73
};

// Error category for TLS errors
class TLSErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "emtls";
    }

    std::string message(int ev) const override;

    static const TLSErrorCategory& instance() {
        static TLSErrorCategory instance;
        return instance;
    }
};

// Create error code from TLS error
inline std::error_code make_error_code(TLSError e) {
    return std::error_code(static_cast<int>(e), TLSErrorCategory::instance());
}

// Exception class for TLS errors, only raised by Result::value() misuse
class EMTLS_API TLSException : public std::system_error {
public:
    explicit TLSException(TLSError error)
        : std::system_error(make_error_code(error)) {}

    TLSException(TLSError error, const std::string& what_arg)
        : std::system_error(make_error_code(error), what_arg) {}

    TLSError tls_error() const noexcept {
        return static_cast<TLSError>(code().value());
    }
};

// Utility functions
EMTLS_API const char* to_string(TLSError error);
EMTLS_API bool is_transport_error(TLSError error);
EMTLS_API bool is_handshake_error(TLSError error);

} // namespace v13
} // namespace emtls

// Make TLSError compatible with std::error_code
namespace std {
template<>
struct is_error_code_enum<emtls::v13::TLSError> : true_type {};
}

#endif // EMTLS_ERROR_H
