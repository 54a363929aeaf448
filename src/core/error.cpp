#include <emtls/error.h>

namespace emtls {
namespace v13 {

std::string TLSErrorCategory::message(int ev) const {
    return to_string(static_cast<TLSError>(ev));
}

const char* to_string(TLSError error) {
    switch (error) {
        case TLSError::SUCCESS: return "Success";

        // General errors
        case TLSError::INTERNAL_ERROR: return "Internal implementation error";
        case TLSError::INVALID_PARAMETER: return "Invalid parameter provided";
        case TLSError::INVALID_STATE: return "Invalid state for operation";
        case TLSError::INSUFFICIENT_SPACE: return "Record buffer too small";
        case TLSError::ENCODE_ERROR: return "Encode error: destination buffer too small";
        case TLSError::DECODE_ERROR: return "Message decode error";
        case TLSError::RECORD_QUEUE_FULL: return "Too many messages in a single record";

        // Connection errors
        case TLSError::MISSING_HANDSHAKE: return "Handshake has not completed";
        case TLSError::CONNECTION_CLOSED: return "Connection closed by peer";

        // Transport errors
        case TLSError::IO_ERROR: return "Transport I/O error";
        case TLSError::TRANSPORT_CLOSED: return "Transport closed by peer";
        case TLSError::TIMEOUT: return "Transport operation timed out";

        // Record layer errors
        case TLSError::INVALID_RECORD: return "Invalid record";
        case TLSError::UNKNOWN_CONTENT_TYPE: return "Unknown record content type";
        case TLSError::RECORD_OVERFLOW: return "Record length exceeds protocol maximum";
        case TLSError::UNEXPECTED_MESSAGE: return "Unexpected message";

        // Handshake errors
        case TLSError::INVALID_HANDSHAKE: return "Invalid handshake message";
        case TLSError::INVALID_CIPHER_SUITE: return "Server selected an unexpected cipher suite";
        case TLSError::INVALID_SUPPORTED_VERSIONS: return "Server did not select TLS 1.3";
        case TLSError::INVALID_KEY_SHARE: return "Invalid key share";
        case TLSError::INVALID_SESSION_ID: return "Invalid legacy session id";
        case TLSError::INVALID_EXTENSIONS_LENGTH: return "Invalid extensions length";
        case TLSError::INVALID_CERTIFICATE: return "Invalid certificate message";
        case TLSError::INVALID_CERTIFICATE_REQUEST: return "Invalid certificate request";
        case TLSError::INVALID_FINISHED: return "Finished verification failed";
        case TLSError::HANDSHAKE_ABORTED: return "Handshake aborted by peer alert";
        case TLSError::HELLO_RETRY_NOT_SUPPORTED: return "HelloRetryRequest is not supported";
        case TLSError::INVALID_TICKET: return "Invalid session ticket";

        // Cryptographic errors
        case TLSError::CRYPTO_ERROR: return "Cryptographic provider error";
        case TLSError::DECRYPT_ERROR: return "Decryption failed";
        case TLSError::RANDOM_GENERATION_FAILED: return "Random number generation failed";
        case TLSError::KEY_DERIVATION_FAILED: return "Key derivation failed";
    }
    return "Unknown error";
}

bool is_transport_error(TLSError error) {
    switch (error) {
        case TLSError::IO_ERROR:
        case TLSError::TRANSPORT_CLOSED:
        case TLSError::TIMEOUT:
            return true;
        default:
            return false;
    }
}

bool is_handshake_error(TLSError error) {
    const int code = static_cast<int>(error);
    return code >= 50 && code < 70;
}

} // namespace v13
} // namespace emtls
