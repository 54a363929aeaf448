#ifndef EMTLS_PROTOCOL_RECORD_H
#define EMTLS_PROTOCOL_RECORD_H

#include <emtls/config.h>
#include <emtls/result.h>
#include <emtls/types.h>
#include <emtls/memory/buffer.h>
#include <emtls/protocol/alert.h>
#include <emtls/protocol/handshake_messages.h>

namespace emtls::v13::protocol {

// TLSPlaintext / TLSCiphertext header (RFC 8446 Section 5.1)
struct EMTLS_API RecordHeader {
    ContentType content_type = ContentType::INVALID;
    ProtocolVersion legacy_version = TLS_V12;
    uint16_t length = 0;

    /**
     * Parse and validate a 5-byte header. Unknown content types yield
     * UNKNOWN_CONTENT_TYPE, a foreign version INVALID_RECORD and a length
     * above the ciphertext limit RECORD_OVERFLOW.
     */
    static Result<RecordHeader> parse(memory::BufferView data);

    void serialize(uint8_t* out) const;
};

/**
 * A record the client wants to send. Handshake records carry the inputs of
 * the message encoder rather than encoded bytes, because the message is
 * encoded straight into the record buffer.
 *
 * Referenced data must stay alive until the record is encoded.
 */
class EMTLS_API ClientRecord {
public:
    enum class Kind : uint8_t {
        CLIENT_HELLO,
        CERTIFICATE,
        FINISHED,
        ALERT,
        APPLICATION_DATA
    };

    static ClientRecord client_hello(const ClientHelloParams& params) {
        ClientRecord record(Kind::CLIENT_HELLO, false);
        record.hello_ = &params;
        return record;
    }

    // Empty client certificate echoing the server's request context
    static ClientRecord certificate(memory::BufferView request_context) {
        ClientRecord record(Kind::CERTIFICATE, true);
        record.data_ = request_context;
        return record;
    }

    static ClientRecord finished(memory::BufferView verify_data) {
        ClientRecord record(Kind::FINISHED, true);
        record.data_ = verify_data;
        return record;
    }

    static ClientRecord alert(const Alert& alert, bool encrypted) {
        ClientRecord record(Kind::ALERT, encrypted);
        record.alert_ = alert;
        return record;
    }

    static ClientRecord application_data(memory::BufferView data) {
        ClientRecord record(Kind::APPLICATION_DATA, true);
        record.data_ = data;
        return record;
    }

    Kind kind() const noexcept { return kind_; }
    bool is_encrypted() const noexcept { return encrypted_; }
    bool is_handshake() const noexcept {
        return kind_ == Kind::CLIENT_HELLO || kind_ == Kind::CERTIFICATE || kind_ == Kind::FINISHED;
    }
    ContentType content_type() const noexcept;
    const Alert& alert_message() const noexcept { return alert_; }

    /** Write the record content (not the record header) into `out`. */
    Result<size_t> encode_payload(memory::MutableBufferView out) const;

private:
    ClientRecord(Kind kind, bool encrypted) noexcept : kind_(kind), encrypted_(encrypted) {}

    Kind kind_;
    bool encrypted_;
    const ClientHelloParams* hello_ = nullptr;
    memory::BufferView data_;
    Alert alert_;
};

/**
 * One protocol message recovered from a server record. Views point into
 * the record buffer and are valid until the next record is read into it.
 */
struct ServerRecord {
    enum class Kind : uint8_t {
        HANDSHAKE,
        ALERT,
        CHANGE_CIPHER_SPEC,
        APPLICATION_DATA
    };

    Kind kind = Kind::APPLICATION_DATA;
    bool encrypted = false;
    HandshakeMessageView handshake;
    Alert alert;
    memory::BufferView data;
};

// One raw record as read from the transport, header included, inside the record buffer
struct RawRecord {
    RecordHeader header;
    memory::MutableBufferView bytes;

    memory::BufferView header_bytes() const noexcept {
        return memory::BufferView(bytes.data(), RECORD_HEADER_LENGTH);
    }
    memory::MutableBufferView payload() noexcept {
        return bytes.subview(RECORD_HEADER_LENGTH);
    }
};

/**
 * Write a plaintext record header in front of `payload_length` bytes that
 * already sit at offset RECORD_HEADER_LENGTH of `out`.
 * @return Total record length
 */
EMTLS_API Result<size_t> encode_plaintext_record(ContentType type,
                                                 ProtocolVersion legacy_version,
                                                 memory::MutableBufferView out,
                                                 size_t payload_length);

/**
 * Locate the real content type of a decrypted TLSInnerPlaintext by skipping
 * trailing zero padding. Returns the content length; an all-zero plaintext
 * yields UNEXPECTED_MESSAGE.
 */
EMTLS_API Result<size_t> strip_inner_padding(memory::BufferView inner, ContentType& content_type);

}  // namespace emtls::v13::protocol

#endif // EMTLS_PROTOCOL_RECORD_H
