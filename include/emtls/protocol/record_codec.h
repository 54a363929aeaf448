#ifndef EMTLS_PROTOCOL_RECORD_CODEC_H
#define EMTLS_PROTOCOL_RECORD_CODEC_H

#include <emtls/result.h>
#include <emtls/types.h>
#include <emtls/error_reporter.h>
#include <emtls/memory/buffer.h>
#include <emtls/memory/bounded_queue.h>
#include <emtls/crypto/key_schedule.h>
#include <emtls/crypto/openssl_crypto.h>
#include <emtls/crypto/transcript_hash.h>
#include <emtls/protocol/record.h>
#include <emtls/protocol/wire.h>
#include <emtls/transport/transport.h>

namespace emtls::v13::protocol {

// Messages one record can carry into the connection
constexpr size_t RECORD_QUEUE_CAPACITY = 8;

template<size_t N>
using RecordQueue = memory::BoundedQueue<ServerRecord, N>;

/**
 * Protect the TLSInnerPlaintext whose content sits at offset
 * RECORD_HEADER_LENGTH of `out`: append the inner content type, seal with
 * the current write keys and write counter and prepend the outer header.
 * The write counter is not advanced.
 * @return Total record length
 */
template<typename Suite>
Result<size_t> seal_record(const crypto::KeySchedule<Suite>& key_schedule,
                           ContentType inner_type,
                           memory::MutableBufferView out,
                           size_t content_length) {
    if (!key_schedule.has_write_keys()) {
        return TLSError::INVALID_STATE;
    }
    if (content_length > MAX_PLAINTEXT_LENGTH) {
        return TLSError::RECORD_OVERFLOW;
    }

    const size_t inner_length = content_length + 1;
    const size_t ciphertext_length = inner_length + Suite::TAG_LENGTH;
    if (out.size() < RECORD_HEADER_LENGTH + ciphertext_length) {
        return TLSError::ENCODE_ERROR;
    }

    out[RECORD_HEADER_LENGTH + content_length] = static_cast<uint8_t>(inner_type);

    RecordHeader header;
    header.content_type = ContentType::APPLICATION_DATA;
    header.legacy_version = TLS_V12;
    header.length = static_cast<uint16_t>(ciphertext_length);
    header.serialize(out.data());

    const auto& keys = key_schedule.write_keys();
    const auto nonce = key_schedule.write_nonce();
    EMTLS_TRY_VOID(crypto::aead_seal(Suite::AEAD,
                                     keys.key,
                                     nonce,
                                     memory::BufferView(out.data(), RECORD_HEADER_LENGTH),
                                     out.slice(RECORD_HEADER_LENGTH, inner_length),
                                     out.data() + RECORD_HEADER_LENGTH + inner_length));

    return RECORD_HEADER_LENGTH + ciphertext_length;
}

/**
 * Encode one client record into the record buffer, ready for transmission.
 *
 * Handshake messages are absorbed into `transcript` (when given) before
 * protection. Protected records use the current write counter, which the
 * caller advances once the record has been transmitted.
 * @return Number of bytes to transmit from the start of the buffer
 */
template<typename Suite>
Result<size_t> encode_record(memory::RecordBuffer& buffer,
                             const crypto::KeySchedule<Suite>& key_schedule,
                             const ClientRecord& record,
                             crypto::TranscriptHash* transcript = nullptr) {
    if (!buffer.is_valid()) {
        return TLSError::INSUFFICIENT_SPACE;
    }

    memory::MutableBufferView out = buffer.mutable_view();
    if (out.size() <= RECORD_HEADER_LENGTH) {
        return TLSError::ENCODE_ERROR;
    }

    // Protected records need room for the inner content type and the tag
    size_t content_capacity = out.size() - RECORD_HEADER_LENGTH;
    if (record.is_encrypted()) {
        const size_t protection = 1 + Suite::TAG_LENGTH;
        if (content_capacity <= protection) {
            return TLSError::ENCODE_ERROR;
        }
        content_capacity -= protection;
    }

    auto content_length = record.encode_payload(out.slice(RECORD_HEADER_LENGTH, content_capacity));
    if (!content_length) {
        return content_length.error();
    }

    if (record.is_handshake() && transcript != nullptr) {
        EMTLS_TRY_VOID(transcript->update(
            memory::BufferView(out.data() + RECORD_HEADER_LENGTH, *content_length)));
    }

    if (record.is_encrypted()) {
        return seal_record(key_schedule, record.content_type(), out, *content_length);
    }

    const ProtocolVersion version =
        record.kind() == ClientRecord::Kind::CLIENT_HELLO ? TLS_V10 : TLS_V12;
    return encode_plaintext_record(record.content_type(), version, out, *content_length);
}

/**
 * Read exactly one record (header and payload) from the transport into the
 * record buffer. Several transport reads may be needed; bytes beyond the
 * record are never requested.
 */
template<typename Transport>
Result<RawRecord> decode_record_blocking(Transport& transport, memory::RecordBuffer& buffer) {
    if (!buffer.is_valid() || buffer.capacity() < RECORD_HEADER_LENGTH) {
        return TLSError::INSUFFICIENT_SPACE;
    }

    uint8_t* data = buffer.data();
    EMTLS_TRY_VOID(transport::read_exact(transport, data, RECORD_HEADER_LENGTH));

    auto header = RecordHeader::parse(memory::BufferView(data, RECORD_HEADER_LENGTH));
    if (!header) {
        EMTLS_LOG_WARN("record", "Rejected record header: " << to_string(header.error()));
        return header.error();
    }

    const size_t total_length = RECORD_HEADER_LENGTH + header->length;
    if (total_length > buffer.capacity()) {
        EMTLS_LOG_WARN("record", "Record of " << total_length << " bytes exceeds buffer capacity "
                                 << buffer.capacity());
        return TLSError::INSUFFICIENT_SPACE;
    }

    EMTLS_TRY_VOID(transport::read_exact(transport, data + RECORD_HEADER_LENGTH, header->length));

    RawRecord raw;
    raw.header = *header;
    raw.bytes = memory::MutableBufferView(data, total_length);
    EMTLS_LOG_TRACE("record", "Received " << to_string(raw.header.content_type)
                              << " record, " << raw.header.length << " bytes");
    return raw;
}

namespace detail {

template<size_t N>
Result<void> push_messages(RecordQueue<N>& queue,
                           ContentType content_type,
                           memory::BufferView content,
                           bool encrypted) {
    ServerRecord message;
    message.encrypted = encrypted;

    switch (content_type) {
        case ContentType::HANDSHAKE: {
            if (content.empty()) {
                return TLSError::INVALID_HANDSHAKE;
            }
            WireReader reader(content);
            while (!reader.empty()) {
                auto handshake = HandshakeMessageView::parse_next(reader);
                if (!handshake) {
                    return handshake.error();
                }
                message.kind = ServerRecord::Kind::HANDSHAKE;
                message.handshake = *handshake;
                EMTLS_TRY_VOID(queue.push(message));
            }
            return make_result();
        }
        case ContentType::ALERT: {
            auto alert = Alert::parse(content);
            if (!alert) {
                return alert.error();
            }
            message.kind = ServerRecord::Kind::ALERT;
            message.alert = *alert;
            return queue.push(message);
        }
        case ContentType::CHANGE_CIPHER_SPEC:
            // Middlebox compatibility only: a single 0x01 byte, never protected
            if (encrypted || content.size() != 1 || content[0] != 0x01) {
                return TLSError::UNEXPECTED_MESSAGE;
            }
            message.kind = ServerRecord::Kind::CHANGE_CIPHER_SPEC;
            return queue.push(message);
        case ContentType::APPLICATION_DATA:
            if (!encrypted) {
                return TLSError::UNEXPECTED_MESSAGE;
            }
            message.kind = ServerRecord::Kind::APPLICATION_DATA;
            message.data = content;
            return queue.push(message);
        default:
            return TLSError::UNKNOWN_CONTENT_TYPE;
    }
}

} // namespace detail

/**
 * Turn one raw record into protocol messages, in order, pushed onto `queue`.
 *
 * Protected records are opened in place with the current read keys and
 * read counter, which is advanced once the record authenticates. Handshake
 * payloads are split into individual messages; a message continued in a
 * later record is rejected with INVALID_HANDSHAKE.
 */
template<typename Suite, size_t N>
Result<void> decrypt_record(crypto::KeySchedule<Suite>& key_schedule,
                            RecordQueue<N>& queue,
                            RawRecord raw) {
    if (raw.header.content_type != ContentType::APPLICATION_DATA) {
        // After the server switched to protected records only alerts and
        // change_cipher_spec may still arrive in the clear
        if (key_schedule.has_read_keys() && raw.header.content_type == ContentType::HANDSHAKE) {
            return TLSError::UNEXPECTED_MESSAGE;
        }
        if (raw.header.length > MAX_PLAINTEXT_LENGTH) {
            return TLSError::RECORD_OVERFLOW;
        }
        return detail::push_messages(queue, raw.header.content_type, raw.payload(), false);
    }

    if (!key_schedule.has_read_keys()) {
        return TLSError::UNEXPECTED_MESSAGE;
    }

    memory::MutableBufferView payload = raw.payload();
    if (payload.size() < Suite::TAG_LENGTH + 1) {
        return TLSError::INVALID_RECORD;
    }

    const size_t inner_length = payload.size() - Suite::TAG_LENGTH;
    const auto& keys = key_schedule.read_keys();
    const auto nonce = key_schedule.read_nonce();
    auto opened = crypto::aead_open(Suite::AEAD,
                                    keys.key,
                                    nonce,
                                    raw.header_bytes(),
                                    payload.slice(0, inner_length),
                                    payload.slice(inner_length, Suite::TAG_LENGTH));
    if (!opened) {
        EMTLS_LOG_WARN("record", "Record failed authentication at sequence "
                                 << key_schedule.read_counter());
        return opened.error();
    }
    key_schedule.increment_read_counter();

    ContentType inner_type = ContentType::INVALID;
    auto content_length = strip_inner_padding(payload.slice(0, inner_length), inner_type);
    if (!content_length) {
        return content_length.error();
    }
    if (*content_length > MAX_PLAINTEXT_LENGTH) {
        return TLSError::RECORD_OVERFLOW;
    }

    return detail::push_messages(queue, inner_type,
                                 memory::BufferView(payload.data(), *content_length), true);
}

}  // namespace emtls::v13::protocol

#endif // EMTLS_PROTOCOL_RECORD_CODEC_H
