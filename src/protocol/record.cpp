#include <emtls/protocol/record.h>
#include <cstring>

namespace emtls::v13::protocol {

Result<RecordHeader> RecordHeader::parse(memory::BufferView data) {
    if (data.size() != RECORD_HEADER_LENGTH) {
        return TLSError::INVALID_RECORD;
    }

    RecordHeader header;
    header.content_type = static_cast<ContentType>(data[0]);
    header.legacy_version = static_cast<ProtocolVersion>((data[1] << 8) | data[2]);
    header.length = static_cast<uint16_t>((data[3] << 8) | data[4]);

    switch (header.content_type) {
        case ContentType::CHANGE_CIPHER_SPEC:
        case ContentType::ALERT:
        case ContentType::HANDSHAKE:
        case ContentType::APPLICATION_DATA:
            break;
        default:
            return TLSError::UNKNOWN_CONTENT_TYPE;
    }

    if (header.legacy_version != TLS_V12 && header.legacy_version != TLS_V10) {
        return TLSError::INVALID_RECORD;
    }

    if (header.length > MAX_CIPHERTEXT_LENGTH) {
        return TLSError::RECORD_OVERFLOW;
    }
    if (header.length == 0) {
        return TLSError::INVALID_RECORD;
    }

    return header;
}

void RecordHeader::serialize(uint8_t* out) const {
    out[0] = static_cast<uint8_t>(content_type);
    out[1] = static_cast<uint8_t>(legacy_version >> 8);
    out[2] = static_cast<uint8_t>(legacy_version);
    out[3] = static_cast<uint8_t>(length >> 8);
    out[4] = static_cast<uint8_t>(length);
}

ContentType ClientRecord::content_type() const noexcept {
    switch (kind_) {
        case Kind::CLIENT_HELLO:
        case Kind::CERTIFICATE:
        case Kind::FINISHED:
            return ContentType::HANDSHAKE;
        case Kind::ALERT:
            return ContentType::ALERT;
        case Kind::APPLICATION_DATA:
            return ContentType::APPLICATION_DATA;
    }
    return ContentType::INVALID;
}

Result<size_t> ClientRecord::encode_payload(memory::MutableBufferView out) const {
    switch (kind_) {
        case Kind::CLIENT_HELLO:
            if (hello_ == nullptr) {
                return TLSError::INVALID_PARAMETER;
            }
            return encode_client_hello(*hello_, out);
        case Kind::CERTIFICATE:
            return encode_empty_certificate(data_, out);
        case Kind::FINISHED:
            return encode_finished(data_, out);
        case Kind::ALERT:
            return alert_.serialize(out);
        case Kind::APPLICATION_DATA:
            if (data_.size() > out.size()) {
                return TLSError::ENCODE_ERROR;
            }
            if (!data_.empty()) {
                std::memcpy(out.data(), data_.data(), data_.size());
            }
            return data_.size();
    }
    return TLSError::INTERNAL_ERROR;
}

Result<size_t> encode_plaintext_record(ContentType type,
                                       ProtocolVersion legacy_version,
                                       memory::MutableBufferView out,
                                       size_t payload_length) {
    if (payload_length > MAX_PLAINTEXT_LENGTH) {
        return TLSError::RECORD_OVERFLOW;
    }
    if (out.size() < RECORD_HEADER_LENGTH + payload_length) {
        return TLSError::ENCODE_ERROR;
    }

    RecordHeader header;
    header.content_type = type;
    header.legacy_version = legacy_version;
    header.length = static_cast<uint16_t>(payload_length);
    header.serialize(out.data());
    return RECORD_HEADER_LENGTH + payload_length;
}

Result<size_t> strip_inner_padding(memory::BufferView inner, ContentType& content_type) {
    size_t index = inner.size();
    while (index > 0 && inner[index - 1] == 0) {
        --index;
    }
    if (index == 0) {
        return TLSError::UNEXPECTED_MESSAGE;
    }

    content_type = static_cast<ContentType>(inner[index - 1]);
    return index - 1;
}

}  // namespace emtls::v13::protocol
