#include <emtls/protocol/alert.h>

namespace emtls::v13::protocol {

Result<size_t> Alert::serialize(memory::MutableBufferView out) const {
    if (out.size() < SERIALIZED_SIZE) {
        return TLSError::ENCODE_ERROR;
    }
    out[0] = static_cast<uint8_t>(level_);
    out[1] = static_cast<uint8_t>(description_);
    return SERIALIZED_SIZE;
}

Result<Alert> Alert::parse(memory::BufferView data) {
    if (data.size() != SERIALIZED_SIZE) {
        return TLSError::DECODE_ERROR;
    }

    const auto level = static_cast<AlertLevel>(data[0]);
    if (level != AlertLevel::WARNING && level != AlertLevel::FATAL) {
        return TLSError::DECODE_ERROR;
    }
    return Alert(level, static_cast<AlertDescription>(data[1]));
}

}  // namespace emtls::v13::protocol
