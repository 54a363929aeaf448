#ifndef EMTLS_PROTOCOL_WIRE_H
#define EMTLS_PROTOCOL_WIRE_H

#include <emtls/result.h>
#include <emtls/memory/buffer.h>
#include <cstdint>
#include <cstring>

namespace emtls::v13::protocol {

/**
 * Bounds-checked big-endian reader over a byte view.
 * Every read past the end fails with DECODE_ERROR and leaves the position unchanged.
 */
class WireReader {
public:
    explicit WireReader(memory::BufferView data) noexcept : data_(data), pos_(0) {}

    Result<uint8_t> read_u8() {
        if (remaining() < 1) {
            return TLSError::DECODE_ERROR;
        }
        return data_[pos_++];
    }

    Result<uint16_t> read_u16() {
        if (remaining() < 2) {
            return TLSError::DECODE_ERROR;
        }
        uint16_t value = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return value;
    }

    Result<uint32_t> read_u24() {
        if (remaining() < 3) {
            return TLSError::DECODE_ERROR;
        }
        uint32_t value = (static_cast<uint32_t>(data_[pos_]) << 16) |
                         (static_cast<uint32_t>(data_[pos_ + 1]) << 8) |
                         static_cast<uint32_t>(data_[pos_ + 2]);
        pos_ += 3;
        return value;
    }

    Result<uint32_t> read_u32() {
        if (remaining() < 4) {
            return TLSError::DECODE_ERROR;
        }
        uint32_t value = (static_cast<uint32_t>(data_[pos_]) << 24) |
                         (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                         (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                         static_cast<uint32_t>(data_[pos_ + 3]);
        pos_ += 4;
        return value;
    }

    Result<memory::BufferView> read_bytes(size_t length) {
        if (remaining() < length) {
            return TLSError::DECODE_ERROR;
        }
        memory::BufferView view(data_.data() + pos_, length);
        pos_ += length;
        return view;
    }

    // Length-prefixed vectors with 1, 2 or 3 byte length fields
    Result<memory::BufferView> read_vector8() {
        size_t start = pos_;
        auto length = read_u8();
        if (!length) {
            return length.error();
        }
        return rewind_on_error(start, read_bytes(*length));
    }

    Result<memory::BufferView> read_vector16() {
        size_t start = pos_;
        auto length = read_u16();
        if (!length) {
            return length.error();
        }
        return rewind_on_error(start, read_bytes(*length));
    }

    Result<memory::BufferView> read_vector24() {
        size_t start = pos_;
        auto length = read_u24();
        if (!length) {
            return length.error();
        }
        return rewind_on_error(start, read_bytes(*length));
    }

    Result<void> skip(size_t length) {
        if (remaining() < length) {
            return TLSError::DECODE_ERROR;
        }
        pos_ += length;
        return make_result();
    }

    size_t position() const noexcept { return pos_; }
    size_t remaining() const noexcept { return data_.size() - pos_; }
    bool empty() const noexcept { return remaining() == 0; }
    memory::BufferView rest() const noexcept { return data_.subview(pos_); }

private:
    Result<memory::BufferView> rewind_on_error(size_t start, Result<memory::BufferView> result) {
        if (!result) {
            pos_ = start;
        }
        return result;
    }

    memory::BufferView data_;
    size_t pos_;
};

/**
 * Bounds-checked big-endian writer into a fixed mutable view.
 * Overflow fails with ENCODE_ERROR. Vector lengths are reserved with
 * begin_length() and back-patched with end_length().
 */
class WireWriter {
public:
    explicit WireWriter(memory::MutableBufferView out) noexcept : out_(out), pos_(0) {}

    Result<void> write_u8(uint8_t value) {
        if (remaining() < 1) {
            return TLSError::ENCODE_ERROR;
        }
        out_[pos_++] = value;
        return make_result();
    }

    Result<void> write_u16(uint16_t value) {
        if (remaining() < 2) {
            return TLSError::ENCODE_ERROR;
        }
        out_[pos_++] = static_cast<uint8_t>(value >> 8);
        out_[pos_++] = static_cast<uint8_t>(value);
        return make_result();
    }

    Result<void> write_u24(uint32_t value) {
        if (remaining() < 3 || value > 0xFFFFFF) {
            return TLSError::ENCODE_ERROR;
        }
        out_[pos_++] = static_cast<uint8_t>(value >> 16);
        out_[pos_++] = static_cast<uint8_t>(value >> 8);
        out_[pos_++] = static_cast<uint8_t>(value);
        return make_result();
    }

    Result<void> write_u32(uint32_t value) {
        if (remaining() < 4) {
            return TLSError::ENCODE_ERROR;
        }
        out_[pos_++] = static_cast<uint8_t>(value >> 24);
        out_[pos_++] = static_cast<uint8_t>(value >> 16);
        out_[pos_++] = static_cast<uint8_t>(value >> 8);
        out_[pos_++] = static_cast<uint8_t>(value);
        return make_result();
    }

    Result<void> write_bytes(memory::BufferView data) {
        if (remaining() < data.size()) {
            return TLSError::ENCODE_ERROR;
        }
        if (!data.empty()) {
            std::memcpy(out_.data() + pos_, data.data(), data.size());
            pos_ += data.size();
        }
        return make_result();
    }

    /** Reserve a `width`-byte length field; returns the marker for end_length(). */
    Result<size_t> begin_length(size_t width) {
        if (width < 1 || width > 3 || remaining() < width) {
            return TLSError::ENCODE_ERROR;
        }
        size_t marker = pos_;
        pos_ += width;
        return marker;
    }

    /** Patch the field reserved at `marker` with the number of bytes written since. */
    Result<void> end_length(size_t marker, size_t width) {
        size_t length = pos_ - marker - width;
        if (length >= (size_t{1} << (8 * width))) {
            return TLSError::ENCODE_ERROR;
        }
        for (size_t i = 0; i < width; ++i) {
            out_[marker + i] = static_cast<uint8_t>(length >> (8 * (width - 1 - i)));
        }
        return make_result();
    }

    size_t position() const noexcept { return pos_; }
    size_t remaining() const noexcept { return out_.size() - pos_; }
    memory::BufferView written() const noexcept { return memory::BufferView(out_.data(), pos_); }

private:
    memory::MutableBufferView out_;
    size_t pos_;
};

}  // namespace emtls::v13::protocol

#endif // EMTLS_PROTOCOL_WIRE_H
