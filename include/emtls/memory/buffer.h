#ifndef EMTLS_MEMORY_BUFFER_H
#define EMTLS_MEMORY_BUFFER_H

#include <emtls/config.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

namespace emtls {
namespace v13 {
namespace memory {

// Read-only, non-owning byte view
class EMTLS_API BufferView {
public:
    BufferView() noexcept : data_(nullptr), size_(0) {}
    BufferView(const uint8_t* data, size_t size) noexcept : data_(data), size_(size) {}

    template<typename Container,
             typename = std::enable_if_t<sizeof(typename Container::value_type) == 1>>
    BufferView(const Container& container) noexcept
        : data_(reinterpret_cast<const uint8_t*>(container.data())),
          size_(container.size()) {}

    const uint8_t* data() const noexcept { return data_; }
    size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

    // Slicing clamps to the view; an offset past the end yields an empty view
    BufferView slice(size_t offset, size_t length) const noexcept;
    BufferView subview(size_t offset) const noexcept;

    const uint8_t* begin() const noexcept { return data_; }
    const uint8_t* end() const noexcept { return data_ + size_; }

    const uint8_t& operator[](size_t index) const noexcept { return data_[index]; }

    bool operator==(const BufferView& other) const noexcept;
    bool operator!=(const BufferView& other) const noexcept { return !(*this == other); }

private:
    const uint8_t* data_;
    size_t size_;
};

// Mutable, non-owning byte view
class EMTLS_API MutableBufferView {
public:
    MutableBufferView() noexcept : data_(nullptr), size_(0) {}
    MutableBufferView(uint8_t* data, size_t size) noexcept : data_(data), size_(size) {}

    template<size_t N>
    MutableBufferView(std::array<uint8_t, N>& storage) noexcept
        : data_(storage.data()), size_(N) {}

    uint8_t* data() noexcept { return data_; }
    const uint8_t* data() const noexcept { return data_; }
    size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

    MutableBufferView slice(size_t offset, size_t length) noexcept;
    MutableBufferView subview(size_t offset) noexcept;

    uint8_t* begin() noexcept { return data_; }
    uint8_t* end() noexcept { return data_ + size_; }
    const uint8_t* begin() const noexcept { return data_; }
    const uint8_t* end() const noexcept { return data_ + size_; }

    uint8_t& operator[](size_t index) noexcept { return data_[index]; }
    const uint8_t& operator[](size_t index) const noexcept { return data_[index]; }

    operator BufferView() const noexcept { return BufferView(data_, size_); }

    void fill(uint8_t value) noexcept;
    void zero() noexcept { fill(0); }

private:
    uint8_t* data_;
    size_t size_;
};

/**
 * RecordBuffer is the single fixed-capacity working area a connection uses
 * for every handshake message and every record it sends or receives.
 *
 * It does not own the storage: the caller provides it (typically a static
 * or stack array) and must keep it alive while any RecordBuffer refers to
 * it. The handle is move-only so that exactly one holder has access at a
 * time; moving leaves the source empty with zero capacity. The capacity is
 * fixed for the lifetime of the handle.
 */
class EMTLS_API RecordBuffer {
public:
    RecordBuffer() noexcept : data_(nullptr), capacity_(0) {}
    RecordBuffer(uint8_t* data, size_t capacity) noexcept : data_(data), capacity_(capacity) {}

    template<size_t N>
    explicit RecordBuffer(std::array<uint8_t, N>& storage) noexcept
        : data_(storage.data()), capacity_(N) {}

    template<size_t N>
    explicit RecordBuffer(uint8_t (&storage)[N]) noexcept
        : data_(storage), capacity_(N) {}

    RecordBuffer(const RecordBuffer&) = delete;
    RecordBuffer& operator=(const RecordBuffer&) = delete;

    RecordBuffer(RecordBuffer&& other) noexcept
        : data_(other.data_), capacity_(other.capacity_) {
        other.data_ = nullptr;
        other.capacity_ = 0;
    }

    RecordBuffer& operator=(RecordBuffer&& other) noexcept {
        if (this != &other) {
            data_ = other.data_;
            capacity_ = other.capacity_;
            other.data_ = nullptr;
            other.capacity_ = 0;
        }
        return *this;
    }

    uint8_t* data() noexcept { return data_; }
    const uint8_t* data() const noexcept { return data_; }
    size_t capacity() const noexcept { return capacity_; }
    bool is_valid() const noexcept { return data_ != nullptr && capacity_ > 0; }

    MutableBufferView mutable_view() noexcept { return MutableBufferView(data_, capacity_); }
    BufferView view(size_t length) const noexcept {
        return BufferView(data_, length < capacity_ ? length : capacity_);
    }

private:
    uint8_t* data_;
    size_t capacity_;
};

// Hex encoding for diagnostics and tests
EMTLS_API std::string to_hex_string(const BufferView& buffer);

} // namespace memory
} // namespace v13
} // namespace emtls

#endif // EMTLS_MEMORY_BUFFER_H
