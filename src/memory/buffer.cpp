#include <emtls/memory/buffer.h>
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace emtls {
namespace v13 {
namespace memory {

BufferView BufferView::slice(size_t offset, size_t length) const noexcept {
    if (offset >= size_) {
        return BufferView();
    }
    return BufferView(data_ + offset, std::min(length, size_ - offset));
}

BufferView BufferView::subview(size_t offset) const noexcept {
    return slice(offset, size_);
}

bool BufferView::operator==(const BufferView& other) const noexcept {
    return size_ == other.size_ && (size_ == 0 || std::memcmp(data_, other.data_, size_) == 0);
}

MutableBufferView MutableBufferView::slice(size_t offset, size_t length) noexcept {
    if (offset >= size_) {
        return MutableBufferView();
    }
    return MutableBufferView(data_ + offset, std::min(length, size_ - offset));
}

MutableBufferView MutableBufferView::subview(size_t offset) noexcept {
    return slice(offset, size_);
}

void MutableBufferView::fill(uint8_t value) noexcept {
    if (size_ > 0) {
        std::memset(data_, value, size_);
    }
}

std::string to_hex_string(const BufferView& buffer) {
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (uint8_t byte : buffer) {
        out << std::setw(2) << static_cast<unsigned>(byte);
    }
    return out.str();
}

} // namespace memory
} // namespace v13
} // namespace emtls
