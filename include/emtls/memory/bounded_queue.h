#ifndef EMTLS_MEMORY_BOUNDED_QUEUE_H
#define EMTLS_MEMORY_BOUNDED_QUEUE_H

#include <emtls/result.h>
#include <array>
#include <cstddef>
#include <optional>
#include <utility>

namespace emtls {
namespace v13 {
namespace memory {

/**
 * Fixed-capacity FIFO ring buffer with in-place storage.
 *
 * Used to hand the messages decrypted from one record to the connection in
 * arrival order. Pushing into a full queue fails with RECORD_QUEUE_FULL and
 * leaves the queue unchanged.
 *
 * @tparam T Element type, must be default constructible and movable
 * @tparam N Capacity
 */
template<typename T, size_t N>
class BoundedQueue {
    static_assert(N > 0, "BoundedQueue capacity must be non-zero");

public:
    BoundedQueue() = default;

    Result<void> push(T value) {
        if (count_ == N) {
            return TLSError::RECORD_QUEUE_FULL;
        }
        slots_[(head_ + count_) % N] = std::move(value);
        ++count_;
        return make_result();
    }

    std::optional<T> pop() {
        if (count_ == 0) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(slots_[head_]));
        head_ = (head_ + 1) % N;
        --count_;
        return value;
    }

    void clear() noexcept {
        head_ = 0;
        count_ = 0;
    }

    size_t size() const noexcept { return count_; }
    bool empty() const noexcept { return count_ == 0; }
    bool full() const noexcept { return count_ == N; }
    static constexpr size_t capacity() noexcept { return N; }

private:
    std::array<T, N> slots_{};
    size_t head_ = 0;
    size_t count_ = 0;
};

} // namespace memory
} // namespace v13
} // namespace emtls

#endif // EMTLS_MEMORY_BOUNDED_QUEUE_H
