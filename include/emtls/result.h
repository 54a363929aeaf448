#ifndef EMTLS_RESULT_H
#define EMTLS_RESULT_H

#include <emtls/config.h>
#include <emtls/error.h>
#include <variant>
#include <type_traits>
#include <utility>

namespace emtls {
namespace v13 {

template<typename T>
class Result;

/**
 * Result type for operations that can fail.
 *
 * Holds either a success value of type T or a TLSError. Every fallible
 * operation in the library returns one of these; nothing on the data path
 * throws. Move-only payloads (transports, record buffers) are supported, in
 * which case the Result itself is move-only.
 *
 * @tparam T The type of the success value
 */
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(TLSError error) : data_(error) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool is_success() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const noexcept {
        return std::holds_alternative<TLSError>(data_);
    }

    // Value access (throws if error)
    const T& value() const & {
        if (is_error()) {
            throw TLSException(std::get<TLSError>(data_));
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (is_error()) {
            throw TLSException(std::get<TLSError>(data_));
        }
        return std::get<T>(data_);
    }

    T value() && {
        if (is_error()) {
            throw TLSException(std::get<TLSError>(data_));
        }
        return std::move(std::get<T>(data_));
    }

    template<typename U>
    T value_or(U&& default_value) const & {
        if (is_success()) {
            return std::get<T>(data_);
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    TLSError error() const {
        if (is_success()) {
            return TLSError::SUCCESS;
        }
        return std::get<TLSError>(data_);
    }

    explicit operator bool() const noexcept {
        return is_success();
    }

    const T& operator*() const & {
        return value();
    }

    T& operator*() & {
        return value();
    }

    T operator*() && {
        return std::move(*this).value();
    }

    const T* operator->() const {
        if (is_error()) {
            return nullptr;
        }
        return &std::get<T>(data_);
    }

    T* operator->() {
        if (is_error()) {
            return nullptr;
        }
        return &std::get<T>(data_);
    }

private:
    std::variant<T, TLSError> data_;
};

// Specialization for void type
template<>
class Result<void> {
public:
    Result() : error_(TLSError::SUCCESS) {}
    Result(TLSError error) : error_(error) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool is_success() const noexcept {
        return error_ == TLSError::SUCCESS;
    }

    bool is_error() const noexcept {
        return error_ != TLSError::SUCCESS;
    }

    TLSError error() const noexcept {
        return error_;
    }

    explicit operator bool() const noexcept {
        return is_success();
    }

private:
    TLSError error_;
};

template<typename T>
Result<std::decay_t<T>> make_result(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> make_result() {
    return Result<void>();
}

template<typename T>
Result<T> make_error(TLSError error) {
    return Result<T>(error);
}

// Propagate the error of a Result-returning expression to the caller
#define EMTLS_TRY_VOID(expr) \
    do { \
        auto _emtls_result = (expr); \
        if (_emtls_result.is_error()) { \
            return _emtls_result.error(); \
        } \
    } while (0)

} // namespace v13
} // namespace emtls

#endif // EMTLS_RESULT_H
