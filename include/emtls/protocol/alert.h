#ifndef EMTLS_PROTOCOL_ALERT_H
#define EMTLS_PROTOCOL_ALERT_H

#include <emtls/config.h>
#include <emtls/result.h>
#include <emtls/types.h>
#include <emtls/memory/buffer.h>

namespace emtls::v13::protocol {

// Alert message (RFC 8446 Section 6)
class EMTLS_API Alert {
private:
    AlertLevel level_ = AlertLevel::WARNING;
    AlertDescription description_ = AlertDescription::CLOSE_NOTIFY;

public:
    static constexpr size_t SERIALIZED_SIZE = 2;

    Alert() = default;
    Alert(AlertLevel level, AlertDescription description)
        : level_(level), description_(description) {}

    static Alert close_notify() {
        return Alert(AlertLevel::WARNING, AlertDescription::CLOSE_NOTIFY);
    }

    AlertLevel level() const { return level_; }
    AlertDescription description() const { return description_; }

    // Serialization
    Result<size_t> serialize(memory::MutableBufferView out) const;
    static Result<Alert> parse(memory::BufferView data);

    bool is_fatal() const { return level_ == AlertLevel::FATAL; }
    bool is_warning() const { return level_ == AlertLevel::WARNING; }
    bool is_close_notify() const { return description_ == AlertDescription::CLOSE_NOTIFY; }

    bool operator==(const Alert& other) const {
        return level_ == other.level_ && description_ == other.description_;
    }

    bool operator!=(const Alert& other) const {
        return !(*this == other);
    }
};

}  // namespace emtls::v13::protocol

#endif // EMTLS_PROTOCOL_ALERT_H
