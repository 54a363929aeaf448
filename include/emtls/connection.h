#ifndef EMTLS_CONNECTION_H
#define EMTLS_CONNECTION_H

#include <emtls/config.h>
#include <emtls/result.h>
#include <emtls/types.h>
#include <emtls/error_reporter.h>
#include <emtls/client_config.h>
#include <emtls/memory/buffer.h>
#include <emtls/crypto/key_schedule.h>
#include <emtls/protocol/alert.h>
#include <emtls/protocol/handshake.h>
#include <emtls/protocol/handshake_messages.h>
#include <emtls/protocol/record.h>
#include <emtls/protocol/record_codec.h>
#include <algorithm>
#include <cstring>
#include <type_traits>
#include <utility>

namespace emtls {
namespace v13 {

/**
 * Everything a connection needs besides its transport: the borrowed
 * configuration, the entropy source and the record buffer. Handed to a
 * connection at construction and handed back by a successful close().
 */
template<typename Suite, typename EntropySource>
struct Context {
    const ClientConfig<Suite>* config;
    EntropySource entropy;
    memory::RecordBuffer record_buffer;

    Context(const ClientConfig<Suite>& client_config,
            EntropySource entropy_source,
            memory::RecordBuffer buffer)
        : config(&client_config)
        , entropy(std::move(entropy_source))
        , record_buffer(std::move(buffer)) {}
};

// Resources recovered from a closed connection, ready for a new one
template<typename Transport, typename EntropySource, typename Suite>
struct ClosedConnection {
    Context<Suite, EntropySource> context;
    Transport transport;
};

/**
 * Blocking TLS 1.3 client connection over a byte-stream transport.
 *
 * All record I/O goes through the single record buffer taken from the
 * Context, so a connection allocates nothing after construction. Writes
 * are split into records of at most max_write_chunk() bytes; each read
 * returns the application data of one record (or of the first records
 * carrying data, when earlier ones carried none) and never retains bytes
 * between calls.
 *
 * Every operation blocks until its transport I/O completes or fails. An
 * error from open(), write() or read() leaves the connection unusable;
 * close() still attempts to notify the peer.
 *
 * Not safe for concurrent use.
 *
 * @tparam Transport Blocking stream transport, see transport/transport.h
 * @tparam EntropySource Random source, see crypto/entropy.h
 * @tparam Suite Cipher suite traits, e.g. crypto::Aes128GcmSha256
 */
template<typename Transport, typename EntropySource, typename Suite>
class Connection {
public:
    using ContextType = Context<Suite, EntropySource>;
    using Closed = ClosedConnection<Transport, EntropySource, Suite>;
    using KeyScheduleType = crypto::KeySchedule<Suite>;

    Connection(ContextType context, Transport transport)
        : config_(context.config)
        , entropy_(std::move(context.entropy))
        , buffer_(std::move(context.record_buffer))
        , transport_(std::move(transport))
        , key_schedule_(crypto::Side::CLIENT) {}

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // The moved-from connection is left closed with an empty record buffer
    Connection(Connection&& other) noexcept(std::is_nothrow_move_constructible<Transport>::value &&
                                            std::is_nothrow_move_constructible<EntropySource>::value)
        : config_(other.config_)
        , entropy_(std::move(other.entropy_))
        , buffer_(std::move(other.buffer_))
        , transport_(std::move(other.transport_))
        , key_schedule_(std::move(other.key_schedule_))
        , opened_(other.opened_)
        , handshake_started_(other.handshake_started_) {
        other.opened_ = false;
        other.handshake_started_ = true;
    }

    Connection& operator=(Connection&&) = delete;

    /**
     * Run the handshake to completion. May be attempted once; after a
     * failure the connection must be discarded.
     */
    Result<void> open() {
        if (opened_ || handshake_started_ || config_ == nullptr) {
            return TLSError::INVALID_STATE;
        }
        handshake_started_ = true;

        auto handshake = protocol::Handshake<Suite>::create();
        if (!handshake) {
            return handshake.error();
        }

        protocol::HandshakeState state = protocol::HandshakeState::CLIENT_HELLO;
        while (state != protocol::HandshakeState::APPLICATION_DATA) {
            auto next = protocol::process_blocking(state, transport_, *handshake, buffer_,
                                                   key_schedule_, *config_, entropy_);
            if (!next) {
                EMTLS_REPORT_ERROR(ErrorReporter::LogLevel::ERROR, next.error(), "connection",
                                   std::string("Handshake failed in state ") + protocol::to_string(state));
                return next.error();
            }
            EMTLS_LOG_TRACE("connection", "Handshake " << protocol::to_string(state)
                                          << " -> " << protocol::to_string(*next));
            state = *next;
        }

        opened_ = true;
        EMTLS_LOG_DEBUG("connection", "Handshake complete, " << to_string(Suite::CODE));
        return make_result();
    }

    /**
     * Encrypt and transmit `data` as consecutive application data records.
     * Records already sent before a failure are not taken back.
     * @return data.size() on success
     */
    Result<size_t> write(memory::BufferView data) {
        if (!opened_) {
            return TLSError::MISSING_HANDSHAKE;
        }
        if (buffer_.capacity() <= TLS_RECORD_OVERHEAD) {
            return TLSError::INSUFFICIENT_SPACE;
        }

        const size_t max_chunk = max_write_chunk();
        size_t offset = 0;
        while (offset < data.size()) {
            const size_t chunk = std::min(max_chunk, data.size() - offset);
            auto record = protocol::ClientRecord::application_data(data.slice(offset, chunk));

            auto length = protocol::encode_record(buffer_, key_schedule_, record);
            if (!length) {
                return length.error();
            }
            EMTLS_TRY_VOID(transport_.write(buffer_.data(), *length));
            key_schedule_.increment_write_counter();

            EMTLS_LOG_TRACE("connection", "Sent application data record, " << chunk << " bytes");
            offset += chunk;
        }
        return data.size();
    }

    /**
     * Read application data into `out`. Records are consumed until at least
     * one byte has been copied; application data that does not fit the
     * remaining space fails with ENCODE_ERROR and is dropped. Session
     * tickets are discarded. Alerts must arrive protected; one sent in the
     * clear fails with UNEXPECTED_MESSAGE.
     * @return Number of bytes copied
     */
    Result<size_t> read(memory::MutableBufferView out) {
        if (!opened_) {
            return TLSError::MISSING_HANDSHAKE;
        }
        if (out.empty()) {
            return size_t{0};
        }

        size_t remaining = out.size();
        while (remaining == out.size()) {
            auto raw = protocol::decode_record_blocking(transport_, buffer_);
            if (!raw) {
                return raw.error();
            }

            protocol::RecordQueue<protocol::RECORD_QUEUE_CAPACITY> queue;
            EMTLS_TRY_VOID(protocol::decrypt_record(key_schedule_, queue, *raw));

            while (auto message = queue.pop()) {
                switch (message->kind) {
                    case protocol::ServerRecord::Kind::APPLICATION_DATA: {
                        const memory::BufferView& data = message->data;
                        if (data.size() > remaining) {
                            EMTLS_LOG_WARN("connection", "Application data of " << data.size()
                                           << " bytes exceeds read buffer space " << remaining);
                            return TLSError::ENCODE_ERROR;
                        }
                        if (!data.empty()) {
                            std::memcpy(out.data() + (out.size() - remaining), data.data(), data.size());
                            remaining -= data.size();
                        }
                        break;
                    }
                    case protocol::ServerRecord::Kind::ALERT:
                        // Only an authenticated alert may end the session
                        if (!message->encrypted) {
                            EMTLS_LOG_WARN("connection", "Rejecting unprotected alert "
                                           << to_string(message->alert.description()));
                            return TLSError::UNEXPECTED_MESSAGE;
                        }
                        if (message->alert.is_close_notify()) {
                            EMTLS_LOG_DEBUG("connection", "Peer sent close_notify");
                            return TLSError::CONNECTION_CLOSED;
                        }
                        EMTLS_LOG_WARN("connection", "Peer sent alert "
                                       << to_string(message->alert.description()));
                        return TLSError::INTERNAL_ERROR;
                    case protocol::ServerRecord::Kind::CHANGE_CIPHER_SPEC:
                        EMTLS_LOG_WARN("connection", "Unexpected change_cipher_spec after handshake");
                        return TLSError::INTERNAL_ERROR;
                    case protocol::ServerRecord::Kind::HANDSHAKE:
                        if (message->handshake.type == HandshakeType::NEW_SESSION_TICKET) {
                            // Tickets are never stored; malformed ones are dropped the same way
                            auto ticket = protocol::NewSessionTicket::parse(message->handshake.body);
                            if (ticket) {
                                EMTLS_LOG_TRACE("connection", "Discarding session ticket, lifetime "
                                                << ticket->lifetime << "s");
                            } else {
                                EMTLS_LOG_TRACE("connection", "Discarding malformed session ticket");
                            }
                            break;
                        }
                        EMTLS_LOG_WARN("connection", "Unsupported post-handshake message "
                                       << to_string(message->handshake.type));
                        return TLSError::INTERNAL_ERROR;
                }
            }
        }
        return out.size() - remaining;
    }

    /**
     * Send close_notify and give back the context and transport. The alert
     * is protected when the handshake completed and sent in the clear
     * otherwise. On failure the resources are released with the connection.
     */
    Result<Closed> close() && {
        Connection self(std::move(*this));

        auto record = protocol::ClientRecord::alert(protocol::Alert::close_notify(), self.opened_);
        auto length = protocol::encode_record(self.buffer_, self.key_schedule_, record);
        if (!length) {
            return length.error();
        }
        EMTLS_TRY_VOID(self.transport_.write(self.buffer_.data(), *length));
        self.key_schedule_.increment_write_counter();

        EMTLS_LOG_DEBUG("connection", "Sent close_notify");
        return Closed{ContextType(*self.config_, std::move(self.entropy_), std::move(self.buffer_)),
                      std::move(self.transport_)};
    }

    bool is_open() const noexcept { return opened_; }

    // Largest plaintext placed in one application data record
    size_t max_write_chunk() const noexcept {
        if (buffer_.capacity() <= TLS_RECORD_OVERHEAD) {
            return 0;
        }
        return std::min(buffer_.capacity() - TLS_RECORD_OVERHEAD, MAX_PLAINTEXT_LENGTH);
    }

    const KeyScheduleType& key_schedule() const noexcept { return key_schedule_; }
    Transport& transport() noexcept { return transport_; }

private:
    const ClientConfig<Suite>* config_;
    EntropySource entropy_;
    memory::RecordBuffer buffer_;
    Transport transport_;
    KeyScheduleType key_schedule_;
    bool opened_ = false;
    bool handshake_started_ = false;
};

} // namespace v13
} // namespace emtls

#endif // EMTLS_CONNECTION_H
