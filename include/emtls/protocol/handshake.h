#ifndef EMTLS_PROTOCOL_HANDSHAKE_H
#define EMTLS_PROTOCOL_HANDSHAKE_H

#include <emtls/config.h>
#include <emtls/result.h>
#include <emtls/types.h>
#include <emtls/error_reporter.h>
#include <emtls/client_config.h>
#include <emtls/memory/buffer.h>
#include <emtls/crypto/key_schedule.h>
#include <emtls/crypto/openssl_crypto.h>
#include <emtls/crypto/transcript_hash.h>
#include <emtls/protocol/handshake_messages.h>
#include <emtls/protocol/record.h>
#include <emtls/protocol/record_codec.h>
#include <openssl/crypto.h>
#include <array>
#include <cstring>

namespace emtls::v13::protocol {

// Client handshake states (RFC 8446 Appendix A.1, without PSK and early data)
enum class HandshakeState : uint8_t {
    CLIENT_HELLO,      // Send ClientHello
    SERVER_HELLO,      // Wait for ServerHello
    SERVER_VERIFY,     // Wait for EncryptedExtensions .. server Finished
    CLIENT_CERT,       // Send empty Certificate (server requested one)
    CLIENT_FINISHED,   // Send Finished
    APPLICATION_DATA   // Handshake complete
};

EMTLS_API const char* to_string(HandshakeState state);

/**
 * Per-handshake client state: the transcript, the ephemeral key and what
 * the server sent so far. Discarded once the connection is established.
 */
template<typename Suite>
class Handshake {
public:
    static Result<Handshake> create() {
        auto transcript = crypto::TranscriptHash::create(Suite::HASH);
        if (!transcript) {
            return transcript.error();
        }
        return Handshake(std::move(*transcript));
    }

    Handshake(Handshake&&) = default;
    Handshake& operator=(Handshake&&) = default;

    ~Handshake() {
        OPENSSL_cleanse(client_random_.data(), client_random_.size());
    }

    crypto::TranscriptHash& transcript() noexcept { return transcript_; }
    const crypto::X25519KeyPair& key_pair() const noexcept { return key_pair_; }
    bool certificate_requested() const noexcept { return certificate_requested_; }
    memory::BufferView certificate_request_context() const noexcept {
        return memory::BufferView(request_context_.data(), request_context_length_);
    }

private:
    // Order of the server's authentication messages
    enum class ServerFlight : uint8_t {
        EXPECT_ENCRYPTED_EXTENSIONS,
        EXPECT_CERTIFICATE_OR_REQUEST,
        EXPECT_CERTIFICATE,
        EXPECT_CERTIFICATE_VERIFY,
        EXPECT_FINISHED
    };

    explicit Handshake(crypto::TranscriptHash transcript) noexcept
        : transcript_(std::move(transcript)) {}

    template<typename T, typename E, typename S>
    friend Result<HandshakeState> process_blocking(HandshakeState, T&, Handshake<S>&,
                                                   memory::RecordBuffer&, crypto::KeySchedule<S>&,
                                                   const ClientConfig<S>&, E&);

    crypto::TranscriptHash transcript_;
    crypto::X25519KeyPair key_pair_;
    Random client_random_{};
    ServerFlight flight_ = ServerFlight::EXPECT_ENCRYPTED_EXTENSIONS;
    bool certificate_requested_ = false;
    std::array<uint8_t, 255> request_context_{};
    size_t request_context_length_ = 0;
};

namespace detail {

template<typename Transport, typename Suite>
Result<void> send_record(Transport& transport,
                         memory::RecordBuffer& buffer,
                         crypto::KeySchedule<Suite>& key_schedule,
                         const ClientRecord& record,
                         crypto::TranscriptHash& transcript) {
    auto length = encode_record(buffer, key_schedule, record, &transcript);
    if (!length) {
        return length.error();
    }
    EMTLS_TRY_VOID(transport.write(buffer.data(), *length));
    if (record.is_encrypted()) {
        key_schedule.increment_write_counter();
    }
    return make_result();
}

template<typename Transport, typename Suite>
Result<HandshakeState> send_client_hello(Transport& transport,
                                         Handshake<Suite>& handshake,
                                         const crypto::X25519KeyPair& key_pair,
                                         const Random& random,
                                         memory::RecordBuffer& buffer,
                                         crypto::KeySchedule<Suite>& key_schedule,
                                         const ClientConfig<Suite>& config) {
    ClientHelloParams params;
    params.random = random;
    params.cipher_suite = Suite::CODE;
    params.server_name = config.server_name;
    params.max_fragment_length = config.max_fragment_length;
    params.enable_rsa_signatures = config.enable_rsa_signatures;
    EMTLS_TRY_VOID(key_pair.public_key(params.key_share));

    EMTLS_TRY_VOID(send_record(transport, buffer, key_schedule,
                               ClientRecord::client_hello(params), handshake.transcript()));
    return HandshakeState::SERVER_HELLO;
}

template<typename Suite>
Result<void> accept_server_hello(Handshake<Suite>& handshake,
                                 const HandshakeMessageView& message,
                                 crypto::KeySchedule<Suite>& key_schedule) {
    auto hello = ServerHello::parse(message.body);
    if (!hello) {
        return hello.error();
    }
    if (hello->is_hello_retry_request) {
        return TLSError::HELLO_RETRY_NOT_SUPPORTED;
    }
    if (hello->legacy_version != TLS_V12 || hello->selected_version != TLS_V13) {
        return TLSError::INVALID_SUPPORTED_VERSIONS;
    }
    if (hello->cipher_suite != Suite::CODE) {
        return TLSError::INVALID_CIPHER_SUITE;
    }
    // The client always sends an empty legacy_session_id
    if (!hello->legacy_session_id.empty()) {
        return TLSError::INVALID_SESSION_ID;
    }
    if (hello->key_share_group != NamedGroup::X25519 ||
        hello->key_share.size() != X25519_KEY_LENGTH) {
        return TLSError::INVALID_KEY_SHARE;
    }

    EMTLS_TRY_VOID(handshake.transcript().update(message.raw));

    std::array<uint8_t, X25519_KEY_LENGTH> shared_secret{};
    std::array<uint8_t, Suite::HASH_LENGTH> hello_hash{};
    auto result = handshake.key_pair().derive_shared_secret(hello->key_share, shared_secret);
    if (result) {
        result = handshake.transcript().snapshot(hello_hash.data());
    }
    if (result) {
        result = key_schedule.initialize_handshake_secret(shared_secret, hello_hash);
    }
    OPENSSL_cleanse(shared_secret.data(), shared_secret.size());
    return result;
}

} // namespace detail

/**
 * Run one transition of the client handshake.
 *
 * Each call performs the I/O of exactly one state: sending a flight or
 * reading one record. The caller loops until APPLICATION_DATA is returned.
 * Any error aborts the handshake; the handshake object, key schedule and
 * transport must then be discarded.
 *
 * @return The next state
 */
template<typename Transport, typename EntropySource, typename Suite>
Result<HandshakeState> process_blocking(HandshakeState state,
                                        Transport& transport,
                                        Handshake<Suite>& handshake,
                                        memory::RecordBuffer& buffer,
                                        crypto::KeySchedule<Suite>& key_schedule,
                                        const ClientConfig<Suite>& config,
                                        EntropySource& entropy) {
    using Flight = typename Handshake<Suite>::ServerFlight;

    switch (state) {
        case HandshakeState::CLIENT_HELLO: {
            EMTLS_TRY_VOID(config.validate());
            EMTLS_TRY_VOID(key_schedule.initialize_early_secret());
            EMTLS_TRY_VOID(entropy.fill_bytes(handshake.client_random_.data(),
                                              handshake.client_random_.size()));

            auto key_pair = crypto::X25519KeyPair::generate(entropy);
            if (!key_pair) {
                return key_pair.error();
            }
            handshake.key_pair_ = std::move(*key_pair);

            return detail::send_client_hello(transport, handshake, handshake.key_pair_,
                                             handshake.client_random_, buffer, key_schedule, config);
        }

        case HandshakeState::SERVER_HELLO: {
            auto raw = decode_record_blocking(transport, buffer);
            if (!raw) {
                return raw.error();
            }
            RecordQueue<RECORD_QUEUE_CAPACITY> queue;
            EMTLS_TRY_VOID(decrypt_record(key_schedule, queue, *raw));

            HandshakeState next = HandshakeState::SERVER_HELLO;
            while (auto message = queue.pop()) {
                switch (message->kind) {
                    case ServerRecord::Kind::CHANGE_CIPHER_SPEC:
                        break;
                    case ServerRecord::Kind::ALERT:
                        EMTLS_LOG_WARN("handshake", "Server aborted handshake with "
                                       << to_string(message->alert.description()));
                        return TLSError::HANDSHAKE_ABORTED;
                    case ServerRecord::Kind::HANDSHAKE:
                        if (next != HandshakeState::SERVER_HELLO ||
                            message->handshake.type != HandshakeType::SERVER_HELLO) {
                            return TLSError::UNEXPECTED_MESSAGE;
                        }
                        EMTLS_TRY_VOID(detail::accept_server_hello(handshake, message->handshake,
                                                                   key_schedule));
                        next = HandshakeState::SERVER_VERIFY;
                        break;
                    default:
                        return TLSError::UNEXPECTED_MESSAGE;
                }
            }
            return next;
        }

        case HandshakeState::SERVER_VERIFY: {
            auto raw = decode_record_blocking(transport, buffer);
            if (!raw) {
                return raw.error();
            }
            RecordQueue<RECORD_QUEUE_CAPACITY> queue;
            EMTLS_TRY_VOID(decrypt_record(key_schedule, queue, *raw));

            HandshakeState next = HandshakeState::SERVER_VERIFY;
            while (auto message = queue.pop()) {
                if (next != HandshakeState::SERVER_VERIFY) {
                    // Nothing may follow the server Finished in its record
                    return TLSError::UNEXPECTED_MESSAGE;
                }
                if (message->kind == ServerRecord::Kind::CHANGE_CIPHER_SPEC) {
                    continue;
                }
                if (message->kind == ServerRecord::Kind::ALERT) {
                    EMTLS_LOG_WARN("handshake", "Server aborted handshake with "
                                   << to_string(message->alert.description()));
                    return TLSError::HANDSHAKE_ABORTED;
                }
                if (message->kind != ServerRecord::Kind::HANDSHAKE) {
                    return TLSError::UNEXPECTED_MESSAGE;
                }

                const HandshakeMessageView& hs = message->handshake;
                EMTLS_LOG_TRACE("handshake", "Received " << to_string(hs.type));

                switch (hs.type) {
                    case HandshakeType::ENCRYPTED_EXTENSIONS: {
                        if (handshake.flight_ != Flight::EXPECT_ENCRYPTED_EXTENSIONS) {
                            return TLSError::UNEXPECTED_MESSAGE;
                        }
                        auto extensions = EncryptedExtensions::parse(hs.body);
                        if (!extensions) {
                            return extensions.error();
                        }
                        handshake.flight_ = Flight::EXPECT_CERTIFICATE_OR_REQUEST;
                        break;
                    }
                    case HandshakeType::CERTIFICATE_REQUEST: {
                        if (handshake.flight_ != Flight::EXPECT_CERTIFICATE_OR_REQUEST) {
                            return TLSError::UNEXPECTED_MESSAGE;
                        }
                        auto request = CertificateRequest::parse(hs.body);
                        if (!request) {
                            return request.error();
                        }
                        std::memcpy(handshake.request_context_.data(),
                                    request->request_context.data(),
                                    request->request_context.size());
                        handshake.request_context_length_ = request->request_context.size();
                        handshake.certificate_requested_ = true;
                        handshake.flight_ = Flight::EXPECT_CERTIFICATE;
                        break;
                    }
                    case HandshakeType::CERTIFICATE: {
                        if (handshake.flight_ != Flight::EXPECT_CERTIFICATE_OR_REQUEST &&
                            handshake.flight_ != Flight::EXPECT_CERTIFICATE) {
                            return TLSError::UNEXPECTED_MESSAGE;
                        }
                        auto certificate = Certificate::parse(hs.body);
                        if (!certificate) {
                            return certificate.error();
                        }
                        if (certificate->entry_count == 0) {
                            return TLSError::INVALID_CERTIFICATE;
                        }
                        handshake.flight_ = Flight::EXPECT_CERTIFICATE_VERIFY;
                        break;
                    }
                    case HandshakeType::CERTIFICATE_VERIFY: {
                        if (handshake.flight_ != Flight::EXPECT_CERTIFICATE_VERIFY) {
                            return TLSError::UNEXPECTED_MESSAGE;
                        }
                        auto verify = CertificateVerify::parse(hs.body);
                        if (!verify) {
                            return verify.error();
                        }
                        handshake.flight_ = Flight::EXPECT_FINISHED;
                        break;
                    }
                    case HandshakeType::FINISHED: {
                        if (handshake.flight_ != Flight::EXPECT_FINISHED) {
                            return TLSError::UNEXPECTED_MESSAGE;
                        }
                        std::array<uint8_t, Suite::HASH_LENGTH> transcript_hash{};
                        EMTLS_TRY_VOID(handshake.transcript_.snapshot(transcript_hash.data()));
                        EMTLS_TRY_VOID(key_schedule.verify_finished(transcript_hash, hs.body));

                        EMTLS_TRY_VOID(handshake.transcript_.update(hs.raw));
                        EMTLS_TRY_VOID(handshake.transcript_.snapshot(transcript_hash.data()));
                        EMTLS_TRY_VOID(key_schedule.initialize_master_secret(transcript_hash));
                        EMTLS_TRY_VOID(key_schedule.switch_read_to_application());

                        next = handshake.certificate_requested_ ? HandshakeState::CLIENT_CERT
                                                                : HandshakeState::CLIENT_FINISHED;
                        continue;
                    }
                    default:
                        return TLSError::UNEXPECTED_MESSAGE;
                }
                EMTLS_TRY_VOID(handshake.transcript_.update(hs.raw));
            }
            return next;
        }

        case HandshakeState::CLIENT_CERT: {
            EMTLS_TRY_VOID(detail::send_record(transport, buffer, key_schedule,
                                               ClientRecord::certificate(handshake.certificate_request_context()),
                                               handshake.transcript_));
            return HandshakeState::CLIENT_FINISHED;
        }

        case HandshakeState::CLIENT_FINISHED: {
            std::array<uint8_t, Suite::HASH_LENGTH> transcript_hash{};
            typename crypto::KeySchedule<Suite>::Secret verify_data{};
            EMTLS_TRY_VOID(handshake.transcript_.snapshot(transcript_hash.data()));
            EMTLS_TRY_VOID(key_schedule.create_finished(transcript_hash, verify_data));
            EMTLS_TRY_VOID(detail::send_record(transport, buffer, key_schedule,
                                               ClientRecord::finished(verify_data),
                                               handshake.transcript_));
            EMTLS_TRY_VOID(key_schedule.switch_write_to_application());
            return HandshakeState::APPLICATION_DATA;
        }

        case HandshakeState::APPLICATION_DATA:
            return TLSError::INVALID_STATE;
    }
    return TLSError::INTERNAL_ERROR;
}

}  // namespace emtls::v13::protocol

#endif // EMTLS_PROTOCOL_HANDSHAKE_H
