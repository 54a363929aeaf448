#ifndef EMTLS_CRYPTO_KEY_SCHEDULE_H
#define EMTLS_CRYPTO_KEY_SCHEDULE_H

#include <emtls/result.h>
#include <emtls/types.h>
#include <emtls/memory/buffer.h>
#include <emtls/crypto/openssl_crypto.h>
#include <openssl/crypto.h>
#include <array>
#include <cstdint>
#include <string_view>

namespace emtls {
namespace v13 {
namespace crypto {

enum class Side : uint8_t {
    CLIENT,
    SERVER
};

/**
 * TLS 1.3 key schedule (RFC 8446 section 7.1) for one endpoint.
 *
 * Holds the secret chain, the active traffic keys of each direction and the
 * per-direction record sequence counters. Write and read keys are switched
 * to the application traffic secrets independently, because the client
 * starts reading with application keys one flight before it starts writing
 * with them.
 *
 * Counters are never advanced implicitly: whoever transmits or accepts a
 * protected record increments the matching counter exactly once. Switching
 * a direction to new keys resets that direction's counter.
 *
 * Secrets are wiped when the schedule is destroyed.
 *
 * @tparam Suite Cipher suite traits, e.g. Aes128GcmSha256
 */
template<typename Suite>
class KeySchedule {
public:
    static constexpr size_t HASH_LENGTH = Suite::HASH_LENGTH;
    static constexpr size_t KEY_LENGTH = Suite::KEY_LENGTH;
    static constexpr size_t IV_LENGTH = Suite::IV_LENGTH;

    using Secret = std::array<uint8_t, HASH_LENGTH>;
    using Nonce = std::array<uint8_t, IV_LENGTH>;

    struct TrafficKeys {
        std::array<uint8_t, KEY_LENGTH> key{};
        std::array<uint8_t, IV_LENGTH> iv{};
    };

    explicit KeySchedule(Side side = Side::CLIENT) noexcept : side_(side) {}

    ~KeySchedule() {
        wipe();
    }

    KeySchedule(const KeySchedule&) = delete;
    KeySchedule& operator=(const KeySchedule&) = delete;

    KeySchedule(KeySchedule&& other) noexcept {
        take(other);
    }

    KeySchedule& operator=(KeySchedule&& other) noexcept {
        if (this != &other) {
            wipe();
            take(other);
        }
        return *this;
    }

    Side side() const noexcept { return side_; }

    Result<void> initialize_early_secret() {
        Secret zeros{};
        EMTLS_TRY_VOID(hkdf_extract(Suite::HASH, memory::BufferView(), zeros, early_secret_.data()));
        stage_ = Stage::EARLY;
        return make_result();
    }

    /**
     * Derive the handshake traffic secrets and install them as the active
     * keys of both directions.
     * @param shared_secret ECDHE shared secret
     * @param hello_hash Transcript hash of ClientHello..ServerHello
     */
    Result<void> initialize_handshake_secret(memory::BufferView shared_secret,
                                             memory::BufferView hello_hash) {
        if (stage_ == Stage::INITIAL) {
            EMTLS_TRY_VOID(initialize_early_secret());
        }
        if (stage_ != Stage::EARLY || hello_hash.size() != HASH_LENGTH) {
            return TLSError::INVALID_STATE;
        }

        Secret derived{};
        EMTLS_TRY_VOID(derive_empty(early_secret_, "derived", derived));
        EMTLS_TRY_VOID(hkdf_extract(Suite::HASH, derived, shared_secret, handshake_secret_.data()));
        EMTLS_TRY_VOID(derive_secret(handshake_secret_, "c hs traffic", hello_hash, client_handshake_secret_));
        EMTLS_TRY_VOID(derive_secret(handshake_secret_, "s hs traffic", hello_hash, server_handshake_secret_));

        EMTLS_TRY_VOID(derive_traffic_keys(own_handshake_secret(), write_keys_));
        EMTLS_TRY_VOID(derive_traffic_keys(peer_handshake_secret(), read_keys_));
        write_counter_ = 0;
        read_counter_ = 0;
        has_write_keys_ = true;
        has_read_keys_ = true;

        OPENSSL_cleanse(derived.data(), derived.size());
        stage_ = Stage::HANDSHAKE;
        return make_result();
    }

    /**
     * Derive the master secret and both application traffic secrets. The
     * active keys are left untouched until switched explicitly.
     * @param handshake_hash Transcript hash of ClientHello..server Finished
     */
    Result<void> initialize_master_secret(memory::BufferView handshake_hash) {
        if (stage_ != Stage::HANDSHAKE || handshake_hash.size() != HASH_LENGTH) {
            return TLSError::INVALID_STATE;
        }

        Secret derived{};
        Secret zeros{};
        EMTLS_TRY_VOID(derive_empty(handshake_secret_, "derived", derived));
        EMTLS_TRY_VOID(hkdf_extract(Suite::HASH, derived, zeros, master_secret_.data()));
        EMTLS_TRY_VOID(derive_secret(master_secret_, "c ap traffic", handshake_hash, client_application_secret_));
        EMTLS_TRY_VOID(derive_secret(master_secret_, "s ap traffic", handshake_hash, server_application_secret_));

        OPENSSL_cleanse(derived.data(), derived.size());
        stage_ = Stage::MASTER;
        return make_result();
    }

    Result<void> switch_read_to_application() {
        if (stage_ != Stage::MASTER) {
            return TLSError::INVALID_STATE;
        }
        EMTLS_TRY_VOID(derive_traffic_keys(peer_application_secret(), read_keys_));
        read_counter_ = 0;
        has_read_keys_ = true;
        return make_result();
    }

    Result<void> switch_write_to_application() {
        if (stage_ != Stage::MASTER) {
            return TLSError::INVALID_STATE;
        }
        EMTLS_TRY_VOID(derive_traffic_keys(own_application_secret(), write_keys_));
        write_counter_ = 0;
        has_write_keys_ = true;
        return make_result();
    }

    /** verify_data of this endpoint's Finished message. */
    Result<void> create_finished(memory::BufferView transcript_hash, Secret& verify_data) const {
        if (stage_ == Stage::INITIAL || stage_ == Stage::EARLY) {
            return TLSError::INVALID_STATE;
        }
        return compute_finished(own_handshake_secret(), transcript_hash, verify_data);
    }

    /** Check the peer's Finished; mismatch yields INVALID_FINISHED. */
    Result<void> verify_finished(memory::BufferView transcript_hash,
                                 memory::BufferView verify_data) const {
        if (stage_ == Stage::INITIAL || stage_ == Stage::EARLY) {
            return TLSError::INVALID_STATE;
        }

        Secret expected{};
        EMTLS_TRY_VOID(compute_finished(peer_handshake_secret(), transcript_hash, expected));
        bool matches = constant_time_equals(expected, verify_data);
        OPENSSL_cleanse(expected.data(), expected.size());
        if (!matches) {
            return TLSError::INVALID_FINISHED;
        }
        return make_result();
    }

    uint64_t write_counter() const noexcept { return write_counter_; }
    uint64_t read_counter() const noexcept { return read_counter_; }
    void increment_write_counter() noexcept { ++write_counter_; }
    void increment_read_counter() noexcept { ++read_counter_; }

    bool has_write_keys() const noexcept { return has_write_keys_; }
    bool has_read_keys() const noexcept { return has_read_keys_; }
    const TrafficKeys& write_keys() const noexcept { return write_keys_; }
    const TrafficKeys& read_keys() const noexcept { return read_keys_; }

    Nonce write_nonce() const noexcept { return make_nonce(write_keys_.iv, write_counter_); }
    Nonce read_nonce() const noexcept { return make_nonce(read_keys_.iv, read_counter_); }

private:
    enum class Stage : uint8_t {
        INITIAL,
        EARLY,
        HANDSHAKE,
        MASTER
    };

    // Per-record nonce: IV XOR the 64-bit sequence number, left-padded to IV length
    static Nonce make_nonce(const std::array<uint8_t, IV_LENGTH>& iv, uint64_t counter) noexcept {
        Nonce nonce = iv;
        for (size_t i = 0; i < 8; ++i) {
            nonce[IV_LENGTH - 1 - i] ^= static_cast<uint8_t>(counter >> (8 * i));
        }
        return nonce;
    }

    static Result<void> derive_secret(const Secret& secret,
                                      std::string_view label,
                                      memory::BufferView transcript_hash,
                                      Secret& out) {
        return hkdf_expand_label(Suite::HASH, secret, label, transcript_hash, out.data(), out.size());
    }

    static Result<void> derive_empty(const Secret& secret, std::string_view label, Secret& out) {
        Secret empty_hash{};
        EMTLS_TRY_VOID(hash(Suite::HASH, memory::BufferView(), empty_hash.data()));
        return derive_secret(secret, label, empty_hash, out);
    }

    static Result<void> derive_traffic_keys(const Secret& secret, TrafficKeys& keys) {
        EMTLS_TRY_VOID(hkdf_expand_label(Suite::HASH, secret, "key", memory::BufferView(),
                                         keys.key.data(), keys.key.size()));
        return hkdf_expand_label(Suite::HASH, secret, "iv", memory::BufferView(),
                                 keys.iv.data(), keys.iv.size());
    }

    static Result<void> compute_finished(const Secret& base_key,
                                         memory::BufferView transcript_hash,
                                         Secret& out) {
        Secret finished_key{};
        EMTLS_TRY_VOID(hkdf_expand_label(Suite::HASH, base_key, "finished", memory::BufferView(),
                                         finished_key.data(), finished_key.size()));
        auto result = hmac(Suite::HASH, finished_key, transcript_hash, out.data());
        OPENSSL_cleanse(finished_key.data(), finished_key.size());
        return result;
    }

    const Secret& own_handshake_secret() const noexcept {
        return side_ == Side::CLIENT ? client_handshake_secret_ : server_handshake_secret_;
    }
    const Secret& peer_handshake_secret() const noexcept {
        return side_ == Side::CLIENT ? server_handshake_secret_ : client_handshake_secret_;
    }
    const Secret& own_application_secret() const noexcept {
        return side_ == Side::CLIENT ? client_application_secret_ : server_application_secret_;
    }
    const Secret& peer_application_secret() const noexcept {
        return side_ == Side::CLIENT ? server_application_secret_ : client_application_secret_;
    }

    void take(KeySchedule& other) noexcept {
        side_ = other.side_;
        stage_ = other.stage_;
        early_secret_ = other.early_secret_;
        handshake_secret_ = other.handshake_secret_;
        master_secret_ = other.master_secret_;
        client_handshake_secret_ = other.client_handshake_secret_;
        server_handshake_secret_ = other.server_handshake_secret_;
        client_application_secret_ = other.client_application_secret_;
        server_application_secret_ = other.server_application_secret_;
        write_keys_ = other.write_keys_;
        read_keys_ = other.read_keys_;
        write_counter_ = other.write_counter_;
        read_counter_ = other.read_counter_;
        has_write_keys_ = other.has_write_keys_;
        has_read_keys_ = other.has_read_keys_;
        other.wipe();
    }

    void wipe() noexcept {
        OPENSSL_cleanse(early_secret_.data(), early_secret_.size());
        OPENSSL_cleanse(handshake_secret_.data(), handshake_secret_.size());
        OPENSSL_cleanse(master_secret_.data(), master_secret_.size());
        OPENSSL_cleanse(client_handshake_secret_.data(), client_handshake_secret_.size());
        OPENSSL_cleanse(server_handshake_secret_.data(), server_handshake_secret_.size());
        OPENSSL_cleanse(client_application_secret_.data(), client_application_secret_.size());
        OPENSSL_cleanse(server_application_secret_.data(), server_application_secret_.size());
        OPENSSL_cleanse(&write_keys_, sizeof(write_keys_));
        OPENSSL_cleanse(&read_keys_, sizeof(read_keys_));
        stage_ = Stage::INITIAL;
        has_write_keys_ = false;
        has_read_keys_ = false;
    }

    Side side_ = Side::CLIENT;
    Stage stage_ = Stage::INITIAL;

    Secret early_secret_{};
    Secret handshake_secret_{};
    Secret master_secret_{};
    Secret client_handshake_secret_{};
    Secret server_handshake_secret_{};
    Secret client_application_secret_{};
    Secret server_application_secret_{};

    TrafficKeys write_keys_{};
    TrafficKeys read_keys_{};

    uint64_t write_counter_ = 0;
    uint64_t read_counter_ = 0;
    bool has_write_keys_ = false;
    bool has_read_keys_ = false;
};

} // namespace crypto
} // namespace v13
} // namespace emtls

#endif // EMTLS_CRYPTO_KEY_SCHEDULE_H
