#ifndef EMTLS_CLIENT_CONFIG_H
#define EMTLS_CLIENT_CONFIG_H

#include <emtls/config.h>
#include <emtls/result.h>
#include <emtls/types.h>
#include <optional>
#include <string_view>

namespace emtls {
namespace v13 {

/**
 * Immutable client configuration, parameterized by the cipher suite the
 * client offers. The connection borrows it for its whole lifetime.
 *
 * @tparam Suite Cipher suite traits, e.g. crypto::Aes128GcmSha256
 */
template<typename Suite>
struct ClientConfig {
    using CipherSuiteType = Suite;

    // Host name sent in the server_name extension; empty disables SNI.
    // The referenced characters must outlive the configuration.
    std::string_view server_name;

    std::optional<MaxFragmentLength> max_fragment_length;

    // Advertise RSA-PSS and PKCS#1 schemes in addition to ECDSA and EdDSA
    bool enable_rsa_signatures = true;

    ClientConfig() = default;

    ClientConfig& with_server_name(std::string_view name) {
        server_name = name;
        return *this;
    }

    ClientConfig& with_max_fragment_length(MaxFragmentLength length) {
        max_fragment_length = length;
        return *this;
    }

    ClientConfig& with_rsa_signatures(bool enabled) {
        enable_rsa_signatures = enabled;
        return *this;
    }

    Result<void> validate() const {
        if (server_name.size() > 255) {
            return TLSError::INVALID_PARAMETER;
        }
        return make_result();
    }
};

} // namespace v13
} // namespace emtls

#endif // EMTLS_CLIENT_CONFIG_H
