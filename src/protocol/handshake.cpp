#include <emtls/protocol/handshake.h>

namespace emtls::v13::protocol {

const char* to_string(HandshakeState state) {
    switch (state) {
        case HandshakeState::CLIENT_HELLO: return "CLIENT_HELLO";
        case HandshakeState::SERVER_HELLO: return "SERVER_HELLO";
        case HandshakeState::SERVER_VERIFY: return "SERVER_VERIFY";
        case HandshakeState::CLIENT_CERT: return "CLIENT_CERT";
        case HandshakeState::CLIENT_FINISHED: return "CLIENT_FINISHED";
        case HandshakeState::APPLICATION_DATA: return "APPLICATION_DATA";
    }
    return "UNKNOWN";
}

}  // namespace emtls::v13::protocol
