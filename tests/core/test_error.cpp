#include <gtest/gtest.h>
#include <emtls/error.h>
#include <string>
#include <system_error>

using namespace emtls::v13;

class TLSErrorTest : public ::testing::Test {};

TEST_F(TLSErrorTest, CategoryName) {
    EXPECT_STREQ(TLSErrorCategory::instance().name(), "emtls");
}

TEST_F(TLSErrorTest, ErrorCodeConversion) {
    std::error_code code = TLSError::CONNECTION_CLOSED;
    EXPECT_EQ(code.value(), 21);
    EXPECT_EQ(&code.category(), &TLSErrorCategory::instance());
    EXPECT_EQ(code.message(), "Connection closed by peer");

    std::error_code success = make_error_code(TLSError::SUCCESS);
    EXPECT_FALSE(success);
}

TEST_F(TLSErrorTest, EveryCodeHasAMessage) {
    const TLSError errors[] = {
        TLSError::INTERNAL_ERROR, TLSError::INVALID_PARAMETER, TLSError::INVALID_STATE,
        TLSError::INSUFFICIENT_SPACE, TLSError::ENCODE_ERROR, TLSError::DECODE_ERROR,
        TLSError::RECORD_QUEUE_FULL, TLSError::MISSING_HANDSHAKE, TLSError::CONNECTION_CLOSED,
        TLSError::IO_ERROR, TLSError::TRANSPORT_CLOSED, TLSError::TIMEOUT,
        TLSError::INVALID_RECORD, TLSError::UNKNOWN_CONTENT_TYPE, TLSError::RECORD_OVERFLOW,
        TLSError::UNEXPECTED_MESSAGE, TLSError::INVALID_HANDSHAKE, TLSError::INVALID_CIPHER_SUITE,
        TLSError::INVALID_SUPPORTED_VERSIONS, TLSError::INVALID_KEY_SHARE, TLSError::INVALID_SESSION_ID,
        TLSError::INVALID_EXTENSIONS_LENGTH, TLSError::INVALID_CERTIFICATE,
        TLSError::INVALID_CERTIFICATE_REQUEST, TLSError::INVALID_FINISHED, TLSError::HANDSHAKE_ABORTED,
        TLSError::HELLO_RETRY_NOT_SUPPORTED, TLSError::INVALID_TICKET, TLSError::CRYPTO_ERROR,
        TLSError::DECRYPT_ERROR, TLSError::RANDOM_GENERATION_FAILED, TLSError::KEY_DERIVATION_FAILED
    };

    for (TLSError error : errors) {
        std::string message = to_string(error);
        EXPECT_FALSE(message.empty());
        EXPECT_NE(message, "Unknown error") << static_cast<int>(error);
    }
    EXPECT_STREQ(to_string(static_cast<TLSError>(999)), "Unknown error");
}

TEST_F(TLSErrorTest, Classification) {
    EXPECT_TRUE(is_transport_error(TLSError::IO_ERROR));
    EXPECT_TRUE(is_transport_error(TLSError::TRANSPORT_CLOSED));
    EXPECT_TRUE(is_transport_error(TLSError::TIMEOUT));
    EXPECT_FALSE(is_transport_error(TLSError::CONNECTION_CLOSED));

    EXPECT_TRUE(is_handshake_error(TLSError::INVALID_FINISHED));
    EXPECT_TRUE(is_handshake_error(TLSError::HELLO_RETRY_NOT_SUPPORTED));
    EXPECT_FALSE(is_handshake_error(TLSError::DECRYPT_ERROR));
    EXPECT_FALSE(is_handshake_error(TLSError::UNEXPECTED_MESSAGE));
}

TEST_F(TLSErrorTest, ExceptionCarriesError) {
    try {
        throw TLSException(TLSError::DECRYPT_ERROR, "record 3");
    } catch (const TLSException& e) {
        EXPECT_EQ(e.tls_error(), TLSError::DECRYPT_ERROR);
        EXPECT_EQ(e.code(), make_error_code(TLSError::DECRYPT_ERROR));
        EXPECT_NE(std::string(e.what()).find("record 3"), std::string::npos);
    }
}
