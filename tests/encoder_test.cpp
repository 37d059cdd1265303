#include <resplite/proto/encoder.hpp>

#include <gtest/gtest.h>

namespace resplite::test {

TEST(EncoderTest, StrAsBulkString) {
    EXPECT_EQ(encode(RespValue::str("hello")), "$5\r\nhello\r\n");
    EXPECT_EQ(encode(RespValue::str("")), "$0\r\n\r\n");
}

TEST(EncoderTest, LengthCountsBytesNotCharacters) {
    EXPECT_EQ(encode(RespValue::str("caf\xc3\xa9")), "$5\r\ncaf\xc3\xa9\r\n");
}

TEST(EncoderTest, EmptyList) {
    EXPECT_EQ(encode(RespValue::list()), "*0\r\n");
}

TEST(EncoderTest, ListKeepsOrder) {
    auto v = RespValue::list({ RespValue::str("ECHO"), RespValue::str("hi"),
                               RespValue::list({ RespValue::str("x") }) });
    EXPECT_EQ(encode(v), "*3\r\n$4\r\nECHO\r\n$2\r\nhi\r\n*1\r\n$1\r\nx\r\n");
}

TEST(EncoderTest, EncodeToAppends) {
    std::string out = "prefix";
    encode_to(out, RespValue::str("a"));
    encode_to(out, RespValue::list());
    EXPECT_EQ(out, "prefix$1\r\na\r\n*0\r\n");
}

TEST(EncoderTest, EncodedSizeIsExact) {
    auto v = RespValue::list({ RespValue::str(std::string(12345, 'q')),
                               RespValue::list({ RespValue::str(""), RespValue::list() }) });
    EXPECT_EQ(encoded_size(v), encode(v).size());
    EXPECT_EQ(encoded_size(RespValue::str("0123456789")), encode(RespValue::str("0123456789")).size());
}

TEST(EncoderTest, ReplyEmitters) {
    EXPECT_EQ(resp_bulk("PONG"), "$4\r\nPONG\r\n");
    EXPECT_EQ(resp_error("unknown command"), "-ERR unknown command\r\n");
    EXPECT_EQ(resp_error("bad\r\nline"), "-ERR bad  line\r\n");
}

} // namespace resplite::test
