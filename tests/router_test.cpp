#include <resplite/core/router.hpp>

#include <gtest/gtest.h>

namespace resplite::test {

namespace {

RespValue cmd(std::vector<std::string> args) {
    std::vector<RespValue> v;
    for (auto& a : args) v.push_back(RespValue::str(a));
    return RespValue::list(std::move(v));
}

} // namespace

TEST(RouterTest, Ping) {
    Router r;
    EXPECT_EQ(r.dispatch(cmd({ "PING" })), "$4\r\nPONG\r\n");
    EXPECT_EQ(r.dispatch(cmd({ "PING", "hey" })), "$3\r\nhey\r\n");
    EXPECT_EQ(r.dispatch(cmd({ "PING", "a", "b" })).substr(0, 5), "-ERR ");
}

TEST(RouterTest, Echo) {
    Router r;
    EXPECT_EQ(r.dispatch(cmd({ "ECHO", "hello world" })), "$11\r\nhello world\r\n");
    EXPECT_EQ(r.dispatch(cmd({ "ECHO" })).substr(0, 5), "-ERR ");
}

TEST(RouterTest, CaseInsensitiveNames) {
    Router r;
    EXPECT_EQ(r.dispatch(cmd({ "ping" })), "$4\r\nPONG\r\n");
    EXPECT_EQ(r.dispatch(cmd({ "eChO", "x" })), "$1\r\nx\r\n");
}

TEST(RouterTest, UnknownCommand) {
    Router r;
    EXPECT_EQ(r.dispatch(cmd({ "GET", "k" })), "-ERR unknown command 'GET'\r\n");
}

TEST(RouterTest, RejectsMalformedCommands) {
    Router r;
    EXPECT_EQ(r.dispatch(RespValue::str("PING")), "-ERR expected an array of strings\r\n");
    EXPECT_EQ(r.dispatch(RespValue::list({ RespValue::list() })), "-ERR expected an array of strings\r\n");
    EXPECT_EQ(r.dispatch(RespValue::list()), "-ERR empty command\r\n");
}

} // namespace resplite::test
