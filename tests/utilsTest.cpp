#include "utils.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <sys/socket.h>
#include <unistd.h>

TEST(UtilsTest, ParsesRequestWithBody) {
    Request req = parseRequest("POST /__agent/message HTTP/1.1\r\n"
                               "Host: localhost:8080\r\n"
                               "Content-Length: 24\r\n"
                               "\r\n"
                               "{\"type\":\"GET_VERSION\"}\r\n");
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, "/__agent/message");
    EXPECT_EQ(headerValue(req.headers, "host"), "localhost:8080");
    EXPECT_EQ(req.body, "{\"type\":\"GET_VERSION\"}\r\n");
}

TEST(UtilsTest, RejectsTruncatedBody) {
    EXPECT_THROW(parseRequest("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc"), std::runtime_error);
    EXPECT_THROW(parseRequest("GET / HTTP/1.1\r\nno colon here\r\n\r\n"), std::runtime_error);
}

TEST(UtilsTest, DecodesChunkedResponse) {
    Response res = parseResponse("HTTP/1.1 200 OK\r\n"
                                 "Transfer-Encoding: chunked\r\n"
                                 "\r\n"
                                 "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n");
    EXPECT_EQ(res.status_code, 200);
    EXPECT_EQ(res.status_msg, "OK");
    EXPECT_EQ(res.body, "Wikipedia");
}

TEST(UtilsTest, ResponseWithoutLengthReadsToEnd) {
    Response res = parseResponse("HTTP/1.0 200 OK\r\nContent-Type: text/plain\r\n\r\nall of it");
    EXPECT_EQ(res.body, "all of it");
}

TEST(UtilsTest, SerializeRecomputesFraming) {
    Response res = makeResponse(200, "OK", "text/plain", "hello");
    res.headers["transfer-encoding"] = "chunked";
    res.headers["content-length"] = "999";
    std::string wire = serializeResponseForClient(res);

    EXPECT_EQ(wire.find("chunked"), std::string::npos);
    EXPECT_EQ(wire.find("999"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: 5\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 5), "hello");

    Response back = parseResponse(wire);
    EXPECT_EQ(back.body, "hello");
}

TEST(UtilsTest, HeaderHelpersIgnoreCase) {
    std::map<std::string, std::string> headers = {{"X-Client-Id", "client-1"}, {"x-client-id", "dup"}, {"Accept", "*/*"}};
    EXPECT_FALSE(headerValue(headers, "X-CLIENT-ID").empty());
    eraseHeader(headers, "x-Client-ID");
    EXPECT_EQ(headers.size(), 1u);
    EXPECT_EQ(headerValue(headers, "accept"), "*/*");
}

TEST(UtilsTest, Iso8601HasMillisecondsAndZuluSuffix) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(86400000LL + 7));
    EXPECT_EQ(formatIso8601(tp), "1970-01-02T00:00:00.007Z");
}

TEST(UtilsTest, ConnectToClosedPortFails) {
    // port 1 on loopback is not listening in any test environment we run in
    EXPECT_LT(connectToOther("127.0.0.1", "1", std::chrono::milliseconds(500)), 0);
}

TEST(UtilsTest, RequestReadGivesUpAtDeadline) {
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    std::string partial = "GET / HTTP/1.1\r\nHost: localhost\r\n";
    ASSERT_TRUE(sendAll(fds[1], partial.data(), partial.size()));

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(readHttpRequestFromFd(fds[0], deadlineAfter(std::chrono::milliseconds(150))), std::runtime_error);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    close(fds[0]);
    close(fds[1]);
}
