#include "cacheEntry.hpp"

#include <gtest/gtest.h>

TEST(CacheEntryTest, StampsRetrievedAtHeader) {
    Response res = makeResponse(200, "OK", "text/css", "body{}");
    CacheEntry entry("GET /main.css", res, CacheEntry::fromMillis(1700000000005LL));

    EXPECT_EQ(entry.headers[RETRIEVED_AT_HEADER], "2023-11-14T22:13:20.005Z");
    EXPECT_EQ(entry.getRetrievedAtString(), "2023-11-14T22:13:20.005Z");
    EXPECT_EQ(entry.headers["Content-Type"], "text/css");
}

TEST(CacheEntryTest, DropsConnectionFraming) {
    Response res = makeResponse(200, "OK", "text/plain", "abc");
    res.headers["transfer-encoding"] = "chunked";
    res.headers["Connection"] = "keep-alive";
    CacheEntry entry("GET /x", res, CacheEntry::fromMillis(0));

    EXPECT_EQ(headerValue(entry.headers, "Transfer-Encoding"), "");
    EXPECT_EQ(headerValue(entry.headers, "Connection"), "");
}

TEST(CacheEntryTest, TruncatesToMilliseconds) {
    auto tp = CacheEntry::fromMillis(1234) + std::chrono::microseconds(999);
    CacheEntry entry("GET /x", makeResponse(200, "OK", "text/plain", ""), tp);
    EXPECT_EQ(entry.retrievedAtMillis(), 1234);
    EXPECT_EQ(entry.retrievedAt, CacheEntry::fromMillis(1234));
}

TEST(CacheEntryTest, ToResponseKeepsStatusHeadersAndBody) {
    Response res = makeResponse(203, "Non-Authoritative Information", "application/json", "{}");
    CacheEntry entry("GET /api/x", res, CacheEntry::fromMillis(10));
    Response back = entry.toResponse();

    EXPECT_EQ(back.status_code, 203);
    EXPECT_EQ(back.status_msg, "Non-Authoritative Information");
    EXPECT_EQ(back.body, "{}");
    EXPECT_EQ(back.headers[RETRIEVED_AT_HEADER], "1970-01-01T00:00:00.010Z");
}
