#include "cacheEntry.hpp"

const char *RETRIEVED_AT_HEADER = "X-Retrieved-At";

CacheEntry::CacheEntry(){
    status = 0;
    retrievedAt = std::chrono::system_clock::time_point();
}

CacheEntry::CacheEntry(std::string key, const Response &response,
                       std::chrono::system_clock::time_point retrievedAt)
    : key(std::move(key)), status(response.status_code), statusMsg(response.status_msg),
      headers(response.headers), body(response.body), retrievedAt(retrievedAt) {
    // stored with millisecond resolution
    this->retrievedAt = fromMillis(retrievedAtMillis());

    // transfer framing belongs to the upstream connection, not the snapshot
    eraseHeader(headers, "Transfer-Encoding");
    eraseHeader(headers, "Connection");
    headers[RETRIEVED_AT_HEADER] = getRetrievedAtString();
}

Response CacheEntry::toResponse() const{
    Response res;
    res.status_code = status;
    res.status_msg = statusMsg;
    res.headers = headers;
    res.body = body;
    return res;
}

std::string CacheEntry::getRetrievedAtString() const{
    return formatIso8601(retrievedAt);
}

long long CacheEntry::retrievedAtMillis() const{
    return std::chrono::duration_cast<std::chrono::milliseconds>(retrievedAt.time_since_epoch()).count();
}

std::chrono::system_clock::time_point CacheEntry::fromMillis(long long ms){
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

bool operator==(const CacheEntry &a, const CacheEntry &b){
    return a.key == b.key && a.status == b.status && a.statusMsg == b.statusMsg &&
           a.headers == b.headers && a.body == b.body && a.retrievedAt == b.retrievedAt;
}
