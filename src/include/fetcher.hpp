#ifndef ETAGCACHE_FETCHER_HPP
#define ETAGCACHE_FETCHER_HPP

#include "common.hpp"
#include "cache.hpp"
#include "errors.hpp"
#include "fingerprint.hpp"
#include "logger.hpp"
#include "transport.hpp"

struct FetchResult
{
    bool success = false;            // a usable body was obtained
    bool fromCache = false;          // body was served from the cache after a 304
    int statusCode = 0;              // origin status, 0 when the transport failed
    std::optional<std::string> body; // resource bytes on success
};

// Fetches resources with conditional requests, keeping validators and
// bodies in a shared Cache. Stateless apart from that cache.
class Fetcher
{
public:
    static constexpr int STATUS_OK = 200;
    static constexpr int STATUS_NOT_MODIFIED = 304;

    Fetcher(Cache &cache, Transport &transport);

    // Fetch resourceId from host.
    // When conditional is set and both validators are cached, the request
    // carries If-None-Match and If-Modified-Since. Transport failures and
    // unexpected statuses yield success == false; a 304 with no cached body
    // throws CacheInconsistency.
    [[nodiscard]] FetchResult get(const std::string &host, const std::string &resourceId,
                                  bool conditional = true);

private:
    Cache &cache;
    Transport &transport;

    [[nodiscard]] HeaderMap buildConditionalHeaders(const std::string &resourceId);
    void storeValidators(const std::string &resourceId, const HttpResponse &response);
    [[nodiscard]] FetchResult storeFreshBody(const std::string &resourceId, HttpResponse &response);
    [[nodiscard]] FetchResult loadCachedBody(const std::string &resourceId);
};

#endif // ETAGCACHE_FETCHER_HPP
