#include "fetcher.hpp"

Fetcher::Fetcher(Cache &cache, Transport &transport)
    : cache(cache), transport(transport)
{
}

HeaderMap Fetcher::buildConditionalHeaders(const std::string &resourceId)
{
    HeaderMap headers;

    auto etag = cache.get(resourceId, Cache::Field::ETag);
    auto lastModified = cache.get(resourceId, Cache::Field::LastModified);
    if (etag && lastModified) // both validators or none
    {
        headers.emplace(HttpHeader::IF_NONE_MATCH, std::move(*etag));
        headers.emplace(HttpHeader::IF_MODIFIED_SINCE, std::move(*lastModified));
    }
    return headers;
}

void Fetcher::storeValidators(const std::string &resourceId, const HttpResponse &response)
{
    // a validator missing from the response keeps the cached one
    cache.set(resourceId, Cache::Field::ETag, response.header(HttpHeader::ETAG));
    cache.set(resourceId, Cache::Field::LastModified, response.header(HttpHeader::LAST_MODIFIED));
}

FetchResult Fetcher::storeFreshBody(const std::string &resourceId, HttpResponse &response)
{
    FetchResult result;
    result.success = true;
    result.statusCode = response.statusCode;
    result.body = response.body ? std::move(*response.body) : std::string();

    const Digest digest = Fingerprint::md5(*result.body);
    if (cache.set(resourceId, Cache::Field::Body, result.body))
    {
        cache.setFingerprint(resourceId, digest);
        Logger::getInstance()->info("Fetched and cached " + std::to_string(result.body->size()) +
                                        " bytes, md5=" + Fingerprint::toHex(digest),
                                    resourceId);
    }
    else if (cache.remove(resourceId))
    {
        // validators without a body would turn the next 304 into an inconsistency
        Logger::getInstance()->warning("Body not cached, dropped stored validators", resourceId);
    }
    return result;
}

FetchResult Fetcher::loadCachedBody(const std::string &resourceId)
{
    auto body = cache.get(resourceId, Cache::Field::Body);
    if (!body)
    {
        Logger::getInstance()->error("Origin reported Not Modified but nothing is cached",
                                     resourceId);
        // validators from this response would make the next request conditional again
        cache.remove(resourceId);
        throw CacheInconsistency(resourceId);
    }

    auto digest = cache.getFingerprint(resourceId);
    Logger::getInstance()->info("Cache hit, " + std::to_string(body->size()) + " bytes" +
                                    (digest ? ", md5=" + Fingerprint::toHex(*digest) : ""),
                                resourceId);

    FetchResult result;
    result.success = true;
    result.fromCache = true;
    result.statusCode = STATUS_NOT_MODIFIED;
    result.body = std::move(body);
    return result;
}

FetchResult Fetcher::get(const std::string &host, const std::string &resourceId,
                         bool conditional)
{
    const HeaderMap requestHeaders = conditional ? buildConditionalHeaders(resourceId)
                                                 : HeaderMap{};
    Logger::getInstance()->debug(std::string(requestHeaders.empty() ? "Unconditional" : "Conditional") +
                                     " GET " + resourceId + " from " + host,
                                 resourceId);

    HttpResponse response;
    try
    {
        response = transport.send(host, resourceId, requestHeaders);
    }
    catch (const TransportError &e)
    {
        Logger::getInstance()->error("Transport failure: " + std::string(e.what()), resourceId);
        return {};
    }

    Logger::getInstance()->debug("Response " + std::to_string(response.statusCode) + " " +
                                     response.reason,
                                 resourceId);

    storeValidators(resourceId, response);

    switch (response.statusCode)
    {
    case STATUS_OK:
        return storeFreshBody(resourceId, response);
    case STATUS_NOT_MODIFIED:
        return loadCachedBody(resourceId);
    default:
        break;
    }

    Logger::getInstance()->error("Unhandled status code: " + std::to_string(response.statusCode),
                                 resourceId);
    FetchResult result;
    result.statusCode = response.statusCode;
    return result;
}
