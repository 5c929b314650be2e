#ifndef ETAGCACHE_TRANSPORT_HPP
#define ETAGCACHE_TRANSPORT_HPP

#include "common.hpp"
#include "errors.hpp"

// case-insensitive ordering for HTTP header names
struct HeaderNameLess
{
    bool operator()(std::string_view a, std::string_view b) const
    {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y)
            { return std::tolower(x) < std::tolower(y); });
    }

    using is_transparent = void;
};

using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

// Header names exchanged with the origin
namespace HttpHeader
{
    constexpr std::string_view ETAG = "ETag";
    constexpr std::string_view LAST_MODIFIED = "Last-Modified";
    constexpr std::string_view IF_NONE_MATCH = "If-None-Match";
    constexpr std::string_view IF_MODIFIED_SINCE = "If-Modified-Since";
    constexpr std::string_view CONTENT_LENGTH = "Content-Length";
    constexpr std::string_view CONTENT_ENCODING = "Content-Encoding";
    constexpr std::string_view TRANSFER_ENCODING = "Transfer-Encoding";
}

struct HttpResponse
{
    int statusCode = 0;              // status code from the status line
    std::string reason;              // reason phrase from the status line
    HeaderMap headers;               // response headers, last occurrence wins
    std::optional<std::string> body; // absent for bodiless responses

    // header value by case-insensitive name
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const
    {
        auto it = headers.find(name);
        if (it == headers.end())
        {
            return std::nullopt;
        }
        return it->second;
    }
};

// abstract base class for one GET round-trip to the origin
class Transport
{
public:
    // virtual destructor for proper cleanup in derived classes
    virtual ~Transport() = default;

    // issue a GET for path on host with the given request headers
    // throws TransportError when no response could be obtained
    virtual HttpResponse send(const std::string &host, const std::string &path,
                              const HeaderMap &headers) = 0;

    // disable copy operations
    Transport(const Transport &) = delete;
    Transport &operator=(const Transport &) = delete;

protected:
    // protected constructor to prevent direct instantiation
    Transport() = default;
};

#endif // ETAGCACHE_TRANSPORT_HPP
