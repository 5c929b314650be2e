#ifndef ETAGCACHE_FAKE_TRANSPORT_HPP
#define ETAGCACHE_FAKE_TRANSPORT_HPP

#include "transport.hpp"

// Transport replaying queued responses and recording every request
class FakeTransport : public Transport
{
public:
    struct Request
    {
        std::string host;
        std::string path;
        HeaderMap headers;
    };

    std::deque<HttpResponse> responses;
    std::vector<Request> requests;
    bool failNext = false;

    void queue(int statusCode, std::optional<std::string> body = std::nullopt,
               std::optional<std::string> etag = std::nullopt,
               std::optional<std::string> lastModified = std::nullopt)
    {
        HttpResponse response;
        response.statusCode = statusCode;
        response.body = std::move(body);
        if (etag)
        {
            response.headers.emplace("ETag", *etag);
        }
        if (lastModified)
        {
            response.headers.emplace("Last-Modified", *lastModified);
        }
        responses.push_back(std::move(response));
    }

    HttpResponse send(const std::string &host, const std::string &path,
                      const HeaderMap &headers) override
    {
        requests.push_back({host, path, headers});
        if (failNext)
        {
            failNext = false;
            throw TransportError("connection refused");
        }
        if (responses.empty())
        {
            throw TransportError("no scripted response");
        }
        HttpResponse response = std::move(responses.front());
        responses.pop_front();
        return response;
    }
};

#endif // ETAGCACHE_FAKE_TRANSPORT_HPP
