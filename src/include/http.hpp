#ifndef ETAGCACHE_HTTP_HPP
#define ETAGCACHE_HTTP_HPP

#include "common.hpp"
#include "compression.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "socket.hpp"
#include "transport.hpp"

// HTTP/1.1 message helpers, malformed input throws TransportError
class Http
{
public:
    // serialise a GET request, extra headers are appended as given
    [[nodiscard]] static std::string buildRequest(const std::string &host, const std::string &path,
                                                  const HeaderMap &headers,
                                                  const std::string &userAgent,
                                                  bool acceptEncoding);

    // parse status line and headers, head excludes the terminating blank line
    [[nodiscard]] static HttpResponse parseResponseHead(std::string_view head);

    // 1xx, 204 and 304 responses never carry a body
    [[nodiscard]] static bool hasBody(int statusCode);

    // decode a chunked body, nullopt while the final chunk has not arrived
    [[nodiscard]] static std::optional<std::string> decodeChunked(std::string_view data);

    // split "name[:port]"
    [[nodiscard]] static std::pair<std::string, int> splitHostPort(const std::string &host,
                                                                   int defaultPort);

    // read one complete response from a connected socket
    [[nodiscard]] static HttpResponse readResponse(Socket &socket);

private:
    // Constants for response reading
    static constexpr size_t BUFFER_SIZE = 65536;
    static constexpr size_t MAX_HEAD_SIZE = 64 * 1024;

    [[nodiscard]] static std::string readBody(Socket &socket, const HttpResponse &response,
                                              std::string received);
};

struct HttpClientOptions
{
    bool useTls = true;                                         // https or plain http
    std::chrono::milliseconds timeout{10000};                   // per connect, send and receive
    std::string userAgent = "etagcache/1.0";                    // User-Agent header
    bool acceptEncoding = true;                                 // advertise gzip/deflate
};

// Transport doing one GET per connection with Connection: close
class HttpClient : public Transport
{
public:
    explicit HttpClient(HttpClientOptions options);

    HttpResponse send(const std::string &host, const std::string &path,
                      const HeaderMap &headers) override;

private:
    HttpClientOptions options;
};

#endif // ETAGCACHE_HTTP_HPP
