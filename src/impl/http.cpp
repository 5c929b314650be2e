#include "http.hpp"

namespace
{
    std::string_view trim(std::string_view value)
    {
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
        {
            value.remove_prefix(1);
        }
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r'))
        {
            value.remove_suffix(1);
        }
        return value;
    }

    bool containsToken(std::string_view value, std::string_view token)
    {
        std::string lowered(value);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return lowered.find(token) != std::string::npos;
    }
}

[[nodiscard]]
std::string Http::buildRequest(const std::string &host, const std::string &path,
                               const HeaderMap &headers, const std::string &userAgent,
                               bool acceptEncoding)
{
    std::string request;
    request.reserve(256);
    request += "GET " + path + " HTTP/1.1\r\n";
    request += "Host: " + host + "\r\n";
    request += "User-Agent: " + userAgent + "\r\n";
    request += "Accept: */*\r\n";
    if (acceptEncoding)
    {
        request += "Accept-Encoding: " + std::string(Compression::ACCEPT_ENCODING) + "\r\n";
    }
    request += "Connection: close\r\n";
    for (const auto &[name, value] : headers)
    {
        request += name + ": " + value + "\r\n";
    }
    request += "\r\n";
    return request;
}

[[nodiscard]]
HttpResponse Http::parseResponseHead(std::string_view head)
{
    HttpResponse response;

    size_t lineEnd = head.find("\r\n");
    std::string_view statusLine = head.substr(0, lineEnd);

    // HTTP/1.x SP 3DIGIT [SP reason]
    if (statusLine.size() < 12 || statusLine.substr(0, 7) != "HTTP/1." ||
        statusLine[8] != ' ')
    {
        throw TransportError("Malformed status line: " + std::string(statusLine));
    }
    std::string_view code = statusLine.substr(9, 3);
    if (!std::all_of(code.begin(), code.end(), [](unsigned char c)
                     { return std::isdigit(c); }))
    {
        throw TransportError("Malformed status code: " + std::string(statusLine));
    }
    response.statusCode = std::stoi(std::string(code));
    if (statusLine.size() > 13)
    {
        response.reason = std::string(statusLine.substr(13));
    }

    while (lineEnd != std::string_view::npos)
    {
        size_t lineStart = lineEnd + 2;
        lineEnd = head.find("\r\n", lineStart);
        std::string_view line = head.substr(lineStart, lineEnd == std::string_view::npos
                                                           ? std::string_view::npos
                                                           : lineEnd - lineStart);
        if (line.empty())
        {
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0)
        {
            throw TransportError("Malformed header line: " + std::string(line));
        }
        response.headers.insert_or_assign(std::string(trim(line.substr(0, colon))),
                                          std::string(trim(line.substr(colon + 1))));
    }
    return response;
}

[[nodiscard]]
bool Http::hasBody(int statusCode)
{
    return statusCode >= 200 && statusCode != 204 && statusCode != 304;
}

[[nodiscard]]
std::optional<std::string> Http::decodeChunked(std::string_view data)
{
    std::string decoded;
    size_t pos = 0;

    while (true)
    {
        size_t lineEnd = data.find("\r\n", pos);
        if (lineEnd == std::string_view::npos)
        {
            return std::nullopt;
        }

        // chunk-size [; chunk-ext]
        std::string_view sizeField = trim(data.substr(pos, lineEnd - pos));
        sizeField = trim(sizeField.substr(0, sizeField.find(';')));
        if (sizeField.empty() || sizeField.size() > 15 ||
            !std::all_of(sizeField.begin(), sizeField.end(), [](unsigned char c)
                         { return std::isxdigit(c); }))
        {
            throw TransportError("Malformed chunk size: " + std::string(sizeField));
        }
        const size_t chunkSize = std::stoull(std::string(sizeField), nullptr, 16);
        pos = lineEnd + 2;

        if (chunkSize == 0)
        {
            // skip trailer fields up to the terminating blank line
            while (true)
            {
                size_t trailerEnd = data.find("\r\n", pos);
                if (trailerEnd == std::string_view::npos)
                {
                    return std::nullopt;
                }
                if (trailerEnd == pos)
                {
                    return decoded;
                }
                pos = trailerEnd + 2;
            }
        }

        if (data.size() < pos + chunkSize + 2)
        {
            return std::nullopt;
        }
        if (data.substr(pos + chunkSize, 2) != "\r\n")
        {
            throw TransportError("Chunk not terminated by CRLF");
        }
        decoded.append(data.substr(pos, chunkSize));
        pos += chunkSize + 2;
    }
}

[[nodiscard]]
std::pair<std::string, int> Http::splitHostPort(const std::string &host, int defaultPort)
{
    std::string name;
    std::string portText;

    if (!host.empty() && host.front() == '[') // [ipv6]:port
    {
        size_t close = host.find(']');
        if (close == std::string::npos)
        {
            throw TransportError("Invalid host: " + host);
        }
        name = host.substr(1, close - 1);
        if (close + 1 < host.size())
        {
            if (host[close + 1] != ':')
            {
                throw TransportError("Invalid host: " + host);
            }
            portText = host.substr(close + 2);
        }
    }
    else
    {
        size_t colon = host.find(':');
        if (colon == std::string::npos || host.find(':', colon + 1) != std::string::npos)
        {
            return {host, defaultPort}; // plain name or bare ipv6 literal
        }
        name = host.substr(0, colon);
        portText = host.substr(colon + 1);
    }

    if (name.empty())
    {
        throw TransportError("Invalid host: " + host);
    }
    if (portText.empty() && host.back() != ':')
    {
        return {name, defaultPort};
    }
    if (portText.empty() || portText.size() > 5 ||
        !std::all_of(portText.begin(), portText.end(), [](unsigned char c)
                     { return std::isdigit(c); }))
    {
        throw TransportError("Invalid port in host: " + host);
    }
    int port = std::stoi(portText);
    if (port <= 0 || port > 65535)
    {
        throw TransportError("Invalid port in host: " + host);
    }
    return {name, port};
}

[[nodiscard]]
std::string Http::readBody(Socket &socket, const HttpResponse &response, std::string received)
{
    std::unique_ptr<char[]> buffer(new char[BUFFER_SIZE]);
    auto readMore = [&]() -> bool
    {
        size_t n = socket.receive(buffer.get(), BUFFER_SIZE);
        received.append(buffer.get(), n);
        return n > 0;
    };

    auto transferEncoding = response.header(HttpHeader::TRANSFER_ENCODING);
    if (transferEncoding && containsToken(*transferEncoding, "chunked"))
    {
        while (true)
        {
            if (auto decoded = decodeChunked(received))
            {
                return std::move(*decoded);
            }
            if (!readMore())
            {
                throw TransportError("Connection closed inside chunked body");
            }
        }
    }

    if (auto contentLength = response.header(HttpHeader::CONTENT_LENGTH))
    {
        size_t expected = 0;
        try
        {
            expected = std::stoull(*contentLength);
        }
        catch (const std::exception &)
        {
            throw TransportError("Invalid Content-Length: " + *contentLength);
        }

        while (received.size() < expected)
        {
            if (!readMore())
            {
                throw TransportError("Connection closed after " + std::to_string(received.size()) +
                                     " of " + std::to_string(expected) + " body bytes");
            }
        }
        received.resize(expected);
        return received;
    }

    // no framing, the body ends with the connection
    while (readMore())
    {
    }
    return received;
}

[[nodiscard]]
HttpResponse Http::readResponse(Socket &socket)
{
    std::unique_ptr<char[]> buffer(new char[BUFFER_SIZE]);
    std::string received;
    HttpResponse response;

    // interim 1xx responses are skipped until the final one arrives
    do
    {
        size_t headEnd = received.find("\r\n\r\n");
        while (headEnd == std::string::npos)
        {
            if (received.size() > MAX_HEAD_SIZE)
            {
                throw TransportError("Response headers exceed " + std::to_string(MAX_HEAD_SIZE) + " bytes");
            }
            size_t n = socket.receive(buffer.get(), BUFFER_SIZE);
            if (n == 0)
            {
                throw TransportError("Connection closed before response headers were complete");
            }
            // resume the search just before the newly received bytes
            size_t searchFrom = received.size() > 3 ? received.size() - 3 : 0;
            received.append(buffer.get(), n);
            headEnd = received.find("\r\n\r\n", searchFrom);
        }

        response = parseResponseHead(std::string_view(received).substr(0, headEnd));
        received.erase(0, headEnd + 4);
    } while (response.statusCode < 200);

    if (!hasBody(response.statusCode))
    {
        return response;
    }

    std::string body = readBody(socket, response, std::move(received));

    auto contentEncoding = response.header(HttpHeader::CONTENT_ENCODING);
    if (contentEncoding && !body.empty() && Compression::canDecode(*contentEncoding))
    {
        body = Compression::decompress(body, *contentEncoding);
    }
    else if (contentEncoding && *contentEncoding != "identity")
    {
        Logger::getInstance()->warning("Passing through body with Content-Encoding " +
                                           *contentEncoding,
                                       socket.getHost());
    }

    response.body = std::move(body);
    return response;
}

HttpClient::HttpClient(HttpClientOptions options) : options(std::move(options))
{
}

HttpResponse HttpClient::send(const std::string &host, const std::string &path,
                              const HeaderMap &headers)
{
    auto startTime = std::chrono::steady_clock::now();
    auto [name, port] = Http::splitHostPort(host, options.useTls ? 443 : 80);

    // the connection is released when this scope ends, on every path
    std::unique_ptr<Socket> socket;
    if (options.useTls)
    {
        socket = std::make_unique<TlsSocket>(name, port, options.timeout);
    }
    else
    {
        socket = std::make_unique<Socket>(name, port, options.timeout);
    }

    socket->connect();
    socket->sendAll(Http::buildRequest(host, path, headers, options.userAgent,
                                       options.acceptEncoding));
    HttpResponse response = Http::readResponse(*socket);

    Logger::getInstance()->debug(
        "Response received: status=" + std::to_string(response.statusCode) +
            ", path=" + path +
            ", bytes=" + std::to_string(response.body ? response.body->size() : 0) +
            ", time=" + Socket::durationToString(std::chrono::steady_clock::now() - startTime),
        host);
    return response;
}
