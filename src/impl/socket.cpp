#include "socket.hpp"

Socket::Socket(std::string host, int port, std::chrono::milliseconds timeout)
    : fd(-1), host(std::move(host)), port(port), timeout(timeout)
{
}

Socket::~Socket()
{
    closeSocket();
}

bool Socket::tryConnect(const struct addrinfo &address)
{
    fd = socket(address.ai_family, address.ai_socktype | SOCK_CLOEXEC, address.ai_protocol);
    if (fd == -1)
    {
        Logger::getInstance()->debug("Socket creation failed: " + std::string(strerror(errno)), host);
        return false;
    }

    // set non-blocking mode so the connect can time out
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
    {
        closeSocket();
        return false;
    }

    if (::connect(fd, address.ai_addr, address.ai_addrlen) < 0)
    {
        if (errno != EINPROGRESS)
        {
            Logger::getInstance()->debug("Connect failed: " + std::string(strerror(errno)), host);
            closeSocket();
            return false;
        }

        // wait for connection with timeout
        struct pollfd pfd{fd, POLLOUT, 0};
        int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
        int soError = 0;
        socklen_t soLen = sizeof(soError);
        if (ready <= 0 ||
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &soLen) < 0 ||
            soError != 0)
        {
            Logger::getInstance()->debug("Connect failed: " +
                                             std::string(ready == 0 ? "timed out" : strerror(soError != 0 ? soError : errno)),
                                         host);
            closeSocket();
            return false;
        }
    }

    // restore blocking mode
    if (fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0)
    {
        closeSocket();
        return false;
    }
    return true;
}

void Socket::connect()
{
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC; // ipv6 or ipv4
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo *result = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0)
    {
        throw TransportError("Could not resolve " + host + ": " + gai_strerror(rc));
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addresses(result, freeaddrinfo);

    for (const struct addrinfo *ai = addresses.get(); ai != nullptr; ai = ai->ai_next)
    {
        if (tryConnect(*ai))
        {
            break;
        }
    }
    if (fd == -1)
    {
        throw TransportError("Could not connect to " + host + ":" + service);
    }

    // lambda for handling setsockopt calls
    auto setSocketOption = [this](int level, int optname, const void *optval,
                                  socklen_t optlen, const char *errorMsg)
    {
        if (setsockopt(fd, level, optname, optval, optlen) < 0)
        {
            throw TransportError(std::string(errorMsg) + ": " +
                                 std::string(strerror(errno)));
        }
    };

    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setSocketOption(SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv), "Failed to set SO_RCVTIMEO");
    setSocketOption(SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv), "Failed to set SO_SNDTIMEO");

    // requests are written in one piece, don't delay them
    int opt = 1;
    setSocketOption(IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt), "Failed to set TCP_NODELAY");

    Logger::getInstance()->debug("Connected to port " + service, host);
}

void Socket::sendAll(std::string_view data)
{
    size_t totalSent = 0;
    while (totalSent < data.size())
    {
        ssize_t sent = send(fd, data.data() + totalSent, data.size() - totalSent, MSG_NOSIGNAL);
        if (sent < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw TransportError("Send failed: " + std::string(strerror(errno)));
        }
        totalSent += static_cast<size_t>(sent);
    }
}

size_t Socket::receive(char *buffer, size_t length)
{
    while (true)
    {
        ssize_t received = recv(fd, buffer, length, 0);
        if (received >= 0)
        {
            return static_cast<size_t>(received);
        }
        if (errno == EINTR)
        {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            throw TransportError("Timed out waiting for " + host);
        }
        throw TransportError("Receive failed: " + std::string(strerror(errno)));
    }
}

void Socket::closeSocket()
{
    if (fd != -1)
    {
        close(fd);
        fd = -1;
    }
}

int Socket::getSocketFd() const
{
    return fd;
}

const std::string &Socket::getHost() const
{
    return host;
}

std::string Socket::durationToString(const std::chrono::steady_clock::duration &duration)
{
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    auto seconds = millis / 1000;
    millis %= 1000;
    return std::to_string(seconds) + "s " + std::to_string(millis) + "ms";
}

void Socket::ignoreBrokenPipe()
{
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_IGN;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGPIPE, &sa, nullptr) < 0)
    {
        throw std::runtime_error("Failed to ignore SIGPIPE: " + std::string(strerror(errno)));
    }
}

TlsSocket::TlsSocket(std::string host, int port, std::chrono::milliseconds timeout)
    : Socket(std::move(host), port, timeout)
{
}

TlsSocket::~TlsSocket()
{
    if (ssl)
    {
        SSL_shutdown(ssl.get()); // best effort close_notify
    }
}

std::string TlsSocket::lastError(std::string_view what)
{
    unsigned long code = ERR_get_error();
    std::string message(what);
    if (code != 0)
    {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        message += ": ";
        message += buffer;
    }
    ERR_clear_error();
    return message;
}

void TlsSocket::connect()
{
    Socket::connect();

    context.reset(SSL_CTX_new(TLS_client_method()));
    if (!context)
    {
        throw TransportError(lastError("SSL_CTX_new() failed"));
    }
    SSL_CTX_set_verify(context.get(), SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(context.get()) != 1)
    {
        throw TransportError(lastError("Failed to load CA certificates"));
    }
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // many servers close without close_notify after Connection: close
    SSL_CTX_set_options(context.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    ssl.reset(SSL_new(context.get()));
    if (!ssl)
    {
        throw TransportError(lastError("SSL_new() failed"));
    }
    if (SSL_set_tlsext_host_name(ssl.get(), host.c_str()) != 1 ||
        SSL_set1_host(ssl.get(), host.c_str()) != 1 ||
        SSL_set_fd(ssl.get(), fd) != 1)
    {
        throw TransportError(lastError("Failed to configure TLS session"));
    }

    if (SSL_connect(ssl.get()) != 1)
    {
        throw TransportError(lastError("TLS handshake with " + host + " failed"));
    }

    Logger::getInstance()->debug(std::string("TLS session established: ") + SSL_get_version(ssl.get()),
                                 host);
}

void TlsSocket::sendAll(std::string_view data)
{
    size_t totalSent = 0;
    while (totalSent < data.size())
    {
        size_t written = 0;
        if (SSL_write_ex(ssl.get(), data.data() + totalSent, data.size() - totalSent, &written) != 1)
        {
            throw TransportError(lastError("TLS write failed"));
        }
        totalSent += written;
    }
}

size_t TlsSocket::receive(char *buffer, size_t length)
{
    size_t received = 0;
    errno = 0;
    if (SSL_read_ex(ssl.get(), buffer, length, &received) == 1)
    {
        return received;
    }

    switch (SSL_get_error(ssl.get(), 0))
    {
    case SSL_ERROR_ZERO_RETURN:
        return 0; // peer sent close_notify
    case SSL_ERROR_WANT_READ:
    case SSL_ERROR_WANT_WRITE:
        throw TransportError("Timed out waiting for " + host);
    case SSL_ERROR_SYSCALL:
        if (ERR_peek_error() == 0 && errno == 0)
        {
            return 0; // eof without close_notify
        }
        break;
    default:
        break;
    }
    throw TransportError(lastError("TLS read failed"));
}
