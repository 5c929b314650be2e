#ifndef ETAGCACHE_SOCKET_HPP
#define ETAGCACHE_SOCKET_HPP

#include "common.hpp"
#include "errors.hpp"
#include "logger.hpp"

// Client TCP connection, closed on destruction.
// All failures throw TransportError.
class Socket
{
public:
    Socket(std::string host, int port, std::chrono::milliseconds timeout);
    virtual ~Socket();

    Socket(const Socket &) = delete;
    Socket &operator=(const Socket &) = delete;

    // resolve host and connect within the timeout
    virtual void connect();

    // send every byte of data
    virtual void sendAll(std::string_view data);

    // read up to length bytes, 0 on orderly close
    [[nodiscard]] virtual size_t receive(char *buffer, size_t length);

    void closeSocket();
    [[nodiscard]] int getSocketFd() const;
    [[nodiscard]] const std::string &getHost() const;

    static std::string durationToString(const std::chrono::steady_clock::duration &duration);

    // writes OpenSSL makes to a reset peer must fail with EPIPE instead of raising SIGPIPE
    static void ignoreBrokenPipe();

protected:
    int fd;                            // Connected socket file descriptor
    std::string host;                  // Host name to resolve
    int port;                          // Port number
    std::chrono::milliseconds timeout; // Connect, send and receive timeout

private:
    [[nodiscard]] bool tryConnect(const struct addrinfo &address);
};

// TLS client connection on top of Socket
class TlsSocket : public Socket
{
public:
    TlsSocket(std::string host, int port, std::chrono::milliseconds timeout);
    ~TlsSocket() override;

    // TCP connect followed by the TLS handshake with SNI and host name verification
    void connect() override;
    void sendAll(std::string_view data) override;
    [[nodiscard]] size_t receive(char *buffer, size_t length) override;

private:
    struct ContextDeleter
    {
        void operator()(SSL_CTX *ctx) const noexcept { SSL_CTX_free(ctx); }
    };
    struct SslDeleter
    {
        void operator()(SSL *ssl) const noexcept { SSL_free(ssl); }
    };

    std::unique_ptr<SSL_CTX, ContextDeleter> context;
    std::unique_ptr<SSL, SslDeleter> ssl;

    [[nodiscard]] static std::string lastError(std::string_view what);
};

#endif // ETAGCACHE_SOCKET_HPP
