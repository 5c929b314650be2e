#include <gtest/gtest.h>

#include "socket.hpp"

namespace
{
    // Socket wrapping one end of a local socket pair
    class PairedSocket : public Socket
    {
    public:
        explicit PairedSocket(int connectedFd)
            : Socket("peer.test", 0, std::chrono::milliseconds(100))
        {
            fd = connectedFd;
        }
    };
}

// Writing to a peer that went away is a transport error
TEST(Socket, SendToClosedPeer)
{
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    PairedSocket socket(fds[0]);
    close(fds[1]);

    EXPECT_THROW(socket.sendAll("GET / HTTP/1.1\r\n\r\n"), TransportError);
}

// An orderly close reads as zero bytes
TEST(Socket, ReceiveAfterPeerClose)
{
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    PairedSocket socket(fds[0]);
    ASSERT_EQ(write(fds[1], "ok", 2), 2);
    close(fds[1]);

    char buffer[16];
    EXPECT_EQ(socket.receive(buffer, sizeof(buffer)), 2u);
    EXPECT_EQ(socket.receive(buffer, sizeof(buffer)), 0u);
}

// Plain writes to a closed peer fail with EPIPE and leave the process running
TEST(Socket, BrokenPipeIsIgnored)
{
    Socket::ignoreBrokenPipe();

    struct sigaction current;
    ASSERT_EQ(sigaction(SIGPIPE, nullptr, &current), 0);
    EXPECT_TRUE(current.sa_handler == SIG_IGN);

    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    close(fds[1]);

    errno = 0;
    EXPECT_EQ(write(fds[0], "x", 1), -1);
    EXPECT_EQ(errno, EPIPE);
    close(fds[0]);
}
