// ============================================================================
// TRANSPORT UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include "transport/transport.hpp"

using namespace hoststatsd::transport;

namespace {

// Bound UDP socket on an ephemeral loopback port.
class UdpReceiver {
public:
    UdpReceiver() {
        fd_ = socket(AF_INET, SOCK_DGRAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));

        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        timeval tv{};
        tv.tv_sec = 2;
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }
    ~UdpReceiver() { close(fd_); }

    uint16_t port() const { return port_; }

    std::string receive() {
        char buf[2048];
        ssize_t n = recv(fd_, buf, sizeof(buf), 0);
        return n > 0 ? std::string(buf, static_cast<size_t>(n)) : std::string();
    }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

} // namespace

TEST(JoinLines, NewlineSeparated) {
    EXPECT_EQ(join_lines({}), "");
    EXPECT_EQ(join_lines({"a:1|c"}), "a:1|c");
    EXPECT_EQ(join_lines({"a:1|c", "b:2|g"}), "a:1|c\nb:2|g");
}

TEST(UdpTransport, SendsLinesAsOneDatagram) {
    UdpReceiver receiver;
    UdpTransport transport("127.0.0.1", receiver.port());
    EXPECT_EQ(transport.destination(), "127.0.0.1:" + std::to_string(receiver.port()));

    transport.send(std::vector<std::string>{"ram._t_hostname.h1:0.5|c", "swap._t_hostname.h1:0.1|c"});
    EXPECT_EQ(receiver.receive(), "ram._t_hostname.h1:0.5|c\nswap._t_hostname.h1:0.1|c");

    transport.send(std::string("uptime._t_hostname.h1:10|c"));
    EXPECT_EQ(receiver.receive(), "uptime._t_hostname.h1:10|c");
}

TEST(UdpTransport, SendAfterCloseIsDropped) {
    UdpReceiver receiver;
    UdpTransport transport("127.0.0.1", receiver.port());
    transport.close();
    EXPECT_NO_THROW(transport.send(std::string("uptime._t_hostname.h1:10|c")));
}
