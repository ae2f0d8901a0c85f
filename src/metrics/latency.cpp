#include "metrics/metrics.hpp"
#include <cerrno>
#include <cmath>
#include <cstring>
#include <memory>
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hoststatsd::metrics {

namespace {

// Closes the probe socket on every exit path.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) close(fd_);
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

} // namespace

double ProcHostProvider::latency_ms() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    std::string port = std::to_string(latency_target_.port);
    int rc = getaddrinfo(latency_target_.host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0) {
        throw ProviderError("cannot resolve " + latency_target_.host + ": " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addrs(res, &freeaddrinfo);

    SocketGuard sock(socket(addrs->ai_family, addrs->ai_socktype | SOCK_NONBLOCK, addrs->ai_protocol));
    if (sock.get() < 0) {
        throw ProviderError(std::string("socket: ") + std::strerror(errno));
    }

    auto start = clock_();
    if (connect(sock.get(), addrs->ai_addr, addrs->ai_addrlen) != 0 && errno != EINPROGRESS) {
        throw ProviderError("connect to " + latency_target_.host + ": " + std::strerror(errno));
    }

    pollfd pfd{};
    pfd.fd = sock.get();
    pfd.events = POLLOUT;
    int ready = poll(&pfd, 1, static_cast<int>(latency_target_.timeout.count()));
    if (ready == 0) {
        throw ProviderError("latency probe to " + latency_target_.host + " timed out");
    }
    if (ready < 0) {
        throw ProviderError(std::string("poll: ") + std::strerror(errno));
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
        throw ProviderError(std::string("getsockopt: ") + std::strerror(errno));
    }
    if (so_error != 0) {
        throw ProviderError("connect to " + latency_target_.host + ": " + std::strerror(so_error));
    }

    double elapsed = std::chrono::duration<double, std::milli>(clock_() - start).count();
    spdlog::debug("Latency to {}:{} is {:.3f} ms", latency_target_.host, latency_target_.port, elapsed);
    return std::round(elapsed * 100.0) / 100.0;
}

} // namespace hoststatsd::metrics
