#include "transport/transport.hpp"
#include <cerrno>
#include <cstring>
#include <spdlog/spdlog.h>
#include <netdb.h>
#include <unistd.h>

namespace hoststatsd::transport {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string payload;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) payload += '\n';
        payload += lines[i];
    }
    return payload;
}

UdpTransport::UdpTransport(const std::string& host, uint16_t port)
    : destination_(host + ":" + std::to_string(port)) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;

    addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0) {
        throw TransportError("cannot resolve " + destination_ + ": " + gai_strerror(rc));
    }

    std::memcpy(&addr_, res->ai_addr, res->ai_addrlen);
    addr_len_ = res->ai_addrlen;
    fd_ = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    freeaddrinfo(res);

    if (fd_ < 0) {
        throw TransportError(std::string("failed to create UDP socket: ") + std::strerror(errno));
    }
    spdlog::debug("UDP transport ready (destination={})", destination_);
}

UdpTransport::~UdpTransport() {
    close();
}

void UdpTransport::send(const std::vector<std::string>& lines) {
    if (lines.empty()) return;
    if (fd_ < 0) {
        spdlog::warn("Dropping {} line(s): transport closed", lines.size());
        return;
    }

    std::string payload = join_lines(lines);
    ssize_t sent = sendto(fd_, payload.data(), payload.size(), 0,
                          reinterpret_cast<const sockaddr*>(&addr_), addr_len_);
    if (sent < 0) {
        spdlog::warn("Send to {} failed: {}", destination_, std::strerror(errno));
    }
}

void UdpTransport::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void LogTransport::send(const std::vector<std::string>& lines) {
    if (lines.empty()) return;
    spdlog::info("{}", join_lines(lines));
}

} // namespace hoststatsd::transport
