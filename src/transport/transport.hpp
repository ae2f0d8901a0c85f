#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/socket.h>

namespace hoststatsd::transport {

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Outbound channel for encoded statsd lines. Delivery is never confirmed.
class Transport {
public:
    virtual ~Transport() = default;

    // Send the lines as one datagram, joined with '\n'.
    virtual void send(const std::vector<std::string>& lines) = 0;

    void send(const std::string& line) { send(std::vector<std::string>{line}); }

    virtual void close() {}
};

// Join lines into one datagram payload.
std::string join_lines(const std::vector<std::string>& lines);

/**
 * Fire-and-forget UDP sender
 *
 * The destination is resolved once at construction. Send failures are
 * logged and the datagram is dropped.
 */
class UdpTransport : public Transport {
public:
    // Throws TransportError if the destination cannot be resolved or no socket can be opened.
    UdpTransport(const std::string& host, uint16_t port);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    using Transport::send;
    void send(const std::vector<std::string>& lines) override;
    void close() override;

    const std::string& destination() const { return destination_; }

private:
    int fd_ = -1;
    sockaddr_storage addr_{};
    socklen_t addr_len_ = 0;
    std::string destination_;
};

// Logs every datagram at info level instead of sending it.
class LogTransport : public Transport {
public:
    using Transport::send;
    void send(const std::vector<std::string>& lines) override;
};

} // namespace hoststatsd::transport
