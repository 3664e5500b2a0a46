// src/transport.hpp
// POSIX socket connection used by the built-in dialer.

#pragma once

#include "logwire/connection.hpp"
#include <cstdint>
#include <string>

namespace logwire {

// One connected socket. Stream sockets write in a loop until the whole
// message is sent; datagram sockets send the message as a single datagram.
class SocketConnection : public Connection {
public:
    SocketConnection(int fd, std::string network, bool stream);
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    void write(const uint8_t* data, size_t len) override;
    std::string network() const override { return network_; }

private:
    void close_socket();

    int socket_fd_ = -1;
    std::string network_;
    bool stream_;
};

} // namespace logwire
