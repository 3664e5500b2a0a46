// src/transport.cpp
// Built-in socket dialer: TCP, UDP and UNIX domain sockets.

#include "transport.hpp"
#include "targets.hpp"
#include "logwire/error.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace logwire {

namespace {

std::string errno_message(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

int remaining_ms(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) return 0;
    if (left > 0x7fffffff) return 0x7fffffff;
    return static_cast<int>(left);
}

// Non-blocking connect bounded by the deadline, then back to blocking mode.
// Returns an errno value, 0 on success.
int connect_with_deadline(int fd, const struct sockaddr* addr, socklen_t addrlen,
                          Deadline deadline) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return errno;
    if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return errno;

    int ret = ::connect(fd, addr, addrlen);
    // A UNIX stream listener with a full backlog refuses immediately with
    // EAGAIN instead of going into EINPROGRESS; keep retrying until the deadline.
    while (ret != 0 && errno == EAGAIN) {
        int left = remaining_ms(deadline);
        if (left == 0) return ETIMEDOUT;
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(left, 10)));
        ret = ::connect(fd, addr, addrlen);
    }
    if (ret != 0) {
        if (errno != EINPROGRESS) return errno;

        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int poll_ret;
        do {
            poll_ret = ::poll(&pfd, 1, remaining_ms(deadline));
        } while (poll_ret < 0 && errno == EINTR);
        if (poll_ret < 0) return errno;
        if (poll_ret == 0) return ETIMEDOUT;

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) return errno;
        if (so_error != 0) return so_error;
    }

    if (::fcntl(fd, F_SETFL, flags) < 0) return errno;
    return 0;
}

std::unique_ptr<Connection> dial_unix(const Target& target, Deadline deadline) {
    bool stream = target.network == "unix";

    struct sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (target.address.size() >= sizeof(addr.sun_path)) {
        throw SyslogError::connect("socket path too long: " + target.address);
    }
    std::memcpy(addr.sun_path, target.address.c_str(), target.address.size() + 1);

    int fd = ::socket(AF_UNIX, (stream ? SOCK_STREAM : SOCK_DGRAM) | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw SyslogError::connect(errno_message("socket", errno));
    }

    int err = connect_with_deadline(fd, reinterpret_cast<struct sockaddr*>(&addr),
                                    sizeof(addr), deadline);
    if (err != 0) {
        ::close(fd);
        throw SyslogError::connect(errno_message(target.network + " " + target.address, err));
    }

    return std::make_unique<SocketConnection>(fd, target.network, stream);
}

std::unique_ptr<Connection> dial_inet(const Target& target, Deadline deadline) {
    const auto& network = target.network;
    bool stream = network.compare(0, 3, "tcp") == 0;

    struct addrinfo hints{};
    if (network == "tcp4" || network == "udp4") {
        hints.ai_family = AF_INET;
    } else if (network == "tcp6" || network == "udp6") {
        hints.ai_family = AF_INET6;
    } else {
        hints.ai_family = AF_UNSPEC;
    }
    hints.ai_socktype = stream ? SOCK_STREAM : SOCK_DGRAM;
    hints.ai_protocol = stream ? IPPROTO_TCP : IPPROTO_UDP;

    std::string host, port;
    if (!split_host_port(target.address, host, port) || port.empty()) {
        throw SyslogError::connect("address must be host:port, got: " + target.address);
    }

    struct addrinfo* res = nullptr;
    int err = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        throw SyslogError::connect("DNS resolution failed for " + host + ": " + ::gai_strerror(err));
    }

    // Try each resolved address (IPv6/IPv4) until one connects.
    std::string first_error;
    for (struct addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
        if (std::chrono::steady_clock::now() >= deadline) {
            if (first_error.empty()) first_error = errno_message("connect " + target.address, ETIMEDOUT);
            break;
        }

        int fd = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
        if (fd < 0) {
            if (first_error.empty()) first_error = errno_message("socket", errno);
            continue;
        }

        int cerr = stream ? connect_with_deadline(fd, rp->ai_addr, rp->ai_addrlen, deadline)
                          : (::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0 ? 0 : errno);
        if (cerr != 0) {
            ::close(fd);
            if (first_error.empty()) first_error = errno_message("connect " + target.address, cerr);
            continue;
        }

        if (stream) {
            int nodelay = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
            int keepalive = 1;
            ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
        }

        ::freeaddrinfo(res);
        return std::make_unique<SocketConnection>(fd, stream ? "tcp" : "udp", stream);
    }

    ::freeaddrinfo(res);
    throw SyslogError::connect(first_error.empty() ? "connect failed to " + target.address
                                                   : first_error);
}

} // namespace

// --- SocketConnection ---

SocketConnection::SocketConnection(int fd, std::string network, bool stream)
    : socket_fd_(fd), network_(std::move(network)), stream_(stream) {}

SocketConnection::~SocketConnection() {
    close_socket();
}

void SocketConnection::close_socket() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

void SocketConnection::write(const uint8_t* data, size_t len) {
    if (socket_fd_ < 0) {
        throw SyslogError::write("connection is closed");
    }

    if (!stream_) {
        ssize_t n;
        do {
            n = ::send(socket_fd_, data, len, MSG_NOSIGNAL);
        } while (n < 0 && errno == EINTR);
        if (n < 0) {
            throw SyslogError::write(errno_message("send", errno));
        }
        if (static_cast<size_t>(n) != len) {
            throw SyslogError::write("short datagram write");
        }
        return;
    }

    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(socket_fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            int err = n < 0 ? errno : EPIPE;
            close_socket();
            throw SyslogError::write(errno_message("send", err));
        }
        sent += static_cast<size_t>(n);
    }
}

// --- Dialer ---

std::unique_ptr<Connection> dial_socket(const Target& target, Deadline deadline) {
    if (is_local_network(target.network)) {
        return dial_unix(target, deadline);
    }

    static const char* const INET_NETWORKS[] = {"tcp", "tcp4", "tcp6", "udp", "udp4", "udp6"};
    bool known = std::any_of(std::begin(INET_NETWORKS), std::end(INET_NETWORKS),
                             [&](const char* n) { return target.network == n; });
    if (!known) {
        throw SyslogError::connect("unsupported network: " + target.network);
    }
    return dial_inet(target, deadline);
}

} // namespace logwire
