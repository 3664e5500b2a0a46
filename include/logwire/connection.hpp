// include/logwire/connection.hpp
// Transport seam: connection handle, dial target and dial function.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace logwire {

// A (network, address) pair a client may dial, e.g. {"unixgram", "/dev/log"}
// or {"udp", "192.0.2.1:514"}.
struct Target {
    std::string network;
    std::string address;

    bool operator==(const Target& other) const {
        return network == other.network && address == other.address;
    }
    bool operator!=(const Target& other) const { return !(*this == other); }
};

// A live transport handle. Destroying it closes the underlying connection.
class Connection {
public:
    virtual ~Connection() = default;

    // Write one complete formatted message. Throws on failure; a throw means
    // the connection is no longer usable.
    virtual void write(const uint8_t* data, size_t len) = 0;

    // Network kind of the established connection ("tcp", "udp", "unix",
    // "unixgram"). An empty string means unknown; the dialled target's
    // network is used instead.
    virtual std::string network() const { return std::string(); }
};

using Deadline = std::chrono::steady_clock::time_point;

// Establish a connection to `target` before `deadline`. Throws on failure.
using DialFunc = std::function<std::unique_ptr<Connection>(const Target& target,
                                                           Deadline deadline)>;

// The built-in POSIX socket dialer used when no DialFunc is configured.
// Supports tcp, tcp4, tcp6, udp, udp4, udp6, unix and unixgram.
// Throws SyslogError (ErrorKind::Connect).
std::unique_ptr<Connection> dial_socket(const Target& target, Deadline deadline);

} // namespace logwire
