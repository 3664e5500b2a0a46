// src/targets.hpp
// Dial target resolution and the local-socket platform capability.

#pragma once

#include "logwire/connection.hpp"
#include <string>
#include <vector>

namespace logwire {

// Whether the platform has UNIX domain sockets, and where a system syslog
// daemon normally listens.
class LocalSocketSupport {
public:
    virtual ~LocalSocketSupport() = default;

    virtual bool available() const noexcept = 0;

    // Standard daemon socket paths, most common first.
    virtual std::vector<std::string> standard_paths() const = 0;

    // The implementation for the running platform.
    static const LocalSocketSupport& host();
};

class PosixLocalSockets : public LocalSocketSupport {
public:
    bool available() const noexcept override { return true; }
    std::vector<std::string> standard_paths() const override {
        return {"/dev/log", "/var/run/syslog", "/var/run/log"};
    }
};

class NoLocalSockets : public LocalSocketSupport {
public:
    bool available() const noexcept override { return false; }
    std::vector<std::string> standard_paths() const override { return {}; }
};

inline bool is_local_network(const std::string& network) {
    return network == "unix" || network == "unixgram";
}

// Transports which preserve message boundaries and so need no framing.
inline bool is_message_oriented(const std::string& network) {
    return network == "unix" || network == "unixgram" ||
           network == "udp" || network == "udp4" || network == "udp6";
}

// Turn the configured (network, address) into dial candidates, most preferred
// first. Throws SyslogError (ErrorKind::Configuration).
std::vector<Target> resolve_targets(const std::string& network, const std::string& address,
                                    const LocalSocketSupport& local_sockets);

// Split "host:port", "[v6]:port", "host", "[v6]" or a bare IPv6 literal.
// Returns false for malformed input. `port` is empty if none was given.
bool split_host_port(const std::string& address, std::string& host, std::string& port);

} // namespace logwire
