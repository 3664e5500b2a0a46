// src/targets.cpp
// Dial target resolution.

#include "targets.hpp"
#include "logwire/error.hpp"
#include "logwire/types.hpp"

#include <algorithm>

namespace logwire {

const LocalSocketSupport& LocalSocketSupport::host() {
#if defined(__unix__) || defined(__APPLE__)
    static const PosixLocalSockets support{};
#else
    static const NoLocalSockets support{};
#endif
    return support;
}

bool split_host_port(const std::string& address, std::string& host, std::string& port) {
    host.clear();
    port.clear();

    if (!address.empty() && address[0] == '[') {
        auto close = address.find(']');
        if (close == std::string::npos) return false;
        host = address.substr(1, close - 1);
        if (close + 1 == address.size()) return true;
        if (address[close + 1] != ':') return false;
        port = address.substr(close + 2);
        return !port.empty();
    }

    auto colons = std::count(address.begin(), address.end(), ':');
    if (colons == 0) {
        host = address;
        return true;
    }
    if (colons > 1) {
        // Bare IPv6 literal, no port.
        host = address;
        return true;
    }

    auto colon = address.find(':');
    host = address.substr(0, colon);
    port = address.substr(colon + 1);
    return !port.empty();
}

std::vector<Target> resolve_targets(const std::string& network, const std::string& address,
                                    const LocalSocketSupport& local_sockets) {
    bool local_request = network.empty() || is_local_network(network);
    bool path_like = address.empty() || address[0] == '/';

    if (local_request && path_like) {
        if (local_sockets.available()) {
            std::vector<Target> targets;
            for (const char* n : {"unixgram", "unix"}) {
                if (!network.empty() && network != n) continue;
                if (!address.empty()) {
                    targets.push_back(Target{n, address});
                } else {
                    for (const auto& path : local_sockets.standard_paths()) {
                        targets.push_back(Target{n, path});
                    }
                }
            }
            if (!targets.empty()) return targets;
        }
        if (!network.empty()) {
            throw SyslogError::configuration("network \"" + network +
                                             "\" is not supported on this platform");
        }
    }

    if (address.empty()) {
        throw SyslogError::configuration("no syslog address specified");
    }

    std::string resolved_network = network.empty() ? "udp" : network;

    std::string host, port;
    if (!split_host_port(address, host, port)) {
        throw SyslogError::configuration("malformed syslog address: " + address);
    }
    if (host.empty()) {
        throw SyslogError::configuration("syslog address has no host: " + address);
    }

    std::string resolved_address = address;
    if (port.empty()) {
        bool ipv6 = host.find(':') != std::string::npos;
        resolved_address = (ipv6 ? "[" + host + "]" : host) + ":" + std::to_string(DEFAULT_PORT);
    }

    return {Target{resolved_network, resolved_address}};
}

} // namespace logwire
