// src/validation.hpp
// Internal config validation functions.

#pragma once

#include "logwire/error.hpp"
#include <cctype>
#include <string>

namespace logwire {
namespace validation {

// Host and process names are single SYSLOG header fields.
inline bool check_header_field(const std::string& value) {
    for (char c : value) {
        if (std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Empty means "autodetect".
inline bool check_network(const std::string& network) {
    static const char* const KNOWN[] = {"", "unix", "unixgram", "tcp", "tcp4", "tcp6",
                                        "udp", "udp4", "udp6"};
    for (const char* n : KNOWN) {
        if (network == n) return true;
    }
    return false;
}

// Split "network:address" and strip a leading "//" from the address.
inline void split_target_spec(const std::string& spec, std::string& network, std::string& address) {
    if (spec.empty()) {
        network.clear();
        address.clear();
        return;
    }

    auto colon = spec.find(':');
    if (colon == std::string::npos) {
        throw SyslogError::configuration("target must be of form 'network:address', got: " + spec);
    }

    network = spec.substr(0, colon);
    address = spec.substr(colon + 1);
    if (address.compare(0, 2, "//") == 0) {
        address.erase(0, 2);
    }
}

} // namespace validation
} // namespace logwire
