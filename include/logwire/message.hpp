// include/logwire/message.hpp
// A single SYSLOG message as supplied by the caller.

#pragma once

#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace logwire {

// The client performs no escaping: `id` and `structured_data` must not
// contain spaces or framing delimiters.
struct Message {
    // Unset means "now", taken when the message is written.
    std::optional<std::chrono::system_clock::time_point> time;

    Severity severity = Severity::Info;
    Facility facility = Facility::User;

    // Separate field for V1Net; folded into the body ("ID body") for V0.
    std::string id;

    std::string body;

    // Pre-encoded RFC 5424 structured data, e.g. [origin ip="192.0.2.1"].
    // Only emitted by V1Net.
    std::string structured_data;
};

} // namespace logwire
