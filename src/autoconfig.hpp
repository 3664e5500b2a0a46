// src/autoconfig.hpp
// Per-connection resolution of the config's auto values.

#pragma once

#include "logwire/config.hpp"
#include "logwire/types.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace logwire {

// Concrete formatting settings for one established connection. Computed from
// the Config and the connection's actual network; never Auto.
struct ResolvedSettings {
    Protocol protocol = Protocol::V1Net;
    Framing framing = Framing::None;
    BomMode bom_mode = BomMode::Never;
    std::string host_name;
    std::string proc_name;
};

ResolvedSettings resolve_settings(const Config& config, const std::string& actual_network);

// The machine's host name, or "" if it cannot be determined.
std::string local_host_name();

// Seconds east of UTC in effect at `time` for the given zone.
int32_t utc_offset_at(std::chrono::system_clock::time_point time, TimeZone zone);

} // namespace logwire
