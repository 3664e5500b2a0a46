// src/autoconfig.cpp
// Per-connection resolution of the config's auto values.

#include "autoconfig.hpp"
#include "targets.hpp"

#include <ctime>
#include <unistd.h>

namespace logwire {

ResolvedSettings resolve_settings(const Config& config, const std::string& actual_network) {
    ResolvedSettings settings;
    settings.protocol = resolve_protocol(config.protocol(), is_local_network(actual_network));
    settings.framing = resolve_framing(config.framing(), !is_message_oriented(actual_network));
    settings.bom_mode = resolve_bom_mode(config.bom_mode(), settings.protocol);

    settings.host_name = config.host_name().empty() ? local_host_name() : config.host_name();
    settings.proc_name = config.proc_name();
    return settings;
}

std::string local_host_name() {
    char buf[256];
    if (::gethostname(buf, sizeof(buf)) != 0) {
        return std::string();
    }
    buf[sizeof(buf) - 1] = '\0';
    return std::string(buf);
}

int32_t utc_offset_at(std::chrono::system_clock::time_point time, TimeZone zone) {
    if (zone == TimeZone::Utc) return 0;

    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    if (::localtime_r(&t, &tm) == nullptr) return 0;
    return static_cast<int32_t>(tm.tm_gmtoff);
}

} // namespace logwire
