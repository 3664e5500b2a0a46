// src/types.cpp
// Severity/facility parsing and auto-value resolution.

#include "logwire/types.hpp"
#include "logwire/error.hpp"

#include <cctype>

namespace logwire {

namespace {

struct SeverityName {
    const char* name;
    Severity value;
};

struct FacilityName {
    const char* name;
    Facility value;
};

// Canonical name first for each value.
constexpr SeverityName SEVERITY_NAMES[] = {
    {"emerg",     Severity::Emergency},
    {"emergency", Severity::Emergency},
    {"alert",     Severity::Alert},
    {"crit",      Severity::Critical},
    {"critical",  Severity::Critical},
    {"err",       Severity::Error},
    {"error",     Severity::Error},
    {"warning",   Severity::Warning},
    {"warn",      Severity::Warning},
    {"notice",    Severity::Notice},
    {"info",      Severity::Info},
    {"debug",     Severity::Debug},
};

constexpr FacilityName FACILITY_NAMES[] = {
    {"kern",     Facility::Kern},
    {"kernel",   Facility::Kern},
    {"user",     Facility::User},
    {"mail",     Facility::Mail},
    {"daemon",   Facility::Daemon},
    {"auth",     Facility::Auth},
    {"syslog",   Facility::Syslog},
    {"lpr",      Facility::Lpr},
    {"news",     Facility::News},
    {"uucp",     Facility::Uucp},
    {"cron",     Facility::Cron},
    {"authpriv", Facility::AuthPriv},
    {"ftp",      Facility::Ftp},
    {"ntp",      Facility::Ntp},
    {"logaudit", Facility::LogAudit},
    {"logalert", Facility::LogAlert},
    {"clock",    Facility::Clock},
    {"local0",   Facility::Local0},
    {"local1",   Facility::Local1},
    {"local2",   Facility::Local2},
    {"local3",   Facility::Local3},
    {"local4",   Facility::Local4},
    {"local5",   Facility::Local5},
    {"local6",   Facility::Local6},
    {"local7",   Facility::Local7},
};

bool equals_ignore_case(const std::string& s, const char* lower) noexcept {
    size_t i = 0;
    for (; i < s.size(); i++) {
        if (lower[i] == '\0') return false;
        auto c = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
        if (c != lower[i]) return false;
    }
    return lower[i] == '\0';
}

} // namespace

bool try_parse_severity(const std::string& name, Severity& out) noexcept {
    for (const auto& entry : SEVERITY_NAMES) {
        if (equals_ignore_case(name, entry.name)) {
            out = entry.value;
            return true;
        }
    }
    out = Severity::Debug;
    return false;
}

bool try_parse_facility(const std::string& name, Facility& out) noexcept {
    for (const auto& entry : FACILITY_NAMES) {
        if (equals_ignore_case(name, entry.name)) {
            out = entry.value;
            return true;
        }
    }
    out = Facility::Local7;
    return false;
}

Severity parse_severity(const std::string& name) {
    Severity value;
    if (!try_parse_severity(name, value)) {
        throw SyslogError::parse("severity", name);
    }
    return value;
}

Facility parse_facility(const std::string& name) {
    Facility value;
    if (!try_parse_facility(name, value)) {
        throw SyslogError::parse("facility", name);
    }
    return value;
}

const char* to_string(Severity severity) noexcept {
    for (const auto& entry : SEVERITY_NAMES) {
        if (entry.value == severity) return entry.name;
    }
    return "unknown";
}

const char* to_string(Facility facility) noexcept {
    for (const auto& entry : FACILITY_NAMES) {
        if (entry.value == facility) return entry.name;
    }
    return "unknown";
}

Protocol resolve_protocol(Protocol protocol, bool is_local_socket) noexcept {
    if (protocol != Protocol::Auto) return protocol;
    return is_local_socket ? Protocol::V0Local : Protocol::V1Net;
}

// Datagram and local-socket transports keep message boundaries themselves,
// so framing is forced off there even if explicitly requested.
Framing resolve_framing(Framing framing, bool needs_framing) noexcept {
    if (!needs_framing) return Framing::None;
    if (framing == Framing::Auto) return Framing::DelimiterNul;
    return framing;
}

BomMode resolve_bom_mode(BomMode mode, Protocol resolved_protocol) noexcept {
    if (mode != BomMode::Auto) return mode;
    return resolved_protocol == Protocol::V1Net ? BomMode::Always : BomMode::Never;
}

} // namespace logwire
