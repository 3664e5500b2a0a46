// include/logwire/types.hpp
// Core enums: severity, facility and the protocol/framing/BOM selectors.

#pragma once

#include <cstdint>
#include <string>

namespace logwire {

// The standard SYSLOG port.
static constexpr uint16_t DEFAULT_PORT = 514;

// SYSLOG severity. The valid range is [0,7].
enum class Severity : uint8_t {
    Emergency = 0,
    Alert     = 1,
    Critical  = 2,
    Error     = 3,
    Warning   = 4,
    Notice    = 5,
    Info      = 6,
    Debug     = 7,
};

// SYSLOG facility. The valid range is [0,23].
enum class Facility : uint8_t {
    Kern     = 0,
    User     = 1,
    Mail     = 2,
    Daemon   = 3,
    Auth     = 4,
    Syslog   = 5,
    Lpr      = 6,
    News     = 7,
    Uucp     = 8,
    Cron     = 9,
    AuthPriv = 10,
    Ftp      = 11,
    Ntp      = 12,  // Not universally supported
    LogAudit = 13,  // Not universally supported
    LogAlert = 14,  // Not universally supported
    Clock    = 15,  // Not universally supported
    Local0   = 16,
    Local1   = 17,
    Local2   = 18,
    Local3   = 19,
    Local4   = 20,
    Local5   = 21,
    Local6   = 22,
    Local7   = 23,
};

// Protocol variant.
//   V0Local: old timestamp, no hostname field (local daemon socket).
//   V0Net:   RFC 3164, old timestamp with hostname field.
//   V1Net:   RFC 5424, RFC 3339 timestamp, message ID and structured data.
enum class Protocol : uint8_t {
    Auto    = 0,
    V0Local = 1,
    V0Net   = 2,
    V1Net   = 3,
};

// Message framing (RFC 6587). Only meaningful for byte-stream transports.
enum class Framing : uint8_t {
    Auto         = 0,
    Length       = 1,
    DelimiterNul = 2,
    DelimiterLf  = 3,
    None         = 4,
};

// Whether a UTF-8 BOM is placed before every message body.
enum class BomMode : uint8_t {
    Auto   = 0,
    Always = 1,
    Never  = 2,
};

// Zone in which message timestamps are rendered.
enum class TimeZone : uint8_t {
    Local = 0,
    Utc   = 1,
};

// PRI = (severity & 7) | ((facility & 31) << 3), always in [0,191] for valid input.
constexpr int make_pri(Severity severity, Facility facility) noexcept {
    return (static_cast<int>(severity) & 7) | ((static_cast<int>(facility) & 31) << 3);
}

// Case-insensitive parsing. On failure `out` is set to Severity::Debug and
// false is returned; the fallback is a placeholder, not a parsed value.
bool try_parse_severity(const std::string& name, Severity& out) noexcept;

// Case-insensitive parsing. On failure `out` is set to Facility::Local7 and
// false is returned.
bool try_parse_facility(const std::string& name, Facility& out) noexcept;

// Throwing variants. Throw SyslogError (ErrorKind::Parse) on unknown names.
Severity parse_severity(const std::string& name);
Facility parse_facility(const std::string& name);

// Canonical lowercase names ("warning", "local3", ...).
const char* to_string(Severity severity) noexcept;
const char* to_string(Facility facility) noexcept;

// Auto-value resolution against the actually connected transport.
// Non-auto values pass through unchanged, so these are idempotent.
Protocol resolve_protocol(Protocol protocol, bool is_local_socket) noexcept;
Framing resolve_framing(Framing framing, bool needs_framing) noexcept;
BomMode resolve_bom_mode(BomMode mode, Protocol resolved_protocol) noexcept;

} // namespace logwire
