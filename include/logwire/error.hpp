// include/logwire/error.hpp
// Single error class with kind enum.

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace logwire {

enum class ErrorKind {
    Configuration,  // Invalid config or unresolvable target at construction
    Connect,        // Every dial candidate failed
    Closed,         // Client already closed
    Backoff,        // Reconnect attempted inside the rate-limit window
    Write,          // I/O failure writing a formatted message
    Parse           // Unknown severity/facility name
};

class SyslogError : public std::exception {
public:
    SyslogError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

    static SyslogError configuration(std::string msg) {
        return SyslogError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static SyslogError connect(std::string msg) {
        return SyslogError(ErrorKind::Connect, "connect error: " + msg);
    }

    static SyslogError closed() {
        return SyslogError(ErrorKind::Closed, "writing to a closed syslog client");
    }

    static SyslogError backoff() {
        return SyslogError(ErrorKind::Backoff, "syslog client is waiting to reconnect");
    }

    static SyslogError write(std::string msg) {
        return SyslogError(ErrorKind::Write, "write error: " + msg);
    }

    static SyslogError parse(std::string what, std::string name) {
        return SyslogError(ErrorKind::Parse, "bad " + what + " string: \"" + name + "\"");
    }

private:
    ErrorKind kind_;
    std::string message_;
};

} // namespace logwire
