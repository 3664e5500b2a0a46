// include/logwire/config.hpp
// Flat configuration struct with builder pattern.

#pragma once

#include "backoff.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace logwire {

class ConfigBuilder;

// Configuration for a syslog Client.
//
// Auto values (protocol, framing, BOM) are resolved against the actual
// transport each time a connection is established; the Config itself is
// never modified by the client.
class Config {
public:
    using ErrorCallback = std::function<void(const SyslogError&)>;

    static ConfigBuilder builder();

    // Presets.
    // Local syslog daemon via a UNIX domain socket, standard paths tried in order.
    static Config local();
    // UDP to a remote collector; ":514" is appended if no port is given.
    static Config remote(const std::string& address);

    Protocol protocol() const noexcept { return protocol_; }
    Framing framing() const noexcept { return framing_; }
    BomMode bom_mode() const noexcept { return bom_mode_; }
    const std::shared_ptr<Backoff>& backoff() const noexcept { return backoff_; }
    const DialFunc& dial() const noexcept { return dial_; }
    const std::string& network() const noexcept { return network_; }
    const std::string& address() const noexcept { return address_; }
    const std::string& host_name() const noexcept { return host_name_; }
    const std::string& proc_name() const noexcept { return proc_name_; }
    std::chrono::milliseconds connect_timeout() const noexcept { return connect_timeout_; }
    TimeZone time_zone() const noexcept { return time_zone_; }
    const ErrorCallback& on_error() const noexcept { return on_error_; }

private:
    friend class ConfigBuilder;

    Protocol protocol_ = Protocol::Auto;
    Framing framing_ = Framing::Auto;
    BomMode bom_mode_ = BomMode::Auto;
    std::shared_ptr<Backoff> backoff_;
    DialFunc dial_;
    std::string network_;
    std::string address_;
    std::string host_name_;
    std::string proc_name_;
    std::chrono::milliseconds connect_timeout_{30000};
    TimeZone time_zone_ = TimeZone::Local;
    ErrorCallback on_error_;
};

// Fluent builder for Config.
class ConfigBuilder {
public:
    ConfigBuilder() = default;

    ConfigBuilder& protocol(Protocol protocol);
    ConfigBuilder& framing(Framing framing);
    ConfigBuilder& bom_mode(BomMode mode);

    // The strategy is owned by the client built from this config; do not
    // share one instance between clients.
    ConfigBuilder& backoff(std::shared_ptr<Backoff> backoff);

    // Replace the built-in socket dialer (e.g. to add TLS).
    ConfigBuilder& dial(DialFunc dial);

    ConfigBuilder& network(std::string network);
    ConfigBuilder& address(std::string address);

    // "network:address", e.g. "udp:192.0.2.1:514" or "unix:///dev/log".
    // Throws SyslogError if there is no ':'.
    ConfigBuilder& target(const std::string& spec);

    // "" = machine host name, "-" = no host name.
    ConfigBuilder& host_name(std::string host_name);
    ConfigBuilder& proc_name(std::string proc_name);
    ConfigBuilder& connect_timeout(std::chrono::milliseconds timeout);
    ConfigBuilder& time_zone(TimeZone zone);
    // Receives errors the client recovered from or that were superseded by
    // the error thrown to the caller. Invoked on the writing thread after the
    // client's lock is released, so the callback may call back into the client.
    ConfigBuilder& on_error(Config::ErrorCallback callback);

    // Build the config. Throws SyslogError on invalid settings.
    Config build() const;

private:
    Config config_;
};

} // namespace logwire
