// src/config.cpp
// Configuration builder and presets.

#include "logwire/config.hpp"
#include "validation.hpp"

namespace logwire {

// --- Config presets ---

ConfigBuilder Config::builder() {
    return ConfigBuilder();
}

Config Config::local() {
    return Config::builder().build();
}

Config Config::remote(const std::string& address) {
    return Config::builder()
        .network("udp")
        .address(address)
        .build();
}

// --- ConfigBuilder ---

ConfigBuilder& ConfigBuilder::protocol(Protocol protocol) {
    config_.protocol_ = protocol;
    return *this;
}

ConfigBuilder& ConfigBuilder::framing(Framing framing) {
    config_.framing_ = framing;
    return *this;
}

ConfigBuilder& ConfigBuilder::bom_mode(BomMode mode) {
    config_.bom_mode_ = mode;
    return *this;
}

ConfigBuilder& ConfigBuilder::backoff(std::shared_ptr<Backoff> backoff) {
    config_.backoff_ = std::move(backoff);
    return *this;
}

ConfigBuilder& ConfigBuilder::dial(DialFunc dial) {
    config_.dial_ = std::move(dial);
    return *this;
}

ConfigBuilder& ConfigBuilder::network(std::string network) {
    config_.network_ = std::move(network);
    return *this;
}

ConfigBuilder& ConfigBuilder::address(std::string address) {
    config_.address_ = std::move(address);
    return *this;
}

ConfigBuilder& ConfigBuilder::target(const std::string& spec) {
    validation::split_target_spec(spec, config_.network_, config_.address_);
    return *this;
}

ConfigBuilder& ConfigBuilder::host_name(std::string host_name) {
    config_.host_name_ = std::move(host_name);
    return *this;
}

ConfigBuilder& ConfigBuilder::proc_name(std::string proc_name) {
    config_.proc_name_ = std::move(proc_name);
    return *this;
}

ConfigBuilder& ConfigBuilder::connect_timeout(std::chrono::milliseconds timeout) {
    config_.connect_timeout_ = timeout;
    return *this;
}

ConfigBuilder& ConfigBuilder::time_zone(TimeZone zone) {
    config_.time_zone_ = zone;
    return *this;
}

ConfigBuilder& ConfigBuilder::on_error(Config::ErrorCallback callback) {
    config_.on_error_ = std::move(callback);
    return *this;
}

Config ConfigBuilder::build() const {
    if (!validation::check_header_field(config_.host_name_)) {
        throw SyslogError::configuration("host name must not contain whitespace");
    }
    if (!validation::check_header_field(config_.proc_name_)) {
        throw SyslogError::configuration("process name must not contain whitespace");
    }
    // A custom dialer may understand networks the built-in one does not.
    if (!config_.dial_ && !validation::check_network(config_.network_)) {
        throw SyslogError::configuration("unsupported network: " + config_.network_);
    }
    if (config_.connect_timeout_.count() <= 0) {
        throw SyslogError::configuration("connect timeout must be positive");
    }
    return config_;
}

} // namespace logwire
