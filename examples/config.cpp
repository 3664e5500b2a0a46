// Full Config builder: all available options with defaults.
//
//   cmake -B build -DLOGWIRE_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/logwire_config

#include "logwire/logwire.hpp"
#include <chrono>
#include <iostream>

int main() {
    auto config = logwire::Config::builder()
        .target("tcp://127.0.0.1:514")                            // default: local daemon socket
        .protocol(logwire::Protocol::Auto)                        // default: legacy local / RFC 5424
        .framing(logwire::Framing::Auto)                          // default: NUL on streams
        .bom_mode(logwire::BomMode::Auto)                         // default: BOM with RFC 5424
        .host_name("")                                            // default: machine host name
        .proc_name("logwire_config")                              // default: none
        .connect_timeout(std::chrono::milliseconds(30000))        // default: 30s dial deadline
        .time_zone(logwire::TimeZone::Local)                      // default: local time
        .backoff(std::make_shared<logwire::ExponentialBackoff>()) // default: 1s x1.5 up to 30s
        .on_error([](const logwire::SyslogError& e) {             // default: errors are silent
            std::cerr << "[logwire] " << e.what() << std::endl;
        })
        .build();

    auto client = logwire::Client::create(std::move(config));

    logwire::Message msg;
    msg.severity = logwire::Severity::Notice;
    msg.id = "CFG";
    msg.structured_data = "[build version=\"0.1.0\"]";
    msg.body = "configuration example";

    try {
        client->write(msg);
    } catch (const logwire::SyslogError& e) {
        std::cerr << "write failed: " << e.what() << std::endl;
    }
    client->close();
}
