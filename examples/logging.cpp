// examples/logging.cpp
// Messages at every severity to the local syslog daemon.

#include "logwire/logwire.hpp"
#include <iostream>

int main() {
    try {
        auto client = logwire::Client::create(logwire::Config::local());

        logwire::Message msg;
        msg.facility = logwire::Facility::Daemon;

        msg.severity = logwire::Severity::Info;
        msg.body = "server started port=8080 workers=4";
        client->write(msg);

        msg.severity = logwire::Severity::Warning;
        msg.body = "high memory usage used_mb=3800 total_mb=4096";
        client->write(msg);

        msg.severity = logwire::Severity::Error;
        msg.id = "DB";
        msg.body = "database connection failed host=db.internal retry_count=3";
        client->write(msg);

        // Severity names as they appear in config files
        msg.severity = logwire::parse_severity("crit");
        msg.id.clear();
        msg.body = "disk space critical mount=/data used_percent=98.5";
        client->write(msg);

        logwire::Severity level;
        if (!logwire::try_parse_severity("verbose", level)) {
            std::cout << "unknown level, using " << logwire::to_string(level) << std::endl;
        }
        msg.severity = level;
        msg.body = "cache miss key=user:123:profile";
        client->write(msg);

        client->close();

        std::cout << "Messages sent successfully." << std::endl;

    } catch (const logwire::SyslogError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
