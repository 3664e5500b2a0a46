// include/logwire/client.hpp
// SYSLOG client: connects, formats, writes and reconnects.

#pragma once

#include "config.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "message.hpp"
#include "types.hpp"
#include <memory>
#include <vector>

namespace logwire {

// A SYSLOG protocol writer which connects and reconnects automatically.
//
// Created via Client::create(config); the first connection is made lazily by
// the first write. Calls are serialized by an internal mutex. No messages are
// buffered: a write that throws is a lost message.
//
// Example:
//   auto client = Client::create(Config::remote("192.0.2.1"));
//   Message msg;
//   msg.severity = Severity::Warning;
//   msg.body = "disk almost full";
//   client->write(msg);
//   client->close();
class Client {
public:
    // Validate the config and resolve its dial targets.
    // Throws SyslogError (ErrorKind::Configuration) if no target can be derived.
    static std::unique_ptr<Client> create(Config config);

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    // Write one message, connecting first if necessary. On a transport
    // failure the connection is re-established and the write retried once.
    //
    // The deadline bounds only the dial phase; a write to a live connection
    // is never interrupted.
    //
    // Throws SyslogError: Closed, Backoff, Connect or Write.
    void write(const Message& message, Deadline deadline);

    // As above, with a deadline of now + config.connect_timeout().
    void write(const Message& message);

    // Close the connection; all later writes fail with ErrorKind::Closed.
    // Idempotent.
    void close();

    bool is_closed() const;
    bool is_connected() const;

    // Dial candidates, most preferred first.
    const std::vector<Target>& targets() const noexcept;

private:
    explicit Client(Config config);
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace logwire
