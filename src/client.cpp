// src/client.cpp
// SYSLOG client: connection state machine, reconnect backoff, write + retry.

#include "logwire/client.hpp"
#include "autoconfig.hpp"
#include "encoding.hpp"
#include "targets.hpp"

#include <chrono>
#include <mutex>
#include <optional>

#include <unistd.h>

namespace logwire {

struct Client::Inner {
    Config config;
    std::vector<Target> targets;
    std::shared_ptr<Backoff> backoff;

    mutable std::mutex mutex;
    std::unique_ptr<Connection> conn;
    bool closed = false;
    std::optional<std::chrono::steady_clock::time_point> reconnect_not_before;
    ResolvedSettings settings;

    // Reusable formatting buffer; format_into() overwrites it on every call.
    std::vector<uint8_t> write_buf;

    // Only called with the mutex released; config is immutable after create().
    void report_error(const SyslogError& err) const {
        if (config.on_error()) {
            config.on_error()(err);
        }
    }

    std::unique_ptr<Connection> dial(const Target& target, Deadline deadline) {
        std::unique_ptr<Connection> c;
        try {
            c = config.dial() ? config.dial()(target, deadline) : dial_socket(target, deadline);
        } catch (const SyslogError& e) {
            if (e.kind() == ErrorKind::Connect) throw;
            throw SyslogError::connect(target.network + " " + target.address + ": " + e.message());
        } catch (const std::exception& e) {
            throw SyslogError::connect(target.network + " " + target.address + ": " + e.what());
        }
        if (!c) {
            throw SyslogError::connect(target.network + " " + target.address +
                                       ": dial returned no connection");
        }
        return c;
    }

    // Resolution is idempotent for non-auto values, so redoing it on every
    // connect only matters when a different kind of target was reached.
    void autoconfigure(const Target& target) {
        auto network = conn->network();
        if (network.empty()) network = target.network;
        settings = resolve_settings(config, network);
    }

    void ensure_connection(Deadline deadline) {
        if (conn) return;
        if (closed) throw SyslogError::closed();

        auto now = std::chrono::steady_clock::now();
        if (reconnect_not_before && now < *reconnect_not_before) {
            throw SyslogError::backoff();
        }

        // Consume the delay before dialling, so a hanging attempt still
        // cannot be retried early.
        reconnect_not_before = now + backoff->next_delay();

        std::optional<SyslogError> first_error;
        for (const auto& target : targets) {
            try {
                conn = dial(target, deadline);
            } catch (const SyslogError& e) {
                if (!first_error) first_error = e;
                continue;
            }
            autoconfigure(target);
            return;
        }

        if (first_error) throw *first_error;
        throw SyslogError::connect("no targets to dial");
    }

    void destroy_connection() {
        conn.reset();
    }

    void send(const Message& message, std::chrono::system_clock::time_point timestamp, int pri) {
        encoding::MessageParams p;
        p.protocol = settings.protocol;
        p.framing = settings.framing;
        p.bom_mode = settings.bom_mode;
        p.pri = pri;
        p.timestamp = timestamp;
        p.utc_offset = utc_offset_at(timestamp, config.time_zone());
        p.host_name = settings.host_name.c_str();
        p.host_name_len = settings.host_name.size();
        p.proc_name = settings.proc_name.c_str();
        p.proc_name_len = settings.proc_name.size();
        p.proc_id = static_cast<long long>(::getpid());
        p.msg_id = message.id.c_str();
        p.msg_id_len = message.id.size();
        p.body = message.body.c_str();
        p.body_len = message.body.size();
        p.structured_data = message.structured_data.c_str();
        p.structured_data_len = message.structured_data.size();

        size_t start = encoding::format_into(write_buf, p);

        try {
            conn->write(write_buf.data() + start, write_buf.size() - start);
        } catch (const SyslogError& e) {
            if (e.kind() == ErrorKind::Write) throw;
            throw SyslogError::write(e.message());
        } catch (const std::exception& e) {
            throw SyslogError::write(e.what());
        }
    }
};

Client::Client(Config config) : inner_(std::make_unique<Inner>()) {
    inner_->targets = resolve_targets(config.network(), config.address(),
                                      LocalSocketSupport::host());
    inner_->backoff = config.backoff() ? config.backoff()
                                       : std::make_shared<ExponentialBackoff>();
    inner_->write_buf.reserve(1024);
    inner_->config = std::move(config);
}

Client::~Client() {
    if (inner_) close();
}

Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

std::unique_ptr<Client> Client::create(Config config) {
    return std::unique_ptr<Client>(new Client(std::move(config)));
}

void Client::write(const Message& message) {
    write(message, std::chrono::steady_clock::now() + inner_->config.connect_timeout());
}

void Client::write(const Message& message, Deadline deadline) {
    // on_error runs after the lock is released, so the callback may use
    // this client again.
    std::unique_lock<std::mutex> lock(inner_->mutex);

    inner_->ensure_connection(deadline);

    auto timestamp = message.time ? *message.time : std::chrono::system_clock::now();
    int pri = make_pri(message.severity, message.facility);

    std::optional<SyslogError> first_error;
    try {
        inner_->send(message, timestamp, pri);
    } catch (const SyslogError& e) {
        first_error = e;
    }
    if (!first_error) {
        inner_->backoff->reset();
        return;
    }

    // One reconnect-and-retry. If reconnecting fails, the original write
    // error is the one the caller sees.
    inner_->destroy_connection();
    try {
        inner_->ensure_connection(deadline);
    } catch (const SyslogError& e) {
        lock.unlock();
        inner_->report_error(e);
        throw *first_error;
    }

    try {
        inner_->send(message, timestamp, pri);
    } catch (const SyslogError&) {
        inner_->destroy_connection();
        throw;
    }

    inner_->backoff->reset();
    lock.unlock();
    inner_->report_error(*first_error);
}

void Client::close() {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    inner_->destroy_connection();
    inner_->closed = true;
}

bool Client::is_closed() const {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    return inner_->closed;
}

bool Client::is_connected() const {
    std::lock_guard<std::mutex> lock(inner_->mutex);
    return inner_->conn != nullptr;
}

const std::vector<Target>& Client::targets() const noexcept {
    return inner_->targets;
}

} // namespace logwire
