// bench/bench_common.hpp
// Shared benchmark scenarios and message fixtures.

#pragma once

#include "logwire/message.hpp"
#include "logwire/types.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>

namespace logwire_bench {

struct BenchScenario {
    const char* name;
    logwire::Protocol protocol;
    logwire::Framing framing;
    size_t body_size;
};

constexpr BenchScenario SCENARIOS[] = {
    {"local_small", logwire::Protocol::V0Local, logwire::Framing::None, 64},
    {"udp_typical", logwire::Protocol::V1Net, logwire::Framing::None, 200},
    {"tcp_nul", logwire::Protocol::V1Net, logwire::Framing::DelimiterNul, 200},
    {"tcp_octet_counted", logwire::Protocol::V1Net, logwire::Framing::Length, 1000},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

// Printable log text of exactly the given size.
inline std::string generate_body(size_t size) {
    static const std::string base = "request completed method=GET path=/api/v1/orders status=200 ";
    std::string body;
    body.reserve(size);
    while (body.size() < size) {
        body.append(base, 0, std::min(base.size(), size - body.size()));
    }
    return body;
}

inline logwire::Message make_message(size_t body_size) {
    logwire::Message msg;
    msg.time = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    msg.severity = logwire::Severity::Info;
    msg.facility = logwire::Facility::Local0;
    msg.id = "REQ";
    msg.body = generate_body(body_size);
    return msg;
}

} // namespace logwire_bench
