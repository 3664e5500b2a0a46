// src/encoding.hpp
// SYSLOG wire formatting: RFC 3164 and RFC 5424 variants with RFC 6587 framing.

#pragma once

#include "logwire/types.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>
#include <vector>

namespace logwire {
namespace encoding {

// Bytes reserved in front of every message for a length-framing prefix.
static constexpr size_t HEADROOM = 16;

static constexpr uint8_t UTF8_BOM[3] = {0xEF, 0xBB, 0xBF};

// --- Helpers ---

inline void append(std::vector<uint8_t>& buf, const char* s, size_t len) {
    if (s && len > 0) {
        buf.insert(buf.end(), reinterpret_cast<const uint8_t*>(s),
                   reinterpret_cast<const uint8_t*>(s) + len);
    }
}

inline void append(std::vector<uint8_t>& buf, const char* s) {
    append(buf, s, std::strlen(s));
}

// Append s, or "-" if s is empty.
inline void append_or_nil(std::vector<uint8_t>& buf, const char* s, size_t len) {
    if (s && len > 0) {
        append(buf, s, len);
    } else {
        buf.push_back('-');
    }
}

inline void append_int(std::vector<uint8_t>& buf, long long value) {
    char tmp[24];
    int n = std::snprintf(tmp, sizeof(tmp), "%lld", value);
    if (n > 0) buf.insert(buf.end(), tmp, tmp + n);
}

// Split a time point into civil fields in the given UTC offset, plus the
// nanosecond fraction. Handles times before the epoch.
inline bool split_time(std::chrono::system_clock::time_point time, int32_t utc_offset,
                       std::tm& out, uint32_t& nanos) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
    long long secs = ns / 1000000000LL;
    long long frac = ns % 1000000000LL;
    if (frac < 0) {
        frac += 1000000000LL;
        secs -= 1;
    }
    nanos = static_cast<uint32_t>(frac);

    std::time_t t = static_cast<std::time_t>(secs + utc_offset);
    return ::gmtime_r(&t, &out) != nullptr;
}

// "Oct 11 07:25:00", the RFC 3164 timestamp: no year, no zone, day space-padded.
inline void append_stamp(std::vector<uint8_t>& buf,
                         std::chrono::system_clock::time_point time, int32_t utc_offset) {
    static const char* const MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                         "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    std::tm tm{};
    uint32_t nanos = 0;
    if (!split_time(time, utc_offset, tm, nanos)) {
        buf.push_back('-');
        return;
    }

    char tmp[32];
    int n = std::snprintf(tmp, sizeof(tmp), "%s %2d %02d:%02d:%02d",
                          MONTHS[tm.tm_mon % 12], tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    if (n > 0) buf.insert(buf.end(), tmp, tmp + n);
}

// "2021-10-11T07:25:00.123Z", RFC 3339 with nanosecond precision. Trailing
// zeros of the fraction are dropped; a zero fraction is omitted entirely.
inline void append_rfc3339(std::vector<uint8_t>& buf,
                           std::chrono::system_clock::time_point time, int32_t utc_offset) {
    std::tm tm{};
    uint32_t nanos = 0;
    if (!split_time(time, utc_offset, tm, nanos)) {
        buf.push_back('-');
        return;
    }

    char tmp[48];
    int n = std::snprintf(tmp, sizeof(tmp), "%04d-%02d-%02dT%02d:%02d:%02d",
                          tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                          tm.tm_hour, tm.tm_min, tm.tm_sec);
    if (n > 0) buf.insert(buf.end(), tmp, tmp + n);

    if (nanos != 0) {
        char frac[10];
        std::snprintf(frac, sizeof(frac), "%09u", static_cast<unsigned>(nanos));
        size_t len = 9;
        while (len > 0 && frac[len - 1] == '0') --len;
        buf.push_back('.');
        buf.insert(buf.end(), frac, frac + len);
    }

    if (utc_offset == 0) {
        buf.push_back('Z');
        return;
    }

    char sign = utc_offset < 0 ? '-' : '+';
    int32_t abs_offset = utc_offset < 0 ? -utc_offset : utc_offset;
    n = std::snprintf(tmp, sizeof(tmp), "%c%02d:%02d", sign,
                      static_cast<int>(abs_offset / 3600), static_cast<int>((abs_offset % 3600) / 60));
    if (n > 0) buf.insert(buf.end(), tmp, tmp + n);
}

// --- Message formatting ---

// Everything needed to render one message. Protocol, framing and BOM mode
// must already be resolved (no Auto values).
struct MessageParams {
    Protocol protocol = Protocol::V1Net;
    Framing framing = Framing::None;
    BomMode bom_mode = BomMode::Never;
    int pri = 0;
    std::chrono::system_clock::time_point timestamp;
    int32_t utc_offset = 0;  // seconds east of UTC
    const char* host_name = nullptr;
    size_t host_name_len = 0;
    const char* proc_name = nullptr;
    size_t proc_name_len = 0;
    long long proc_id = 0;
    const char* msg_id = nullptr;
    size_t msg_id_len = 0;
    const char* body = nullptr;
    size_t body_len = 0;
    const char* structured_data = nullptr;
    size_t structured_data_len = 0;
};

// Format one message into buf, replacing its contents. Returns the offset at
// which the message (including any length prefix) starts; bytes before it
// are scratch space.
inline size_t format_into(std::vector<uint8_t>& buf, const MessageParams& p) {
    buf.clear();
    buf.resize(HEADROOM, ' ');

    buf.push_back('<');
    append_int(buf, p.pri);
    buf.push_back('>');

    bool bom = p.bom_mode == BomMode::Always;

    switch (p.protocol) {
        case Protocol::V0Local:
        case Protocol::V0Net:
            append_stamp(buf, p.timestamp, p.utc_offset);
            buf.push_back(' ');
            if (p.protocol == Protocol::V0Net) {
                append_or_nil(buf, p.host_name, p.host_name_len);
                buf.push_back(' ');
            }
            append_or_nil(buf, p.proc_name, p.proc_name_len);
            buf.push_back('[');
            append_int(buf, p.proc_id);
            append(buf, "]: ", 3);
            // The message ID is folded into the body, so the BOM precedes it.
            if (bom) buf.insert(buf.end(), UTF8_BOM, UTF8_BOM + 3);
            if (p.msg_id && p.msg_id_len > 0) {
                append(buf, p.msg_id, p.msg_id_len);
                buf.push_back(' ');
            }
            append(buf, p.body, p.body_len);
            break;

        case Protocol::V1Net:
        default:
            append(buf, "1 ", 2);
            append_rfc3339(buf, p.timestamp, p.utc_offset);
            buf.push_back(' ');
            append_or_nil(buf, p.host_name, p.host_name_len);
            buf.push_back(' ');
            append_or_nil(buf, p.proc_name, p.proc_name_len);
            buf.push_back(' ');
            append_int(buf, p.proc_id);
            buf.push_back(' ');
            append_or_nil(buf, p.msg_id, p.msg_id_len);
            buf.push_back(' ');
            append_or_nil(buf, p.structured_data, p.structured_data_len);
            buf.push_back(' ');
            if (bom) buf.insert(buf.end(), UTF8_BOM, UTF8_BOM + 3);
            append(buf, p.body, p.body_len);
            break;
    }

    switch (p.framing) {
        case Framing::DelimiterNul:
            buf.push_back('\0');
            break;
        case Framing::DelimiterLf:
            buf.push_back('\n');
            break;
        default:
            break;
    }

    if (p.framing != Framing::Length) {
        return HEADROOM;
    }

    // Write the decimal length backwards into the headroom; HEADROOM-1 is
    // already the separating space.
    size_t remaining = buf.size() - HEADROOM;
    size_t i = HEADROOM - 1;
    do {
        --i;
        buf[i] = static_cast<uint8_t>('0' + remaining % 10);
        remaining /= 10;
    } while (remaining > 0 && i > 0);
    return i;
}

// Convenience wrapper returning the formatted bytes as a string.
inline std::string format_message(const MessageParams& params) {
    std::vector<uint8_t> buf;
    size_t start = format_into(buf, params);
    return std::string(buf.begin() + static_cast<ptrdiff_t>(start), buf.end());
}

} // namespace encoding
} // namespace logwire
