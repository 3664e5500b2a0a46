// tests/types_test.cpp
// Unit tests for severity/facility parsing, PRI and auto-value resolution.

#include <gtest/gtest.h>
#include "logwire/error.hpp"
#include "logwire/types.hpp"

using namespace logwire;

TEST(TypesTest, PriForAllSeveritiesAndFacilities) {
    for (int s = 0; s <= 7; s++) {
        for (int f = 0; f <= 23; f++) {
            int pri = make_pri(static_cast<Severity>(s), static_cast<Facility>(f));
            EXPECT_EQ(pri, (s & 7) | ((f & 31) << 3));
            EXPECT_GE(pri, 0);
            EXPECT_LE(pri, 191);
        }
    }
}

TEST(TypesTest, PriExamples) {
    EXPECT_EQ(make_pri(Severity::Warning, Facility::Auth), 36);
    EXPECT_EQ(make_pri(Severity::Warning, Facility::Daemon), 28);
    EXPECT_EQ(make_pri(Severity::Emergency, Facility::Kern), 0);
    EXPECT_EQ(make_pri(Severity::Debug, Facility::Local7), 191);
}

TEST(TypesTest, ParseSeverityAliases) {
    EXPECT_EQ(parse_severity("emerg"), Severity::Emergency);
    EXPECT_EQ(parse_severity("emergency"), Severity::Emergency);
    EXPECT_EQ(parse_severity("alert"), Severity::Alert);
    EXPECT_EQ(parse_severity("crit"), Severity::Critical);
    EXPECT_EQ(parse_severity("critical"), Severity::Critical);
    EXPECT_EQ(parse_severity("err"), Severity::Error);
    EXPECT_EQ(parse_severity("error"), Severity::Error);
    EXPECT_EQ(parse_severity("warn"), Severity::Warning);
    EXPECT_EQ(parse_severity("warning"), Severity::Warning);
    EXPECT_EQ(parse_severity("notice"), Severity::Notice);
    EXPECT_EQ(parse_severity("info"), Severity::Info);
    EXPECT_EQ(parse_severity("debug"), Severity::Debug);
}

TEST(TypesTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parse_severity("WARNING"), Severity::Warning);
    EXPECT_EQ(parse_severity("Err"), Severity::Error);
    EXPECT_EQ(parse_facility("LOCAL3"), Facility::Local3);
    EXPECT_EQ(parse_facility("AuthPriv"), Facility::AuthPriv);
    EXPECT_EQ(parse_facility("Kernel"), Facility::Kern);
}

TEST(TypesTest, UnknownSeverityFallsBackToDebug) {
    Severity s = Severity::Emergency;
    EXPECT_FALSE(try_parse_severity("loud", s));
    EXPECT_EQ(s, Severity::Debug);

    s = Severity::Emergency;
    EXPECT_FALSE(try_parse_severity("", s));
    EXPECT_EQ(s, Severity::Debug);

    EXPECT_FALSE(try_parse_severity("warningx", s));
    EXPECT_FALSE(try_parse_severity("war", s));
}

TEST(TypesTest, UnknownFacilityFallsBackToLocal7) {
    Facility f = Facility::Kern;
    EXPECT_FALSE(try_parse_facility("local8", f));
    EXPECT_EQ(f, Facility::Local7);
}

TEST(TypesTest, ThrowingParseReportsParseKind) {
    try {
        parse_severity("nope");
        FAIL() << "expected SyslogError";
    } catch (const SyslogError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Parse);
    }
    EXPECT_THROW(parse_facility("nope"), SyslogError);
}

TEST(TypesTest, SeverityNamesRoundTrip) {
    for (int s = 0; s <= 7; s++) {
        auto severity = static_cast<Severity>(s);
        EXPECT_EQ(parse_severity(to_string(severity)), severity);
    }
    EXPECT_STREQ(to_string(Severity::Warning), "warning");
}

TEST(TypesTest, FacilityNamesRoundTrip) {
    for (int f = 0; f <= 23; f++) {
        auto facility = static_cast<Facility>(f);
        EXPECT_EQ(parse_facility(to_string(facility)), facility);
    }
    EXPECT_STREQ(to_string(Facility::Local0), "local0");
    EXPECT_STREQ(to_string(Facility::Kern), "kern");
}

TEST(TypesTest, ResolveProtocol) {
    EXPECT_EQ(resolve_protocol(Protocol::Auto, true), Protocol::V0Local);
    EXPECT_EQ(resolve_protocol(Protocol::Auto, false), Protocol::V1Net);
    EXPECT_EQ(resolve_protocol(Protocol::V0Net, true), Protocol::V0Net);
    EXPECT_EQ(resolve_protocol(Protocol::V0Local, false), Protocol::V0Local);
}

TEST(TypesTest, ResolveFraming) {
    EXPECT_EQ(resolve_framing(Framing::Auto, true), Framing::DelimiterNul);
    EXPECT_EQ(resolve_framing(Framing::Length, true), Framing::Length);
    EXPECT_EQ(resolve_framing(Framing::DelimiterLf, true), Framing::DelimiterLf);
    // Message-oriented transports never get framing.
    EXPECT_EQ(resolve_framing(Framing::Auto, false), Framing::None);
    EXPECT_EQ(resolve_framing(Framing::Length, false), Framing::None);
}

TEST(TypesTest, ResolveBomMode) {
    EXPECT_EQ(resolve_bom_mode(BomMode::Auto, Protocol::V1Net), BomMode::Always);
    EXPECT_EQ(resolve_bom_mode(BomMode::Auto, Protocol::V0Net), BomMode::Never);
    EXPECT_EQ(resolve_bom_mode(BomMode::Auto, Protocol::V0Local), BomMode::Never);
    EXPECT_EQ(resolve_bom_mode(BomMode::Never, Protocol::V1Net), BomMode::Never);
    EXPECT_EQ(resolve_bom_mode(BomMode::Always, Protocol::V0Local), BomMode::Always);
}

TEST(TypesTest, ResolutionIsIdempotent) {
    auto p = resolve_protocol(Protocol::Auto, true);
    EXPECT_EQ(resolve_protocol(p, false), p);
    auto f = resolve_framing(Framing::Auto, true);
    EXPECT_EQ(resolve_framing(f, true), f);
    auto b = resolve_bom_mode(BomMode::Auto, Protocol::V1Net);
    EXPECT_EQ(resolve_bom_mode(b, Protocol::V0Net), b);
}
