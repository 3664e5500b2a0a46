// tests/autoconfig_test.cpp
// Unit tests for per-connection resolution of auto settings.

#include <gtest/gtest.h>
#include "autoconfig.hpp"

using namespace logwire;

TEST(AutoconfigTest, UnixDatagramGetsLegacyLocal) {
    auto s = resolve_settings(Config::builder().build(), "unixgram");
    EXPECT_EQ(s.protocol, Protocol::V0Local);
    EXPECT_EQ(s.framing, Framing::None);
    EXPECT_EQ(s.bom_mode, BomMode::Never);
}

TEST(AutoconfigTest, UnixStreamIsStillUnframed) {
    auto s = resolve_settings(Config::builder().framing(Framing::Length).build(), "unix");
    EXPECT_EQ(s.protocol, Protocol::V0Local);
    EXPECT_EQ(s.framing, Framing::None);
}

TEST(AutoconfigTest, UdpGetsModernUnframed) {
    auto s = resolve_settings(Config::builder().build(), "udp");
    EXPECT_EQ(s.protocol, Protocol::V1Net);
    EXPECT_EQ(s.framing, Framing::None);
    EXPECT_EQ(s.bom_mode, BomMode::Always);
}

TEST(AutoconfigTest, TcpGetsNulDelimiter) {
    auto s = resolve_settings(Config::builder().build(), "tcp");
    EXPECT_EQ(s.protocol, Protocol::V1Net);
    EXPECT_EQ(s.framing, Framing::DelimiterNul);
    EXPECT_EQ(s.bom_mode, BomMode::Always);
}

TEST(AutoconfigTest, CustomStreamNetworkIsFramed) {
    auto config = Config::builder()
        .framing(Framing::Length)
        .network("tls")
        .address("collector.example.com")
        .dial([](const Target&, Deadline) -> std::unique_ptr<Connection> { return nullptr; })
        .build();
    auto s = resolve_settings(config, "tls");
    EXPECT_EQ(s.protocol, Protocol::V1Net);
    EXPECT_EQ(s.framing, Framing::Length);
}

TEST(AutoconfigTest, ExplicitValuesWin) {
    auto config = Config::builder()
        .protocol(Protocol::V0Net)
        .bom_mode(BomMode::Always)
        .build();
    auto s = resolve_settings(config, "unixgram");
    EXPECT_EQ(s.protocol, Protocol::V0Net);
    EXPECT_EQ(s.bom_mode, BomMode::Always);
}

TEST(AutoconfigTest, EmptyHostNameUsesMachineName) {
    auto s = resolve_settings(Config::builder().build(), "udp");
    EXPECT_EQ(s.host_name, local_host_name());
}

TEST(AutoconfigTest, DashHostNamePassesThrough) {
    auto s = resolve_settings(Config::builder().host_name("-").proc_name("app").build(), "udp");
    EXPECT_EQ(s.host_name, "-");
    EXPECT_EQ(s.proc_name, "app");
}

TEST(AutoconfigTest, UtcZoneHasNoOffset) {
    auto now = std::chrono::system_clock::now();
    EXPECT_EQ(utc_offset_at(now, TimeZone::Utc), 0);
}

TEST(AutoconfigTest, LocalOffsetIsWithinADay) {
    auto offset = utc_offset_at(std::chrono::system_clock::now(), TimeZone::Local);
    EXPECT_GT(offset, -86400);
    EXPECT_LT(offset, 86400);
}
