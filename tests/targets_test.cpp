// tests/targets_test.cpp
// Unit tests for dial target resolution.

#include <gtest/gtest.h>
#include "logwire/error.hpp"
#include "targets.hpp"

using namespace logwire;

namespace {

const PosixLocalSockets posix{};
const NoLocalSockets none{};

std::vector<Target> standard(const std::string& network) {
    return {{network, "/dev/log"}, {network, "/var/run/syslog"}, {network, "/var/run/log"}};
}

void expect_configuration_error(const std::string& network, const std::string& address,
                                const LocalSocketSupport& local) {
    try {
        resolve_targets(network, address, local);
        FAIL() << "expected configuration error for \"" << network << "\", \"" << address << "\"";
    } catch (const SyslogError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Configuration);
    }
}

} // namespace

// ==================== Local sockets ====================

TEST(TargetsTest, EmptyAutodetectsStandardPaths) {
    auto targets = resolve_targets("", "", posix);
    auto expected = standard("unixgram");
    auto stream = standard("unix");
    expected.insert(expected.end(), stream.begin(), stream.end());
    EXPECT_EQ(targets, expected);
}

TEST(TargetsTest, PathWithoutNetworkTriesDatagramThenStream) {
    auto targets = resolve_targets("", "/dev/log", posix);
    std::vector<Target> expected = {{"unixgram", "/dev/log"}, {"unix", "/dev/log"}};
    EXPECT_EQ(targets, expected);
}

TEST(TargetsTest, ExplicitUnixOnlyUsesThatKind) {
    EXPECT_EQ(resolve_targets("unix", "", posix), standard("unix"));
    EXPECT_EQ(resolve_targets("unixgram", "", posix), standard("unixgram"));

    std::vector<Target> expected = {{"unix", "/run/custom.sock"}};
    EXPECT_EQ(resolve_targets("unix", "/run/custom.sock", posix), expected);
}

TEST(TargetsTest, IsIdempotent) {
    EXPECT_EQ(resolve_targets("", "", posix), resolve_targets("", "", posix));
    EXPECT_EQ(resolve_targets("tcp", "example.com", posix),
              resolve_targets("tcp", "example.com", posix));
}

TEST(TargetsTest, NoLocalSocketsRequiresAddress) {
    expect_configuration_error("", "", none);
}

TEST(TargetsTest, NoLocalSocketsRejectsExplicitUnix) {
    expect_configuration_error("unix", "/dev/log", none);
    expect_configuration_error("unixgram", "", none);
}

TEST(TargetsTest, NoLocalSocketsUsesNetworkForHostAddress) {
    std::vector<Target> expected = {{"udp", "example.com:514"}};
    EXPECT_EQ(resolve_targets("", "example.com", none), expected);
}

// ==================== Network addresses ====================

TEST(TargetsTest, HostDefaultsToUdpAndPort514) {
    std::vector<Target> expected = {{"udp", "foobar.example.com:514"}};
    EXPECT_EQ(resolve_targets("", "foobar.example.com", posix), expected);
}

TEST(TargetsTest, ExplicitPortKept) {
    std::vector<Target> expected = {{"udp", "foobar.example.com:1514"}};
    EXPECT_EQ(resolve_targets("", "foobar.example.com:1514", posix), expected);
}

TEST(TargetsTest, Ipv4) {
    std::vector<Target> expected = {{"udp", "127.0.0.1:514"}};
    EXPECT_EQ(resolve_targets("", "127.0.0.1", posix), expected);
    EXPECT_EQ(resolve_targets("", "127.0.0.1:514", posix), expected);
}

TEST(TargetsTest, Ipv6) {
    std::vector<Target> expected = {{"udp", "[::1]:514"}};
    EXPECT_EQ(resolve_targets("", "[::1]", posix), expected);
    EXPECT_EQ(resolve_targets("", "[::1]:514", posix), expected);
    EXPECT_EQ(resolve_targets("", "::1", posix), expected);
}

TEST(TargetsTest, TcpKept) {
    std::vector<Target> expected = {{"tcp", "foobar.example.com:514"}};
    EXPECT_EQ(resolve_targets("tcp", "foobar.example.com", posix), expected);
    EXPECT_EQ(resolve_targets("tcp", "foobar.example.com:514", posix), expected);
}

TEST(TargetsTest, NetworkWithoutAddressFails) {
    expect_configuration_error("udp", "", posix);
    expect_configuration_error("tcp", "", posix);
}

TEST(TargetsTest, MalformedAddressFails) {
    expect_configuration_error("udp", "[::1", posix);
    expect_configuration_error("udp", "[::1]x", posix);
    expect_configuration_error("udp", "host:", posix);
    expect_configuration_error("udp", ":514", posix);
}

// ==================== split_host_port ====================

TEST(TargetsTest, SplitHostPort) {
    std::string host, port;
    ASSERT_TRUE(split_host_port("example.com:514", host, port));
    EXPECT_EQ(host, "example.com");
    EXPECT_EQ(port, "514");

    ASSERT_TRUE(split_host_port("example.com", host, port));
    EXPECT_EQ(host, "example.com");
    EXPECT_EQ(port, "");

    ASSERT_TRUE(split_host_port("[2001:db8::1]:6514", host, port));
    EXPECT_EQ(host, "2001:db8::1");
    EXPECT_EQ(port, "6514");

    ASSERT_TRUE(split_host_port("2001:db8::1", host, port));
    EXPECT_EQ(host, "2001:db8::1");
    EXPECT_EQ(port, "");

    EXPECT_FALSE(split_host_port("[2001:db8::1", host, port));
}

// ==================== Transport classification ====================

TEST(TargetsTest, NetworkClassification) {
    EXPECT_TRUE(is_local_network("unix"));
    EXPECT_TRUE(is_local_network("unixgram"));
    EXPECT_FALSE(is_local_network("udp"));

    EXPECT_TRUE(is_message_oriented("unix"));
    EXPECT_TRUE(is_message_oriented("unixgram"));
    EXPECT_TRUE(is_message_oriented("udp"));
    EXPECT_TRUE(is_message_oriented("udp6"));
    EXPECT_FALSE(is_message_oriented("tcp"));
    EXPECT_FALSE(is_message_oriented("tls"));
}

TEST(TargetsTest, HostCapabilityOnPosix) {
    EXPECT_TRUE(LocalSocketSupport::host().available());
    EXPECT_FALSE(LocalSocketSupport::host().standard_paths().empty());
}
