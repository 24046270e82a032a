#include <gtest/gtest.h>
#include <transfer/naming.hpp>

// ── normalize_host ──────────────────────────────────────────

TEST(Naming, NormalizeAppendsDefaultPort) {
    EXPECT_EQ(normalize_host("web1", 22), "web1:22");
    EXPECT_EQ(normalize_host("10.0.0.5", 2222), "10.0.0.5:2222");
}

TEST(Naming, NormalizeKeepsExplicitPort) {
    EXPECT_EQ(normalize_host("web1:2200", 22), "web1:2200");
}

TEST(Naming, NormalizeIPv6) {
    EXPECT_EQ(normalize_host("[::1]", 22), "[::1]:22");
    EXPECT_EQ(normalize_host("[::1]:2022", 22), "[::1]:2022");
    EXPECT_EQ(normalize_host("fe80::1", 22), "[fe80::1]:22");
}

// ── split_host_port ─────────────────────────────────────────

TEST(Naming, SplitHostPort) {
    auto r = split_host_port("web1:2200");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.host, "web1");
    EXPECT_EQ(r.value.port, 2200);

    auto v6 = split_host_port("[fe80::1]:22");
    ASSERT_TRUE(v6.is_ok());
    EXPECT_EQ(v6.value.host, "fe80::1");
    EXPECT_EQ(v6.value.port, 22);
}

TEST(Naming, SplitHostPortRejectsGarbage) {
    EXPECT_TRUE(split_host_port("web1").is_err());
    EXPECT_TRUE(split_host_port("web1:ssh").is_err());
    EXPECT_TRUE(split_host_port("web1:70000").is_err());
    EXPECT_TRUE(split_host_port(":22").is_err());
    EXPECT_TRUE(split_host_port("[::1]").is_err());
    EXPECT_TRUE(split_host_port("web1:22abc").is_err());
}

TEST(Naming, ParsePort) {
    EXPECT_EQ(parse_port("22").value, 22);
    EXPECT_EQ(parse_port("65535").value, 65535);
    EXPECT_TRUE(parse_port("").is_err());
    EXPECT_TRUE(parse_port("0").is_err());
    EXPECT_TRUE(parse_port("65536").is_err());
    EXPECT_TRUE(parse_port("22abc").is_err());
    EXPECT_TRUE(parse_port("+22").is_err());
    EXPECT_TRUE(parse_port(" 22").is_err());
}

// ── basenames and artifact names ────────────────────────────

TEST(Naming, PathBasename) {
    EXPECT_EQ(path_basename("/etc/app/app.conf"), "app.conf");
    EXPECT_EQ(path_basename("app.conf"), "app.conf");
    EXPECT_EQ(path_basename("/var/log/"), "log");
    EXPECT_EQ(path_basename("/"), "/");
}

TEST(Naming, PeerToken) {
    EXPECT_EQ(peer_token("10.0.0.5:22"), "10-0-0-5");
    EXPECT_EQ(peer_token("[fe80::1]:22"), "fe80--1");
}

TEST(Naming, FetchDestinationWithExtension) {
    EXPECT_EQ(fetch_destination_name("app.conf", "192.168.1.20:22"), "app-192-168-1-20.conf");
}

TEST(Naming, FetchDestinationSplitsOnFinalDot) {
    EXPECT_EQ(fetch_destination_name("backup.tar.gz", "10.0.0.1:22"), "backup.tar-10-0-0-1.gz");
}

TEST(Naming, FetchDestinationWithoutExtensionKeepsTrailingDot) {
    EXPECT_EQ(fetch_destination_name("hosts", "10.0.0.1:22"), "hosts-10-0-0-1.");
}

TEST(Naming, FetchDestinationDotfile) {
    EXPECT_EQ(fetch_destination_name(".bashrc", "10.0.0.1:22"), "-10-0-0-1.bashrc");
}

TEST(Naming, FetchDestinationDistinctPerPeer) {
    EXPECT_NE(fetch_destination_name("app.conf", "10.0.0.1:22"),
              fetch_destination_name("app.conf", "10.0.0.2:22"));
}

// ── send target ─────────────────────────────────────────────

TEST(Naming, SendTargetDirectoryGetsBasename) {
    EXPECT_EQ(send_remote_target("/opt/app/", "build/app.bin"), "/opt/app/app.bin");
}

TEST(Naming, SendTargetFileIsUnchanged) {
    EXPECT_EQ(send_remote_target("/opt/app/current.bin", "build/app.bin"), "/opt/app/current.bin");
}
