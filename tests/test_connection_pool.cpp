#include <gtest/gtest.h>
#include <transfer/connection_pool.hpp>
#include "fake_remote.hpp"

class ConnectionPoolTest : public ::testing::Test {
protected:
    fs::path test_dir;
    FakeNetwork net;
    AuthPlan plan;
    PoolOptions options;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "hostcp_pool_test";
        fs::remove_all(test_dir);
        for (const char* h : {"a", "b", "c"}) {
            fs::create_directories(test_dir / h);
        }
        net.hosts["a:22"] = {test_dir / "a", "10.0.0.1:22"};
        net.hosts["b:22"] = {test_dir / "b", "10.0.0.2:22"};
        net.hosts["c:2222"] = {test_dir / "c", "10.0.0.3:2222"};

        plan.user = "deploy";
        plan.methods.push_back({AuthMethodKind::Password, "secret", "", ""});
        options.default_port = 22;
        options.timeout = 7;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ConnectionPoolTest, ConnectsEveryHost) {
    ConnectionPool pool(options, net.dialer());
    auto r = pool.connect({"a", "b", "c:2222"}, plan);

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(pool.size(), 3u);
    EXPECT_EQ(pool.sessions()[0].host, "a:22");
    EXPECT_EQ(pool.sessions()[2].host, "c:2222");
    EXPECT_EQ(pool.sessions()[1].fs->peer_address(), "10.0.0.2:22");
}

TEST_F(ConnectionPoolTest, PassesTimeoutAndPort) {
    ConnectionPool pool(options, net.dialer());
    ASSERT_TRUE(pool.connect({"c:2222"}, plan).is_ok());

    ASSERT_EQ(net.targets.size(), 1u);
    EXPECT_EQ(net.targets[0].host, "c");
    EXPECT_EQ(net.targets[0].port, 2222);
    EXPECT_EQ(net.targets[0].timeout, 7);
    EXPECT_EQ(net.targets[0].host_key_policy, HostKeyPolicy::InsecureAcceptAny);
}

TEST_F(ConnectionPoolTest, DialsSequentiallyAndFailsFast) {
    ConnectionPool pool(options, net.dialer());
    auto r = pool.connect({"a", "b", "down", "c:2222"}, plan);

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Connect);
    EXPECT_NE(r.error.find("down:22"), std::string::npos);
    // c was never dialed, a and b were released
    EXPECT_EQ(net.dials->load(), 3);
    EXPECT_EQ(net.closes->load(), 2);
    EXPECT_EQ(pool.size(), 0u);
}

TEST_F(ConnectionPoolTest, FirstHostFailure) {
    ConnectionPool pool(options, net.dialer());
    net.unreachable.insert("a:22");

    auto r = pool.connect({"a", "b"}, plan);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(net.dials->load(), 1);
    EXPECT_EQ(net.closes->load(), 0);
}

TEST_F(ConnectionPoolTest, DuplicateHostsDialedOnce) {
    ConnectionPool pool(options, net.dialer());
    ASSERT_TRUE(pool.connect({"a", "a:22", "b"}, plan).is_ok());

    EXPECT_EQ(pool.size(), 2u);
    EXPECT_EQ(net.dials->load(), 2);
}

TEST_F(ConnectionPoolTest, AliasesOfOnePeerKeepOneSession) {
    net.hosts["web1:22"] = {test_dir / "a", "10.0.0.1:22"};
    ConnectionPool pool(options, net.dialer());
    auto r = pool.connect({"a", "web1", "b"}, plan);

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(net.dials->load(), 3);
    ASSERT_EQ(pool.size(), 2u);
    EXPECT_EQ(pool.sessions()[0].host, "a:22");
    EXPECT_EQ(pool.sessions()[1].host, "b:22");
    EXPECT_EQ(net.closes->load(), 1);
}

TEST_F(ConnectionPoolTest, EmptyHostList) {
    ConnectionPool pool(options, net.dialer());
    auto r = pool.connect({}, plan);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(net.dials->load(), 0);
}

TEST_F(ConnectionPoolTest, CloseAllReleasesEachSessionOnce) {
    ConnectionPool pool(options, net.dialer());
    ASSERT_TRUE(pool.connect({"a", "b", "c:2222"}, plan).is_ok());

    pool.close_all();
    pool.close_all();
    EXPECT_EQ(net.closes->load(), 3);
    EXPECT_EQ(pool.size(), 0u);
}

TEST_F(ConnectionPoolTest, DestructorReleasesSessions) {
    {
        ConnectionPool pool(options, net.dialer());
        ASSERT_TRUE(pool.connect({"a", "b"}, plan).is_ok());
    }
    EXPECT_EQ(net.closes->load(), 2);
}
