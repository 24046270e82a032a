#include <gtest/gtest.h>
#include <transfer/result_store.hpp>
#include <fmt/format.h>
#include <thread>
#include <vector>

static TransferOutcome outcome(int64_t bytes) {
    TransferOutcome o;
    o.source = "/src";
    o.destination = "/dst";
    o.bytes = bytes;
    return o;
}

TEST(ResultStore, RecordAndGet) {
    ResultStore store;
    store.record("10.0.0.1:22", outcome(42));

    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(store.contains("10.0.0.1:22"));
    EXPECT_FALSE(store.contains("10.0.0.2:22"));
    ASSERT_TRUE(store.get("10.0.0.1:22").has_value());
    EXPECT_EQ(store.get("10.0.0.1:22")->bytes, 42);
    EXPECT_FALSE(store.get("10.0.0.2:22").has_value());
}

TEST(ResultStore, RecordReplacesSameHost) {
    ResultStore store;
    store.record("h:22", outcome(1));
    store.record("h:22", outcome(2));

    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get("h:22")->bytes, 2);
}

TEST(ResultStore, ConcurrentWriters) {
    ResultStore store;
    constexpr int kThreads = 16;
    constexpr int kPerThread = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < kPerThread; i++) {
                store.record(fmt::format("10.{}.{}.1:22", t, i), outcome(i));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(store.size(), static_cast<size_t>(kThreads * kPerThread));
    auto snap = store.snapshot();
    EXPECT_EQ(snap.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(snap.at("10.3.7.1:22").bytes, 7);
}

TEST(ResultStore, CopyIsIndependent) {
    ResultStore a;
    a.record("h1:22", outcome(1));
    ResultStore b = a;
    b.record("h2:22", outcome(2));

    EXPECT_EQ(a.size(), 1u);
    EXPECT_EQ(b.size(), 2u);
}
