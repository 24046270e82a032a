#include <gtest/gtest.h>
#include <transfer/fan_out.hpp>
#include <atomic>
#include <system_error>
#include <vector>

TEST(FanOut, RunsEveryIndexOnce) {
    std::vector<std::atomic<int>> hits(8);
    auto r = fan_out(hits.size(), [&](size_t i) { hits[i]++; });

    EXPECT_EQ(r.started, 8u);
    EXPECT_TRUE(r.error.empty());
    for (auto& h : hits) EXPECT_EQ(h.load(), 1);
}

TEST(FanOut, ZeroCount) {
    auto r = fan_out(0, [](size_t) { FAIL(); });
    EXPECT_EQ(r.started, 0u);
}

TEST(FanOut, SpawnFailureJoinsStartedThreads) {
    std::atomic<int> finished{0};
    int spawns = 0;
    ThreadSpawner limited = [&spawns](std::function<void()> work) {
        if (++spawns > 2) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread limit");
        }
        return std::thread(std::move(work));
    };

    auto r = fan_out(5, [&](size_t) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        finished++;
    }, limited);

    EXPECT_EQ(r.started, 2u);
    EXPECT_NE(r.error.find("thread limit"), std::string::npos);
    // Both started threads completed before fan_out returned
    EXPECT_EQ(finished.load(), 2);
    EXPECT_EQ(spawns, 3);
}
