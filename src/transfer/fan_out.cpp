#include "fan_out.hpp"
#include <core/log.hpp>
#include <stdexcept>
#include <vector>
#include <fmt/format.h>

std::thread spawn_thread(std::function<void()> work) {
    return std::thread(std::move(work));
}

FanOutResult fan_out(size_t count, const std::function<void(size_t)>& work,
                     const ThreadSpawner& spawn) {
    FanOutResult result;
    std::vector<std::thread> workers;
    workers.reserve(count);

    try {
        for (size_t i = 0; i < count; i++) {
            workers.push_back(spawn([&work, i] { work(i); }));
            result.started++;
        }
    } catch (const std::exception& e) {
        result.error = e.what();
        hostcp_log(fmt::format("fan_out: started {} of {} threads: {}",
                               result.started, count, result.error));
    }

    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }
    return result;
}
