#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <thread>

// Starts a thread running the given work. Replaceable so callers can
// simulate thread exhaustion.
using ThreadSpawner = std::function<std::thread(std::function<void()>)>;

std::thread spawn_thread(std::function<void()> work);

struct FanOutResult {
    size_t started = 0;    // work(0) .. work(started - 1) ran to completion
    std::string error;     // why work(started) could not be started, if any
};

// Runs work(i) for every i in [0, count), one thread each, and joins them
// all before returning. When a thread cannot be started no further ones
// are attempted; the threads already running are still joined.
FanOutResult fan_out(size_t count, const std::function<void(size_t)>& work,
                     const ThreadSpawner& spawn = spawn_thread);
