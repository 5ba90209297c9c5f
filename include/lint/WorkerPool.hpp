#pragma once

#include <functional>
#include <thread>

namespace lint {

using ThreadFactory = std::function<std::thread(std::function<void()>)>;

// Runs `work` on up to n threads and returns once all of them have finished.
// `work` must pull its items from shared state until none are left. If a thread
// cannot be started, the calling thread runs `work` itself so nothing is left
// behind. An empty factory starts plain std::threads.
void run_workers(size_t n, const std::function<void()>& work, const ThreadFactory& spawn = {});

}  // namespace lint
