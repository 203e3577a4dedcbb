#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace cleanmarkers {

class ThreadPool {
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> q;
    std::mutex m;
    std::condition_variable cv;
    std::condition_variable idle_cv;
    size_t active = 0;
    std::atomic<bool> stop {false};

   public:
    explicit ThreadPool(unsigned n);
    ~ThreadPool();
    void submit(std::function<void()> fn);
    // Blocks until the queue is drained and no job is running.
    void wait_idle();
    size_t size() const { return workers.size(); }
};

} // namespace cleanmarkers
