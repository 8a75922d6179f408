#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace hdrguard {

class ThreadPool {
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> q;
    std::mutex m;
    std::condition_variable cv;
    std::atomic<bool> stop {false};

   public:
    // n == 0 means one worker per hardware thread
    explicit ThreadPool(unsigned n);
    ~ThreadPool();
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void submit(std::function<void()> fn);
};

} // namespace hdrguard
