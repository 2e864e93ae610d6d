#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Pool for per-symbol work. It only grows; the destructor finishes queued
// tasks and joins the workers.
class WorkerPool {
public:
    explicit WorkerPool(unsigned threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void post(std::function<void()> fn);

    // Starts workers until there are at least `threads`
    void grow_to(unsigned threads);

    unsigned size();

private:
    void worker_loop();

    std::vector<std::thread> threads_;
    std::mutex mx_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> queue_;
    std::atomic<bool> stopping_{false};
};
