#include "worker_pool.hpp"
#include <spdlog/spdlog.h>

WorkerPool::WorkerPool(unsigned threads) {
    if (threads == 0) threads = 1;
    threads_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        threads_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lk(mx_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::post(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lk(mx_);
        if (stopping_) return;
        queue_.push(std::move(fn));
    }
    cv_.notify_one();
}

void WorkerPool::grow_to(unsigned threads) {
    std::lock_guard<std::mutex> lk(mx_);
    if (stopping_) return;
    while (threads_.size() < threads) {
        threads_.emplace_back([this] { worker_loop(); });
    }
}

unsigned WorkerPool::size() {
    std::lock_guard<std::mutex> lk(mx_);
    return static_cast<unsigned>(threads_.size());
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> fn;
        {
            std::unique_lock<std::mutex> lk(mx_);
            cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) return;
            fn = std::move(queue_.front());
            queue_.pop();
        }

        try {
            fn();
        } catch (const std::exception& e) {
            spdlog::error("Worker task failed: {}", e.what());
        }
    }
}
