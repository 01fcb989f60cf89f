#include "chunkvault/core/thread_pool.hpp"
#include "chunkvault/core/logger.hpp"

namespace chunkvault::core {

ThreadPool::ThreadPool(size_t num_threads) : stopping_(false) {
    if (num_threads == 0) {
        throw std::invalid_argument("ThreadPool requires at least one thread");
    }
    
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] {
            for (;;) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex_);
                    condition_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
                    
                    // Drain remaining tasks before exiting
                    if (stopping_ && tasks_.empty()) {
                        return;
                    }
                    
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                task();
            }
        });
    }
    
    LOG_DEBUG("ThreadPool started with {} workers", num_threads);
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    condition_.notify_all();
    
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

}
