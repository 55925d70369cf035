#include "paper_splitter/thread_pool.h"
#include <algorithm>

namespace paper_splitter {

ThreadPool::ThreadPool(size_t num_threads) {
    const size_t count = std::max<size_t>(num_threads, 1);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&ThreadPool::run_worker, this);
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
    }
    job_ready_.notify_all();

    for (auto& worker : workers_) {
        worker.join();
    }
}

void ThreadPool::run_worker() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            job_ready_.wait(lock, [this] { return shutting_down_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        job();
    }
}

} // namespace paper_splitter
