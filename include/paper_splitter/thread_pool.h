#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace paper_splitter {

// Fixed-size worker pool. Used for page header scans and for running
// independent documents of a batch side by side. Callers wait on the
// returned futures; the destructor drains the queue before joining.
class ThreadPool {
public:
    // A request for 0 threads starts one worker.
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::runtime_error once the pool is shutting down.
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<typename std::invoke_result<F, Args...>::type>;

    size_t thread_count() const { return workers_.size(); }

private:
    void run_worker();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable job_ready_;
    bool shutting_down_ = false;
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<typename std::invoke_result<F, Args...>::type> {
    using result_type = typename std::invoke_result<F, Args...>::type;

    auto job = std::make_shared<std::packaged_task<result_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    std::future<result_type> result = job->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            throw std::runtime_error("submit on stopped ThreadPool");
        }
        jobs_.emplace([job]() { (*job)(); });
    }
    job_ready_.notify_one();
    return result;
}

} // namespace paper_splitter
