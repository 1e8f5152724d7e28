#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace scholar_parser {

// Fixed set of workers draining a FIFO queue of parse jobs
class ThreadPool {
public:
    // 0 means one worker per hardware thread
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>>;

    // Blocks until the queue is empty and no job is running
    void wait_idle();

    size_t pending() const;
    size_t size() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable job_ready_;
    std::condition_variable idle_;
    bool stopping_ = false;
    std::atomic<size_t> running_{0};
};

template<typename F>
auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<F>> {
    using result_type = std::invoke_result_t<F>;

    auto job = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(f));
    std::future<result_type> result = job->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("submit on stopped ThreadPool");
        }
        ++running_;
        jobs_.emplace([job]() { (*job)(); });
    }
    job_ready_.notify_one();
    return result;
}

} // namespace scholar_parser
