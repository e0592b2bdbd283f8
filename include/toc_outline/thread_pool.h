#pragma once

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

namespace toc_outline {

// Fixed set of workers draining a FIFO of page jobs. Futures carry results and
// exceptions back to the submitting thread.
class ThreadPool {
public:
    explicit ThreadPool(size_t worker_count);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    size_t worker_count() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;

    std::mutex mutex_;
    std::condition_variable job_ready_;
    bool stopping_ = false;
};

template<typename F, typename... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using result_type = std::invoke_result_t<F, Args...>;

    auto job = std::make_shared<std::packaged_task<result_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<result_type> result = job->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("enqueue on stopped ThreadPool");
        }
        jobs_.emplace([job]() { (*job)(); });
    }
    job_ready_.notify_one();
    return result;
}

} // namespace toc_outline
