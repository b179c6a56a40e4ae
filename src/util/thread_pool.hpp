#ifndef PHIGUARD_UTIL_THREAD_POOL_HPP
#define PHIGUARD_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <vector>
#include <queue>
#include <future>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include "logger.hpp"

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used to de-identify independent documents in parallel.
 *
 * Documents share nothing except the SubjectRegistry, which does its own locking,
 * so the pool only has to hand out tasks and collect results through futures.
 *
 * Usage Example:
 *  @code
 *    phiguard::util::ThreadPool pool(4);
 *    auto fut = pool.submit([&] { return deid.deidentify(text, "p1"); });
 *    auto result = fut.get();
 *  @endcode
 */

namespace phiguard {
namespace util {

class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. Zero means hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
        logger::debug("ThreadPool: started " + std::to_string(threadCount) + " workers");
    }

    ~ThreadPool()
    {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a nullary callable; the returned future carries its result or exception.
     * @throw std::runtime_error after shutdown().
     */
    template<typename F>
    auto submit(F&& f) -> std::future<typename std::invoke_result<F>::type>
    {
        using R = typename std::invoke_result<F>::type;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> res = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool: submit after shutdown");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return res;
    }

    /**
     * @brief Drain queued tasks and join the workers. Idempotent.
     */
    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_ && workers_.empty()) {
                return;
            }
            stop_ = true;
        }
        cv_.notify_all();
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    size_t size() const { return workers_.size(); }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            // packaged_task stores any exception in the future
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_;
};

} // namespace util
} // namespace phiguard

#endif // PHIGUARD_UTIL_THREAD_POOL_HPP
