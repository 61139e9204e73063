// DECMAIL - Thread Pool
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Fixed set of workers draining a bounded FIFO queue. The mailbox uses one
// pool per instance to issue the same backend call to every backend at once.

#ifndef DECMAIL_UTIL_THREADPOOL_H
#define DECMAIL_UTIL_THREADPOOL_H

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace decmail {
namespace util {

/**
 * Worker pool.
 *
 * Tasks must not wait for other tasks of the same pool: with every worker
 * blocked that way the queue never drains.
 */
class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};        // 0 = hardware concurrency
        size_t maxQueueSize{4096};   // queued, not yet running tasks
        std::string name{"pool"};
    };
    
    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);
    
    /// Shuts down
    ~ThreadPool();
    
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    
    /**
     * Queue a callable; its result or exception arrives through the future.
     * Throws std::runtime_error after Shutdown or when the queue is full.
     */
    template<typename F>
    auto Submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
        using Result = std::invoke_result_t<std::decay_t<F>&>;
        
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        std::future<Result> result = task->get_future();
        Enqueue([task]() { (*task)(); });
        return result;
    }
    
    /// Block until the queue is empty and no task runs
    void Wait();
    
    /**
     * Stop accepting work, drop queued tasks (their futures report
     * broken_promise) and join the workers after their current task.
     */
    void Shutdown();
    
    bool IsRunning() const;
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    const std::string& Name() const { return config_.name; }

private:
    Config config_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    size_t running_{0};
    bool stopping_{false};
    
    mutable std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;
    
    void Enqueue(std::function<void()> job);
    void Worker();
};

} // namespace util
} // namespace decmail

#endif // DECMAIL_UTIL_THREADPOOL_H
