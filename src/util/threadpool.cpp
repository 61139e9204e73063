// DECMAIL - Thread Pool Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/util/threadpool.h>
#include <decmail/util/logging.h>

#include <algorithm>

namespace decmail {
namespace util {

namespace {

ThreadPool::Config WithThreads(size_t numThreads) {
    ThreadPool::Config config;
    config.numThreads = numThreads;
    return config;
}

} // namespace

ThreadPool::ThreadPool(size_t numThreads) : ThreadPool(WithThreads(numThreads)) {}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    size_t count = config_.numThreads;
    if (count == 0) {
        count = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&ThreadPool::Worker, this);
    }
    LOG_TRACE(LogCategory::TRANSPORT) << "Pool " << config_.name << " started " << count
                                      << " worker(s)";
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("ThreadPool " + config_.name + " is shut down");
        }
        if (queue_.size() >= config_.maxQueueSize) {
            throw std::runtime_error("ThreadPool " + config_.name + " queue is full");
        }
        queue_.push_back(std::move(job));
    }
    workAvailable_.notify_one();
}

void ThreadPool::Worker() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        workAvailable_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (stopping_) {
            return;
        }
        
        std::function<void()> job = std::move(queue_.front());
        queue_.pop_front();
        ++running_;
        
        lock.unlock();
        job();
        lock.lock();
        
        --running_;
        if (queue_.empty() && running_ == 0) {
            idle_.notify_all();
        }
    }
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return stopping_ || (queue_.empty() && running_ == 0); });
}

void ThreadPool::Shutdown() {
    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        dropped.swap(queue_);
    }
    workAvailable_.notify_all();
    idle_.notify_all();
    
    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();
}

bool ThreadPool::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace util
} // namespace decmail
