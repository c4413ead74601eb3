// TALLY - Thread Pool
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Fixed-size worker pool used by the HTTP server and by concurrent
// ledger workloads:
// - FIFO task queue with a bounded size
// - Futures for result retrieval
// - Graceful shutdown

#ifndef TALLY_UTIL_THREADPOOL_H
#define TALLY_UTIL_THREADPOOL_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
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

namespace tally {
namespace util {

// ============================================================================
// Thread Pool
// ============================================================================

class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};        // 0 = hardware concurrency
        size_t maxQueueSize{10000};  // Maximum pending tasks
        std::string name{"pool"};    // Pool name for logging
        bool startImmediately{true}; // Start workers on construction
    };

    ThreadPool();
    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);

    /// Joins the workers; queued tasks that have not started are dropped
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void Start();

    /// Stop accepting new tasks (queued tasks still run)
    void Stop();

    /// Block until the queue is empty and no task is running
    void Wait();

    /// Stop, join all workers and drop pending tasks
    void Shutdown();

    bool IsRunning() const { return running_.load() && !stopping_.load(); }
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    size_t ActiveTasks() const { return activeTasks_.load(); }
    const std::string& Name() const { return config_.name; }

    // ========================================================================
    // Task Submission
    // ========================================================================

    /**
     * Submit a task and get a future for its result. Exceptions thrown by
     * the task are delivered through the future.
     *
     * @throws std::runtime_error if the pool is stopped or the queue is full
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        using ReturnType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<ReturnType> result = task->get_future();

        Enqueue([task]() { (*task)(); }, true);
        return result;
    }

    /// Fire-and-forget submission
    template<typename F>
    void Execute(F&& f) {
        Enqueue(std::function<void()>(std::forward<F>(f)), true);
    }

    /// Like Execute but returns false instead of throwing when full or stopped
    template<typename F>
    bool TrySubmit(F&& f) {
        return Enqueue(std::function<void()>(std::forward<F>(f)), false);
    }

private:
    bool Enqueue(std::function<void()> task, bool throwOnFailure);
    void WorkerLoop();

    Config config_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;

    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable waitCondition_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<size_t> activeTasks_{0};
};

} // namespace util
} // namespace tally

#endif // TALLY_UTIL_THREADPOOL_H
