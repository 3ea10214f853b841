#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace iomux {

struct WorkerPoolOptions {
    std::size_t coreThreads = 1;
    // Extra workers are started while the queue is deeper than the worker count
    std::size_t maxThreads = 1;
    std::size_t queueCapacity = 1024;
    std::string name = "worker";
};

/**
 * @brief Threads for blocking work that must stay off the event loops
 *
 * post() waits for queue space; tryPost() rejects instead and is the only
 * variant a loop thread may call. A task that throws is logged and counted,
 * the worker keeps running. shutdown() stops intake, runs what is already
 * queued, then joins; the destructor calls it.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(const WorkerPoolOptions& options);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // False once shutdown() has begun
    bool post(Task task);
    bool tryPost(Task task);

    void shutdown();

    const std::string& name() const { return options_.name; }
    std::size_t threadCount() const;
    std::size_t queueSize() const;
    std::size_t rejectedCount() const;

    nlohmann::json stats() const;

private:
    void spawnLocked();
    void enqueueLocked(Task task);
    void run(std::size_t index);

    WorkerPoolOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable taskReady_;
    std::condition_variable spaceFree_;
    std::deque<Task> queue_;
    std::vector<std::thread> threads_;
    bool stopping_;
    std::size_t busy_;
    std::size_t completed_;
    std::size_t failed_;
    std::size_t rejected_;
};

} // namespace iomux
