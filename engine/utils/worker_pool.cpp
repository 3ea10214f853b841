#include "utils/worker_pool.h"
#include "logger.h"

#include <algorithm>
#include <exception>

namespace iomux {

WorkerPool::WorkerPool(const WorkerPoolOptions& options)
    : options_(options),
      stopping_(false),
      busy_(0),
      completed_(0),
      failed_(0),
      rejected_(0) {
    options_.coreThreads = std::max<std::size_t>(1, options_.coreThreads);
    options_.maxThreads = std::max(options_.maxThreads, options_.coreThreads);
    if (options_.queueCapacity == 0) {
        options_.queueCapacity = 1024;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    while (threads_.size() < options_.coreThreads) {
        spawnLocked();
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && threads_.empty()) {
            return;
        }
        stopping_ = true;
        threads.swap(threads_);
    }
    taskReady_.notify_all();
    spaceFree_.notify_all();
    for (auto& t : threads) {
        t.join();
    }
    LOG_DEBUG("WorkerPool [{}] stopped, {} tasks completed, {} failed",
              options_.name, completed_, failed_);
}

bool WorkerPool::post(Task task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        spaceFree_.wait(lock, [this]() {
            return stopping_ || queue_.size() < options_.queueCapacity;
        });
        if (stopping_) {
            return false;
        }
        enqueueLocked(std::move(task));
    }
    taskReady_.notify_one();
    return true;
}

bool WorkerPool::tryPost(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        if (queue_.size() >= options_.queueCapacity) {
            ++rejected_;
            return false;
        }
        enqueueLocked(std::move(task));
    }
    taskReady_.notify_one();
    return true;
}

void WorkerPool::enqueueLocked(Task task) {
    queue_.push_back(std::move(task));
    const std::size_t idle = threads_.size() - busy_;
    if (queue_.size() > idle && threads_.size() < options_.maxThreads) {
        spawnLocked();
    }
}

void WorkerPool::spawnLocked() {
    const std::size_t index = threads_.size();
    threads_.emplace_back([this, index]() { run(index); });
}

void WorkerPool::run(std::size_t index) {
    LOG_DEBUG("WorkerPool [{}] worker {} started", options_.name, index);
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        taskReady_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // Only reachable while stopping: the queue is drained first
            return;
        }
        Task task = std::move(queue_.front());
        queue_.pop_front();
        ++busy_;
        lock.unlock();
        spaceFree_.notify_one();

        bool ok = true;
        try {
            task();
        } catch (const std::exception& e) {
            ok = false;
            LOG_ERROR("WorkerPool [{}] task failed: {}", options_.name, e.what());
        }

        lock.lock();
        --busy_;
        if (ok) {
            ++completed_;
        } else {
            ++failed_;
        }
    }
}

std::size_t WorkerPool::threadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.size();
}

std::size_t WorkerPool::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t WorkerPool::rejectedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

nlohmann::json WorkerPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json stats;
    stats["name"] = options_.name;
    stats["threads"] = threads_.size();
    stats["busy"] = busy_;
    stats["queued"] = queue_.size();
    stats["queue_capacity"] = options_.queueCapacity;
    stats["completed"] = completed_;
    stats["failed"] = failed_;
    stats["rejected"] = rejected_;
    return stats;
}

} // namespace iomux
