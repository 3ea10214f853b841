#pragma once

#include <vector>
#include <memory>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

#include "net/event_loop_thread.h"

namespace iomux {

class EventLoop;

/**
 * @brief N event loops, each pinned to its own thread
 *
 * getNextLoop() hands out loops round-robin; the caller keeps a channel on
 * the loop it got for the channel's whole life. With zero threads all work
 * stays on the base loop.
 */
class EventLoopThreadPool {
public:
    using ThreadInitCallback = EventLoopThread::ThreadInitCallback;

    EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg);
    ~EventLoopThreadPool();

    EventLoopThreadPool(const EventLoopThreadPool&) = delete;
    EventLoopThreadPool& operator=(const EventLoopThreadPool&) = delete;

    // 0 keeps everything on the base loop, < 0 means one per hardware thread
    void setThreadNum(int numThreads) { numThreads_ = numThreads; }
    void setPollerType(PollerType type) { pollerType_ = type; }
    void setPollTimeoutMs(int timeoutMs) { pollTimeoutMs_ = timeoutMs; }

    void start(const ThreadInitCallback& cb = ThreadInitCallback());

    /**
     * @brief Stop and join every io thread; base loop thread only
     *
     * Tasks already queued on an io loop run before its thread exits. Work
     * handed out afterwards stays on the base loop.
     */
    void stop();

    EventLoop* getNextLoop();

    /**
     * @brief Number of loops that take work, the base loop when there are no threads
     */
    std::size_t loopCount() const;

    /**
     * @brief Loop with the given id; throws std::out_of_range
     */
    EventLoop* loop(std::size_t loopId) const;

    /**
     * @brief Run callback on the loop with the given id. Any thread.
     */
    void submit(std::size_t loopId, std::function<void()> callback);

    std::vector<EventLoop*> getAllLoops() const;

    nlohmann::json metricsSnapshot() const;

    bool started() const { return started_; }
    const std::string& name() const { return name_; }

private:
    EventLoop* baseLoop_;
    std::string name_;
    bool started_;
    int numThreads_;
    PollerType pollerType_;
    int pollTimeoutMs_;
    std::size_t next_;
    std::vector<EventLoop*> loops_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
};

} // namespace iomux
