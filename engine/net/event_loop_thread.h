#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "net/poller.h"

namespace iomux {

class EventLoop;

/**
 * @brief A thread running exactly one EventLoop
 */
class EventLoopThread {
public:
    using ThreadInitCallback = std::function<void(EventLoop*)>;

    EventLoopThread(int loopId,
                    PollerType pollerType,
                    int pollTimeoutMs,
                    ThreadInitCallback cb = ThreadInitCallback());
    ~EventLoopThread();

    EventLoopThread(const EventLoopThread&) = delete;
    EventLoopThread& operator=(const EventLoopThread&) = delete;

    /**
     * @brief Spawn the thread and block until its loop exists
     *
     * Rethrows whatever the loop constructor threw on the new thread.
     */
    EventLoop* startLoop();

private:
    void threadFunc();

    const int loopId_;
    const PollerType pollerType_;
    const int pollTimeoutMs_;
    ThreadInitCallback callback_;

    EventLoop* loop_;
    bool exiting_;
    bool started_;
    std::exception_ptr startError_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
};

} // namespace iomux
