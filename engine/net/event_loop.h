#pragma once

#include <vector>
#include <functional>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include "net/callbacks.h"
#include "net/loop_metrics.h"
#include "net/poller.h"
#include "net/timer.h"
#include "net/timestamp.h"

namespace iomux {

class Channel;
class TimerQueue;

/**
 * @brief EventLoop, the reactor core
 *
 * One loop per thread. Each cycle waits on the Poller, dispatches every ready
 * channel to its handlers, then drains the task queue once. Tasks queued while
 * draining run in the next cycle.
 *
 * An exception escaping a handler is logged, counted and handed to that
 * channel's failure handler; the loop and the other channels keep going.
 */
class EventLoop {
public:
    using Functor = std::function<void()>;

    static constexpr int kDefaultPollTimeoutMs = 10000;

    /**
     * @brief Create the loop for the calling thread
     *
     * Throws std::logic_error if this thread already owns a loop.
     */
    explicit EventLoop(int loopId = 0,
                       PollerType pollerType = PollerType::kDefault,
                       int pollTimeoutMs = kDefaultPollTimeoutMs);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Run until stop()
     *
     * Must be called from the thread that created the loop.
     */
    void loop();

    /**
     * @brief Ask the loop to exit after the current cycle. Any thread.
     */
    void stop();

    /**
     * @brief Run cb on the loop thread
     *
     * Runs inline when already on the loop thread; queues and wakes otherwise.
     */
    void runInLoop(Functor cb);

    /**
     * @brief Append cb to the task queue, waking the loop when needed
     */
    void queueInLoop(Functor cb);

    std::size_t queueSize() const;

    // Channel management, loop thread only
    void updateChannel(Channel* channel);
    void removeChannel(Channel* channel);
    bool hasChannel(Channel* channel);

    void wakeup();

    // Timers, callable from any thread
    TimerId runAt(Timestamp time, TimerCallback cb);
    TimerId runAfter(double delay, TimerCallback cb);
    TimerId runEvery(double interval, TimerCallback cb);
    void cancel(TimerId timerId);

    bool isInLoopThread() const { return threadId_ == std::this_thread::get_id(); }
    void assertInLoopThread() const {
        if (!isInLoopThread()) {
            abortNotInLoopThread();
        }
    }

    int loopId() const { return loopId_; }
    PollerType pollerType() const { return poller_->type(); }
    Timestamp pollReturnTime() const { return pollReturnTime_; }
    LoopMetrics& metrics() { return *metrics_; }
    const LoopMetrics& metrics() const { return *metrics_; }

    static EventLoop* getEventLoopOfCurrentThread();

private:
    void abortNotInLoopThread() const;
    void handleRead(); // wakeup
    void dispatch(Channel* channel, Timestamp receiveTime);
    void doPendingFunctors();
    void refreshRegisteredCount();

    const int loopId_;
    const int pollTimeoutMs_;
    bool looping_;
    std::atomic<bool> quit_;
    bool callingPendingFunctors_;

    const std::thread::id threadId_;
    Timestamp pollReturnTime_;

    std::unique_ptr<LoopMetrics> metrics_;
    std::unique_ptr<Poller> poller_;

    int wakeupFd_;
    std::unique_ptr<Channel> wakeupChannel_;

    Poller::ReadyList readyList_;

    mutable std::mutex mutex_;
    std::vector<Functor> pendingFunctors_;

    std::unique_ptr<TimerQueue> timerQueue_;
    // wakeup and timer channels, left out of the registered count
    std::size_t internalChannels_;
};

} // namespace iomux
