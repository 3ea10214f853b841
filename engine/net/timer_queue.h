#ifndef IOMUX_NET_TIMER_QUEUE_H
#define IOMUX_NET_TIMER_QUEUE_H

#include <set>
#include <vector>
#include <memory>

#include "net/timestamp.h"
#include "net/callbacks.h"
#include "net/channel.h"
#include "net/timer.h"

namespace iomux {

class EventLoop;

/**
 * @brief timerfd driven timer set owned by one EventLoop
 *
 * Periodic housekeeping (idle sweeps, metric dumps) runs from here so it
 * fires even when no I/O arrives.
 */
class TimerQueue {
public:
    explicit TimerQueue(EventLoop* loop);
    ~TimerQueue();

    // Schedules the callback to be run at given time,
    // repeats if interval > 0.0. Safe from any thread.
    TimerId addTimer(TimerCallback cb, Timestamp when, double interval);

    void cancel(TimerId timerId);

    std::size_t size() const { return timers_.size(); }

private:
    using Entry = std::pair<Timestamp, Timer*>;
    using TimerList = std::set<Entry>;
    using ActiveTimer = std::pair<Timer*, int64_t>;
    using ActiveTimerSet = std::set<ActiveTimer>;

    void addTimerInLoop(Timer* timer);
    void cancelInLoop(TimerId timerId);
    void handleRead();
    // Move out all expired timers
    std::vector<Entry> getExpired(Timestamp now);
    void reset(const std::vector<Entry>& expired, Timestamp now);

    bool insert(Timer* timer);

    EventLoop* loop_;
    const int timerfd_;
    Channel timerfdChannel_;
    // Timer list sorted by expiration
    TimerList timers_;

    ActiveTimerSet activeTimers_;
    bool callingExpiredTimers_;
    ActiveTimerSet cancelingTimers_;
};

} // namespace iomux

#endif // IOMUX_NET_TIMER_QUEUE_H
