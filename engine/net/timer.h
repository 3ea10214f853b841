#pragma once

#include "net/callbacks.h"
#include "net/timestamp.h"

#include <atomic>
#include <cstdint>

namespace iomux {

/**
 * @brief One scheduled callback, optionally repeating
 */
class Timer {
public:
    Timer(TimerCallback cb, Timestamp when, double interval)
        : callback_(std::move(cb)),
          expiration_(when),
          interval_(interval),
          repeat_(interval > 0.0),
          sequence_(++s_numCreated_) {
    }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    void run() const { callback_(); }

    Timestamp expiration() const { return expiration_; }
    bool repeat() const { return repeat_; }
    int64_t sequence() const { return sequence_; }

    void restart(Timestamp now) {
        expiration_ = repeat_ ? addTime(now, interval_) : Timestamp::invalid();
    }

private:
    const TimerCallback callback_;
    Timestamp expiration_;
    const double interval_;
    const bool repeat_;
    const int64_t sequence_;

    static std::atomic<int64_t> s_numCreated_;
};

/**
 * @brief Opaque handle for cancelling a timer
 */
class TimerId {
public:
    TimerId() : timer_(nullptr), sequence_(0) {}
    TimerId(Timer* timer, int64_t seq) : timer_(timer), sequence_(seq) {}

    bool valid() const { return timer_ != nullptr; }

    friend class TimerQueue;

private:
    Timer* timer_;
    int64_t sequence_;
};

} // namespace iomux
