#pragma once

#include "net/interest.h"
#include "net/timestamp.h"

#include <any>
#include <exception>
#include <functional>
#include <memory>

namespace iomux {

class EventLoop;
class Poller;

/**
 * @brief Multiplexer registration entry
 *
 * Binds a file descriptor to its interest set, an optional user attachment
 * and the handlers the loop runs when the descriptor turns ready. The
 * Channel never owns the descriptor.
 *
 * A Channel is registered with at most one Poller at a time; it must be
 * removed before it can be registered elsewhere.
 */
class Channel {
public:
    using EventCallback = std::function<void()>;
    using ReadEventCallback = std::function<void(Timestamp)>;
    using FailureCallback = std::function<void(const std::exception&)>;

    Channel(EventLoop* loop, int fd);
    ~Channel();

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Dispatch the last reported readiness to the handlers
     *
     * Called by EventLoop only.
     */
    void handleEvent(Timestamp receiveTime);

    /**
     * @brief Report an exception that escaped one of this channel's handlers
     *
     * Runs the failure callback, or the error callback when none is set.
     */
    void handleFailure(const std::exception& e);

    /**
     * @brief Tie the channel to its owner's lifetime
     *
     * Keeps an owner such as TcpConnection alive while its handlers run.
     */
    void tie(const std::shared_ptr<void>&);

    int fd() const { return fd_; }
    InterestSet interests() const { return interests_; }
    InterestSet ready() const { return ready_; }
    bool hangup() const { return hangup_; }
    bool error() const { return error_; }

    // Written by the Poller
    void setReady(InterestSet ready, bool hangup, bool error) {
        ready_ = ready;
        hangup_ = hangup;
        error_ = error;
    }
    void setInterestsQuietly(InterestSet interests) { interests_ = interests; }
    int index() const { return index_; }
    void set_index(int idx) { index_ = idx; }
    Poller* poller() const { return poller_; }
    void setPoller(Poller* poller) { poller_ = poller; }

    void setReadCallback(ReadEventCallback cb) { readCallback_ = std::move(cb); }
    void setWriteCallback(EventCallback cb) { writeCallback_ = std::move(cb); }
    void setCloseCallback(EventCallback cb) { closeCallback_ = std::move(cb); }
    void setErrorCallback(EventCallback cb) { errorCallback_ = std::move(cb); }
    void setFailureCallback(FailureCallback cb) { failureCallback_ = std::move(cb); }

    // Interest toggles, applied through the owner loop's poller
    void enableReading() { interests_ |= interest::kRead; update(); }
    void disableReading() { interests_ &= ~interest::kRead; update(); }
    void enableWriting() { interests_ |= interest::kWrite; update(); }
    void disableWriting() { interests_ &= ~interest::kWrite; update(); }
    void enableAccepting() { interests_ |= interest::kAccept; update(); }
    void enableConnecting() { interests_ |= interest::kConnect; update(); }
    void disableConnecting() { interests_ &= ~interest::kConnect; update(); }
    void disableAll() { interests_ = interest::kNone; update(); }
    void setInterests(InterestSet interests) { interests_ = interests; update(); }

    bool isWriting() const { return (interests_ & interest::kWrite) != 0; }
    bool isReading() const { return (interests_ & interest::kRead) != 0; }
    bool isNoneEvent() const { return interests_ == interest::kNone; }

    // Optional user state carried with the registration
    void attach(std::any state) { attachment_ = std::move(state); }
    const std::any& attachment() const { return attachment_; }
    std::any* mutableAttachment() { return &attachment_; }

    EventLoop* ownerLoop() const { return loop_; }

    /**
     * @brief Deregister from the owner loop's poller
     */
    void remove();

private:
    void update();
    void handleEventWithGuard(Timestamp receiveTime);

    EventLoop* loop_;
    const int fd_;
    InterestSet interests_;
    InterestSet ready_;
    bool hangup_;
    bool error_;
    int index_; // used by Poller
    Poller* poller_;
    bool tied_;
    std::weak_ptr<void> tie_;
    std::any attachment_;

    ReadEventCallback readCallback_;
    EventCallback writeCallback_;
    EventCallback closeCallback_;
    EventCallback errorCallback_;
    FailureCallback failureCallback_;
};

} // namespace iomux
