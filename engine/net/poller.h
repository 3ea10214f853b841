#pragma once

#include "net/interest.h"
#include "net/timestamp.h"

#include <any>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace iomux {

class Channel;
class EventLoop;

enum class PollerType {
    kDefault,
    kEpoll,
    kPoll
};

const char* pollerTypeName(PollerType type);
PollerType parsePollerType(const std::string& name);

/**
 * @brief Poller abstract base
 *
 * Readiness multiplexer over the OS facility: EpollPoller (Linux epoll, the
 * kernel keeps the interest table and wait() costs O(ready)) or PollPoller
 * (poll(2), linear scan fallback).
 *
 * THREAD SAFETY: none. A Poller belongs to the thread running its loop.
 */
class Poller {
public:
    struct ReadyEvent {
        Channel* channel;
        InterestSet ready;
    };
    using ReadyList = std::vector<ReadyEvent>;

    explicit Poller(EventLoop* loop);
    virtual ~Poller();

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    virtual PollerType type() const = 0;

    /**
     * @brief Wait for readiness
     *
     * @param timeoutMs < 0 blocks indefinitely, 0 returns at once, > 0 waits
     *                  up to that many milliseconds
     * @param ready     cleared, then filled with (channel, satisfied interests)
     * @return time the wait returned
     */
    virtual Timestamp wait(int timeoutMs, ReadyList* ready) = 0;

    /**
     * @brief Start watching channel for interests
     *
     * Throws IoException(kAlreadyRegistered) if the channel is registered here
     * or with another poller.
     */
    void registerChannel(Channel* channel, InterestSet interests);
    // Same, attaching state that comes back with every ready entry
    void registerChannel(Channel* channel, InterestSet interests, std::any attachment);

    /**
     * @brief Replace the interest set; effective before the next wait()
     *
     * An empty set parks the channel: the OS stops reporting it but the
     * registration is kept. Throws IoException(kNotRegistered).
     */
    void modifyInterest(Channel* channel, InterestSet interests);

    /**
     * @brief Forget the channel. Throws IoException(kNotRegistered).
     */
    void deregister(Channel* channel);

    /**
     * @brief Apply channel->interests(), registering on first use
     */
    void updateChannel(Channel* channel);

    /**
     * @brief Deregister if registered; never throws on unknown channels
     */
    void removeChannel(Channel* channel);

    bool hasChannel(Channel* channel) const;
    std::size_t channelCount() const { return channels_.size(); }

    static std::unique_ptr<Poller> newPoller(EventLoop* loop, PollerType type = PollerType::kDefault);

protected:
    // OS-level table operations
    virtual void addToOs(Channel* channel) = 0;
    virtual void modifyInOs(Channel* channel) = 0;
    virtual void removeFromOs(Channel* channel) = 0;

    /**
     * @brief Requested interests satisfied by the given readiness bits
     *
     * Hang-up and error surface as every interest the channel holds, so the
     * owner observes them through its own read or write.
     */
    static InterestSet satisfied(InterestSet interests, bool readable, bool writable,
                                 bool hangup, bool error);

    using ChannelMap = std::unordered_map<int, Channel*>;
    ChannelMap channels_;

private:
    EventLoop* ownerLoop_;
};

} // namespace iomux
