#include "net/poller.h"
#include "net/channel.h"
#include "net/io_error.h"
#include "net/poller/epoll_poller.h"
#include "net/poller/poll_poller.h"
#include "logger.h"

#include <cstdlib>
#include <utility>
#include <string>

namespace iomux {

namespace {
    const int kNew = -1;
    const int kAdded = 1;
    // Known to the poller, parked with an empty interest set
    const int kDeleted = 2;
}

const char* pollerTypeName(PollerType type) {
    switch (type) {
        case PollerType::kEpoll: return "epoll";
        case PollerType::kPoll: return "poll";
        case PollerType::kDefault: return "default";
    }
    return "default";
}

PollerType parsePollerType(const std::string& name) {
    if (name == "epoll") return PollerType::kEpoll;
    if (name == "poll") return PollerType::kPoll;
    return PollerType::kDefault;
}

Poller::Poller(EventLoop* loop)
    : ownerLoop_(loop) {
}

Poller::~Poller() = default;

bool Poller::hasChannel(Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

void Poller::registerChannel(Channel* channel, InterestSet interests) {
    if (channel->poller() != nullptr || hasChannel(channel)) {
        throw IoException(ErrorCode::kAlreadyRegistered, "fd=" + std::to_string(channel->fd()));
    }
    if (channels_.count(channel->fd()) != 0) {
        // Another Channel still holds this fd: it was closed without deregistering
        throw IoException(ErrorCode::kAlreadyRegistered,
                          "fd=" + std::to_string(channel->fd()) + " held by a stale channel");
    }

    channel->setInterestsQuietly(interests);
    if (interests != interest::kNone) {
        addToOs(channel);
        channel->set_index(kAdded);
    } else {
        channel->set_index(kDeleted);
    }
    channels_[channel->fd()] = channel;
    channel->setPoller(this);
    LOG_TRACE("register fd={} interests={}", channel->fd(), interestToString(interests));
}

void Poller::registerChannel(Channel* channel, InterestSet interests, std::any attachment) {
    registerChannel(channel, interests);
    channel->attach(std::move(attachment));
}

void Poller::modifyInterest(Channel* channel, InterestSet interests) {
    if (!hasChannel(channel)) {
        throw IoException(ErrorCode::kNotRegistered, "fd=" + std::to_string(channel->fd()));
    }
    channel->setInterestsQuietly(interests);
    if (channel->index() == kAdded) {
        if (interests == interest::kNone) {
            removeFromOs(channel);
            channel->set_index(kDeleted);
        } else {
            modifyInOs(channel);
        }
    } else if (interests != interest::kNone) {
        addToOs(channel);
        channel->set_index(kAdded);
    }
}

void Poller::deregister(Channel* channel) {
    if (!hasChannel(channel)) {
        throw IoException(ErrorCode::kNotRegistered, "fd=" + std::to_string(channel->fd()));
    }
    if (channel->index() == kAdded) {
        removeFromOs(channel);
    }
    channels_.erase(channel->fd());
    channel->set_index(kNew);
    channel->setPoller(nullptr);
    LOG_TRACE("deregister fd={}", channel->fd());
}

void Poller::updateChannel(Channel* channel) {
    if (hasChannel(channel)) {
        modifyInterest(channel, channel->interests());
    } else {
        registerChannel(channel, channel->interests());
    }
}

void Poller::removeChannel(Channel* channel) {
    if (hasChannel(channel)) {
        deregister(channel);
    }
}

InterestSet Poller::satisfied(InterestSet interests, bool readable, bool writable,
                              bool hangup, bool error) {
    InterestSet ready = interest::kNone;
    if (readable) {
        ready |= interests & interest::kInput;
    }
    if (writable) {
        ready |= interests & interest::kOutput;
    }
    if (hangup || error) {
        ready |= interests;
    }
    return ready;
}

std::unique_ptr<Poller> Poller::newPoller(EventLoop* loop, PollerType type) {
    if (type == PollerType::kDefault) {
        type = ::getenv("IOMUX_USE_POLL") ? PollerType::kPoll : PollerType::kEpoll;
    }
    if (type == PollerType::kPoll) {
        return std::make_unique<PollPoller>(loop);
    }
    return std::make_unique<EpollPoller>(loop);
}

} // namespace iomux
