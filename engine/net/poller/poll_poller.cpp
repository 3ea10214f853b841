#include "net/poller/poll_poller.h"
#include "net/channel.h"
#include "logger.h"

#include <cerrno>
#include <cstring>

namespace iomux {

PollPoller::PollPoller(EventLoop* loop)
    : Poller(loop),
      dirty_(false) {
    LOG_DEBUG("using poll(2) readiness fallback");
}

PollPoller::~PollPoller() = default;

void PollPoller::rebuild() {
    pollfds_.clear();
    pollChannels_.clear();
    pollfds_.reserve(channels_.size());
    pollChannels_.reserve(channels_.size());

    for (const auto& item : channels_) {
        Channel* channel = item.second;
        InterestSet interests = channel->interests();
        if (interests == interest::kNone) {
            continue;
        }
        struct pollfd pfd;
        pfd.fd = channel->fd();
        pfd.events = 0;
        if (interests & interest::kInput) pfd.events |= POLLIN | POLLPRI | POLLRDHUP;
        if (interests & interest::kOutput) pfd.events |= POLLOUT;
        pfd.revents = 0;
        pollfds_.push_back(pfd);
        pollChannels_.push_back(channel);
    }
    dirty_ = false;
}

Timestamp PollPoller::wait(int timeoutMs, ReadyList* ready) {
    ready->clear();
    if (dirty_) {
        rebuild();
    }

    int numEvents = ::poll(pollfds_.data(), static_cast<nfds_t>(pollfds_.size()), timeoutMs);
    int savedErrno = errno;
    Timestamp now(Timestamp::now());

    if (numEvents < 0) {
        if (savedErrno != EINTR) {
            LOG_ERROR("poll failed: {}", std::strerror(savedErrno));
        }
        return now;
    }

    for (size_t i = 0; i < pollfds_.size() && numEvents > 0; ++i) {
        const short revents = pollfds_[i].revents;
        if (revents == 0) {
            continue;
        }
        --numEvents;
        Channel* channel = pollChannels_[i];
        const bool readable = (revents & (POLLIN | POLLPRI | POLLRDHUP)) != 0;
        const bool writable = (revents & POLLOUT) != 0;
        const bool hangup = (revents & POLLHUP) != 0;
        const bool error = (revents & (POLLERR | POLLNVAL)) != 0;
        InterestSet satisfiedSet = satisfied(channel->interests(), readable, writable, hangup, error);
        channel->setReady(satisfiedSet, hangup, error);
        ready->push_back(ReadyEvent{channel, satisfiedSet});
    }
    return now;
}

} // namespace iomux
