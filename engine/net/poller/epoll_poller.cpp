#include "net/poller/epoll_poller.h"
#include "net/channel.h"
#include "net/io_error.h"
#include "logger.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace iomux {

namespace {

uint32_t toEpollEvents(InterestSet interests) {
    uint32_t events = 0;
    if (interests & interest::kInput) {
        events |= EPOLLIN | EPOLLPRI | EPOLLRDHUP;
    }
    if (interests & interest::kOutput) {
        events |= EPOLLOUT;
    }
    return events;
}

const char* operationName(int operation) {
    switch (operation) {
        case EPOLL_CTL_ADD: return "ADD";
        case EPOLL_CTL_MOD: return "MOD";
        case EPOLL_CTL_DEL: return "DEL";
    }
    return "?";
}

} // namespace

EpollPoller::EpollPoller(EventLoop* loop)
    : Poller(loop),
      epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitEventListSize) {
    if (epollfd_ < 0) {
        int savedErrno = errno;
        LOG_CRITICAL("epoll_create1 failed: {}", std::strerror(savedErrno));
        throw IoException(ErrorCode::kSystemError, "epoll_create1", savedErrno);
    }
}

EpollPoller::~EpollPoller() {
    ::close(epollfd_);
}

Timestamp EpollPoller::wait(int timeoutMs, ReadyList* ready) {
    ready->clear();
    int numEvents = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeoutMs);
    int savedErrno = errno;
    Timestamp now(Timestamp::now());

    if (numEvents > 0) {
        fillReadyList(numEvents, ready);
        if (static_cast<size_t>(numEvents) == events_.size()) {
            events_.resize(events_.size() * 2);
        }
    } else if (numEvents < 0 && savedErrno != EINTR) {
        LOG_ERROR("epoll_wait failed: {}", std::strerror(savedErrno));
    }
    return now;
}

void EpollPoller::fillReadyList(int numEvents, ReadyList* ready) const {
    for (int i = 0; i < numEvents; ++i) {
        Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
        const uint32_t revents = events_[i].events;
        const bool readable = (revents & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) != 0;
        const bool writable = (revents & EPOLLOUT) != 0;
        const bool hangup = (revents & EPOLLHUP) != 0;
        const bool error = (revents & EPOLLERR) != 0;
        InterestSet satisfiedSet = satisfied(channel->interests(), readable, writable, hangup, error);
        channel->setReady(satisfiedSet, hangup, error);
        if (satisfiedSet != interest::kNone || hangup || error) {
            ready->push_back(ReadyEvent{channel, satisfiedSet});
        }
    }
}

void EpollPoller::addToOs(Channel* channel) {
    update(EPOLL_CTL_ADD, channel);
}

void EpollPoller::modifyInOs(Channel* channel) {
    update(EPOLL_CTL_MOD, channel);
}

void EpollPoller::removeFromOs(Channel* channel) {
    update(EPOLL_CTL_DEL, channel);
}

void EpollPoller::update(int operation, Channel* channel) {
    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = toEpollEvents(channel->interests());
    event.data.ptr = channel;
    int fd = channel->fd();
    if (::epoll_ctl(epollfd_, operation, fd, &event) < 0) {
        int savedErrno = errno;
        LOG_ERROR("epoll_ctl op={} fd={} error: {}", operationName(operation), fd, std::strerror(savedErrno));
        // A failed DEL leaves nothing behind in the kernel table
        if (operation != EPOLL_CTL_DEL) {
            throw IoException(ErrorCode::kSystemError,
                              std::string("epoll_ctl ") + operationName(operation) + " fd=" + std::to_string(fd),
                              savedErrno);
        }
    }
}

} // namespace iomux
