#pragma once

#include "net/poller.h"
#include <vector>
#include <sys/epoll.h>

namespace iomux {

/**
 * @brief epoll(7) backed Poller, level-triggered
 */
class EpollPoller : public Poller {
public:
    explicit EpollPoller(EventLoop* loop);
    ~EpollPoller() override;

    PollerType type() const override { return PollerType::kEpoll; }
    Timestamp wait(int timeoutMs, ReadyList* ready) override;

protected:
    void addToOs(Channel* channel) override;
    void modifyInOs(Channel* channel) override;
    void removeFromOs(Channel* channel) override;

private:
    static const int kInitEventListSize = 16;

    void fillReadyList(int numEvents, ReadyList* ready) const;
    void update(int operation, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> events_;
};

} // namespace iomux
