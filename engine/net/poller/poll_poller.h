#pragma once

#include "net/poller.h"
#include <vector>
#include <poll.h>

namespace iomux {

/**
 * @brief poll(2) backed Poller
 *
 * Fallback for platforms without a scalable facility. Interest changes mark
 * the pollfd array dirty; it is rebuilt at the start of the next wait(), and
 * every wait scans all registered descriptors.
 */
class PollPoller : public Poller {
public:
    explicit PollPoller(EventLoop* loop);
    ~PollPoller() override;

    PollerType type() const override { return PollerType::kPoll; }
    Timestamp wait(int timeoutMs, ReadyList* ready) override;

protected:
    void addToOs(Channel*) override { dirty_ = true; }
    void modifyInOs(Channel*) override { dirty_ = true; }
    void removeFromOs(Channel*) override { dirty_ = true; }

private:
    void rebuild();

    std::vector<struct pollfd> pollfds_;
    std::vector<Channel*> pollChannels_;
    bool dirty_;
};

} // namespace iomux
