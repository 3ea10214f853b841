#pragma once

#include "net/channel.h"
#include <functional>
#include <memory>
#include <sys/signalfd.h>
#include <signal.h>

namespace iomux {

class EventLoop;

/**
 * @brief Delivers signals as readable events on a loop
 *
 * addSignal() blocks the signal for the calling thread; call it before
 * spawning other threads so they inherit the mask.
 */
class SignalFd {
public:
    using SignalCallback = std::function<void(int)>;

    explicit SignalFd(EventLoop* loop);
    ~SignalFd();

    SignalFd(const SignalFd&) = delete;
    SignalFd& operator=(const SignalFd&) = delete;

    // Throws IoException(kSystemError) if the mask or signalfd cannot be set up
    void addSignal(int signo);
    void setCallback(SignalCallback cb) { callback_ = std::move(cb); }

private:
    void handleRead();
    void closeChannel();

    EventLoop* loop_;
    int fd_;
    std::unique_ptr<Channel> channel_;
    SignalCallback callback_;
    sigset_t mask_;
};

} // namespace iomux
