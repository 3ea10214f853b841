#include "net/signal_fd.h"
#include "net/event_loop.h"
#include "net/io_error.h"
#include "logger.h"
#include <pthread.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace iomux {

SignalFd::SignalFd(EventLoop* loop)
    : loop_(loop), fd_(-1) {
    sigemptyset(&mask_);
}

SignalFd::~SignalFd() {
    closeChannel();
}

void SignalFd::closeChannel() {
    // Deregister before the descriptor goes away
    if (channel_) {
        channel_->disableAll();
        channel_->remove();
        channel_.reset();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void SignalFd::addSignal(int signo) {
    sigaddset(&mask_, signo);

    int err = ::pthread_sigmask(SIG_BLOCK, &mask_, nullptr);
    if (err != 0) {
        LOG_ERROR("pthread_sigmask failed: {}", std::strerror(err));
        throw IoException(ErrorCode::kSystemError, "pthread_sigmask", err);
    }

    closeChannel();

    fd_ = ::signalfd(-1, &mask_, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd_ < 0) {
        int savedErrno = errno;
        LOG_ERROR("signalfd failed: {}", std::strerror(savedErrno));
        throw IoException(ErrorCode::kSystemError, "signalfd", savedErrno);
    }

    channel_ = std::make_unique<Channel>(loop_, fd_);
    channel_->setReadCallback([this](Timestamp) { handleRead(); });
    channel_->enableReading();
}

void SignalFd::handleRead() {
    struct signalfd_siginfo fdsi;
    ssize_t s = ::read(fd_, &fdsi, sizeof(struct signalfd_siginfo));
    if (s != sizeof(struct signalfd_siginfo)) {
        LOG_ERROR("SignalFd::handleRead read {} bytes", s);
        return;
    }

    LOG_INFO("Received signal {} ({})", fdsi.ssi_signo, ::strsignal(static_cast<int>(fdsi.ssi_signo)));
    if (callback_) {
        callback_(static_cast<int>(fdsi.ssi_signo));
    }
}

} // namespace iomux
