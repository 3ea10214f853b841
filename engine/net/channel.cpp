#include "net/channel.h"
#include "net/event_loop.h"
#include "net/io_error.h"
#include "logger.h"

namespace iomux {

namespace {
const int kNew = -1;
}

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      interests_(interest::kNone),
      ready_(interest::kNone),
      hangup_(false),
      error_(false),
      index_(kNew),
      poller_(nullptr),
      tied_(false) {
}

Channel::~Channel() {
    if (poller_ != nullptr) {
        // Destroying a registered channel would leave a dangling entry behind
        LOG_ERROR("Channel fd={} destroyed while still registered", fd_);
        if (loop_ != nullptr && loop_->isInLoopThread()) {
            loop_->removeChannel(this);
        }
    }
}

void Channel::tie(const std::shared_ptr<void>& obj) {
    tie_ = obj;
    tied_ = true;
}

void Channel::update() {
    if (loop_ == nullptr) {
        throw IoException(ErrorCode::kNotRegistered, "channel has no owner loop");
    }
    loop_->updateChannel(this);
}

void Channel::remove() {
    if (loop_ == nullptr) {
        return;
    }
    loop_->removeChannel(this);
}

void Channel::handleEvent(Timestamp receiveTime) {
    if (tied_) {
        std::shared_ptr<void> guard = tie_.lock();
        if (guard) {
            handleEventWithGuard(receiveTime);
        }
    } else {
        handleEventWithGuard(receiveTime);
    }
}

void Channel::handleFailure(const std::exception& e) {
    std::shared_ptr<void> guard;
    if (tied_) {
        guard = tie_.lock();
        if (!guard) {
            return;
        }
    }
    if (failureCallback_) {
        failureCallback_(e);
    } else if (errorCallback_) {
        errorCallback_();
    }
}

void Channel::handleEventWithGuard(Timestamp receiveTime) {
    // Hang-up with no input interest: nobody will read the EOF, close now
    if (hangup_ && (ready_ & interest::kInput) == 0) {
        if (closeCallback_) {
            closeCallback_();
        }
    }

    if (error_ && errorCallback_) {
        errorCallback_();
    }

    if ((ready_ & interest::kInput) && readCallback_) {
        readCallback_(receiveTime);
    }

    if ((ready_ & interest::kOutput) && writeCallback_) {
        writeCallback_();
    }
}

} // namespace iomux
