#include "net/event_loop.h"
#include "net/channel.h"
#include "net/io_error.h"
#include "net/poller.h"
#include "net/timer_queue.h"
#include "logger.h"

#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>

namespace iomux {

namespace {
    __thread EventLoop* t_loopInThisThread = nullptr;

    int createEventfd() {
        int evtfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (evtfd < 0) {
            int savedErrno = errno;
            LOG_CRITICAL("Failed in eventfd: {}", std::strerror(savedErrno));
            throw IoException(ErrorCode::kSystemError, "eventfd", savedErrno);
        }
        return evtfd;
    }
}

EventLoop* EventLoop::getEventLoopOfCurrentThread() {
    return t_loopInThisThread;
}

EventLoop::EventLoop(int loopId, PollerType pollerType, int pollTimeoutMs)
    : loopId_(loopId),
      pollTimeoutMs_(pollTimeoutMs),
      looping_(false),
      quit_(false),
      callingPendingFunctors_(false),
      threadId_(std::this_thread::get_id()),
      metrics_(new LoopMetrics(loopId)),
      poller_(Poller::newPoller(this, pollerType)),
      wakeupFd_(createEventfd()),
      wakeupChannel_(new Channel(this, wakeupFd_)),
      internalChannels_(0) {
    if (t_loopInThisThread) {
        LOG_CRITICAL("Another EventLoop {} exists in this thread", t_loopInThisThread->loopId());
        ::close(wakeupFd_);
        throw std::logic_error("another EventLoop exists in this thread");
    }

    wakeupChannel_->setReadCallback([this](Timestamp) { handleRead(); });
    wakeupChannel_->enableReading();
    timerQueue_.reset(new TimerQueue(this));
    internalChannels_ = poller_->channelCount();
    refreshRegisteredCount();

    t_loopInThisThread = this;
    LOG_DEBUG("EventLoop {} created with {} poller", loopId_, pollerTypeName(poller_->type()));
}

EventLoop::~EventLoop() {
    // Tasks queued after the last cycle (connection teardown, mostly)
    doPendingFunctors();
    timerQueue_.reset();
    wakeupChannel_->disableAll();
    wakeupChannel_->remove();
    ::close(wakeupFd_);
    if (t_loopInThisThread == this) {
        t_loopInThisThread = nullptr;
    }
}

void EventLoop::loop() {
    assertInLoopThread();
    if (looping_) return;
    looping_ = true;

    LOG_INFO("EventLoop {} start looping", loopId_);

    while (!quit_) {
        auto waitStart = std::chrono::steady_clock::now();
        pollReturnTime_ = poller_->wait(pollTimeoutMs_, &readyList_);
        auto waited = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - waitStart).count();
        metrics_->recordWait(waited, readyList_.size());

        for (const Poller::ReadyEvent& event : readyList_) {
            // Deregistered by an earlier handler of this cycle
            if (event.channel->poller() == nullptr) {
                continue;
            }
            dispatch(event.channel, pollReturnTime_);
        }

        doPendingFunctors();
    }
    LOG_INFO("EventLoop {} stop looping", loopId_);
    looping_ = false;
    quit_ = false;
}

void EventLoop::dispatch(Channel* channel, Timestamp receiveTime) {
    try {
        channel->handleEvent(receiveTime);
    } catch (const std::exception& e) {
        metrics_->handlerFailures.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("EventLoop {} handler for fd={} failed: {}", loopId_, channel->fd(), e.what());
        try {
            channel->handleFailure(e);
        } catch (const std::exception& inner) {
            LOG_ERROR("EventLoop {} failure handler for fd={} failed: {}", loopId_, channel->fd(), inner.what());
        }
    }
}

void EventLoop::stop() {
    quit_ = true;
    if (!isInLoopThread()) {
        wakeup();
    }
}

void EventLoop::runInLoop(Functor cb) {
    if (isInLoopThread()) {
        cb();
    } else {
        queueInLoop(std::move(cb));
    }
}

void EventLoop::queueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingFunctors_.emplace_back(std::move(cb));
    }
    if (!isInLoopThread() || callingPendingFunctors_) {
        wakeup();
    }
}

std::size_t EventLoop::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pendingFunctors_.size();
}

void EventLoop::updateChannel(Channel* channel) {
    assertInLoopThread();
    poller_->updateChannel(channel);
    refreshRegisteredCount();
}

void EventLoop::removeChannel(Channel* channel) {
    assertInLoopThread();
    poller_->removeChannel(channel);
    refreshRegisteredCount();
}

bool EventLoop::hasChannel(Channel* channel) {
    assertInLoopThread();
    return poller_->hasChannel(channel);
}

void EventLoop::refreshRegisteredCount() {
    std::size_t count = poller_->channelCount();
    metrics_->registeredChannels.store(count > internalChannels_ ? count - internalChannels_ : 0,
                                       std::memory_order_relaxed);
}

void EventLoop::abortNotInLoopThread() const {
    LOG_CRITICAL("EventLoop {} used from a thread other than its own", loopId_);
    throw std::logic_error("EventLoop used outside its thread");
}

void EventLoop::wakeup() {
    uint64_t one = 1;
    ssize_t n = ::write(wakeupFd_, &one, sizeof(one));
    if (n != sizeof(one)) {
        LOG_ERROR("EventLoop::wakeup() writes {} bytes instead of 8", n);
    }
}

void EventLoop::handleRead() {
    uint64_t one = 1;
    ssize_t n = ::read(wakeupFd_, &one, sizeof(one));
    if (n != sizeof(one)) {
        LOG_ERROR("EventLoop::handleRead() reads {} bytes instead of 8", n);
    }
}

void EventLoop::doPendingFunctors() {
    std::vector<Functor> functors;
    callingPendingFunctors_ = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pendingFunctors_);
    }

    for (const auto& functor : functors) {
        try {
            functor();
        } catch (const std::exception& e) {
            metrics_->handlerFailures.fetch_add(1, std::memory_order_relaxed);
            LOG_ERROR("EventLoop {} task failed: {}", loopId_, e.what());
        }
    }
    metrics_->tasksRun.fetch_add(functors.size(), std::memory_order_relaxed);
    callingPendingFunctors_ = false;
}

TimerId EventLoop::runAt(Timestamp time, TimerCallback cb) {
    return timerQueue_->addTimer(std::move(cb), time, 0.0);
}

TimerId EventLoop::runAfter(double delay, TimerCallback cb) {
    Timestamp time = addTime(Timestamp::now(), delay);
    return runAt(time, std::move(cb));
}

TimerId EventLoop::runEvery(double interval, TimerCallback cb) {
    Timestamp time = addTime(Timestamp::now(), interval);
    return timerQueue_->addTimer(std::move(cb), time, interval);
}

void EventLoop::cancel(TimerId timerId) {
    timerQueue_->cancel(timerId);
}

} // namespace iomux
