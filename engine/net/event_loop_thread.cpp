#include "net/event_loop_thread.h"
#include "net/event_loop.h"
#include "logger.h"

namespace iomux {

EventLoopThread::EventLoopThread(int loopId,
                                 PollerType pollerType,
                                 int pollTimeoutMs,
                                 ThreadInitCallback cb)
    : loopId_(loopId),
      pollerType_(pollerType),
      pollTimeoutMs_(pollTimeoutMs),
      callback_(std::move(cb)),
      loop_(nullptr),
      exiting_(false),
      started_(false) {
}

EventLoopThread::~EventLoopThread() {
    exiting_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loop_) {
            loop_->stop();
        }
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

EventLoop* EventLoopThread::startLoop() {
    thread_ = std::thread(&EventLoopThread::threadFunc, this);

    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this]() { return started_; });
    if (startError_) {
        std::rethrow_exception(startError_);
    }
    return loop_;
}

void EventLoopThread::threadFunc() {
    std::unique_ptr<EventLoop> loop;
    try {
        loop.reset(new EventLoop(loopId_, pollerType_, pollTimeoutMs_));
        if (callback_) {
            callback_(loop.get());
        }
    } catch (const std::exception& e) {
        LOG_CRITICAL("EventLoop {} failed to start: {}", loopId_, e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        startError_ = std::current_exception();
        started_ = true;
        cond_.notify_one();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = loop.get();
        started_ = true;
        cond_.notify_one();
    }

    loop->loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}

} // namespace iomux
