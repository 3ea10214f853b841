#include "net/event_loop_thread_pool.h"
#include "net/event_loop.h"
#include "logger.h"

#include <stdexcept>
#include <thread>

namespace iomux {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg)
    : baseLoop_(baseLoop),
      name_(nameArg),
      started_(false),
      numThreads_(0),
      pollerType_(PollerType::kDefault),
      pollTimeoutMs_(EventLoop::kDefaultPollTimeoutMs),
      next_(0) {
}

EventLoopThreadPool::~EventLoopThreadPool() {
    // Don't delete baseLoop_; threads_ stop and join their loops
}

void EventLoopThreadPool::start(const ThreadInitCallback& cb) {
    if (started_) {
        throw std::logic_error("EventLoopThreadPool " + name_ + " already started");
    }
    baseLoop_->assertInLoopThread();
    started_ = true;

    int numThreads = numThreads_;
    if (numThreads < 0) {
        numThreads = static_cast<int>(std::thread::hardware_concurrency());
        if (numThreads <= 0) {
            numThreads = 1;
        }
    }

    for (int i = 0; i < numThreads; ++i) {
        // Loop id equals the index accepted by loop() and submit()
        auto t = std::make_unique<EventLoopThread>(i, pollerType_, pollTimeoutMs_, cb);
        EventLoop* loop = t->startLoop();
        threads_.push_back(std::move(t));
        loops_.push_back(loop);
    }

    if (numThreads == 0 && cb) {
        cb(baseLoop_);
    }
    LOG_INFO("EventLoopThreadPool {} started with {} io thread(s)", name_, numThreads);
}

void EventLoopThreadPool::stop() {
    baseLoop_->assertInLoopThread();
    if (threads_.empty()) {
        return;
    }
    loops_.clear();
    next_ = 0;
    // Each EventLoopThread stops its loop and joins on destruction
    threads_.clear();
    LOG_INFO("EventLoopThreadPool {} stopped", name_);
}

EventLoop* EventLoopThreadPool::getNextLoop() {
    baseLoop_->assertInLoopThread();
    EventLoop* loop = baseLoop_;

    if (!loops_.empty()) {
        // Round-robin
        loop = loops_[next_];
        ++next_;
        if (next_ >= loops_.size()) {
            next_ = 0;
        }
    }
    return loop;
}

std::size_t EventLoopThreadPool::loopCount() const {
    return loops_.empty() ? 1 : loops_.size();
}

EventLoop* EventLoopThreadPool::loop(std::size_t loopId) const {
    if (loops_.empty()) {
        if (loopId == 0) {
            return baseLoop_;
        }
    } else if (loopId < loops_.size()) {
        return loops_[loopId];
    }
    throw std::out_of_range("no event loop with id " + std::to_string(loopId));
}

void EventLoopThreadPool::submit(std::size_t loopId, std::function<void()> callback) {
    loop(loopId)->queueInLoop(std::move(callback));
}

std::vector<EventLoop*> EventLoopThreadPool::getAllLoops() const {
    if (loops_.empty()) {
        return std::vector<EventLoop*>(1, baseLoop_);
    }
    return loops_;
}

nlohmann::json EventLoopThreadPool::metricsSnapshot() const {
    nlohmann::json loops = nlohmann::json::array();
    for (EventLoop* loop : getAllLoops()) {
        loops.push_back(loop->metrics().snapshot());
    }
    return loops;
}

} // namespace iomux
