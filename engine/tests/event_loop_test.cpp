#include <gtest/gtest.h>
#include "net/event_loop.h"
#include "net/event_loop_thread.h"
#include "net/event_loop_thread_pool.h"
#include "net/channel.h"
#include "net/signal_fd.h"
#include <sys/eventfd.h>
#include <signal.h>
#include <unistd.h>
#include <thread>
#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace iomux;

class EventLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
    }
    void TearDown() override {
    }
};

TEST_F(EventLoopTest, BasicLoop) {
    EventLoop loop;
    EXPECT_TRUE(loop.isInLoopThread());
    EXPECT_EQ(EventLoop::getEventLoopOfCurrentThread(), &loop);

    // Stop after 100ms
    std::thread t([&loop](){
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        loop.stop();
    });

    loop.loop();
    t.join();
}

TEST_F(EventLoopTest, EventFdTrigger) {
    EventLoop loop;
    int evtfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    ASSERT_GT(evtfd, 0);

    Channel channel(&loop, evtfd);
    bool triggered = false;

    channel.setReadCallback([&](Timestamp){
        uint64_t one;
        ssize_t n = ::read(evtfd, &one, sizeof(one));
        (void)n;
        triggered = true;
        loop.stop();
    });
    channel.enableReading();
    EXPECT_EQ(loop.metrics().registeredChannels.load(), 1u);

    // Write to eventfd after 50ms
    std::thread t([&](){
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        uint64_t one = 1;
        ssize_t n = ::write(evtfd, &one, sizeof(one));
        (void)n;
    });

    loop.loop();
    t.join();

    EXPECT_TRUE(triggered);
    channel.disableAll();
    channel.remove();
    EXPECT_EQ(loop.metrics().registeredChannels.load(), 0u);
    ::close(evtfd);
}

TEST_F(EventLoopTest, QueueInLoopCrossThread) {
    EventLoop loop;
    std::atomic<bool> ran(false);

    std::thread t([&](){
        loop.queueInLoop([&](){
            ran = true;
            loop.stop();
        });
    });

    loop.loop();
    t.join();
    EXPECT_TRUE(ran);
}

TEST_F(EventLoopTest, SecondLoopInThreadRejected) {
    EventLoop loop;
    EXPECT_THROW(EventLoop second, std::logic_error);
    EXPECT_EQ(EventLoop::getEventLoopOfCurrentThread(), &loop);
}

TEST_F(EventLoopTest, ChannelUpdateFromOtherThreadRejected) {
    EventLoop loop;
    int evtfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    ASSERT_GT(evtfd, 0);
    Channel channel(&loop, evtfd);

    bool threw = false;
    std::thread t([&]() {
        try {
            channel.enableReading();
        } catch (const std::logic_error&) {
            threw = true;
        }
    });
    t.join();
    EXPECT_TRUE(threw);
    EXPECT_FALSE(loop.hasChannel(&channel));
    ::close(evtfd);
}

TEST_F(EventLoopTest, TasksQueuedDuringDrainRunNextCycle) {
    EventLoop loop;
    std::vector<int> order;
    loop.queueInLoop([&]() {
        order.push_back(1);
        loop.queueInLoop([&]() {
            order.push_back(3);
            loop.stop();
        });
    });
    loop.queueInLoop([&]() { order.push_back(2); });
    EXPECT_EQ(loop.queueSize(), 2u);

    loop.loop();
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
    EXPECT_EQ(order[2], 3);
    EXPECT_EQ(loop.metrics().tasksRun.load(), 3u);
}

TEST_F(EventLoopTest, HandlerExceptionDoesNotStopLoop) {
    EventLoop loop;
    int evtfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    ASSERT_GT(evtfd, 0);

    Channel channel(&loop, evtfd);
    int failures = 0;
    std::string lastFailure;
    channel.setReadCallback([&](Timestamp) {
        uint64_t one;
        ssize_t n = ::read(evtfd, &one, sizeof(one));
        (void)n;
        throw std::runtime_error("handler blew up");
    });
    channel.setFailureCallback([&](const std::exception& e) {
        failures++;
        lastFailure = e.what();
        channel.disableAll();
    });
    channel.enableReading();

    uint64_t one = 1;
    ASSERT_EQ(::write(evtfd, &one, sizeof(one)), static_cast<ssize_t>(sizeof(one)));

    bool laterTaskRan = false;
    loop.runAfter(0.05, [&]() {
        laterTaskRan = true;
        loop.stop();
    });
    loop.loop();

    EXPECT_EQ(failures, 1);
    EXPECT_EQ(lastFailure, "handler blew up");
    EXPECT_TRUE(laterTaskRan);
    EXPECT_EQ(loop.metrics().handlerFailures.load(), 1u);

    channel.remove();
    ::close(evtfd);
}

TEST_F(EventLoopTest, ChannelRemovedMidCycleNotDispatched) {
    EventLoop loop;
    int first = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    int second = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    ASSERT_GT(first, 0);
    ASSERT_GT(second, 0);

    Channel a(&loop, first);
    Channel b(&loop, second);
    int handled = 0;

    // Whichever handler runs first deregisters the other one
    a.setReadCallback([&](Timestamp) {
        uint64_t count;
        ssize_t n = ::read(first, &count, sizeof(count));
        (void)n;
        handled++;
        b.disableAll();
        b.remove();
    });
    b.setReadCallback([&](Timestamp) {
        uint64_t count;
        ssize_t n = ::read(second, &count, sizeof(count));
        (void)n;
        handled++;
        a.disableAll();
        a.remove();
    });
    a.enableReading();
    b.enableReading();

    // Both ready before the first wait, so they land in the same cycle
    uint64_t one = 1;
    ASSERT_EQ(::write(first, &one, sizeof(one)), static_cast<ssize_t>(sizeof(one)));
    ASSERT_EQ(::write(second, &one, sizeof(one)), static_cast<ssize_t>(sizeof(one)));

    loop.runAfter(0.05, [&loop]() { loop.stop(); });
    loop.loop();

    EXPECT_EQ(handled, 1);
    EXPECT_EQ(loop.metrics().registeredChannels.load(), 1u);
    a.disableAll();
    a.remove();
    b.disableAll();
    b.remove();
    EXPECT_EQ(loop.metrics().registeredChannels.load(), 0u);
    ::close(first);
    ::close(second);
}

TEST_F(EventLoopTest, TaskExceptionIsolated) {
    EventLoop loop;
    bool secondRan = false;
    loop.queueInLoop([]() { throw std::runtime_error("task failed"); });
    loop.queueInLoop([&]() {
        secondRan = true;
        loop.stop();
    });
    loop.loop();
    EXPECT_TRUE(secondRan);
    EXPECT_EQ(loop.metrics().handlerFailures.load(), 1u);
}

TEST_F(EventLoopTest, WaitMetricsRecorded) {
    EventLoop loop(7, PollerType::kPoll, 20);
    EXPECT_EQ(loop.pollerType(), PollerType::kPoll);
    int cycles = 0;
    loop.runEvery(0.01, [&]() {
        if (++cycles == 3) {
            loop.stop();
        }
    });
    loop.loop();

    json snap = loop.metrics().snapshot();
    EXPECT_EQ(snap["loop_id"], 7);
    EXPECT_GE(snap["wait"]["calls"].get<uint64_t>(), 3u);
    EXPECT_GE(snap["wait"]["ready_events"].get<uint64_t>(), 3u);
    EXPECT_GE(snap["wait"]["max_us"].get<int64_t>(), snap["wait"]["avg_us"].get<int64_t>());
    EXPECT_EQ(snap["registered_channels"], 0);
}

TEST_F(EventLoopTest, StopFromSignal) {
    EventLoop loop;
    SignalFd signals(&loop);
    int received = 0;
    signals.setCallback([&](int signo) {
        received = signo;
        loop.stop();
    });
    signals.addSignal(SIGUSR1);

    // Blocked by addSignal, so it stays pending for the signalfd
    loop.queueInLoop([]() { ::raise(SIGUSR1); });
    loop.loop();
    EXPECT_EQ(received, SIGUSR1);
}

TEST(EventLoopThreadTest, StartLoopRunsInOwnThread) {
    EventLoopThread loopThread(3, PollerType::kDefault, 100);
    EventLoop* loop = loopThread.startLoop();
    ASSERT_NE(loop, nullptr);
    EXPECT_EQ(loop->loopId(), 3);
    EXPECT_FALSE(loop->isInLoopThread());

    std::atomic<bool> inLoopThread{false};
    std::atomic<bool> done{false};
    loop->runInLoop([&]() {
        inLoopThread = loop->isInLoopThread();
        done = true;
    });
    for (int i = 0; i < 100 && !done; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(done);
    EXPECT_TRUE(inLoopThread);
}

TEST(EventLoopThreadPoolTest, SubmitTargetsLoopById) {
    EventLoop baseLoop;
    EventLoopThreadPool pool(&baseLoop, "test");
    pool.setThreadNum(3);
    pool.setPollTimeoutMs(100);
    pool.start();

    EXPECT_EQ(pool.loopCount(), 3u);
    EXPECT_THROW(pool.loop(3), std::out_of_range);
    EXPECT_THROW(pool.start(), std::logic_error);

    std::atomic<int> remaining{3};
    std::vector<int> seenIds(3, -1);
    for (std::size_t id = 0; id < 3; ++id) {
        EventLoop* target = pool.loop(id);
        EXPECT_EQ(target->loopId(), static_cast<int>(id));
        pool.submit(id, [&, id, target]() {
            if (target->isInLoopThread()) {
                seenIds[id] = EventLoop::getEventLoopOfCurrentThread()->loopId();
            }
            if (--remaining == 0) {
                baseLoop.queueInLoop([&]() { baseLoop.stop(); });
            }
        });
    }
    baseLoop.loop();

    for (int id = 0; id < 3; ++id) {
        EXPECT_EQ(seenIds[id], id);
    }

    json snapshot = pool.metricsSnapshot();
    ASSERT_TRUE(snapshot.is_array());
    EXPECT_EQ(snapshot.size(), 3u);
}

TEST(EventLoopThreadPoolTest, RoundRobinAndBaseLoopFallback) {
    EventLoop baseLoop;
    {
        EventLoopThreadPool single(&baseLoop, "single");
        single.setThreadNum(0);
        single.start();
        EXPECT_EQ(single.getNextLoop(), &baseLoop);
        EXPECT_EQ(single.loopCount(), 1u);
        EXPECT_EQ(single.loop(0), &baseLoop);
    }

    EventLoopThreadPool pool(&baseLoop, "rr");
    pool.setThreadNum(2);
    pool.start();
    EventLoop* first = pool.getNextLoop();
    EventLoop* second = pool.getNextLoop();
    EventLoop* third = pool.getNextLoop();
    EXPECT_NE(first, second);
    EXPECT_EQ(first, third);
    EXPECT_EQ(pool.getAllLoops().size(), 2u);
}
