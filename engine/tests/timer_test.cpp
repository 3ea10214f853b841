#include <gtest/gtest.h>
#include "net/event_loop.h"
#include "net/timestamp.h"
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace iomux;

class TimerTest : public ::testing::Test {
protected:
    EventLoop loop;
};

TEST_F(TimerTest, BasicTimer) {
    std::vector<std::string> results;

    loop.runAfter(0.1, [&]() {
        results.push_back("0.1s");
    });

    loop.runAfter(0.3, [&]() {
        results.push_back("0.3s");
        loop.stop();
    });

    loop.loop();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0], "0.1s");
    EXPECT_EQ(results[1], "0.3s");
}

TEST_F(TimerTest, RepeatTimer) {
    int count = 0;

    // Every 0.05s
    loop.runEvery(0.05, [&]() {
        count++;
        if (count >= 3) {
            loop.stop();
        }
    });

    loop.loop();

    EXPECT_GE(count, 3);
}

TEST_F(TimerTest, OrderCheck) {
    std::vector<int> order;

    loop.runAfter(0.3, [&]() { order.push_back(3); });
    loop.runAfter(0.1, [&]() { order.push_back(1); });
    loop.runAfter(0.2, [&]() { order.push_back(2); });

    loop.runAfter(0.4, [&]() { loop.stop(); });

    loop.loop();

    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
    EXPECT_EQ(order[2], 3);
}

TEST_F(TimerTest, CancelBeforeExpiry) {
    bool fired = false;
    TimerId id = loop.runAfter(0.05, [&]() { fired = true; });
    EXPECT_TRUE(id.valid());
    loop.cancel(id);

    loop.runAfter(0.15, [&]() { loop.stop(); });
    loop.loop();
    EXPECT_FALSE(fired);
}

TEST_F(TimerTest, CancelRepeatingFromItsOwnCallback) {
    int count = 0;
    TimerId id;
    id = loop.runEvery(0.02, [&]() {
        if (++count == 2) {
            loop.cancel(id);
        }
    });

    loop.runAfter(0.2, [&]() { loop.stop(); });
    loop.loop();
    EXPECT_EQ(count, 2);
}

TEST_F(TimerTest, CancelFromOtherThread) {
    int count = 0;
    TimerId id = loop.runEvery(0.02, [&]() { count++; });

    std::thread t([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(70));
        loop.cancel(id);
        loop.runAfter(0.1, [&]() { loop.stop(); });
    });
    loop.loop();
    t.join();

    int atStop = count;
    EXPECT_GE(atStop, 1);
    EXPECT_LE(atStop, 6);
}

TEST_F(TimerTest, ThrowingCallbackIsolated) {
    bool later = false;
    loop.runAfter(0.01, []() { throw std::runtime_error("timer failure"); });
    loop.runAfter(0.05, [&]() {
        later = true;
        loop.stop();
    });
    loop.loop();
    EXPECT_TRUE(later);
    EXPECT_EQ(loop.metrics().handlerFailures.load(), 1u);
}

TEST(TimestampTest, Arithmetic) {
    Timestamp start(1000000);
    Timestamp later = addTime(start, 1.5);
    EXPECT_EQ(later.microSecondsSinceEpoch(), 2500000);
    EXPECT_DOUBLE_EQ(timeDifference(later, start), 1.5);
    EXPECT_TRUE(start < later);
    EXPECT_FALSE(Timestamp().valid());
}
