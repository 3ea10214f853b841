#include "net/buffer_pool.h"
#include "net/io_error.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace iomux;

class BufferPoolTest : public ::testing::Test {
protected:
    BufferPoolOptions smallPool() {
        BufferPoolOptions options;
        options.kind = Buffer::Kind::kHeap;
        options.minBufferSize = 1024;
        options.maxBufferSize = 64 * 1024;
        options.maxRetained = 2;
        options.maxOutstanding = 3;
        options.shards = 2;
        return options;
    }
};

TEST_F(BufferPoolTest, CapacityRoundsUpToSizeClass) {
    BufferPool pool(smallPool());
    EXPECT_EQ(pool.sizeClassFor(1), 1024u);
    EXPECT_EQ(pool.sizeClassFor(1024), 1024u);
    EXPECT_EQ(pool.sizeClassFor(1025), 2048u);
    EXPECT_EQ(pool.sizeClassFor(5000), 8192u);

    BufferPtr buf = pool.acquire(3000);
    EXPECT_GE(buf->capacity(), 3000u);
    EXPECT_EQ(buf->capacity(), 4096u);
    EXPECT_TRUE(pool.owns(buf));
    pool.release(buf);
}

TEST_F(BufferPoolTest, AcquiredBufferIsCleared) {
    BufferPool pool(smallPool());
    BufferPtr buf = pool.acquire(100);
    buf->put("leftover");
    buf->flip();
    pool.release(buf);

    BufferPtr again = pool.acquire(100);
    EXPECT_EQ(again.get(), buf.get());
    EXPECT_EQ(again->position(), 0u);
    EXPECT_EQ(again->limit(), again->capacity());
    EXPECT_EQ(again->mode(), Buffer::Mode::kWrite);
    pool.release(again);

    BufferPool::Stats stats = pool.stats();
    EXPECT_EQ(stats.created, 1u);
    EXPECT_EQ(stats.reused, 1u);
}

TEST_F(BufferPoolTest, RetainedCountIsBounded) {
    BufferPool pool(smallPool());
    std::vector<BufferPtr> bufs;
    for (int i = 0; i < 3; ++i) {
        bufs.push_back(pool.acquire(512));
    }
    EXPECT_EQ(pool.outstanding(), 3u);
    for (auto& b : bufs) {
        pool.release(b);
    }
    EXPECT_EQ(pool.outstanding(), 0u);
    EXPECT_EQ(pool.retained(), 2u);
    EXPECT_EQ(pool.stats().dropped, 1u);
    // The dropped buffer gave its storage back
    int releasedCount = 0;
    for (auto& b : bufs) {
        if (b->released()) ++releasedCount;
    }
    EXPECT_EQ(releasedCount, 1);
}

TEST_F(BufferPoolTest, ExhaustedFailsFast) {
    BufferPool pool(smallPool());
    BufferPtr a = pool.acquire(1);
    BufferPtr b = pool.acquire(1);
    BufferPtr c = pool.acquire(1);

    try {
        pool.acquire(1);
        FAIL() << "expected kPoolExhausted";
    } catch (const IoException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kPoolExhausted);
    }
    EXPECT_EQ(pool.tryAcquire(1), nullptr);
    EXPECT_EQ(pool.stats().exhausted, 2u);
    EXPECT_EQ(pool.stats().highWaterMark, 3u);

    pool.release(a);
    BufferPtr d = pool.acquire(1);
    EXPECT_NE(d, nullptr);
    pool.release(b);
    pool.release(c);
    pool.release(d);
}

TEST_F(BufferPoolTest, BoundedWaitGetsReleasedSlot) {
    BufferPoolOptions options = smallPool();
    options.maxOutstanding = 1;
    options.acquireTimeout = std::chrono::milliseconds(2000);
    BufferPool pool(options);

    BufferPtr held = pool.acquire(1);
    std::thread t([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        pool.release(held);
    });

    BufferPtr next = pool.acquire(1);
    t.join();
    EXPECT_NE(next, nullptr);
    pool.release(next);
}

TEST_F(BufferPoolTest, BoundedWaitTimesOut) {
    BufferPoolOptions options = smallPool();
    options.maxOutstanding = 1;
    options.acquireTimeout = std::chrono::milliseconds(50);
    BufferPool pool(options);

    BufferPtr held = pool.acquire(1);
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(pool.tryAcquire(1), nullptr);
    auto waited = std::chrono::steady_clock::now() - start;
    EXPECT_GE(waited, std::chrono::milliseconds(40));
    pool.release(held);
}

TEST_F(BufferPoolTest, SingleSlotHandoffNeverStalls) {
    BufferPoolOptions options = smallPool();
    options.maxOutstanding = 1;
    options.acquireTimeout = std::chrono::milliseconds(5000);
    BufferPool pool(options);

    // Every release must wake a waiter; a lost wakeup parks one for the full timeout
    const int kThreads = 4;
    const int kRounds = 300;
    std::atomic<int> failed{0};
    auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kRounds; ++i) {
                BufferPtr buf = pool.tryAcquire(1);
                if (!buf) {
                    failed++;
                    continue;
                }
                pool.release(buf);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(failed.load(), 0);
    EXPECT_EQ(pool.outstanding(), 0u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(4000));
}

TEST_F(BufferPoolTest, DoubleReleaseRejected) {
    BufferPool pool(smallPool());
    BufferPtr buf = pool.acquire(10);
    pool.release(buf);
    try {
        pool.release(buf);
        FAIL() << "expected kDoubleRelease";
    } catch (const IoException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kDoubleRelease);
    }
    // Pool state is unchanged by the rejected release
    EXPECT_EQ(pool.outstanding(), 0u);
    EXPECT_EQ(pool.retained(), 1u);
}

TEST_F(BufferPoolTest, ForeignBufferRejected) {
    BufferPool pool(smallPool());
    BufferPool other(smallPool());
    BufferPtr mine = other.acquire(10);
    BufferPtr loose = std::make_shared<Buffer>(10);

    EXPECT_FALSE(pool.owns(mine));
    EXPECT_THROW(pool.release(mine), IoException);
    EXPECT_THROW(pool.release(loose), IoException);
    EXPECT_THROW(pool.release(nullptr), IoException);
    other.release(mine);
}

TEST_F(BufferPoolTest, OversizedRequestNotRetained) {
    BufferPool pool(smallPool());
    BufferPtr big = pool.acquire(100 * 1024);
    EXPECT_GE(big->capacity(), 100u * 1024);
    pool.release(big);
    EXPECT_EQ(pool.retained(), 0u);
    EXPECT_TRUE(big->released());
}

TEST_F(BufferPoolTest, ConcurrentAcquireRelease) {
    BufferPoolOptions options;
    options.kind = Buffer::Kind::kNative;
    options.minBufferSize = 4096;
    options.maxRetained = 16;
    options.maxOutstanding = 64;
    BufferPool pool(options);

    const int kThreads = 8;
    const int kRounds = 2000;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kRounds; ++i) {
                BufferPtr buf = pool.tryAcquire(4096);
                if (!buf) {
                    continue;
                }
                buf->putUint32(static_cast<uint32_t>(t * kRounds + i));
                buf->flip();
                if (buf->getUint32() != static_cast<uint32_t>(t * kRounds + i)) {
                    failures++;
                }
                pool.release(buf);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(pool.outstanding(), 0u);
    EXPECT_LE(pool.retained(), 16u);
    EXPECT_LE(pool.stats().highWaterMark, 64u);
}
