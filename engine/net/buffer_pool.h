#pragma once

#include "net/buffer.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace iomux {

struct BufferPoolOptions {
    Buffer::Kind kind = Buffer::Kind::kNative;
    // Smallest and largest pooled size class, rounded up to powers of two.
    std::size_t minBufferSize = 4096;
    std::size_t maxBufferSize = 1024 * 1024;
    // Idle buffers kept for reuse; releases beyond this go back to the OS.
    std::size_t maxRetained = 256;
    // Buffers handed out and not yet released.
    std::size_t maxOutstanding = 4096;
    // How long acquire() may wait for a slot. Zero fails fast.
    std::chrono::milliseconds acquireTimeout{0};
    // Free-list shards; 0 picks one per hardware thread.
    std::size_t shards = 0;
};

/**
 * @brief Recycles fixed-size buffers so native allocation stays off the hot path
 *
 * Free lists are sharded by calling thread; an empty local shard steals from
 * the others before allocating. Every acquired buffer must be released
 * exactly once. The pool must outlive every buffer it hands out.
 *
 * THREAD SAFETY: acquire/release may be called from any thread.
 */
class BufferPool {
public:
    struct Stats {
        std::size_t outstanding = 0;
        std::size_t retained = 0;
        std::size_t highWaterMark = 0;
        uint64_t created = 0;
        uint64_t reused = 0;
        uint64_t dropped = 0;
        uint64_t exhausted = 0;
    };

    explicit BufferPool(BufferPoolOptions options = BufferPoolOptions());
    ~BufferPool();

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /**
     * @brief Hand out a cleared buffer with capacity() >= minSize
     *
     * Throws IoException(kPoolExhausted) when maxOutstanding buffers are out and
     * none comes back within acquireTimeout; kAllocationFailed is propagated
     * from the allocator untouched.
     */
    BufferPtr acquire(std::size_t minSize);

    /**
     * @brief Like acquire() but returns nullptr instead of throwing on exhaustion
     */
    BufferPtr tryAcquire(std::size_t minSize);

    /**
     * @brief Return a buffer; throws IoException(kDoubleRelease) if it is not out
     */
    void release(const BufferPtr& buffer);

    std::size_t sizeClassFor(std::size_t minSize) const;

    bool owns(const BufferPtr& buffer) const { return buffer && buffer->owner_ == this; }

    std::size_t outstanding() const { return outstanding_.load(std::memory_order_acquire); }
    std::size_t retained() const { return retained_.load(std::memory_order_acquire); }
    Stats stats() const;
    const BufferPoolOptions& options() const { return options_; }

private:
    struct Shard {
        std::mutex mutex;
        // Indexed by size class
        std::vector<std::vector<BufferPtr>> freeLists;
    };

    BufferPtr acquireImpl(std::size_t minSize, bool throwOnExhausted);
    bool tryReserveSlot();
    bool reserveSlot();
    void releaseSlot();
    int classIndex(std::size_t classSize) const;
    Shard& localShard();
    BufferPtr popFree(int index);
    bool pushFree(int index, const BufferPtr& buffer);

    BufferPoolOptions options_;
    int minShift_;
    int maxShift_;
    std::vector<std::unique_ptr<Shard>> shards_;

    std::atomic<std::size_t> outstanding_;
    std::atomic<std::size_t> retained_;
    std::atomic<std::size_t> highWaterMark_;
    std::atomic<uint64_t> created_;
    std::atomic<uint64_t> reused_;
    std::atomic<uint64_t> dropped_;
    std::atomic<uint64_t> exhausted_;

    std::mutex slotMutex_;
    std::condition_variable slotFreed_;
    std::atomic<int> slotWaiters_;
};

using BufferPoolPtr = std::shared_ptr<BufferPool>;

} // namespace iomux
