#include "net/buffer_pool.h"
#include "net/io_error.h"
#include "logger.h"

#include <algorithm>
#include <functional>
#include <new>
#include <thread>

namespace iomux {

namespace {

int log2Ceil(std::size_t n) {
    int shift = 0;
    std::size_t v = 1;
    while (v < n) {
        v <<= 1;
        ++shift;
    }
    return shift;
}

} // namespace

BufferPool::BufferPool(BufferPoolOptions options)
    : options_(options),
      minShift_(log2Ceil(std::max<std::size_t>(1, options.minBufferSize))),
      maxShift_(log2Ceil(std::max<std::size_t>(1, options.maxBufferSize))),
      outstanding_(0),
      retained_(0),
      highWaterMark_(0),
      created_(0),
      reused_(0),
      dropped_(0),
      exhausted_(0),
      slotWaiters_(0) {
    if (maxShift_ < minShift_) {
        maxShift_ = minShift_;
    }
    if (options_.maxOutstanding == 0) {
        options_.maxOutstanding = 1;
    }
    std::size_t shardCount = options_.shards;
    if (shardCount == 0) {
        shardCount = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }
    const std::size_t classCount = static_cast<std::size_t>(maxShift_ - minShift_ + 1);
    for (std::size_t i = 0; i < shardCount; ++i) {
        auto shard = std::make_unique<Shard>();
        shard->freeLists.resize(classCount);
        shards_.push_back(std::move(shard));
    }
    LOG_DEBUG("BufferPool kind={} classes=[{}, {}] maxRetained={} maxOutstanding={} shards={}",
              Buffer::kindName(options_.kind),
              std::size_t(1) << minShift_, std::size_t(1) << maxShift_,
              options_.maxRetained, options_.maxOutstanding, shardCount);
}

BufferPool::~BufferPool() {
    std::size_t out = outstanding();
    if (out != 0) {
        LOG_WARN("BufferPool destroyed with {} buffers still outstanding", out);
    }
}

std::size_t BufferPool::sizeClassFor(std::size_t minSize) const {
    int shift = std::max(minShift_, log2Ceil(std::max<std::size_t>(1, minSize)));
    return std::size_t(1) << shift;
}

int BufferPool::classIndex(std::size_t classSize) const {
    int shift = log2Ceil(classSize);
    if ((std::size_t(1) << shift) != classSize || shift < minShift_ || shift > maxShift_) {
        return -1;
    }
    return shift - minShift_;
}

BufferPool::Shard& BufferPool::localShard() {
    std::size_t h = std::hash<std::thread::id>()(std::this_thread::get_id());
    return *shards_[h % shards_.size()];
}

// outstanding_ and slotWaiters_ are paired seq_cst: a waiter publishes itself
// before re-checking the count, a releaser drops the count before checking for
// waiters, so at least one side always sees the other.
bool BufferPool::tryReserveSlot() {
    std::size_t cur = outstanding_.load(std::memory_order_seq_cst);
    while (cur < options_.maxOutstanding) {
        if (outstanding_.compare_exchange_weak(cur, cur + 1, std::memory_order_seq_cst)) {
            std::size_t high = highWaterMark_.load(std::memory_order_relaxed);
            while (cur + 1 > high &&
                   !highWaterMark_.compare_exchange_weak(high, cur + 1, std::memory_order_relaxed)) {
            }
            return true;
        }
    }
    return false;
}

bool BufferPool::reserveSlot() {
    if (tryReserveSlot()) {
        return true;
    }
    if (options_.acquireTimeout.count() <= 0) {
        return false;
    }

    // Bounded wait; never blocks a loop longer than acquireTimeout
    auto deadline = std::chrono::steady_clock::now() + options_.acquireTimeout;
    std::unique_lock<std::mutex> lock(slotMutex_);
    slotWaiters_.fetch_add(1, std::memory_order_seq_cst);
    bool reserved = false;
    while (true) {
        if (tryReserveSlot()) {
            reserved = true;
            break;
        }
        if (slotFreed_.wait_until(lock, deadline) == std::cv_status::timeout) {
            reserved = tryReserveSlot();
            break;
        }
    }
    slotWaiters_.fetch_sub(1, std::memory_order_seq_cst);
    return reserved;
}

void BufferPool::releaseSlot() {
    outstanding_.fetch_sub(1, std::memory_order_seq_cst);
    if (slotWaiters_.load(std::memory_order_seq_cst) > 0) {
        std::lock_guard<std::mutex> lock(slotMutex_);
        slotFreed_.notify_one();
    }
}

BufferPtr BufferPool::popFree(int index) {
    Shard& local = localShard();
    {
        std::lock_guard<std::mutex> lock(local.mutex);
        auto& list = local.freeLists[index];
        if (!list.empty()) {
            BufferPtr buf = std::move(list.back());
            list.pop_back();
            retained_.fetch_sub(1);
            return buf;
        }
    }
    // Local shard is dry, steal from the others
    for (auto& shard : shards_) {
        if (shard.get() == &local) {
            continue;
        }
        std::lock_guard<std::mutex> lock(shard->mutex);
        auto& list = shard->freeLists[index];
        if (!list.empty()) {
            BufferPtr buf = std::move(list.back());
            list.pop_back();
            retained_.fetch_sub(1);
            return buf;
        }
    }
    return nullptr;
}

bool BufferPool::pushFree(int index, const BufferPtr& buffer) {
    if (retained_.fetch_add(1) >= options_.maxRetained) {
        retained_.fetch_sub(1);
        return false;
    }
    Shard& local = localShard();
    std::lock_guard<std::mutex> lock(local.mutex);
    local.freeLists[index].push_back(buffer);
    return true;
}

BufferPtr BufferPool::acquireImpl(std::size_t minSize, bool throwOnExhausted) {
    if (!reserveSlot()) {
        exhausted_.fetch_add(1);
        if (!throwOnExhausted) {
            return nullptr;
        }
        throw IoException(ErrorCode::kPoolExhausted,
                          std::to_string(options_.maxOutstanding) + " buffers outstanding");
    }

    const std::size_t classSize = sizeClassFor(minSize);
    const int index = classIndex(classSize);
    BufferPtr buf;
    if (index >= 0) {
        buf = popFree(index);
    }

    if (buf) {
        reused_.fetch_add(1);
    } else {
        try {
            buf = std::make_shared<Buffer>(classSize, options_.kind);
        } catch (const IoException& e) {
            releaseSlot();
            LOG_CRITICAL("BufferPool allocation of {} bytes failed: {}", classSize, e.what());
            throw;
        } catch (const std::bad_alloc&) {
            releaseSlot();
            LOG_CRITICAL("BufferPool allocation of {} bytes failed: out of memory", classSize);
            throw IoException(ErrorCode::kAllocationFailed, std::to_string(classSize) + " bytes");
        }
        buf->owner_ = this;
        created_.fetch_add(1);
    }

    buf->clear();
    buf->poolState_.store(Buffer::PoolState::kInUse, std::memory_order_release);
    return buf;
}

BufferPtr BufferPool::acquire(std::size_t minSize) {
    return acquireImpl(minSize, true);
}

BufferPtr BufferPool::tryAcquire(std::size_t minSize) {
    return acquireImpl(minSize, false);
}

void BufferPool::release(const BufferPtr& buffer) {
    if (!buffer) {
        throw IoException(ErrorCode::kBufferReleased, "release of a null buffer");
    }
    if (buffer->owner_ != this) {
        throw IoException(ErrorCode::kDoubleRelease, "buffer was not acquired from this pool");
    }
    Buffer::PoolState expected = Buffer::PoolState::kInUse;
    if (!buffer->poolState_.compare_exchange_strong(expected, Buffer::PoolState::kIdle,
                                                    std::memory_order_acq_rel)) {
        LOG_ERROR("BufferPool double release of buffer {} (capacity {})",
                  static_cast<const void*>(buffer.get()), buffer->capacity());
        throw IoException(ErrorCode::kDoubleRelease,
                          "capacity " + std::to_string(buffer->capacity()));
    }

    buffer->clear();
    const int index = classIndex(buffer->capacity());
    if (index < 0 || buffer->released() || !pushFree(index, buffer)) {
        // Over the retention bound or oversize: give the memory back now
        buffer->poolState_.store(Buffer::PoolState::kDropped, std::memory_order_release);
        buffer->release();
        dropped_.fetch_add(1);
    }
    releaseSlot();
}

BufferPool::Stats BufferPool::stats() const {
    Stats s;
    s.outstanding = outstanding_.load();
    s.retained = retained_.load();
    s.highWaterMark = highWaterMark_.load();
    s.created = created_.load();
    s.reused = reused_.load();
    s.dropped = dropped_.load();
    s.exhausted = exhausted_.load();
    return s;
}

} // namespace iomux
