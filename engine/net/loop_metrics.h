#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

#include "net/buffer_pool.h"
#include "net/io_error.h"

namespace iomux {

using json = nlohmann::json;

/**
 * @brief Counters for one EventLoop
 *
 * Written by the loop thread, read from anywhere through snapshot().
 */
class LoopMetrics {
public:
    explicit LoopMetrics(int loopId);

    void recordWait(int64_t micros, std::size_t readyCount);
    void recordError(ErrorCode code);

    json snapshot() const;

    int loopId() const { return loopId_; }

    // Channels registered by users, internal wakeup/timer channels excluded
    std::atomic<std::size_t> registeredChannels{0};
    std::atomic<uint64_t> waitCalls{0};
    std::atomic<int64_t> lastWaitMicros{0};
    std::atomic<int64_t> maxWaitMicros{0};
    std::atomic<int64_t> totalWaitMicros{0};
    std::atomic<uint64_t> readyEvents{0};
    std::atomic<uint64_t> handlerFailures{0};
    std::atomic<uint64_t> tasksRun{0};
    std::atomic<uint64_t> bytesRead{0};
    std::atomic<uint64_t> bytesWritten{0};

private:
    const int loopId_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> errorCounts_;
    std::chrono::system_clock::time_point startTime_;
};

json poolStatsToJson(const BufferPool::Stats& stats);

} // namespace iomux
