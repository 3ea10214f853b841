#include "net/loop_metrics.h"

namespace iomux {

LoopMetrics::LoopMetrics(int loopId)
    : loopId_(loopId),
      startTime_(std::chrono::system_clock::now()) {
}

void LoopMetrics::recordWait(int64_t micros, std::size_t readyCount) {
    waitCalls.fetch_add(1, std::memory_order_relaxed);
    lastWaitMicros.store(micros, std::memory_order_relaxed);
    totalWaitMicros.fetch_add(micros, std::memory_order_relaxed);
    readyEvents.fetch_add(readyCount, std::memory_order_relaxed);

    int64_t prev = maxWaitMicros.load(std::memory_order_relaxed);
    while (micros > prev &&
           !maxWaitMicros.compare_exchange_weak(prev, micros, std::memory_order_relaxed)) {
    }
}

void LoopMetrics::recordError(ErrorCode code) {
    std::lock_guard<std::mutex> lock(mutex_);
    errorCounts_[errorCodeName(code)]++;
}

json LoopMetrics::snapshot() const {
    json metrics;
    metrics["loop_id"] = loopId_;
    metrics["registered_channels"] = registeredChannels.load();

    uint64_t calls = waitCalls.load();
    int64_t total = totalWaitMicros.load();
    metrics["wait"] = {
        {"calls", calls},
        {"last_us", lastWaitMicros.load()},
        {"max_us", maxWaitMicros.load()},
        {"avg_us", calls == 0 ? 0 : total / static_cast<int64_t>(calls)},
        {"ready_events", readyEvents.load()}
    };
    metrics["handler_failures"] = handlerFailures.load();
    metrics["tasks_run"] = tasksRun.load();
    metrics["bytes_read"] = bytesRead.load();
    metrics["bytes_written"] = bytesWritten.load();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics["errors"] = errorCounts_;
    }

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - startTime_).count();
    metrics["uptime_seconds"] = uptime;
    return metrics;
}

json poolStatsToJson(const BufferPool::Stats& stats) {
    json j;
    j["outstanding"] = stats.outstanding;
    j["retained"] = stats.retained;
    j["high_water_mark"] = stats.highWaterMark;
    j["created"] = stats.created;
    j["reused"] = stats.reused;
    j["dropped"] = stats.dropped;
    j["exhausted"] = stats.exhausted;
    return j;
}

} // namespace iomux
