#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace iomux {

/**
 * @brief Wall-clock time point in microseconds since the epoch
 */
class Timestamp {
public:
    static constexpr int64_t kMicroSecondsPerSecond = 1000 * 1000;

    Timestamp() : microSecondsSinceEpoch_(0) {}
    explicit Timestamp(int64_t microSecondsSinceEpoch)
        : microSecondsSinceEpoch_(microSecondsSinceEpoch) {}

    static Timestamp now() {
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch());
        return Timestamp(us.count());
    }

    static Timestamp invalid() { return Timestamp(); }

    bool valid() const { return microSecondsSinceEpoch_ > 0; }
    int64_t microSecondsSinceEpoch() const { return microSecondsSinceEpoch_; }

    std::string toString() const {
        return std::to_string(microSecondsSinceEpoch_ / kMicroSecondsPerSecond) + "." +
               std::to_string(microSecondsSinceEpoch_ % kMicroSecondsPerSecond);
    }

    bool operator<(const Timestamp& rhs) const { return microSecondsSinceEpoch_ < rhs.microSecondsSinceEpoch_; }
    bool operator==(const Timestamp& rhs) const { return microSecondsSinceEpoch_ == rhs.microSecondsSinceEpoch_; }

private:
    int64_t microSecondsSinceEpoch_;
};

inline double timeDifference(Timestamp high, Timestamp low) {
    int64_t diff = high.microSecondsSinceEpoch() - low.microSecondsSinceEpoch();
    return static_cast<double>(diff) / Timestamp::kMicroSecondsPerSecond;
}

inline Timestamp addTime(Timestamp timestamp, double seconds) {
    int64_t delta = static_cast<int64_t>(seconds * Timestamp::kMicroSecondsPerSecond);
    return Timestamp(timestamp.microSecondsSinceEpoch() + delta);
}

} // namespace iomux
