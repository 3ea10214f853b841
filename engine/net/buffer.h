#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace iomux {

class BufferPool;

/**
 * @brief Fixed-capacity byte buffer with a position/limit cursor pair
 *
 * +-------------------+------------------+------------------+
 * |     consumed      |    [pos, limit)  |   beyond limit   |
 * +-------------------+------------------+------------------+
 * |                   |                  |                  |
 * 0      <=       position    <=       limit     <=     capacity
 *
 * Write mode: [position, limit) is free space to fill.
 * Read mode:  [position, limit) is data not yet consumed.
 *
 * flip() goes write -> read, compact() goes read -> write keeping the unread
 * tail, clear() discards everything and returns to write mode. Every operation
 * checks the mode and the cursor invariant and throws IoException on misuse.
 */
class Buffer {
public:
    enum class Kind { kHeap, kNative };
    enum class Mode { kWrite, kRead };

    static std::unique_ptr<Buffer> allocate(std::size_t capacity, Kind kind = Kind::kHeap);

    explicit Buffer(std::size_t capacity, Kind kind = Kind::kHeap);
    ~Buffer();

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    std::size_t capacity() const { return capacity_; }
    std::size_t position() const { return position_; }
    std::size_t limit() const { return limit_; }
    Kind kind() const { return kind_; }
    Mode mode() const { return mode_; }

    std::size_t remaining() const { return limit_ - position_; }
    bool hasRemaining() const { return position_ < limit_; }
    bool released() const { return data_ == nullptr; }

    // Write mode
    void put(const void* data, std::size_t len);
    void put(std::string_view str) { put(str.data(), str.size()); }
    void putUint32(uint32_t value);

    // Read mode
    void get(void* out, std::size_t count);
    std::string getAsString(std::size_t count);
    std::string getAllAsString() { return getAsString(remaining()); }
    uint32_t getUint32();
    uint32_t peekUint32() const;
    const char* peek() const;
    void skip(std::size_t count);

    void flip();
    void compact();
    void clear();

    /**
     * @brief Start of the [position, limit) window
     *
     * Used by channels and the scatter/gather path, which hand the window to a
     * syscall and then report back through advance().
     */
    char* window();
    const char* window() const;

    /**
     * @brief Move position forward by n after an external transfer
     */
    void advance(std::size_t n);

    void setLimit(std::size_t newLimit);

    /**
     * @brief Free the backing storage
     *
     * Idempotent. Native storage is unmapped immediately; any later data
     * access throws kBufferReleased.
     */
    void release() noexcept;

    static const char* kindName(Kind kind);

private:
    friend class BufferPool;

    enum class PoolState { kUnpooled, kInUse, kIdle, kDropped };

    void requireMode(Mode expected, const char* op) const;
    void requireStorage(const char* op) const;
    void checkInvariant() const;

    char* data_;
    std::size_t capacity_;
    std::size_t position_;
    std::size_t limit_;
    std::size_t mappedLength_;
    Kind kind_;
    Mode mode_;

    // Maintained by BufferPool
    std::atomic<PoolState> poolState_;
    const BufferPool* owner_;
};

using BufferPtr = std::shared_ptr<Buffer>;

} // namespace iomux
