#include "net/buffer.h"
#include "net/io_error.h"

#include <arpa/inet.h>
#include <sys/mman.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <new>

namespace iomux {

namespace {

std::size_t pageRound(std::size_t len) {
    static const std::size_t page = static_cast<std::size_t>(::sysconf(_SC_PAGESIZE));
    if (len == 0) {
        return page;
    }
    return (len + page - 1) / page * page;
}

const char* modeName(Buffer::Mode mode) {
    return mode == Buffer::Mode::kWrite ? "write" : "read";
}

} // namespace

std::unique_ptr<Buffer> Buffer::allocate(std::size_t capacity, Kind kind) {
    return std::make_unique<Buffer>(capacity, kind);
}

Buffer::Buffer(std::size_t capacity, Kind kind)
    : data_(nullptr),
      capacity_(capacity),
      position_(0),
      limit_(capacity),
      mappedLength_(0),
      kind_(kind),
      mode_(Mode::kWrite),
      poolState_(PoolState::kUnpooled),
      owner_(nullptr) {
    if (kind_ == Kind::kNative) {
        // Anonymous mapping: page aligned and outside the malloc heap
        mappedLength_ = pageRound(capacity);
        void* p = ::mmap(nullptr, mappedLength_, PROT_READ | PROT_WRITE,
                         MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        if (p == MAP_FAILED) {
            int savedErrno = errno;
            throw IoException(ErrorCode::kAllocationFailed,
                              "mmap " + std::to_string(mappedLength_) + " bytes", savedErrno);
        }
        data_ = static_cast<char*>(p);
    } else {
        data_ = new (std::nothrow) char[capacity_ == 0 ? 1 : capacity_];
        if (data_ == nullptr) {
            throw IoException(ErrorCode::kAllocationFailed,
                              "heap " + std::to_string(capacity_) + " bytes");
        }
    }
}

Buffer::~Buffer() {
    release();
}

void Buffer::release() noexcept {
    if (data_ == nullptr) {
        return;
    }
    if (kind_ == Kind::kNative) {
        ::munmap(data_, mappedLength_);
    } else {
        delete[] data_;
    }
    data_ = nullptr;
}

const char* Buffer::kindName(Kind kind) {
    return kind == Kind::kNative ? "native" : "heap";
}

void Buffer::requireMode(Mode expected, const char* op) const {
    requireStorage(op);
    if (mode_ != expected) {
        throw IoException(ErrorCode::kBufferMode,
                          std::string(op) + " needs " + modeName(expected) +
                          " mode, buffer is in " + modeName(mode_) + " mode");
    }
}

void Buffer::requireStorage(const char* op) const {
    if (data_ == nullptr) {
        throw IoException(ErrorCode::kBufferReleased, op);
    }
}

void Buffer::checkInvariant() const {
    if (!(position_ <= limit_ && limit_ <= capacity_)) {
        throw IoException(ErrorCode::kBufferMode,
                          "cursor invariant broken: position=" + std::to_string(position_) +
                          " limit=" + std::to_string(limit_) +
                          " capacity=" + std::to_string(capacity_));
    }
}

void Buffer::put(const void* data, std::size_t len) {
    requireMode(Mode::kWrite, "put");
    if (len > remaining()) {
        throw IoException(ErrorCode::kCapacityExceeded,
                          "put " + std::to_string(len) + " bytes, " +
                          std::to_string(remaining()) + " free");
    }
    if (len > 0) {
        std::memcpy(data_ + position_, data, len);
    }
    position_ += len;
}

void Buffer::putUint32(uint32_t value) {
    uint32_t be = htonl(value);
    put(&be, sizeof be);
}

void Buffer::get(void* out, std::size_t count) {
    requireMode(Mode::kRead, "get");
    if (count > remaining()) {
        throw IoException(ErrorCode::kUnderflow,
                          "get " + std::to_string(count) + " bytes, " +
                          std::to_string(remaining()) + " remaining");
    }
    if (count > 0) {
        std::memcpy(out, data_ + position_, count);
    }
    position_ += count;
}

std::string Buffer::getAsString(std::size_t count) {
    std::string result(count, '\0');
    get(result.empty() ? nullptr : &result[0], count);
    return result;
}

uint32_t Buffer::getUint32() {
    uint32_t be = 0;
    get(&be, sizeof be);
    return ntohl(be);
}

uint32_t Buffer::peekUint32() const {
    requireMode(Mode::kRead, "peekUint32");
    if (remaining() < sizeof(uint32_t)) {
        throw IoException(ErrorCode::kUnderflow, "peekUint32");
    }
    uint32_t be = 0;
    std::memcpy(&be, data_ + position_, sizeof be);
    return ntohl(be);
}

const char* Buffer::peek() const {
    requireMode(Mode::kRead, "peek");
    return data_ + position_;
}

void Buffer::skip(std::size_t count) {
    requireMode(Mode::kRead, "skip");
    if (count > remaining()) {
        throw IoException(ErrorCode::kUnderflow, "skip " + std::to_string(count));
    }
    position_ += count;
}

void Buffer::flip() {
    requireMode(Mode::kWrite, "flip");
    limit_ = position_;
    position_ = 0;
    mode_ = Mode::kRead;
    checkInvariant();
}

void Buffer::compact() {
    requireMode(Mode::kRead, "compact");
    std::size_t unread = remaining();
    if (unread > 0 && position_ > 0) {
        std::memmove(data_, data_ + position_, unread);
    }
    position_ = unread;
    limit_ = capacity_;
    mode_ = Mode::kWrite;
    checkInvariant();
}

void Buffer::clear() {
    position_ = 0;
    limit_ = capacity_;
    mode_ = Mode::kWrite;
}

char* Buffer::window() {
    requireStorage("window");
    return data_ + position_;
}

const char* Buffer::window() const {
    requireStorage("window");
    return data_ + position_;
}

void Buffer::advance(std::size_t n) {
    requireStorage("advance");
    if (n > remaining()) {
        throw IoException(mode_ == Mode::kWrite ? ErrorCode::kCapacityExceeded : ErrorCode::kUnderflow,
                          "advance " + std::to_string(n) + " past limit");
    }
    position_ += n;
}

void Buffer::setLimit(std::size_t newLimit) {
    if (newLimit < position_ || newLimit > capacity_) {
        throw IoException(ErrorCode::kBufferMode,
                          "limit " + std::to_string(newLimit) + " outside [" +
                          std::to_string(position_) + ", " + std::to_string(capacity_) + "]");
    }
    limit_ = newLimit;
}

} // namespace iomux
