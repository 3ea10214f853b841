#include "net/transfer.h"
#include "net/stream_channel.h"
#include "logger.h"

#include <sys/sendfile.h>
#include <sys/uio.h>
#include <algorithm>
#include <climits>
#include <csignal>
#include <cerrno>
#include <mutex>
#include <string>

namespace iomux {

namespace {

// Largest count sendfile(2) moves in one call
const std::size_t kMaxSendfileChunk = 0x7ffff000;

#ifdef IOV_MAX
const std::size_t kMaxIov = IOV_MAX;
#else
const std::size_t kMaxIov = 1024;
#endif

std::once_flag g_sigpipeOnce;

// sendfile(2) has no MSG_NOSIGNAL, a closed socket peer would raise SIGPIPE
void ignoreSigPipe() {
    std::call_once(g_sigpipeOnce, []() { ::signal(SIGPIPE, SIG_IGN); });
}

std::vector<Buffer*> rawPointers(const std::vector<BufferPtr>& buffers) {
    std::vector<Buffer*> raw;
    raw.reserve(buffers.size());
    for (const BufferPtr& buffer : buffers) {
        raw.push_back(buffer.get());
    }
    return raw;
}

void requireAllInMode(const std::vector<Buffer*>& buffers, Buffer::Mode mode, const char* op) {
    for (Buffer* buffer : buffers) {
        if (buffer == nullptr) {
            throw IoException(ErrorCode::kBufferReleased, std::string(op) + ": null buffer");
        }
        if (buffer->mode() != mode) {
            throw IoException(ErrorCode::kBufferMode,
                              std::string(op) + (mode == Buffer::Mode::kWrite
                                                     ? " needs buffers in write mode"
                                                     : " needs buffers in read mode"));
        }
    }
}

// Collects up to kMaxIov non-empty windows starting at buffers[*next]
std::size_t fillIov(const std::vector<Buffer*>& buffers, std::size_t* next,
                    std::vector<struct iovec>* iov, std::vector<Buffer*>* owners) {
    iov->clear();
    owners->clear();
    std::size_t bytes = 0;
    while (*next < buffers.size() && iov->size() < kMaxIov) {
        Buffer* buffer = buffers[*next];
        ++*next;
        if (!buffer->hasRemaining()) {
            continue;
        }
        struct iovec vec;
        vec.iov_base = buffer->window();
        vec.iov_len = buffer->remaining();
        iov->push_back(vec);
        owners->push_back(buffer);
        bytes += vec.iov_len;
    }
    return bytes;
}

// Moves positions forward by n bytes, in list order
void distribute(const std::vector<Buffer*>& owners, std::size_t n) {
    for (Buffer* buffer : owners) {
        if (n == 0) {
            break;
        }
        std::size_t step = std::min(n, buffer->remaining());
        buffer->advance(step);
        n -= step;
    }
}

} // namespace

IoResult transferFile(FileChannel& file, off_t offset, std::size_t count, StreamChannel& dest) {
    file.requireOpen("transferFile");
    dest.requireOpen("transferFile");
    if (count == 0) {
        return IoResult::ok(0);
    }
    ignoreSigPipe();

    std::size_t total = 0;
    off_t cursor = offset;
    while (total < count) {
        std::size_t chunk = std::min(count - total, kMaxSendfileChunk);
        ssize_t n = ::sendfile(dest.fd(), file.fd(), &cursor, chunk);
        if (n < 0) {
            int savedErrno = errno;
            if (savedErrno == EINTR) {
                continue;
            }
            IoResult result = IoResult::fromErrno(savedErrno, total);
            if (result.wouldBlock() && total > 0) {
                break;
            }
            if (result.isFailure()) {
                LOG_DEBUG("sendfile fd={} -> fd={} stopped after {} bytes: {}",
                          file.fd(), dest.fd(), total, result.describe());
            }
            return result;
        }
        if (n == 0) {
            // Source exhausted
            if (total == 0) {
                return IoResult::eof();
            }
            break;
        }
        total += static_cast<std::size_t>(n);
    }

    file.recordRead(total);
    dest.recordWritten(total);
    return IoResult::ok(total);
}

IoResult scatterRead(StreamChannel& channel, const std::vector<Buffer*>& buffers) {
    channel.requireOpen("scatterRead");
    requireAllInMode(buffers, Buffer::Mode::kWrite, "scatterRead");

    std::vector<struct iovec> iov;
    std::vector<Buffer*> owners;
    std::size_t next = 0;
    std::size_t total = 0;

    while (true) {
        std::size_t wanted = fillIov(buffers, &next, &iov, &owners);
        if (iov.empty()) {
            break;
        }
        ssize_t n;
        do {
            n = channel.readVector(iov.data(), static_cast<int>(iov.size()));
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            IoResult result = IoResult::fromErrno(errno, total);
            if (result.wouldBlock() && total > 0) {
                break;
            }
            return result;
        }
        if (n == 0) {
            if (total == 0) {
                return IoResult::eof();
            }
            break;
        }
        distribute(owners, static_cast<std::size_t>(n));
        total += static_cast<std::size_t>(n);
        if (static_cast<std::size_t>(n) < wanted) {
            break;
        }
    }

    channel.recordRead(total);
    return IoResult::ok(total);
}

IoResult scatterRead(StreamChannel& channel, const std::vector<BufferPtr>& buffers) {
    return scatterRead(channel, rawPointers(buffers));
}

IoResult gatherWrite(StreamChannel& channel, const std::vector<Buffer*>& buffers) {
    channel.requireOpen("gatherWrite");
    requireAllInMode(buffers, Buffer::Mode::kRead, "gatherWrite");

    std::vector<struct iovec> iov;
    std::vector<Buffer*> owners;
    std::size_t total = 0;
    std::size_t next = 0;

    while (true) {
        std::size_t wanted = fillIov(buffers, &next, &iov, &owners);
        if (iov.empty()) {
            break;
        }
        bool chunkDone = false;
        while (!chunkDone) {
            ssize_t n = channel.writeVector(iov.data(), static_cast<int>(iov.size()));
            if (n < 0) {
                int savedErrno = errno;
                if (savedErrno == EINTR) {
                    continue;
                }
                channel.recordWritten(total);
                IoResult result = IoResult::fromErrno(savedErrno, total);
                if (result.wouldBlock() && total > 0) {
                    return IoResult::ok(total);
                }
                return result;
            }
            distribute(owners, static_cast<std::size_t>(n));
            total += static_cast<std::size_t>(n);
            wanted -= static_cast<std::size_t>(n);
            if (wanted == 0) {
                chunkDone = true;
            } else if (!channel.isBlocking()) {
                channel.recordWritten(total);
                return IoResult::ok(total);
            } else {
                // Blocking short write: rebuild the iov from the advanced positions
                std::vector<Buffer*> pending = owners;
                std::size_t again = 0;
                wanted = fillIov(pending, &again, &iov, &owners);
            }
        }
    }

    channel.recordWritten(total);
    return IoResult::ok(total);
}

IoResult gatherWrite(StreamChannel& channel, const std::vector<BufferPtr>& buffers) {
    return gatherWrite(channel, rawPointers(buffers));
}

} // namespace iomux
