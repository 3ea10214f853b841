#include "net/stream_channel.h"
#include "net/buffer.h"
#include "logger.h"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace iomux {

namespace {

bool fdIsBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && (flags & O_NONBLOCK) == 0;
}

void setSockOpt(int fd, int level, int name, int value, const char* what) {
    if (::setsockopt(fd, level, name, &value, sizeof value) < 0) {
        throw IoException(ErrorCode::kSystemError, what, errno);
    }
}

} // namespace

// StreamChannel

StreamChannel::StreamChannel(int fd)
    : fd_(fd),
      blocking_(fd >= 0 ? fdIsBlocking(fd) : true),
      bytesRead_(0),
      bytesWritten_(0) {
}

StreamChannel::~StreamChannel() {
    close();
}

void StreamChannel::requireOpen(const char* op) const {
    if (fd_ < 0) {
        throw IoException(ErrorCode::kChannelClosed, op);
    }
}

void StreamChannel::setBlocking(bool blocking) {
    requireOpen("setBlocking");
    int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0) {
        throw IoException(ErrorCode::kSystemError, "fcntl(F_GETFL)", errno);
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (::fcntl(fd_, F_SETFL, flags) < 0) {
        throw IoException(ErrorCode::kSystemError, "fcntl(F_SETFL)", errno);
    }
    blocking_ = blocking;
}

IoResult StreamChannel::read(Buffer& buffer) {
    requireOpen("read");
    if (buffer.mode() != Buffer::Mode::kWrite) {
        throw IoException(ErrorCode::kBufferMode, "channel read needs a buffer in write mode");
    }
    if (!buffer.hasRemaining()) {
        return IoResult::ok(0);
    }

    ssize_t n;
    do {
        n = ::read(fd_, buffer.window(), buffer.remaining());
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        buffer.advance(static_cast<std::size_t>(n));
        bytesRead_ += static_cast<uint64_t>(n);
        return IoResult::ok(static_cast<std::size_t>(n));
    }
    if (n == 0) {
        return IoResult::eof();
    }
    return IoResult::fromErrno(errno);
}

ssize_t StreamChannel::writeSome(const char* data, std::size_t len) {
    return ::write(fd_, data, len);
}

ssize_t StreamChannel::readVector(const struct iovec* iov, int iovcnt) {
    return ::readv(fd_, iov, iovcnt);
}

ssize_t StreamChannel::writeVector(const struct iovec* iov, int iovcnt) {
    return ::writev(fd_, iov, iovcnt);
}

IoResult StreamChannel::write(Buffer& buffer) {
    requireOpen("write");
    if (buffer.mode() != Buffer::Mode::kRead) {
        throw IoException(ErrorCode::kBufferMode, "channel write needs a buffer in read mode");
    }

    std::size_t total = 0;
    while (buffer.hasRemaining()) {
        ssize_t n = writeSome(buffer.window(), buffer.remaining());
        if (n < 0) {
            int savedErrno = errno;
            if (savedErrno == EINTR) {
                continue;
            }
            IoResult result = IoResult::fromErrno(savedErrno, total);
            // Bytes already moved count as progress; would-block after progress is just a short write
            if (result.wouldBlock() && total > 0) {
                return IoResult::ok(total);
            }
            return result;
        }
        buffer.advance(static_cast<std::size_t>(n));
        bytesWritten_ += static_cast<uint64_t>(n);
        total += static_cast<std::size_t>(n);
        // Non-blocking: one syscall, the caller retries on the next readiness
        if (!blocking_) {
            break;
        }
    }
    return IoResult::ok(total);
}

void StreamChannel::close() noexcept {
    if (fd_ >= 0) {
        if (::close(fd_) < 0) {
            LOG_DEBUG("close fd={} failed: {}", fd_, std::strerror(errno));
        }
        fd_ = -1;
    }
}

// SocketChannel

SocketChannel::SocketChannel(int sockfd)
    : StreamChannel(sockfd) {
}

std::unique_ptr<SocketChannel> SocketChannel::open() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        throw IoException(ErrorCode::kSystemError, "socket", errno);
    }
    return std::make_unique<SocketChannel>(sockfd);
}

IoResult SocketChannel::connect(const InetAddress& addr) {
    requireOpen("connect");
    int ret = ::connect(fd(), reinterpret_cast<const struct sockaddr*>(addr.getSockAddr()),
                        sizeof(struct sockaddr_in));
    if (ret == 0) {
        return IoResult::ok(0);
    }
    int savedErrno = errno;
    if (savedErrno == EINPROGRESS || savedErrno == EINTR) {
        return IoResult::wouldBlock(0);
    }
    return IoResult::fromErrno(savedErrno);
}

IoResult SocketChannel::finishConnect() {
    int err = socketError();
    if (err == 0) {
        return IoResult::ok(0);
    }
    if (err == EINPROGRESS || err == EALREADY) {
        return IoResult::wouldBlock(0);
    }
    return IoResult::fromErrno(err);
}

ssize_t SocketChannel::writeSome(const char* data, std::size_t len) {
    return ::send(fd(), data, len, MSG_NOSIGNAL);
}

ssize_t SocketChannel::writeVector(const struct iovec* iov, int iovcnt) {
    struct msghdr msg;
    std::memset(&msg, 0, sizeof msg);
    msg.msg_iov = const_cast<struct iovec*>(iov);
    msg.msg_iovlen = static_cast<std::size_t>(iovcnt);
    return ::sendmsg(fd(), &msg, MSG_NOSIGNAL);
}

void SocketChannel::shutdownOutput() {
    requireOpen("shutdownOutput");
    if (::shutdown(fd(), SHUT_WR) < 0 && errno != ENOTCONN) {
        throw IoException(ErrorCode::kSystemError, "shutdown(SHUT_WR)", errno);
    }
}

void SocketChannel::setTcpNoDelay(bool on) {
    setSockOpt(fd(), IPPROTO_TCP, TCP_NODELAY, on ? 1 : 0, "TCP_NODELAY");
}

void SocketChannel::setKeepAlive(bool on) {
    setSockOpt(fd(), SOL_SOCKET, SO_KEEPALIVE, on ? 1 : 0, "SO_KEEPALIVE");
}

void SocketChannel::setSendBufferSize(int bytes) {
    setSockOpt(fd(), SOL_SOCKET, SO_SNDBUF, bytes, "SO_SNDBUF");
}

void SocketChannel::setReceiveBufferSize(int bytes) {
    setSockOpt(fd(), SOL_SOCKET, SO_RCVBUF, bytes, "SO_RCVBUF");
}

int SocketChannel::socketError() const {
    int optval = 0;
    socklen_t optlen = sizeof optval;
    if (::getsockopt(fd(), SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        return errno;
    }
    return optval;
}

// ServerSocketChannel

ServerSocketChannel::ServerSocketChannel(const InetAddress& listenAddr, bool reusePort)
    : fd_(::socket(listenAddr.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP)) {
    if (fd_ < 0) {
        throw IoException(ErrorCode::kSystemError, "socket", errno);
    }
    int opt = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof opt);
    if (reusePort) {
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof opt);
    }
    if (::bind(fd_, reinterpret_cast<const struct sockaddr*>(listenAddr.getSockAddr()),
               sizeof(struct sockaddr_in)) < 0) {
        int savedErrno = errno;
        close();
        throw IoException(ErrorCode::kSystemError, "bind " + listenAddr.toIpPort(), savedErrno);
    }
}

ServerSocketChannel::~ServerSocketChannel() {
    close();
}

void ServerSocketChannel::listen(int backlog) {
    if (::listen(fd_, backlog) < 0) {
        throw IoException(ErrorCode::kSystemError, "listen", errno);
    }
}

IoResult ServerSocketChannel::accept(std::unique_ptr<SocketChannel>* out, InetAddress* peer) {
    if (fd_ < 0) {
        throw IoException(ErrorCode::kChannelClosed, "accept");
    }
    struct sockaddr_in peerAddr;
    std::memset(&peerAddr, 0, sizeof peerAddr);
    socklen_t peerAddrLen = sizeof peerAddr;
    int connfd;
    do {
        connfd = ::accept4(fd_, reinterpret_cast<struct sockaddr*>(&peerAddr), &peerAddrLen,
                           SOCK_NONBLOCK | SOCK_CLOEXEC);
    } while (connfd < 0 && errno == EINTR);

    if (connfd < 0) {
        return IoResult::fromErrno(errno);
    }
    *out = std::make_unique<SocketChannel>(connfd);
    if (peer) {
        peer->setSockAddr(peerAddr);
    }
    return IoResult::ok(0);
}

void ServerSocketChannel::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// FileChannel

std::unique_ptr<FileChannel> FileChannel::open(const std::string& path, int flags, mode_t mode) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    if (fd < 0) {
        throw IoException(ErrorCode::kSystemError, "open " + path, errno);
    }
    return std::make_unique<FileChannel>(fd);
}

off_t FileChannel::size() const {
    requireOpen("size");
    struct stat st;
    if (::fstat(fd(), &st) < 0) {
        throw IoException(ErrorCode::kSystemError, "fstat", errno);
    }
    return st.st_size;
}

IoResult FileChannel::readAt(Buffer& buffer, off_t offset) {
    requireOpen("readAt");
    if (buffer.mode() != Buffer::Mode::kWrite) {
        throw IoException(ErrorCode::kBufferMode, "readAt needs a buffer in write mode");
    }
    if (!buffer.hasRemaining()) {
        return IoResult::ok(0);
    }
    ssize_t n;
    do {
        n = ::pread(fd(), buffer.window(), buffer.remaining(), offset);
    } while (n < 0 && errno == EINTR);
    if (n > 0) {
        buffer.advance(static_cast<std::size_t>(n));
        recordRead(static_cast<std::size_t>(n));
        return IoResult::ok(static_cast<std::size_t>(n));
    }
    if (n == 0) {
        return IoResult::eof();
    }
    return IoResult::fromErrno(errno);
}

IoResult FileChannel::writeAt(Buffer& buffer, off_t offset) {
    requireOpen("writeAt");
    if (buffer.mode() != Buffer::Mode::kRead) {
        throw IoException(ErrorCode::kBufferMode, "writeAt needs a buffer in read mode");
    }
    std::size_t total = 0;
    while (buffer.hasRemaining()) {
        ssize_t n = ::pwrite(fd(), buffer.window(), buffer.remaining(),
                             offset + static_cast<off_t>(total));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return IoResult::fromErrno(errno, total);
        }
        buffer.advance(static_cast<std::size_t>(n));
        recordWritten(static_cast<std::size_t>(n));
        total += static_cast<std::size_t>(n);
    }
    return IoResult::ok(total);
}

} // namespace iomux
