#pragma once

#include "net/inet_address.h"
#include "net/io_error.h"

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/uio.h>
#include <cstdint>
#include <memory>
#include <string>

namespace iomux {

class Buffer;

/**
 * @brief Byte stream endpoint over an OS handle (pipe, socket or file)
 *
 * read() fills a buffer in write mode, write() drains a buffer in read mode;
 * both move the buffer position by exactly the bytes transferred. In
 * non-blocking mode a single syscall is issued: partial transfers and
 * kWouldBlock are normal results. The channel owns its descriptor.
 */
class StreamChannel {
public:
    explicit StreamChannel(int fd);
    virtual ~StreamChannel();

    StreamChannel(const StreamChannel&) = delete;
    StreamChannel& operator=(const StreamChannel&) = delete;

    int fd() const { return fd_; }
    bool isOpen() const { return fd_ >= 0; }

    void setBlocking(bool blocking);
    bool isBlocking() const { return blocking_; }

    IoResult read(Buffer& buffer);
    IoResult write(Buffer& buffer);

    /**
     * @brief Release the handle. Safe to call repeatedly and after errors.
     */
    void close() noexcept;

    uint64_t bytesRead() const { return bytesRead_; }
    uint64_t bytesWritten() const { return bytesWritten_; }

    // Bookkeeping for transfers done outside read()/write() (readv, sendfile)
    void recordRead(std::size_t n) { bytesRead_ += n; }
    void recordWritten(std::size_t n) { bytesWritten_ += n; }

    void requireOpen(const char* op) const;

    // One readv/writev-style syscall, used by scatterRead and gatherWrite
    ssize_t readVector(const struct iovec* iov, int iovcnt);
    virtual ssize_t writeVector(const struct iovec* iov, int iovcnt);

protected:
    virtual ssize_t writeSome(const char* data, std::size_t len);

private:
    int fd_;
    bool blocking_;
    uint64_t bytesRead_;
    uint64_t bytesWritten_;
};

/**
 * @brief Connected TCP socket
 */
class SocketChannel : public StreamChannel {
public:
    explicit SocketChannel(int sockfd);

    /**
     * @brief New non-blocking socket, not yet connected
     */
    static std::unique_ptr<SocketChannel> open();

    /**
     * @brief Start a connect; kWouldBlock means it is in progress
     *
     * Completion is signalled by write readiness; call finishConnect() then.
     */
    IoResult connect(const InetAddress& addr);
    IoResult finishConnect();

    void shutdownOutput();
    void setTcpNoDelay(bool on);
    void setKeepAlive(bool on);
    void setSendBufferSize(int bytes);
    void setReceiveBufferSize(int bytes);
    int socketError() const;

    InetAddress localAddress() const { return InetAddress::localOf(fd()); }
    InetAddress peerAddress() const { return InetAddress::peerOf(fd()); }

    ssize_t writeVector(const struct iovec* iov, int iovcnt) override;

protected:
    // send(MSG_NOSIGNAL): a closed peer yields EPIPE, not SIGPIPE
    ssize_t writeSome(const char* data, std::size_t len) override;
};

/**
 * @brief Listening TCP socket
 */
class ServerSocketChannel {
public:
    explicit ServerSocketChannel(const InetAddress& listenAddr, bool reusePort = false);
    ~ServerSocketChannel();

    ServerSocketChannel(const ServerSocketChannel&) = delete;
    ServerSocketChannel& operator=(const ServerSocketChannel&) = delete;

    int fd() const { return fd_; }
    void listen(int backlog = SOMAXCONN);
    InetAddress localAddress() const { return InetAddress::localOf(fd_); }

    /**
     * @brief Accept one pending connection as a non-blocking SocketChannel
     *
     * Returns kWouldBlock with *out untouched when the backlog is empty.
     */
    IoResult accept(std::unique_ptr<SocketChannel>* out, InetAddress* peer);

    void close() noexcept;

private:
    int fd_;
};

/**
 * @brief Regular file; the source side of zero-copy transfers
 */
class FileChannel : public StreamChannel {
public:
    explicit FileChannel(int fd) : StreamChannel(fd) {}

    /**
     * @brief open(2) wrapper; throws IoException(kSystemError) on failure
     */
    static std::unique_ptr<FileChannel> open(const std::string& path,
                                             int flags = O_RDONLY,
                                             mode_t mode = 0644);

    off_t size() const;

    // Positional I/O, leaves the file offset alone
    IoResult readAt(Buffer& buffer, off_t offset);
    IoResult writeAt(Buffer& buffer, off_t offset);
};

using StreamChannelPtr = std::shared_ptr<StreamChannel>;
using FileChannelPtr = std::shared_ptr<FileChannel>;

} // namespace iomux
