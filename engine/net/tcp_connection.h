#pragma once

#include <any>
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "net/buffer.h"
#include "net/buffer_pool.h"
#include "net/callbacks.h"
#include "net/connection_state.h"
#include "net/inet_address.h"
#include "net/io_error.h"
#include "net/stream_channel.h"

namespace iomux {

class EventLoop;
class Channel;

struct ConnectionOptions {
    // First input buffer; doubled on demand up to maxInputBufferSize
    std::size_t inputBufferSize = 4096;
    std::size_t maxInputBufferSize = 4 * 1024 * 1024;
    // Pending output that triggers the high-water-mark callback
    std::size_t highWaterMark = 64 * 1024 * 1024;
};

/**
 * @brief One accepted TCP stream, pinned to a single EventLoop
 *
 * Input lands in a pooled buffer handed to the message callback in read mode.
 * Output is a queue of pooled buffers and file segments; write interest is on
 * only while the queue is non-empty. Would-block and EOF are handled here;
 * reset, broken pipe, capacity and pool failures reach the error callback
 * before the connection closes.
 */
class TcpConnection : public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  std::unique_ptr<SocketChannel> socket,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr,
                  BufferPoolPtr pool,
                  const ConnectionOptions& options = ConnectionOptions());
    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    ConnectionState state() const { return state_.state(); }
    bool connected() const { return state_.isOpen(); }
    bool disconnected() const { return state_.state() == ConnectionState::kClosed; }

    // Send data (thread-safe)
    void send(const void* data, std::size_t len);
    void send(std::string_view message);

    /**
     * @brief Queue pooled buffers (read mode) for one gather write
     *
     * Buffers from this connection's pool go back to it once written; the
     * caller must not touch them afterwards.
     */
    void sendBuffers(std::vector<BufferPtr> buffers);

    /**
     * @brief Queue count bytes of file from offset for zero-copy transfer
     */
    void sendFile(FileChannelPtr file, off_t offset, std::size_t count);

    // Half-close once the output queue drains (thread-safe)
    void shutdown();
    void forceClose();
    void setTcpNoDelay(bool on);

    void setConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void setMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void setWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void setHighWaterMarkCallback(const HighWaterMarkCallback& cb, std::size_t highWaterMark) {
        highWaterMarkCallback_ = cb;
        options_.highWaterMark = highWaterMark;
    }
    void setErrorCallback(const ErrorCallback& cb) { errorCallback_ = cb; }
    // Internal use by TcpServer
    void setCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Context management
    void setContext(const std::any& context) { context_ = context; }
    const std::any& getContext() const { return context_; }
    std::any* getMutableContext() { return &context_; }

    const BufferPoolPtr& pool() const { return pool_; }

    uint64_t bytesReceived() const { return bytesReceived_.load(std::memory_order_relaxed); }
    uint64_t bytesSent() const { return bytesSent_.load(std::memory_order_relaxed); }
    // Loop thread only
    std::size_t pendingOutputBytes() const { return pendingBytes_; }
    Timestamp lastActivity() const {
        return Timestamp(lastActivityMicros_.load(std::memory_order_relaxed));
    }

    // Called on the owning loop by TcpServer
    void connectEstablished();
    void connectDestroyed();

private:
    struct OutputSegment {
        BufferPtr buffer;      // read mode
        FileChannelPtr file;   // set for zero-copy segments
        off_t offset = 0;
        std::size_t remaining = 0;
    };

    void handleRead(Timestamp receiveTime);
    void handleWrite();
    void handleClose();
    void handleError();
    void handleFailure(const std::exception& e);

    void sendInLoop(const void* data, std::size_t len);
    void enqueueBuffers(std::vector<BufferPtr> buffers);
    void enqueueFile(FileChannelPtr file, off_t offset, std::size_t count);
    void afterEnqueue(std::size_t oldPending);
    IoResult flushOutput();
    void onOutputProgress();
    void shutdownInLoop();
    void forceCloseInLoop();

    bool ensureInputSpace();
    void recycle(const BufferPtr& buffer);
    void releaseAll();
    void reportError(ErrorCode code, const std::string& detail);
    void touch();

    EventLoop* loop_;
    const std::string name_;
    ConnectionStateMachine state_;
    bool shutdownRequested_;
    bool closeNotified_;

    std::unique_ptr<SocketChannel> socket_;
    std::unique_ptr<Channel> channel_;
    const InetAddress localAddr_;
    const InetAddress peerAddr_;
    BufferPoolPtr pool_;
    ConnectionOptions options_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    ErrorCallback errorCallback_;
    CloseCallback closeCallback_;

    BufferPtr inputBuffer_;   // write mode between reads
    std::deque<OutputSegment> outputQueue_;
    std::size_t pendingBytes_;

    std::atomic<uint64_t> bytesReceived_;
    std::atomic<uint64_t> bytesSent_;
    std::atomic<int64_t> lastActivityMicros_;
    std::any context_;
};

void defaultConnectionCallback(const TcpConnectionPtr& conn);
void defaultMessageCallback(const TcpConnectionPtr& conn, Buffer* buffer, Timestamp receiveTime);

} // namespace iomux
