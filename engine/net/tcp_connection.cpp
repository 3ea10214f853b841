#include "net/tcp_connection.h"
#include "net/channel.h"
#include "net/event_loop.h"
#include "net/transfer.h"
#include "logger.h"

#include <algorithm>

namespace iomux {

namespace {
// Buffers handed to one gather write
const std::size_t kMaxGatherBuffers = 64;
}

void defaultConnectionCallback(const TcpConnectionPtr& conn) {
    LOG_DEBUG("{} -> {} is {}", conn->localAddress().toIpPort(), conn->peerAddress().toIpPort(),
              connectionStateName(conn->state()));
}

void defaultMessageCallback(const TcpConnectionPtr&, Buffer* buffer, Timestamp) {
    buffer->skip(buffer->remaining());
}

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& name,
                             std::unique_ptr<SocketChannel> socket,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr,
                             BufferPoolPtr pool,
                             const ConnectionOptions& options)
    : loop_(loop),
      name_(name),
      state_(ConnectionState::kAccepting),
      shutdownRequested_(false),
      closeNotified_(false),
      socket_(std::move(socket)),
      channel_(new Channel(loop, socket_->fd())),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      pool_(std::move(pool)),
      options_(options),
      pendingBytes_(0),
      bytesReceived_(0),
      bytesSent_(0),
      lastActivityMicros_(Timestamp::now().microSecondsSinceEpoch()) {
    channel_->setReadCallback([this](Timestamp receiveTime) { handleRead(receiveTime); });
    channel_->setWriteCallback([this]() { handleWrite(); });
    channel_->setCloseCallback([this]() { handleClose(); });
    channel_->setErrorCallback([this]() { handleError(); });
    channel_->setFailureCallback([this](const std::exception& e) { handleFailure(e); });
    LOG_DEBUG("TcpConnection::ctor[{}] fd={}", name_, socket_->fd());
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG("TcpConnection::dtor[{}] state={}", name_, connectionStateName(state()));
    releaseAll();
}

void TcpConnection::send(const void* data, std::size_t len) {
    if (loop_->isInLoopThread()) {
        sendInLoop(data, len);
    } else {
        std::string copy(static_cast<const char*>(data), len);
        loop_->runInLoop([self = shared_from_this(), copy]() {
            self->sendInLoop(copy.data(), copy.size());
        });
    }
}

void TcpConnection::send(std::string_view message) {
    send(message.data(), message.size());
}

void TcpConnection::sendBuffers(std::vector<BufferPtr> buffers) {
    for (const BufferPtr& buffer : buffers) {
        if (!buffer) {
            throw IoException(ErrorCode::kBufferReleased, "sendBuffers: null buffer");
        }
        if (buffer->mode() != Buffer::Mode::kRead) {
            throw IoException(ErrorCode::kBufferMode, "sendBuffers needs buffers in read mode");
        }
    }
    if (loop_->isInLoopThread()) {
        enqueueBuffers(std::move(buffers));
    } else {
        loop_->runInLoop([self = shared_from_this(), buffers]() mutable {
            self->enqueueBuffers(std::move(buffers));
        });
    }
}

void TcpConnection::sendFile(FileChannelPtr file, off_t offset, std::size_t count) {
    if (!file || !file->isOpen()) {
        throw IoException(ErrorCode::kChannelClosed, "sendFile: file is not open");
    }
    loop_->runInLoop([self = shared_from_this(), file, offset, count]() {
        self->enqueueFile(file, offset, count);
    });
}

void TcpConnection::sendInLoop(const void* data, std::size_t len) {
    loop_->assertInLoopThread();
    if (!state_.isOpen()) {
        LOG_WARN("{} disconnected, give up writing {} bytes", name_, len);
        return;
    }
    if (len == 0) {
        return;
    }

    std::vector<BufferPtr> chunks;
    try {
        const char* p = static_cast<const char*>(data);
        std::size_t left = len;
        const std::size_t chunkMax = pool_->options().maxBufferSize;
        while (left > 0) {
            std::size_t n = std::min(left, chunkMax);
            BufferPtr chunk = pool_->acquire(n);
            chunk->put(p, n);
            chunk->flip();
            chunks.push_back(std::move(chunk));
            p += n;
            left -= n;
        }
    } catch (const IoException& e) {
        for (const BufferPtr& chunk : chunks) {
            recycle(chunk);
        }
        reportError(e.code(), e.what());
        state_.fire(ConnectionEvent::kFailed);
        handleClose();
        return;
    }

    std::size_t oldPending = pendingBytes_;
    for (BufferPtr& chunk : chunks) {
        pendingBytes_ += chunk->remaining();
        OutputSegment segment;
        segment.buffer = std::move(chunk);
        outputQueue_.push_back(std::move(segment));
    }
    afterEnqueue(oldPending);
}

void TcpConnection::enqueueBuffers(std::vector<BufferPtr> buffers) {
    loop_->assertInLoopThread();
    if (!state_.isOpen()) {
        LOG_WARN("{} disconnected, dropping {} queued buffers", name_, buffers.size());
        for (const BufferPtr& buffer : buffers) {
            recycle(buffer);
        }
        return;
    }
    std::size_t oldPending = pendingBytes_;
    for (BufferPtr& buffer : buffers) {
        pendingBytes_ += buffer->remaining();
        OutputSegment segment;
        segment.buffer = std::move(buffer);
        outputQueue_.push_back(std::move(segment));
    }
    afterEnqueue(oldPending);
}

void TcpConnection::enqueueFile(FileChannelPtr file, off_t offset, std::size_t count) {
    loop_->assertInLoopThread();
    if (!state_.isOpen()) {
        LOG_WARN("{} disconnected, give up sending file", name_);
        return;
    }
    if (count == 0) {
        return;
    }
    std::size_t oldPending = pendingBytes_;
    OutputSegment segment;
    segment.file = std::move(file);
    segment.offset = offset;
    segment.remaining = count;
    pendingBytes_ += count;
    outputQueue_.push_back(std::move(segment));
    afterEnqueue(oldPending);
}

void TcpConnection::afterEnqueue(std::size_t oldPending) {
    const std::size_t highWaterMark = options_.highWaterMark;
    if (highWaterMarkCallback_ && oldPending < highWaterMark && pendingBytes_ >= highWaterMark) {
        loop_->queueInLoop([self = shared_from_this(), cb = highWaterMarkCallback_, pending = pendingBytes_]() {
            cb(self, pending);
        });
    }
    state_.fire(ConnectionEvent::kOutputQueued);

    if (!channel_->isWriting()) {
        // Nothing was waiting for writability: try right away
        IoResult result = flushOutput();
        if (result.isFailure()) {
            reportError(result.errorCode(), result.describe());
            state_.fire(ConnectionEvent::kFailed);
            handleClose();
            return;
        }
        onOutputProgress();
    }
}

IoResult TcpConnection::flushOutput() {
    std::vector<Buffer*> run;
    while (!outputQueue_.empty()) {
        OutputSegment& front = outputQueue_.front();

        if (front.file) {
            IoResult result = transferFile(*front.file, front.offset, front.remaining, *socket_);
            if (result.isOk()) {
                front.offset += static_cast<off_t>(result.bytes);
                front.remaining -= result.bytes;
                pendingBytes_ -= result.bytes;
                bytesSent_.fetch_add(result.bytes, std::memory_order_relaxed);
                loop_->metrics().bytesWritten.fetch_add(result.bytes, std::memory_order_relaxed);
                touch();
                if (front.remaining != 0) {
                    break;
                }
                outputQueue_.pop_front();
            } else if (result.wouldBlock()) {
                break;
            } else if (result.isEof()) {
                LOG_WARN("{} file ended {} bytes short of the requested range", name_, front.remaining);
                pendingBytes_ -= front.remaining;
                outputQueue_.pop_front();
            } else {
                return result;
            }
            continue;
        }

        run.clear();
        std::size_t requested = 0;
        for (auto it = outputQueue_.begin();
             it != outputQueue_.end() && !it->file && run.size() < kMaxGatherBuffers; ++it) {
            run.push_back(it->buffer.get());
            requested += it->buffer->remaining();
        }
        IoResult result = gatherWrite(*socket_, run);
        if (result.wouldBlock()) {
            break;
        }
        if (!result.isOk()) {
            return result;
        }
        pendingBytes_ -= result.bytes;
        bytesSent_.fetch_add(result.bytes, std::memory_order_relaxed);
        loop_->metrics().bytesWritten.fetch_add(result.bytes, std::memory_order_relaxed);
        touch();

        while (!outputQueue_.empty() && !outputQueue_.front().file &&
               !outputQueue_.front().buffer->hasRemaining()) {
            recycle(outputQueue_.front().buffer);
            outputQueue_.pop_front();
        }
        if (result.bytes < requested) {
            // Short write, the socket is full
            break;
        }
    }
    return IoResult::ok(0);
}

void TcpConnection::onOutputProgress() {
    if (outputQueue_.empty()) {
        if (channel_->isWriting()) {
            channel_->disableWriting();
        }
        state_.fire(ConnectionEvent::kOutputDrained);
        if (writeCompleteCallback_) {
            loop_->queueInLoop([self = shared_from_this(), cb = writeCompleteCallback_]() { cb(self); });
        }
        if (shutdownRequested_) {
            socket_->shutdownOutput();
        }
    } else if (!channel_->isWriting()) {
        channel_->enableWriting();
    }
}

void TcpConnection::shutdown() {
    loop_->runInLoop([self = shared_from_this()]() { self->shutdownInLoop(); });
}

void TcpConnection::shutdownInLoop() {
    loop_->assertInLoopThread();
    if (!state_.isOpen()) {
        return;
    }
    shutdownRequested_ = true;
    state_.fire(ConnectionEvent::kCloseRequested);
    if (outputQueue_.empty()) {
        socket_->shutdownOutput();
    }
}

void TcpConnection::forceClose() {
    loop_->queueInLoop([self = shared_from_this()]() { self->forceCloseInLoop(); });
}

void TcpConnection::forceCloseInLoop() {
    loop_->assertInLoopThread();
    if (state_.state() != ConnectionState::kClosed) {
        handleClose();
    }
}

void TcpConnection::setTcpNoDelay(bool on) {
    socket_->setTcpNoDelay(on);
}

void TcpConnection::connectEstablished() {
    loop_->assertInLoopThread();
    state_.fire(ConnectionEvent::kEstablished);
    channel_->tie(shared_from_this());
    channel_->enableReading();
    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::connectDestroyed() {
    loop_->assertInLoopThread();
    if (!closeNotified_) {
        closeNotified_ = true;
        state_.fire(ConnectionEvent::kCloseRequested);
        channel_->disableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    state_.fire(ConnectionEvent::kClosedDone);
    channel_->remove();
    releaseAll();
    socket_->close();
}

bool TcpConnection::ensureInputSpace() {
    try {
        if (!inputBuffer_) {
            inputBuffer_ = pool_->acquire(options_.inputBufferSize);
            return true;
        }
        if (inputBuffer_->hasRemaining()) {
            return true;
        }
        const std::size_t capacity = inputBuffer_->capacity();
        if (capacity >= options_.maxInputBufferSize) {
            reportError(ErrorCode::kCapacityExceeded,
                        "input buffer full at " + std::to_string(capacity) + " bytes");
            state_.fire(ConnectionEvent::kFailed);
            handleClose();
            return false;
        }
        BufferPtr bigger = pool_->acquire(std::min(capacity * 2, options_.maxInputBufferSize));
        inputBuffer_->flip();
        bigger->put(inputBuffer_->window(), inputBuffer_->remaining());
        recycle(inputBuffer_);
        inputBuffer_ = std::move(bigger);
        return true;
    } catch (const IoException& e) {
        reportError(e.code(), e.what());
        state_.fire(ConnectionEvent::kFailed);
        handleClose();
        return false;
    }
}

void TcpConnection::handleRead(Timestamp receiveTime) {
    loop_->assertInLoopThread();
    if (!ensureInputSpace()) {
        return;
    }

    IoResult result = socket_->read(*inputBuffer_);
    if (result.isOk()) {
        bytesReceived_.fetch_add(result.bytes, std::memory_order_relaxed);
        loop_->metrics().bytesRead.fetch_add(result.bytes, std::memory_order_relaxed);
        touch();
        state_.fire(ConnectionEvent::kReadable);

        inputBuffer_->flip();
        if (messageCallback_) {
            messageCallback_(shared_from_this(), inputBuffer_.get(), receiveTime);
        } else {
            inputBuffer_->skip(inputBuffer_->remaining());
        }
        if (inputBuffer_ && inputBuffer_->mode() == Buffer::Mode::kRead) {
            inputBuffer_->compact();
        }
        if (inputBuffer_ && inputBuffer_->position() == 0) {
            // Drained: hand it back until the next read
            recycle(inputBuffer_);
            inputBuffer_.reset();
        }
    } else if (result.wouldBlock()) {
        return;
    } else if (result.isEof()) {
        LOG_DEBUG("{} peer closed", name_);
        state_.fire(ConnectionEvent::kPeerClosed);
        handleClose();
    } else {
        reportError(result.errorCode(), result.describe());
        state_.fire(ConnectionEvent::kFailed);
        handleClose();
    }
}

void TcpConnection::handleWrite() {
    loop_->assertInLoopThread();
    if (!channel_->isWriting()) {
        LOG_TRACE("{} is down, no more writing", name_);
        return;
    }
    IoResult result = flushOutput();
    if (result.isFailure()) {
        reportError(result.errorCode(), result.describe());
        state_.fire(ConnectionEvent::kFailed);
        handleClose();
        return;
    }
    onOutputProgress();
}

void TcpConnection::handleClose() {
    loop_->assertInLoopThread();
    if (closeNotified_) {
        return;
    }
    closeNotified_ = true;
    LOG_DEBUG("{} closing in state {}", name_, connectionStateName(state()));
    state_.fire(ConnectionEvent::kCloseRequested);
    channel_->disableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }
    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::handleError() {
    int err = socket_->socketError();
    if (err == 0) {
        return;
    }
    IoResult result = IoResult::fromErrno(err);
    reportError(result.errorCode(), result.describe());
}

void TcpConnection::handleFailure(const std::exception& e) {
    const IoException* ioError = dynamic_cast<const IoException*>(&e);
    reportError(ioError ? ioError->code() : ErrorCode::kSystemError, e.what());
    state_.fire(ConnectionEvent::kFailed);
    handleClose();
}

void TcpConnection::reportError(ErrorCode code, const std::string& detail) {
    loop_->metrics().recordError(code);
    if (code == ErrorCode::kConnectionReset || code == ErrorCode::kBrokenPipe) {
        LOG_WARN("{} {}: {}", name_, errorCodeName(code), detail);
    } else {
        LOG_ERROR("{} {}: {}", name_, errorCodeName(code), detail);
    }
    if (errorCallback_) {
        errorCallback_(shared_from_this(), code);
    }
}

void TcpConnection::recycle(const BufferPtr& buffer) {
    if (!pool_->owns(buffer)) {
        return;
    }
    try {
        pool_->release(buffer);
    } catch (const IoException& e) {
        LOG_ERROR("{} buffer release failed: {}", name_, e.what());
    }
}

void TcpConnection::releaseAll() {
    if (inputBuffer_) {
        recycle(inputBuffer_);
        inputBuffer_.reset();
    }
    for (const OutputSegment& segment : outputQueue_) {
        if (segment.buffer) {
            recycle(segment.buffer);
        }
    }
    outputQueue_.clear();
    pendingBytes_ = 0;
}

void TcpConnection::touch() {
    lastActivityMicros_.store(Timestamp::now().microSecondsSinceEpoch(), std::memory_order_relaxed);
}

} // namespace iomux
