#pragma once

#include "net/buffer_pool.h"
#include "net/callbacks.h"
#include "net/inet_address.h"
#include "net/poller.h"
#include "net/tcp_connection.h"
#include "net/timer.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace iomux {

class Acceptor;
class EventLoop;
class EventLoopThreadPool;

/**
 * @brief Accepts on the base loop and spreads connections over the io loops
 *
 * The connection map lives on the base loop. Each connection stays on the io
 * loop it was assigned for its whole life.
 */
class TcpServer {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    const std::string& ipPort() const { return ipPort_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }
    // Bound address; resolves port 0 to the port the kernel picked
    InetAddress listenAddress() const;

    // Must be set before start()
    void setThreadNum(int numThreads);
    void setPollerType(PollerType type);
    void setPollTimeoutMs(int timeoutMs);
    void setBufferPool(BufferPoolPtr pool) { pool_ = std::move(pool); }
    void setConnectionOptions(const ConnectionOptions& options) { connectionOptions_ = options; }
    // Close connections idle longer than timeoutSeconds, checked every checkIntervalSeconds
    void setIdleTimeout(double timeoutSeconds, double checkIntervalSeconds);

    void start();

    void setConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void setMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void setWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void setHighWaterMarkCallback(const HighWaterMarkCallback& cb) { highWaterMarkCallback_ = cb; }
    void setErrorCallback(const ErrorCallback& cb) { errorCallback_ = cb; }

    const BufferPoolPtr& bufferPool() const { return pool_; }
    std::shared_ptr<EventLoopThreadPool> threadPool() const { return threadPool_; }
    std::size_t connectionCount() const { return connectionCount_.load(std::memory_order_relaxed); }

    /**
     * @brief Loops, pool and connection counts as JSON. Any thread.
     */
    nlohmann::json metricsSnapshot() const;

private:
    void newConnection(std::unique_ptr<SocketChannel> socket, const InetAddress& peerAddr);
    void removeConnectionInLoop(const TcpConnectionPtr& conn);
    void sweepIdleConnections();

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string ipPort_;
    const std::string name_;

    std::unique_ptr<Acceptor> acceptor_;
    std::shared_ptr<EventLoopThreadPool> threadPool_;
    BufferPoolPtr pool_;
    ConnectionOptions connectionOptions_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    ErrorCallback errorCallback_;

    double idleTimeoutSeconds_;
    double idleCheckIntervalSeconds_;
    TimerId idleTimer_;

    std::atomic_int32_t started_;
    int nextConnId_;
    ConnectionMap connections_;
    std::atomic<std::size_t> connectionCount_;
    std::atomic<uint64_t> totalAccepted_;
    // Reset first thing in the destructor; close callbacks hold a weak copy
    std::shared_ptr<bool> alive_;
};

} // namespace iomux
