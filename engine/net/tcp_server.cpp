#include "net/tcp_server.h"
#include "net/acceptor.h"
#include "net/event_loop.h"
#include "net/event_loop_thread_pool.h"
#include "net/loop_metrics.h"
#include "logger.h"

#include <stdio.h>
#include <stdexcept>
#include <vector>

namespace iomux {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      ipPort_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      threadPool_(new EventLoopThreadPool(loop, name_)),
      connectionCallback_(defaultConnectionCallback),
      messageCallback_(defaultMessageCallback),
      idleTimeoutSeconds_(0.0),
      idleCheckIntervalSeconds_(0.0),
      started_(0),
      nextConnId_(1),
      connectionCount_(0),
      totalAccepted_(0),
      alive_(std::make_shared<bool>(true)) {
    acceptor_->setNewConnectionCallback(
        [this](std::unique_ptr<SocketChannel> socket, const InetAddress& peerAddr) {
            newConnection(std::move(socket), peerAddr);
        });
}

TcpServer::~TcpServer() {
    loop_->assertInLoopThread();
    LOG_DEBUG("TcpServer::~TcpServer [{}] destructing", name_);

    // Close callbacks firing from here on must not reach this object
    alive_.reset();

    if (idleTimer_.valid()) {
        loop_->cancel(idleTimer_);
    }
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->runInLoop([conn]() { conn->connectDestroyed(); });
    }
    // Joins the io threads while every member is still intact
    threadPool_->stop();
}

InetAddress TcpServer::listenAddress() const {
    return acceptor_->listenAddress();
}

void TcpServer::setThreadNum(int numThreads) {
    if (started_ != 0) {
        throw std::logic_error("TcpServer::setThreadNum after start");
    }
    threadPool_->setThreadNum(numThreads);
}

void TcpServer::setPollerType(PollerType type) {
    threadPool_->setPollerType(type);
}

void TcpServer::setPollTimeoutMs(int timeoutMs) {
    threadPool_->setPollTimeoutMs(timeoutMs);
}

void TcpServer::setIdleTimeout(double timeoutSeconds, double checkIntervalSeconds) {
    idleTimeoutSeconds_ = timeoutSeconds;
    idleCheckIntervalSeconds_ = checkIntervalSeconds > 0.0 ? checkIntervalSeconds : timeoutSeconds;
}

void TcpServer::start() {
    if (started_.fetch_add(1) == 0) {
        if (!pool_) {
            pool_ = std::make_shared<BufferPool>();
        }
        threadPool_->start();
        loop_->runInLoop([this]() { acceptor_->listen(); });
        if (idleTimeoutSeconds_ > 0.0) {
            idleTimer_ = loop_->runEvery(idleCheckIntervalSeconds_, [this]() { sweepIdleConnections(); });
        }
    }
}

void TcpServer::newConnection(std::unique_ptr<SocketChannel> socket, const InetAddress& peerAddr) {
    loop_->assertInLoopThread();
    EventLoop* ioLoop = threadPool_->getNextLoop();
    char buf[64];
    snprintf(buf, sizeof buf, "-%s#%d", ipPort_.c_str(), nextConnId_);
    ++nextConnId_;
    std::string connName = name_ + buf;

    LOG_INFO("TcpServer::newConnection [{}] - new connection [{}] from {} on loop {}",
             name_, connName, peerAddr.toIpPort(), ioLoop->loopId());

    InetAddress localAddr(socket->localAddress());
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(ioLoop,
                                                            connName,
                                                            std::move(socket),
                                                            localAddr,
                                                            peerAddr,
                                                            pool_,
                                                            connectionOptions_);

    connections_[connName] = conn;
    connectionCount_.store(connections_.size(), std::memory_order_relaxed);
    totalAccepted_.fetch_add(1, std::memory_order_relaxed);

    conn->setConnectionCallback(connectionCallback_);
    conn->setMessageCallback(messageCallback_);
    conn->setWriteCompleteCallback(writeCompleteCallback_);
    conn->setErrorCallback(errorCallback_);
    if (highWaterMarkCallback_) {
        conn->setHighWaterMarkCallback(highWaterMarkCallback_, connectionOptions_.highWaterMark);
    }
    // Runs on the io loop, possibly while the server is being destroyed: only
    // state copied here is touched before the liveness check on the base loop
    std::weak_ptr<bool> alive = alive_;
    EventLoop* baseLoop = loop_;
    conn->setCloseCallback([this, alive, baseLoop](const TcpConnectionPtr& c) {
        baseLoop->runInLoop([this, alive, c]() {
            // A destroyed server already scheduled connectDestroyed for every connection
            if (alive.lock()) {
                removeConnectionInLoop(c);
            }
        });
    });

    ioLoop->runInLoop([conn]() { conn->connectEstablished(); });
}

void TcpServer::removeConnectionInLoop(const TcpConnectionPtr& conn) {
    loop_->assertInLoopThread();
    LOG_INFO("TcpServer::removeConnectionInLoop [{}] - connection {} ({} bytes in, {} bytes out)",
             name_, conn->name(), conn->bytesReceived(), conn->bytesSent());

    size_t erased = connections_.erase(conn->name());
    if (erased == 0) {
        LOG_WARN("TcpServer::removeConnectionInLoop [{}] - connection not found", name_);
    }
    connectionCount_.store(connections_.size(), std::memory_order_relaxed);

    EventLoop* ioLoop = conn->getLoop();
    ioLoop->queueInLoop([conn]() { conn->connectDestroyed(); });
}

void TcpServer::sweepIdleConnections() {
    loop_->assertInLoopThread();
    Timestamp now = Timestamp::now();
    std::vector<TcpConnectionPtr> idle;
    for (const auto& item : connections_) {
        if (timeDifference(now, item.second->lastActivity()) >= idleTimeoutSeconds_) {
            idle.push_back(item.second);
        }
    }
    for (const TcpConnectionPtr& conn : idle) {
        LOG_INFO("TcpServer [{}] closing idle connection {}", name_, conn->name());
        conn->forceClose();
    }
}

nlohmann::json TcpServer::metricsSnapshot() const {
    nlohmann::json metrics;
    metrics["server"] = name_;
    metrics["connections"] = connectionCount_.load(std::memory_order_relaxed);
    metrics["accepted_total"] = totalAccepted_.load(std::memory_order_relaxed);
    if (threadPool_->started()) {
        metrics["loops"] = threadPool_->metricsSnapshot();
    }
    if (pool_) {
        metrics["buffer_pool"] = poolStatsToJson(pool_->stats());
    }
    return metrics;
}

} // namespace iomux
