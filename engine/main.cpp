#include "logger.h"
#include "net/blocking_task.h"
#include "net/buffer.h"
#include "net/buffer_pool.h"
#include "net/event_loop.h"
#include "net/inet_address.h"
#include "net/signal_fd.h"
#include "net/tcp_server.h"
#include "utils/engine_config.h"
#include "utils/worker_pool.h"

#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>

using namespace iomux;

int main(int argc, char* argv[]) {
    EngineConfig& config = EngineConfig::instance();
    bool loaded = config.load("conf/iomux.yaml");

    // Allow port override from command line
    if (argc > 1) {
        config.port = std::atoi(argv[1]);
    }

    const auto& logCfg = config.logging;
    Logger::instance().configure(logCfg.console_output, logCfg.file_path, logCfg.level,
                                 logCfg.max_size, logCfg.max_files);
    if (!loaded) {
        LOG_WARN("conf/iomux.yaml not found, running with defaults");
    }

    LOG_INFO("===== iomux echo server =====");
    LOG_INFO("port: {}, poller: {}, io threads: {}", config.port, config.loop.poller,
             config.loop.io_threads);

    try {
        EventLoop loop(0, config.pollerType(), config.loop.poll_timeout_ms);

        // Blocked here, before any thread starts, so every loop inherits the mask
        SignalFd signals(&loop);
        signals.addSignal(SIGINT);
        signals.addSignal(SIGTERM);
        signals.setCallback([&loop](int signo) {
            LOG_INFO("Shutting down on signal {}", signo);
            loop.stop();
        });

        auto pool = std::make_shared<BufferPool>(config.poolOptions());
        WorkerPool workers(config.workerOptions());

        TcpServer server(&loop, InetAddress(static_cast<uint16_t>(config.port)), "iomux");
        server.setThreadNum(config.ioThreadCount());
        server.setPollerType(config.pollerType());
        server.setPollTimeoutMs(config.loop.poll_timeout_ms);
        server.setBufferPool(pool);
        server.setConnectionOptions(config.connectionOptions());
        if (config.connection.idle_timeout_seconds > 0) {
            server.setIdleTimeout(config.connection.idle_timeout_seconds,
                                  config.connection.idle_check_interval_seconds);
        }

        server.setConnectionCallback([](const TcpConnectionPtr& conn) {
            if (conn->connected()) {
                conn->setTcpNoDelay(true);
                LOG_INFO("{} connected from {}", conn->name(), conn->peerAddress().toIpPort());
            } else {
                LOG_INFO("{} disconnected after {} bytes in, {} bytes out", conn->name(),
                         conn->bytesReceived(), conn->bytesSent());
            }
        });
        server.setMessageCallback([](const TcpConnectionPtr& conn, Buffer* buffer, Timestamp) {
            conn->send(buffer->peek(), buffer->remaining());
            buffer->skip(buffer->remaining());
        });
        server.setErrorCallback([](const TcpConnectionPtr& conn, ErrorCode code) {
            LOG_WARN("{} failed: {}", conn->name(), ErrorInfo::fromCode(code).message);
        });
        server.setHighWaterMarkCallback([](const TcpConnectionPtr& conn, std::size_t pending) {
            LOG_WARN("{} has {} bytes of output pending, closing", conn->name(), pending);
            conn->forceClose();
        });

        server.start();

        if (config.metrics_interval_seconds > 0) {
            loop.runEvery(config.metrics_interval_seconds, [&server, &workers, &loop]() {
                nlohmann::json snapshot = server.metricsSnapshot();
                snapshot["workers"] = workers.stats();
                bool queued = runBlocking(
                    workers, &loop,
                    [snapshot]() { return snapshot.dump(); },
                    [](std::string text) { LOG_INFO("metrics {}", text); });
                if (!queued) {
                    LOG_WARN("worker queue full, metrics dump skipped");
                }
            });
        }

        loop.loop();
    } catch (const std::exception& e) {
        LOG_ERROR("server error: {}", e.what());
        return 1;
    }

    return 0;
}
