#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "net/buffer_pool.h"
#include "net/poller.h"
#include "net/tcp_connection.h"
#include "utils/worker_pool.h"

namespace iomux {

struct LogConfig {
    std::string level = "info";
    std::string file_path = "logs/iomux.log";
    bool console_output = true;
    std::size_t max_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
};

struct LoopConfig {
    std::size_t io_threads = 0; // 0 means one loop per hardware thread
    std::string poller = "default";
    int poll_timeout_ms = 10000;
};

struct PoolConfig {
    std::string kind = "native";
    std::size_t min_buffer_size = 4096;
    std::size_t max_buffer_size = 1024 * 1024;
    std::size_t max_retained = 256;
    std::size_t max_outstanding = 4096;
    int acquire_timeout_ms = 0;
};

struct ConnectionConfig {
    std::size_t input_buffer_size = 4096;
    std::size_t max_input_buffer_size = 4 * 1024 * 1024;
    std::size_t high_water_mark = 64 * 1024 * 1024;
    int idle_timeout_seconds = 0; // 0 disables the idle sweep
    int idle_check_interval_seconds = 5;
};

struct WorkerConfig {
    std::size_t core_threads = 0;
    std::size_t max_threads = 0;
    std::size_t queue_capacity = 1024;
};

/**
 * @brief Engine settings read from a `key: value` file
 *
 * Unknown keys are ignored; malformed values are logged and the default kept.
 */
struct EngineConfig {
    int port = 9000;
    int metrics_interval_seconds = 30;

    LogConfig logging;
    LoopConfig loop;
    PoolConfig pool;
    ConnectionConfig connection;
    WorkerConfig workers;

    static EngineConfig& instance();

    // Returns false when the file cannot be opened; defaults stay in place
    bool load(const std::string& config_file);
    void reset();

    BufferPoolOptions poolOptions() const;
    ConnectionOptions connectionOptions() const;
    WorkerPoolOptions workerOptions() const;
    PollerType pollerType() const;
    int ioThreadCount() const;

private:
    EngineConfig() = default;
    EngineConfig(const EngineConfig&) = delete;
    EngineConfig& operator=(const EngineConfig&) = delete;

    void applyDefaults();
};

} // namespace iomux
