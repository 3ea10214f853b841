#include "utils/engine_config.h"
#include "logger.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace iomux {

static std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

static bool parseBool(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    return v == "true" || v == "1" || v == "on" || v == "yes";
}

// Strips a trailing "# comment" and surrounding quotes
static std::string cleanValue(const std::string& raw) {
    std::string v = raw;
    auto hash = v.find(" #");
    if (hash != std::string::npos) {
        v = v.substr(0, hash);
    }
    v = trim(v);
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        v = v.substr(1, v.size() - 2);
    }
    return v;
}

static std::size_t parseSize(const std::string& value) {
    if (!value.empty() && value[0] == '-') {
        throw std::invalid_argument("negative size");
    }
    return std::stoul(value);
}

EngineConfig& EngineConfig::instance() {
    static EngineConfig instance;
    return instance;
}

void EngineConfig::reset() {
    port = 9000;
    metrics_interval_seconds = 30;
    logging = LogConfig();
    loop = LoopConfig();
    pool = PoolConfig();
    connection = ConnectionConfig();
    workers = WorkerConfig();
}

bool EngineConfig::load(const std::string& config_file) {
    std::ifstream in(config_file);
    if (!in.is_open()) {
        applyDefaults();
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') {
            continue;
        }
        auto pos = t.find(':');
        if (pos == std::string::npos) {
            continue;
        }
        std::string key = trim(t.substr(0, pos));
        std::string value = cleanValue(t.substr(pos + 1));

        try {
            if (key == "port") {
                port = std::stoi(value);
            } else if (key == "io_threads") {
                loop.io_threads = parseSize(value);
            } else if (key == "poller") {
                loop.poller = value;
            } else if (key == "poll_timeout_ms") {
                loop.poll_timeout_ms = std::stoi(value);
            } else if (key == "log_level") {
                logging.level = value;
            } else if (key == "log_file") {
                logging.file_path = value;
            } else if (key == "log_console") {
                logging.console_output = parseBool(value);
            } else if (key == "log_max_size") {
                logging.max_size = parseSize(value);
            } else if (key == "log_max_files") {
                logging.max_files = parseSize(value);
            } else if (key == "pool_kind") {
                if (value != "native" && value != "heap") {
                    throw std::invalid_argument("expected native or heap");
                }
                pool.kind = value;
            } else if (key == "pool_min_buffer_size") {
                pool.min_buffer_size = parseSize(value);
            } else if (key == "pool_max_buffer_size") {
                pool.max_buffer_size = parseSize(value);
            } else if (key == "pool_max_retained") {
                pool.max_retained = parseSize(value);
            } else if (key == "pool_max_outstanding") {
                pool.max_outstanding = parseSize(value);
            } else if (key == "pool_acquire_timeout_ms") {
                pool.acquire_timeout_ms = std::stoi(value);
            } else if (key == "input_buffer_size") {
                connection.input_buffer_size = parseSize(value);
            } else if (key == "max_input_buffer_size") {
                connection.max_input_buffer_size = parseSize(value);
            } else if (key == "high_water_mark") {
                connection.high_water_mark = parseSize(value);
            } else if (key == "idle_timeout_seconds") {
                connection.idle_timeout_seconds = std::stoi(value);
            } else if (key == "idle_check_interval_seconds") {
                connection.idle_check_interval_seconds = std::stoi(value);
            } else if (key == "metrics_interval_seconds") {
                metrics_interval_seconds = std::stoi(value);
            } else if (key == "worker_core_threads") {
                workers.core_threads = parseSize(value);
            } else if (key == "worker_max_threads") {
                workers.max_threads = parseSize(value);
            } else if (key == "worker_queue_capacity") {
                workers.queue_capacity = parseSize(value);
            } else {
                LOG_DEBUG("Ignoring unknown config key: {}", key);
            }
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing config key: {}, value: {} ({})", key, value, e.what());
        }
    }

    applyDefaults();
    return true;
}

void EngineConfig::applyDefaults() {
    std::size_t hw = std::thread::hardware_concurrency();
    if (hw == 0) hw = 4;
    if (workers.core_threads == 0) {
        workers.core_threads = std::max<std::size_t>(1, hw / 2);
    }
    if (workers.max_threads == 0) {
        workers.max_threads = std::max<std::size_t>(workers.core_threads, hw * 2);
    }
    if (workers.queue_capacity == 0) {
        workers.queue_capacity = 1024;
    }
    if (pool.max_buffer_size < pool.min_buffer_size) {
        pool.max_buffer_size = pool.min_buffer_size;
    }
    if (connection.max_input_buffer_size < connection.input_buffer_size) {
        connection.max_input_buffer_size = connection.input_buffer_size;
    }
}

BufferPoolOptions EngineConfig::poolOptions() const {
    BufferPoolOptions options;
    options.kind = pool.kind == "heap" ? Buffer::Kind::kHeap : Buffer::Kind::kNative;
    options.minBufferSize = pool.min_buffer_size;
    options.maxBufferSize = pool.max_buffer_size;
    options.maxRetained = pool.max_retained;
    options.maxOutstanding = pool.max_outstanding;
    options.acquireTimeout = std::chrono::milliseconds(std::max(0, pool.acquire_timeout_ms));
    return options;
}

ConnectionOptions EngineConfig::connectionOptions() const {
    ConnectionOptions options;
    options.inputBufferSize = connection.input_buffer_size;
    options.maxInputBufferSize = connection.max_input_buffer_size;
    options.highWaterMark = connection.high_water_mark;
    return options;
}

WorkerPoolOptions EngineConfig::workerOptions() const {
    WorkerPoolOptions options;
    options.coreThreads = workers.core_threads;
    options.maxThreads = workers.max_threads;
    options.queueCapacity = workers.queue_capacity;
    return options;
}

PollerType EngineConfig::pollerType() const {
    return parsePollerType(loop.poller);
}

int EngineConfig::ioThreadCount() const {
    // EventLoopThreadPool reads a negative count as one per hardware thread
    return loop.io_threads == 0 ? -1 : static_cast<int>(loop.io_threads);
}

} // namespace iomux
