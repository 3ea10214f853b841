#include <gtest/gtest.h>
#include "utils/engine_config.h"

#include <stdlib.h>
#include <unistd.h>
#include <chrono>
#include <fstream>
#include <string>

using namespace iomux;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Shared singleton: every test starts from the defaults
        EngineConfig::instance().reset();
        path_ = "/tmp/iomux_config_XXXXXX";
        int fd = ::mkstemp(&path_[0]);
        ASSERT_GE(fd, 0);
        ::close(fd);
    }

    void TearDown() override {
        ::unlink(path_.c_str());
        EngineConfig::instance().reset();
    }

    void writeConfig(const std::string& text) {
        std::ofstream out(path_, std::ios::trunc);
        out << text;
    }

    std::string path_;
};

TEST_F(EngineConfigTest, LoadsValues) {
    writeConfig(
        "# engine settings\n"
        "port: 9100\n"
        "io_threads: 4\n"
        "poller: \"poll\"\n"
        "poll_timeout_ms: 250   # wake at least this often\n"
        "log_level: 'debug'\n"
        "log_console: off\n"
        "pool_kind: heap\n"
        "pool_min_buffer_size: 1024\n"
        "pool_max_buffer_size: 65536\n"
        "pool_max_retained: 8\n"
        "pool_max_outstanding: 32\n"
        "pool_acquire_timeout_ms: 15\n"
        "input_buffer_size: 2048\n"
        "high_water_mark: 1048576\n"
        "idle_timeout_seconds: 60\n"
        "worker_core_threads: 2\n"
        "worker_max_threads: 3\n");

    EngineConfig& config = EngineConfig::instance();
    ASSERT_TRUE(config.load(path_));

    EXPECT_EQ(config.port, 9100);
    EXPECT_EQ(config.loop.io_threads, 4u);
    EXPECT_EQ(config.ioThreadCount(), 4);
    EXPECT_EQ(config.pollerType(), PollerType::kPoll);
    EXPECT_EQ(config.loop.poll_timeout_ms, 250);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_FALSE(config.logging.console_output);
    EXPECT_EQ(config.connection.idle_timeout_seconds, 60);
    EXPECT_EQ(config.workers.core_threads, 2u);
    EXPECT_EQ(config.workers.max_threads, 3u);
    EXPECT_EQ(config.workerOptions().maxThreads, 3u);

    BufferPoolOptions pool = config.poolOptions();
    EXPECT_EQ(pool.kind, Buffer::Kind::kHeap);
    EXPECT_EQ(pool.minBufferSize, 1024u);
    EXPECT_EQ(pool.maxBufferSize, 65536u);
    EXPECT_EQ(pool.maxRetained, 8u);
    EXPECT_EQ(pool.maxOutstanding, 32u);
    EXPECT_EQ(pool.acquireTimeout, std::chrono::milliseconds(15));

    ConnectionOptions conn = config.connectionOptions();
    EXPECT_EQ(conn.inputBufferSize, 2048u);
    EXPECT_EQ(conn.highWaterMark, 1048576u);
}

TEST_F(EngineConfigTest, MalformedValuesKeepDefaults) {
    writeConfig(
        "port: not-a-number\n"
        "pool_kind: mmap\n"
        "pool_max_retained: -3\n"
        "no separator here\n"
        "mystery_key: 42\n"
        "poll_timeout_ms: 500\n");

    EngineConfig& config = EngineConfig::instance();
    ASSERT_TRUE(config.load(path_));

    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.pool.kind, "native");
    EXPECT_EQ(config.pool.max_retained, 256u);
    EXPECT_EQ(config.loop.poll_timeout_ms, 500);
}

TEST_F(EngineConfigTest, DerivedDefaults) {
    writeConfig(
        "pool_min_buffer_size: 8192\n"
        "pool_max_buffer_size: 1024\n"
        "input_buffer_size: 65536\n"
        "max_input_buffer_size: 4096\n");

    EngineConfig& config = EngineConfig::instance();
    ASSERT_TRUE(config.load(path_));

    // io_threads 0 asks for one loop per hardware thread
    EXPECT_EQ(config.ioThreadCount(), -1);
    EXPECT_EQ(config.pollerType(), PollerType::kDefault);
    EXPECT_EQ(config.pool.max_buffer_size, 8192u);
    EXPECT_EQ(config.connection.max_input_buffer_size, 65536u);
    EXPECT_GE(config.workers.core_threads, 1u);
    EXPECT_GE(config.workers.max_threads, config.workers.core_threads);
}

TEST_F(EngineConfigTest, MissingFileKeepsDefaults) {
    EngineConfig& config = EngineConfig::instance();
    EXPECT_FALSE(config.load("/nonexistent/iomux.yaml"));
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.pool.max_outstanding, 4096u);
    EXPECT_EQ(config.poolOptions().kind, Buffer::Kind::kNative);
}

TEST_F(EngineConfigTest, ResetRestoresDefaults) {
    writeConfig("port: 1234\nlog_level: trace\n");
    EngineConfig& config = EngineConfig::instance();
    ASSERT_TRUE(config.load(path_));
    EXPECT_EQ(config.port, 1234);

    config.reset();
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.logging.level, "info");
}
