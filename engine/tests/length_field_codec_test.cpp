#include <gtest/gtest.h>
#include "codec/length_field_codec.h"
#include "net/buffer_pool.h"
#include "net/event_loop.h"
#include "net/stream_channel.h"
#include "net/tcp_server.h"
#include "test_util.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <unistd.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace iomux;
using namespace iomux::testing_util;

namespace {

std::string frameBytes(const std::string& body) {
    uint32_t be = htonl(static_cast<uint32_t>(body.size()));
    return std::string(reinterpret_cast<const char*>(&be), sizeof be) + body;
}

} // namespace

TEST(LengthFieldCodecTest, DecodeWholeFrames) {
    LengthFieldCodec codec;
    Buffer input(64);
    input.put(frameBytes("abc") + frameBytes("") + frameBytes("defgh"));
    input.flip();

    std::string frame;
    ASSERT_EQ(codec.decode(input, &frame), LengthFieldCodec::DecodeStatus::kFrame);
    EXPECT_EQ(frame, "abc");
    ASSERT_EQ(codec.decode(input, &frame), LengthFieldCodec::DecodeStatus::kFrame);
    EXPECT_EQ(frame, "");
    ASSERT_EQ(codec.decode(input, &frame), LengthFieldCodec::DecodeStatus::kFrame);
    EXPECT_EQ(frame, "defgh");
    EXPECT_EQ(codec.decode(input, &frame), LengthFieldCodec::DecodeStatus::kNeedMore);
}

TEST(LengthFieldCodecTest, PartialFrameWaitsForMore) {
    LengthFieldCodec codec;
    const std::string wire = frameBytes("hello world");
    Buffer input(64);
    std::string frame;

    // Header split across reads
    input.put(wire.substr(0, 2));
    input.flip();
    EXPECT_EQ(codec.decode(input, &frame), LengthFieldCodec::DecodeStatus::kNeedMore);
    EXPECT_EQ(input.position(), 0u);
    input.compact();

    input.put(wire.substr(2, 6));
    input.flip();
    EXPECT_EQ(codec.decode(input, &frame), LengthFieldCodec::DecodeStatus::kNeedMore);
    EXPECT_EQ(input.position(), 0u);
    input.compact();

    input.put(wire.substr(8));
    input.flip();
    ASSERT_EQ(codec.decode(input, &frame), LengthFieldCodec::DecodeStatus::kFrame);
    EXPECT_EQ(frame, "hello world");
    EXPECT_FALSE(input.hasRemaining());
}

TEST(LengthFieldCodecTest, OversizedFrameRejected) {
    LengthFieldCodec codec(16);
    Buffer input(64);
    input.put(frameBytes(std::string(17, 'x')));
    input.flip();
    std::string frame;
    EXPECT_EQ(codec.decode(input, &frame), LengthFieldCodec::DecodeStatus::kTooLarge);

    BufferPoolOptions options;
    options.kind = Buffer::Kind::kHeap;
    BufferPool pool(options);
    try {
        codec.encodeHeader(pool, 17);
        FAIL() << "expected kFrameTooLarge";
    } catch (const IoException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kFrameTooLarge);
    }
    EXPECT_EQ(pool.outstanding(), 0u);
}

TEST(LengthFieldCodecTest, WriteFrameGathersHeaderAndBody) {
    int fds[2];
    ASSERT_EQ(::pipe2(fds, O_CLOEXEC), 0);
    StreamChannel reader(fds[0]);
    StreamChannel writer(fds[1]);

    BufferPoolOptions options;
    options.kind = Buffer::Kind::kHeap;
    BufferPool pool(options);
    LengthFieldCodec codec;

    BufferPtr header = codec.encodeHeader(pool, 5);
    BufferPtr body = pool.acquire(5);
    body->put("frame");
    body->flip();
    IoResult r = codec.writeFrame(writer, *header, *body);
    ASSERT_TRUE(r.isOk());
    EXPECT_EQ(r.bytes, 9u);
    pool.release(header);
    pool.release(body);

    Buffer input(64);
    ASSERT_TRUE(reader.read(input).isOk());
    input.flip();
    std::string frame;
    ASSERT_EQ(codec.decode(input, &frame), LengthFieldCodec::DecodeStatus::kFrame);
    EXPECT_EQ(frame, "frame");
}

class CodecServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.reset(new TcpServer(&loop_, InetAddress(0, true), "codec"));
        port_ = server_->listenAddress().toPort();
    }

    void TearDown() override {
        server_.reset();
    }

    void runClient(std::function<void()> fn) {
        std::thread client([this, fn]() {
            fn();
            loop_.queueInLoop([this]() { loop_.stop(); });
        });
        loop_.loop();
        client.join();
    }

    EventLoop loop_;
    std::unique_ptr<TcpServer> server_;
    uint16_t port_ = 0;
    LengthFieldCodec codec_{1024};
};

TEST_F(CodecServerTest, FramesEchoedAcrossSplitWrites) {
    std::mutex mutex;
    std::vector<std::string> frames;
    server_->setThreadNum(1);
    server_->setMessageCallback(codec_.messageHandler(
        [&](const TcpConnectionPtr& conn, std::string&& frame, Timestamp) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                frames.push_back(frame);
            }
            codec_.send(conn, frame);
        }));
    server_->start();

    std::string reply;
    const std::string wire = frameBytes("first") + frameBytes("second");
    runClient([&]() {
        int fd = connectLoopback(port_);
        ASSERT_GE(fd, 0);
        // Byte at a time: the server sees every possible split
        for (char c : wire) {
            ASSERT_TRUE(writeFully(fd, std::string(1, c)));
        }
        readFully(fd, &reply, wire.size());
        ::close(fd);
    });

    EXPECT_EQ(reply, wire);
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0], "first");
    EXPECT_EQ(frames[1], "second");
}

TEST_F(CodecServerTest, OversizedFrameClosesConnection) {
    std::atomic<int> tooLarge{0};
    server_->setThreadNum(1);
    server_->setMessageCallback(codec_.messageHandler(
        [](const TcpConnectionPtr&, std::string&&, Timestamp) {}));
    server_->setErrorCallback([&](const TcpConnectionPtr&, ErrorCode code) {
        if (code == ErrorCode::kFrameTooLarge) {
            tooLarge++;
        }
    });
    server_->start();

    ssize_t lastRead = -1;
    runClient([&]() {
        int fd = connectLoopback(port_);
        ASSERT_GE(fd, 0);
        uint32_t be = htonl(4096);
        ASSERT_TRUE(writeFully(fd, std::string(reinterpret_cast<const char*>(&be), sizeof be)));
        char c;
        lastRead = ::read(fd, &c, 1);
        ::close(fd);
    });

    EXPECT_EQ(lastRead, 0);
    EXPECT_EQ(tooLarge.load(), 1);
}
