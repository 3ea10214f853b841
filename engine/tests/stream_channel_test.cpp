#include "net/buffer.h"
#include "net/io_error.h"
#include "net/stream_channel.h"
#include "test_util.h"

#include <gtest/gtest.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <string>

using namespace iomux;
using namespace iomux::testing_util;

class PipeTest : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2];
        ASSERT_EQ(::pipe2(fds, O_NONBLOCK | O_CLOEXEC), 0);
        reader_ = std::make_unique<StreamChannel>(fds[0]);
        writer_ = std::make_unique<StreamChannel>(fds[1]);
    }

    std::unique_ptr<StreamChannel> reader_;
    std::unique_ptr<StreamChannel> writer_;
};

TEST_F(PipeTest, NonBlockingModeDetected) {
    EXPECT_FALSE(reader_->isBlocking());
    EXPECT_FALSE(writer_->isBlocking());
}

TEST_F(PipeTest, ReadEmptyWouldBlock) {
    Buffer buf(64);
    IoResult r = reader_->read(buf);
    EXPECT_TRUE(r.wouldBlock());
    EXPECT_EQ(r.bytes, 0u);
    EXPECT_EQ(buf.position(), 0u);
}

TEST_F(PipeTest, ReadAfterWriterClosedIsEof) {
    Buffer out(16);
    out.put("bye");
    out.flip();
    ASSERT_TRUE(writer_->write(out).isOk());
    writer_->close();

    Buffer in(16);
    IoResult r = reader_->read(in);
    EXPECT_TRUE(r.isOk());
    EXPECT_EQ(r.bytes, 3u);
    r = reader_->read(in);
    EXPECT_TRUE(r.isEof());
    EXPECT_EQ(r.errorCode(), ErrorCode::kPeerClosed);
}

TEST_F(PipeTest, PartialWriteThenResume) {
    int pipeSize = ::fcntl(writer_->fd(), F_SETPIPE_SZ, 4096);
    ASSERT_GT(pipeSize, 0);
    if (pipeSize >= 10000) {
        GTEST_SKIP() << "pipe capacity cannot be shrunk below 10000 here";
    }
    const std::size_t capacity = static_cast<std::size_t>(pipeSize);

    std::string payload(10000, '\0');
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>(i % 251);
    }
    Buffer out(10000);
    out.put(payload);
    out.flip();

    IoResult r = writer_->write(out);
    ASSERT_TRUE(r.isOk());
    EXPECT_EQ(r.bytes, capacity);
    EXPECT_EQ(out.position(), capacity);
    EXPECT_EQ(out.remaining(), 10000 - capacity);

    // Pipe is full: nothing moves and the cursor stays put
    r = writer_->write(out);
    EXPECT_TRUE(r.wouldBlock());
    EXPECT_EQ(out.position(), capacity);

    std::string received;
    Buffer in(capacity);
    while (received.size() < payload.size()) {
        in.clear();
        IoResult rr = reader_->read(in);
        ASSERT_TRUE(rr.isOk()) << rr.describe();
        in.flip();
        received += in.getAllAsString();
        if (out.hasRemaining()) {
            IoResult wr = writer_->write(out);
            ASSERT_FALSE(wr.isFailure()) << wr.describe();
        }
    }
    EXPECT_EQ(received, payload);
    EXPECT_FALSE(out.hasRemaining());
    EXPECT_EQ(writer_->bytesWritten(), 10000u);
    EXPECT_EQ(reader_->bytesRead(), 10000u);
}

TEST_F(PipeTest, CloseIsIdempotent) {
    reader_->close();
    EXPECT_FALSE(reader_->isOpen());
    reader_->close();
    EXPECT_FALSE(reader_->isOpen());

    Buffer buf(8);
    try {
        reader_->read(buf);
        FAIL() << "expected kChannelClosed";
    } catch (const IoException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kChannelClosed);
    }
}

TEST_F(PipeTest, BufferModeChecked) {
    Buffer buf(8);
    EXPECT_THROW(writer_->write(buf), IoException);
    buf.flip();
    EXPECT_THROW(reader_->read(buf), IoException);
}

TEST_F(PipeTest, FullBufferReadsNothing) {
    Buffer buf(2);
    buf.put("xy");
    IoResult r = reader_->read(buf);
    EXPECT_TRUE(r.isOk());
    EXPECT_EQ(r.bytes, 0u);
}

TEST(SocketChannelTest, BrokenPipeWhenPeerGone) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv), 0);
    SocketChannel local(sv[0]);
    ::close(sv[1]);

    Buffer buf(16);
    buf.put("after close");
    buf.flip();
    // MSG_NOSIGNAL: no SIGPIPE, the test process survives
    IoResult r = local.write(buf);
    EXPECT_EQ(r.status, IoResult::Status::kBrokenPipe);
    EXPECT_EQ(r.errorCode(), ErrorCode::kBrokenPipe);
    EXPECT_TRUE(r.isFailure());
}

TEST(SocketChannelTest, ConnectionResetIsDistinct) {
    auto pair = tcpPair();
    SocketChannel& client = *pair.first;
    SocketChannel& server = *pair.second;

    // Abortive close: linger 0 sends RST
    struct linger lg;
    lg.l_onoff = 1;
    lg.l_linger = 0;
    ASSERT_EQ(::setsockopt(server.fd(), SOL_SOCKET, SO_LINGER, &lg, sizeof lg), 0);
    server.close();

    Buffer buf(64);
    IoResult r = client.read(buf);
    EXPECT_EQ(r.status, IoResult::Status::kConnectionReset) << r.describe();
    EXPECT_EQ(r.errorCode(), ErrorCode::kConnectionReset);
}

TEST(SocketChannelTest, HalfCloseYieldsEof) {
    auto pair = tcpPair();
    SocketChannel& client = *pair.first;
    SocketChannel& server = *pair.second;

    Buffer out(16);
    out.put("ping");
    out.flip();
    ASSERT_TRUE(server.write(out).isOk());
    server.shutdownOutput();

    Buffer in(16);
    IoResult r = client.read(in);
    ASSERT_TRUE(r.isOk());
    in.flip();
    EXPECT_EQ(in.getAllAsString(), "ping");
    in.clear();
    EXPECT_TRUE(client.read(in).isEof());
}

TEST(SocketChannelTest, NonBlockingConnect) {
    ServerSocketChannel listener(InetAddress(0, true));
    listener.listen();
    InetAddress addr("127.0.0.1", listener.localAddress().toPort());

    auto client = SocketChannel::open();
    IoResult r = client->connect(addr);
    ASSERT_TRUE(r.isOk() || r.wouldBlock()) << r.describe();

    client->setBlocking(true);
    Buffer out(8);
    out.put("hi");
    out.flip();
    // Blocking write completes once the handshake is done
    EXPECT_TRUE(client->write(out).isOk());
    EXPECT_TRUE(client->finishConnect().isOk());
    EXPECT_EQ(client->peerAddress().toPort(), addr.toPort());
}

TEST(SocketChannelTest, AcceptOnEmptyBacklogWouldBlock) {
    ServerSocketChannel listener(InetAddress(0, true));
    listener.listen();
    std::unique_ptr<SocketChannel> accepted;
    InetAddress peer;
    IoResult r = listener.accept(&accepted, &peer);
    EXPECT_TRUE(r.wouldBlock());
    EXPECT_EQ(accepted, nullptr);
}

TEST(FileChannelTest, PositionalReadWrite) {
    TempFile file(100);
    auto channel = FileChannel::open(file.path(), O_RDWR);
    EXPECT_EQ(channel->size(), 100);

    Buffer in(10);
    ASSERT_TRUE(channel->readAt(in, 26).isOk());
    in.flip();
    EXPECT_EQ(in.getAllAsString(), "abcdefghij");

    Buffer out(4);
    out.put("ZZZZ");
    out.flip();
    ASSERT_TRUE(channel->writeAt(out, 96).isOk());
    in.clear();
    ASSERT_TRUE(channel->readAt(in, 94).isOk());
    in.flip();
    EXPECT_EQ(in.getAllAsString(), "qrZZZZ");

    in.clear();
    EXPECT_TRUE(channel->readAt(in, 100).isEof());
    EXPECT_THROW(FileChannel::open("/nonexistent/iomux/file"), IoException);
}
