#pragma once

#include "net/inet_address.h"
#include "net/stream_channel.h"

#include <gtest/gtest.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

namespace iomux {
namespace testing_util {

// Connected loopback TCP pair: {client (blocking), server side (non-blocking)}
inline std::pair<std::unique_ptr<SocketChannel>, std::unique_ptr<SocketChannel>> tcpPair() {
    ServerSocketChannel listener(InetAddress(0, true));
    listener.listen();
    InetAddress listenAddr = listener.localAddress();

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    EXPECT_GE(fd, 0);
    int ret = ::connect(fd, reinterpret_cast<const struct sockaddr*>(listenAddr.getSockAddr()),
                        sizeof(struct sockaddr_in));
    EXPECT_EQ(ret, 0);

    std::unique_ptr<SocketChannel> accepted;
    InetAddress peer;
    IoResult r = listener.accept(&accepted, &peer);
    EXPECT_TRUE(r.isOk()) << r.describe();
    return {std::make_unique<SocketChannel>(fd), std::move(accepted)};
}

// Blocking client connected to 127.0.0.1:port, or -1
inline int connectLoopback(uint16_t port) {
    InetAddress addr("127.0.0.1", port);
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return -1;
    }
    if (::connect(fd, reinterpret_cast<const struct sockaddr*>(addr.getSockAddr()),
                  sizeof(struct sockaddr_in)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

inline bool readFully(int fd, std::string* out, std::size_t len) {
    out->clear();
    char buf[65536];
    while (out->size() < len) {
        std::size_t want = std::min(sizeof buf, len - out->size());
        ssize_t n = ::read(fd, buf, want);
        if (n <= 0) {
            return false;
        }
        out->append(buf, static_cast<std::size_t>(n));
    }
    return true;
}

inline bool writeFully(int fd, const std::string& data) {
    std::size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::write(fd, data.data() + done, data.size() - done);
        if (n <= 0) {
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

// Temporary file filled with a repeating pattern; removed on destruction
class TempFile {
public:
    explicit TempFile(std::size_t size) : path_("/tmp/iomux_test_XXXXXX") {
        int fd = ::mkstemp(&path_[0]);
        EXPECT_GE(fd, 0);
        content_.resize(size);
        for (std::size_t i = 0; i < size; ++i) {
            content_[i] = static_cast<char>('a' + i % 26);
        }
        std::size_t done = 0;
        while (done < size) {
            ssize_t n = ::write(fd, content_.data() + done, size - done);
            if (n <= 0) break;
            done += static_cast<std::size_t>(n);
        }
        ::close(fd);
    }
    ~TempFile() { ::unlink(path_.c_str()); }

    const std::string& path() const { return path_; }
    const std::string& content() const { return content_; }

private:
    std::string path_;
    std::string content_;
};

} // namespace testing_util
} // namespace iomux
