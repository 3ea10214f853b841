#include "net/acceptor.h"
#include "net/event_loop.h"
#include "logger.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace iomux {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      acceptSocket_(listenAddr, reuseport),
      acceptChannel_(loop, acceptSocket_.fd()),
      listening_(false),
      idleFd_(::open("/dev/null", O_RDONLY | O_CLOEXEC)) {
    if (idleFd_ < 0) {
        LOG_WARN("Acceptor could not reserve an idle fd: {}", std::strerror(errno));
    }
    acceptChannel_.setReadCallback([this](Timestamp) { handleRead(); });
}

Acceptor::~Acceptor() {
    if (listening_) {
        acceptChannel_.disableAll();
        acceptChannel_.remove();
    }
    acceptSocket_.close();
    if (idleFd_ >= 0) {
        ::close(idleFd_);
    }
}

void Acceptor::listen() {
    loop_->assertInLoopThread();
    acceptSocket_.listen();
    listening_ = true;
    acceptChannel_.enableAccepting();
    LOG_INFO("Acceptor listening on {}", acceptSocket_.localAddress().toIpPort());
}

void Acceptor::handleRead() {
    loop_->assertInLoopThread();
    std::unique_ptr<SocketChannel> socket;
    InetAddress peerAddr;
    IoResult result = acceptSocket_.accept(&socket, &peerAddr);

    if (result.isOk()) {
        if (newConnectionCallback_) {
            newConnectionCallback_(std::move(socket), peerAddr);
        }
        // Without a callback the socket closes as it goes out of scope
        return;
    }
    if (result.wouldBlock()) {
        return;
    }

    LOG_ERROR("Acceptor::handleRead accept failed: {}", result.describe());
    if (result.sysErrno == EMFILE && idleFd_ >= 0) {
        // Out of descriptors: free the spare one, accept and drop the peer, re-reserve
        ::close(idleFd_);
        idleFd_ = ::accept(acceptSocket_.fd(), nullptr, nullptr);
        if (idleFd_ >= 0) {
            ::close(idleFd_);
        }
        idleFd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    }
}

} // namespace iomux
