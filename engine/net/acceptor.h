#pragma once

#include <functional>
#include <memory>
#include <string>
#include "net/channel.h"
#include "net/inet_address.h"
#include "net/stream_channel.h"

namespace iomux {

class EventLoop;

/**
 * @brief Listening socket registered for kAccept on one loop
 */
class Acceptor {
public:
    using NewConnectionCallback =
        std::function<void(std::unique_ptr<SocketChannel> socket, const InetAddress& peerAddr)>;

    // Binds immediately; throws IoException(kSystemError) if the address is taken
    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void setNewConnectionCallback(const NewConnectionCallback& cb) {
        newConnectionCallback_ = cb;
    }

    void listen();
    bool listening() const { return listening_; }
    InetAddress listenAddress() const { return acceptSocket_.localAddress(); }

private:
    void handleRead();

    EventLoop* loop_;
    ServerSocketChannel acceptSocket_;
    Channel acceptChannel_;
    NewConnectionCallback newConnectionCallback_;
    bool listening_;
    int idleFd_; // For EMFILE handling
};

} // namespace iomux
