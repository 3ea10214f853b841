#include "net/inet_address.h"
#include "net/io_error.h"

#include <sys/socket.h>
#include <cerrno>
#include <cstring>

namespace iomux {

InetAddress::InetAddress(uint16_t port, bool loopbackOnly) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    addr_.sin_addr.s_addr = htonl(loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY);
    addr_.sin_port = htons(port);
}

InetAddress::InetAddress(const std::string& ip, uint16_t port) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    addr_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &addr_.sin_addr) != 1) {
        throw IoException(ErrorCode::kSystemError, "invalid IPv4 address '" + ip + "'", EINVAL);
    }
}

std::string InetAddress::toIp() const {
    char buf[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    return buf;
}

std::string InetAddress::toIpPort() const {
    return toIp() + ":" + std::to_string(toPort());
}

uint16_t InetAddress::toPort() const {
    return ntohs(addr_.sin_port);
}

InetAddress InetAddress::localOf(int sockfd) {
    struct sockaddr_in local;
    std::memset(&local, 0, sizeof local);
    socklen_t len = sizeof local;
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&local), &len) < 0) {
        throw IoException(ErrorCode::kSystemError, "getsockname", errno);
    }
    return InetAddress(local);
}

InetAddress InetAddress::peerOf(int sockfd) {
    struct sockaddr_in peer;
    std::memset(&peer, 0, sizeof peer);
    socklen_t len = sizeof peer;
    if (::getpeername(sockfd, reinterpret_cast<struct sockaddr*>(&peer), &len) < 0) {
        throw IoException(ErrorCode::kSystemError, "getpeername", errno);
    }
    return InetAddress(peer);
}

} // namespace iomux
