#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstdint>
#include <string>

namespace iomux {

/**
 * @brief IPv4 socket address
 *
 * Wraps struct sockaddr_in with ip/port conversions.
 */
class InetAddress {
public:
    /**
     * @param port port in host byte order
     * @param loopbackOnly true: 127.0.0.1, false: 0.0.0.0
     */
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);

    /**
     * @brief Parse a dotted-quad ip; throws IoException(kSystemError) if it is not one
     */
    InetAddress(const std::string& ip, uint16_t port);

    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {
    }

    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr_in* getSockAddr() const { return &addr_; }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

    // Address bound to / connected from a socket
    static InetAddress localOf(int sockfd);
    static InetAddress peerOf(int sockfd);

private:
    struct sockaddr_in addr_;
};

} // namespace iomux
