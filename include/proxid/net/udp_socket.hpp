/**
 * @file udp_socket.hpp
 * @brief RAII UDP socket with multicast group membership.
 *
 * This is the broadcast medium of the emulated radio: advertisement frames
 * are multicast to a group and every scanner joined to it receives them.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/net/export.hpp"
#include "proxid/net/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace proxid {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address and port.
 */
struct PROXID_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(std::string ip_, uint16_t port_) : ip(std::move(ip_)), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief Owning wrapper around an IPv4 datagram socket.
 *
 * Every operation reports failure by returning false (or -1) and records
 * the platform error code, retrievable with getLastError().
 *
 * @code
 * UdpSocket sock;
 * sock.setReuseAddress(true);
 * sock.bind(5770);
 * sock.joinMulticastGroup("239.255.77.7");
 *
 * SocketAddress from;
 * int n = sock.receiveFrom(buf, sizeof(buf), 500, from);
 * @endcode
 */
class PROXID_NET_API UdpSocket {
public:
    /// Creates the underlying socket immediately.
    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    /**
     * @brief Create a fresh socket if this one was closed.
     * @return True if the socket is valid afterwards.
     */
    bool open();

    /**
     * @brief Bind to a local port (0 picks an ephemeral port).
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /// Port the socket is bound to, or 0.
    uint16_t getLocalPort() const;

    /// SO_REUSEADDR (and SO_REUSEPORT where available). Call before bind().
    bool setReuseAddress(bool enable);

    /// Hop limit for outgoing multicast (1 = local subnet).
    bool setMulticastTTL(int ttl);

    /// Deliver our own multicast datagrams back to us.
    bool setMulticastLoopback(bool enable);

    /// Outgoing interface for multicast; empty selects the default route.
    bool setMulticastInterface(const std::string& interfaceAddress);

    bool joinMulticastGroup(const std::string& groupAddress,
                            const std::string& interfaceAddress = "");

    bool leaveMulticastGroup(const std::string& groupAddress,
                             const std::string& interfaceAddress = "");

    /**
     * @return Bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive one datagram.
     * @param timeoutMs Wait limit in ms; negative blocks indefinitely.
     * @return Bytes received, 0 on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    template<typename T>
    bool setOption(int level, int name, const T& value);

    bool changeMembership(int option, const std::string& groupAddress,
                          const std::string& interfaceAddress);

    void setLastError();
};

}  // namespace net
}  // namespace proxid
