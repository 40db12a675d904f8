/**
 * @file udp_socket.cpp
 * @brief UdpSocket implementation.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#include "proxid/net/udp_socket.hpp"
#include "proxid/utils/logger.hpp"

namespace proxid {
namespace net {

SocketInitializer::SocketInitializer() {
#ifdef _WIN32
    WSADATA wsaData;
    initialized_ = WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
#else
    initialized_ = true;
#endif
}

SocketInitializer::~SocketInitializer() {
#ifdef _WIN32
    if (initialized_) {
        WSACleanup();
    }
#endif
}

namespace {

bool parseIpv4(const std::string& text, struct in_addr& out) {
    if (text.empty() || text == "0.0.0.0") {
        out.s_addr = htonl(INADDR_ANY);
        return true;
    }
    return inet_pton(AF_INET, text.c_str(), &out) == 1;
}

}  // namespace

UdpSocket::UdpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{
    open();
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool UdpSocket::open() {
    if (isValid()) {
        return true;
    }
    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (!isValid()) {
        setLastError();
        LOG_ERROR("UdpSocket", "socket() failed: error {}", lastError_);
        return false;
    }
    return true;
}

template<typename T>
bool UdpSocket::setOption(int level, int name, const T& value) {
    if (!isValid()) {
        return false;
    }
    if (setsockopt(socket_, level, name, reinterpret_cast<SockOptPtr>(&value),
                   sizeof(value)) != 0) {
        setLastError();
        return false;
    }
    return true;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!parseIpv4(address, addr.sin_addr)) {
        LOG_ERROR("UdpSocket", "Invalid bind address: {}", address);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_ERROR("UdpSocket", "bind {}:{} failed: error {}", address, port, lastError_);
        return false;
    }

    LOG_DEBUG("UdpSocket", "Bound to {}:{}", address, getLocalPort());
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
    if (!isValid()) {
        return 0;
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
    if (getsockname(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) != 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

bool UdpSocket::setReuseAddress(bool enable) {
    int optval = enable ? 1 : 0;
    if (!setOption(SOL_SOCKET, SO_REUSEADDR, optval)) {
        return false;
    }
#ifdef SO_REUSEPORT
    // Several radios on one host share the beacon port.
    if (!setOption(SOL_SOCKET, SO_REUSEPORT, optval)) {
        LOG_DEBUG("UdpSocket", "SO_REUSEPORT unsupported: error {}", lastError_);
    }
#endif
    return true;
}

bool UdpSocket::setMulticastTTL(int ttl) {
    unsigned char ttlVal = static_cast<unsigned char>(ttl);
    return setOption(IPPROTO_IP, IP_MULTICAST_TTL, ttlVal);
}

bool UdpSocket::setMulticastLoopback(bool enable) {
    unsigned char loop = enable ? 1 : 0;
    return setOption(IPPROTO_IP, IP_MULTICAST_LOOP, loop);
}

bool UdpSocket::setMulticastInterface(const std::string& interfaceAddress) {
    struct in_addr addr{};
    if (!parseIpv4(interfaceAddress, addr)) {
        LOG_ERROR("UdpSocket", "Invalid interface address: {}", interfaceAddress);
        return false;
    }
    return setOption(IPPROTO_IP, IP_MULTICAST_IF, addr);
}

bool UdpSocket::changeMembership(int option, const std::string& groupAddress,
                                 const std::string& interfaceAddress) {
    struct ip_mreq mreq{};
    if (inet_pton(AF_INET, groupAddress.c_str(), &mreq.imr_multiaddr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid multicast group: {}", groupAddress);
        return false;
    }
    if (!parseIpv4(interfaceAddress, mreq.imr_interface)) {
        LOG_ERROR("UdpSocket", "Invalid interface address: {}", interfaceAddress);
        return false;
    }
    return setOption(IPPROTO_IP, option, mreq);
}

bool UdpSocket::joinMulticastGroup(const std::string& groupAddress,
                                   const std::string& interfaceAddress) {
    if (!changeMembership(IP_ADD_MEMBERSHIP, groupAddress, interfaceAddress)) {
        LOG_ERROR("UdpSocket", "Failed to join multicast group {}: error {}",
                  groupAddress, lastError_);
        return false;
    }
    LOG_DEBUG("UdpSocket", "Joined multicast group {}", groupAddress);
    return true;
}

bool UdpSocket::leaveMulticastGroup(const std::string& groupAddress,
                                    const std::string& interfaceAddress) {
    if (!changeMembership(IP_DROP_MEMBERSHIP, groupAddress, interfaceAddress)) {
        return false;
    }
    LOG_DEBUG("UdpSocket", "Left multicast group {}", groupAddress);
    return true;
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    if (!isValid()) {
        return -1;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(dest.port);
    if (inet_pton(AF_INET, dest.ip.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid destination address: {}", dest.ip);
        return -1;
    }

#ifdef _WIN32
    int result = ::sendto(socket_, static_cast<const char*>(data), static_cast<int>(length),
                          0, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
#else
    ssize_t result = ::sendto(socket_, data, length, 0,
                              reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
#endif
    if (result < 0) {
        setLastError();
        return -1;
    }
    return static_cast<int>(result);
}

int UdpSocket::receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                           SocketAddress& sender) {
    if (!isValid()) {
        return -1;
    }

    if (timeoutMs >= 0) {
        fd_set readSet;
        FD_ZERO(&readSet);
        FD_SET(socket_, &readSet);

        struct timeval tv;
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;

        int ready = ::select(selectNfds(socket_), &readSet, nullptr, nullptr, &tv);
        if (ready < 0) {
            setLastError();
            return -1;
        }
        if (ready == 0) {
            return 0;
        }
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
#ifdef _WIN32
    int result = ::recvfrom(socket_, static_cast<char*>(buffer), static_cast<int>(bufferSize),
                            0, reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
#else
    ssize_t result = ::recvfrom(socket_, buffer, bufferSize, 0,
                                reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
#endif
    if (result < 0) {
        setLastError();
        return -1;
    }

    char ipStr[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, ipStr, sizeof(ipStr));
    sender.ip = ipStr;
    sender.port = ntohs(addr.sin_port);
    return static_cast<int>(result);
}

void UdpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void UdpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace proxid
