/**
 * @file platform.hpp
 * @brief Socket handle type and system includes per platform.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/net/export.hpp"

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>

    #pragma comment(lib, "Ws2_32.lib")

    namespace proxid {
    namespace net {
        using SocketHandle = SOCKET;
        using SockOptPtr = const char*;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;

        inline int getLastSocketError() { return WSAGetLastError(); }
        inline void closeSocket(SocketHandle s) { ::closesocket(s); }
        inline int selectNfds(SocketHandle) { return 0; }
    }  // namespace net
    }  // namespace proxid
#else
    #include <arpa/inet.h>
    #include <errno.h>
    #include <netinet/in.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>

    namespace proxid {
    namespace net {
        using SocketHandle = int;
        using SockOptPtr = const void*;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

        inline int getLastSocketError() { return errno; }
        inline void closeSocket(SocketHandle s) { ::close(s); }
        inline int selectNfds(SocketHandle s) { return s + 1; }
    }  // namespace net
    }  // namespace proxid
#endif

namespace proxid {
namespace net {

/**
 * @brief Process-wide socket library setup (WSAStartup on Windows).
 *
 * Create one at program start before any UdpSocket.
 */
class PROXID_NET_API SocketInitializer {
public:
    SocketInitializer();
    ~SocketInitializer();

    bool isInitialized() const { return initialized_; }

    SocketInitializer(const SocketInitializer&) = delete;
    SocketInitializer& operator=(const SocketInitializer&) = delete;

private:
    bool initialized_;
};

}  // namespace net
}  // namespace proxid
