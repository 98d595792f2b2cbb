// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SOCKET_H_8912374019283471092
#define SOCKET_H_8912374019283471092

#include <chrono>
#include <memory>
#include <optional>
#include "sys_error.h"
    #include <unistd.h> //close
    #include <fcntl.h>
    #include <poll.h>
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h> //TCP_NODELAY
    #include <arpa/inet.h>   //inet_ntop
    #include <netdb.h>       //getaddrinfo


namespace fse
{
#define THROW_LAST_SYS_ERROR_GAI(rcGai)                        \
    do {                                                       \
        if (rcGai == EAI_SYSTEM) /*"check errno for details"*/ \
            THROW_LAST_SYS_ERROR("getaddrinfo");               \
        \
        throw fse::SysError(fse::formatSystemError("getaddrinfo", fse::formatGaiErrorCode(rcGai), ::gai_strerror(rcGai))); \
    } while (false)

inline
std::string formatGaiErrorCode(int ec)
{
    switch (ec)
    {
            FSE_CHECK_CASE_FOR_CONSTANT(EAI_ADDRFAMILY);
            FSE_CHECK_CASE_FOR_CONSTANT(EAI_AGAIN);
            FSE_CHECK_CASE_FOR_CONSTANT(EAI_BADFLAGS);
            FSE_CHECK_CASE_FOR_CONSTANT(EAI_FAIL);
            FSE_CHECK_CASE_FOR_CONSTANT(EAI_FAMILY);
            FSE_CHECK_CASE_FOR_CONSTANT(EAI_MEMORY);
            FSE_CHECK_CASE_FOR_CONSTANT(EAI_NODATA);
            FSE_CHECK_CASE_FOR_CONSTANT(EAI_NONAME);
            FSE_CHECK_CASE_FOR_CONSTANT(EAI_SERVICE);
            FSE_CHECK_CASE_FOR_CONSTANT(EAI_SOCKTYPE);
            FSE_CHECK_CASE_FOR_CONSTANT(EAI_SYSTEM);
            FSE_CHECK_CASE_FOR_CONSTANT(EAI_OVERFLOW);
        default:
            return "Error code " + numberTo<std::string>(ec);
    }
}

using SocketType = int;
const SocketType invalidSocket = -1;
inline void closeSocket(SocketType s) { ::close(s); }

void setNonBlocking(SocketType socket, bool value); //throw SysError


struct SocketAddress
{
    std::string ip; //numeric: "127.0.0.1", "::1"
    uint16_t port = 0;
    int family = AF_INET;
};
SocketAddress getLocalAddress(SocketType socket); //throw SysError
SocketAddress getPeerAddress (SocketType socket); //throw SysError


class Socket //throw SysError
{
public:
    //timeout == 0: block indefinitely
    Socket(const std::string& server, const std::string& serviceName, std::chrono::milliseconds timeout) //throw SysError
    {
        if (trimCpy(server).empty())
            throw SysError("Server name must not be empty.");

        const addrinfo hints
        {
            .ai_flags = AI_ADDRCONFIG, //save a AAAA lookup on machines that can't use the returned data anyhow
            .ai_socktype = SOCK_STREAM, //we *do* care about this one!
        };

        addrinfo* servinfo = nullptr;
        FSE_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

        const int rcGai = ::getaddrinfo(server.c_str(), serviceName.c_str(), &hints, &servinfo);
        if (rcGai != 0)
            THROW_LAST_SYS_ERROR_GAI(rcGai);
        if (!servinfo)
            throw SysError(formatSystemError("getaddrinfo", "", "Empty server info."));

        const auto getConnectedSocket = [timeout](const addrinfo& ai)
        {
            SocketType testSocket = ::socket(ai.ai_family,    //int socket_family
                                             SOCK_CLOEXEC | SOCK_NONBLOCK |
                                             ai.ai_socktype,  //int socket_type
                                             ai.ai_protocol); //int protocol
            if (testSocket == invalidSocket)
                THROW_LAST_SYS_ERROR("socket");
            FSE_ON_SCOPE_FAIL(closeSocket(testSocket));

            if (::connect(testSocket, ai.ai_addr, static_cast<socklen_t>(ai.ai_addrlen)) != 0)
            {
                if (errno != EINPROGRESS)
                    THROW_LAST_SYS_ERROR("connect");

                fd_set writefds{};
                fd_set exceptfds{}; //mostly only relevant for connect()
                FD_SET(testSocket, &writefds);
                FD_SET(testSocket, &exceptfds);

                timeval tv{};
                tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
                tv.tv_usec = static_cast<suseconds_t>(timeout.count() % 1000 * 1000);

                const int rv = ::select(
                                   testSocket + 1, //int nfds = "highest-numbered file descriptor in any of the three sets, plus 1"
                                   nullptr,        //fd_set* readfds
                                   &writefds,      //fd_set* writefds
                                   &exceptfds,     //fd_set* exceptfds
                                   timeout.count() > 0 ? &tv : nullptr); //const timeval* timeout
                if (rv < 0)
                    THROW_LAST_SYS_ERROR("select");

                if (rv == 0) //time-out!
                    throw SysError(formatSystemError("select, " + numberTo<std::string>(timeout.count()) + " ms", ETIMEDOUT));
                int error = 0;
                socklen_t optLen = sizeof(error);
                if (::getsockopt(testSocket, SOL_SOCKET, SO_ERROR, &error, &optLen) != 0)
                    THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");

                if (error != 0)
                    throw SysError(formatSystemError("connect, SO_ERROR", static_cast<ErrorCode>(error)));
            }

            setNonBlocking(testSocket, false); //throw SysError
            //-----------------------------------------------------------

            int noDelay =  1; //disable Nagle algorithm: command/reply ping-pong
            if (::setsockopt(testSocket, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) != 0)
                THROW_LAST_SYS_ERROR("setsockopt(TCP_NODELAY)");

            return testSocket;
        };

        /* getaddrinfo() often returns only one ai_family == AF_INET address, but more items are possible:
            "localhost": AF_INET6 ::1 first, then AF_INET 127.0.0.1  => keep the first error only     */
        std::optional<SysError> firstError;
        for (const addrinfo* si = servinfo; si; si = si->ai_next)
            try
            {
                socket_ = getConnectedSocket(*si); //throw SysError; pass ownership
                return;
            }
            catch (const SysError& e) { if (!firstError) firstError = e; }

        throw* firstError; //list was not empty, so there must have been an error!
    }

    explicit Socket(SocketType socket) : socket_(socket) {} //take ownership

    ~Socket() { closeSocket(socket_); }

    SocketType get() const { return socket_; }

    //applies to all subsequent recv()/send(); timeout == 0: block indefinitely
    void setIoTimeout(std::chrono::milliseconds timeout) //throw SysError
    {
        timeval tv{};
        tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>(timeout.count() % 1000 * 1000);

        if (::setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0)
            THROW_LAST_SYS_ERROR("setsockopt(SO_RCVTIMEO)");
        if (::setsockopt(socket_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
            THROW_LAST_SYS_ERROR("setsockopt(SO_SNDTIMEO)");
    }

    //unblock pending recv()/send() on other threads; the descriptor stays valid until destruction
    void shutdownBoth() //throw SysError
    {
        if (::shutdown(socket_, SHUT_RDWR) != 0 && errno != ENOTCONN)
            THROW_LAST_SYS_ERROR("shutdown");
    }

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    SocketType socket_ = invalidSocket;
};


//listening socket for active-mode data connections
class ServerSocket
{
public:
    ServerSocket(const std::string& bindIp /*numeric*/, uint16_t port /*0: ephemeral*/) //throw SysError
    {
        const addrinfo hints
        {
            .ai_flags = AI_NUMERICHOST | AI_NUMERICSERV | AI_PASSIVE,
            .ai_socktype = SOCK_STREAM,
        };

        addrinfo* servinfo = nullptr;
        FSE_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

        const int rcGai = ::getaddrinfo(bindIp.c_str(), numberTo<std::string>(port).c_str(), &hints, &servinfo);
        if (rcGai != 0)
            THROW_LAST_SYS_ERROR_GAI(rcGai);
        if (!servinfo)
            throw SysError(formatSystemError("getaddrinfo", "", "Empty server info."));

        socket_ = ::socket(servinfo->ai_family, SOCK_CLOEXEC | servinfo->ai_socktype, servinfo->ai_protocol);
        if (socket_ == invalidSocket)
            THROW_LAST_SYS_ERROR("socket");
        FSE_ON_SCOPE_FAIL(closeSocket(socket_));

        int reuseAddr = 1;
        if (::setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR, &reuseAddr, sizeof(reuseAddr)) != 0)
            THROW_LAST_SYS_ERROR("setsockopt(SO_REUSEADDR)");

        if (::bind(socket_, servinfo->ai_addr, static_cast<socklen_t>(servinfo->ai_addrlen)) != 0)
            THROW_LAST_SYS_ERROR("bind");

        if (::listen(socket_, SOMAXCONN) != 0)
            THROW_LAST_SYS_ERROR("listen");

        port_ = getLocalAddress(socket_).port; //throw SysError
    }

    ~ServerSocket() { closeSocket(socket_); }

    SocketType get() const { return socket_; }
    uint16_t getPort() const { return port_; }

    //timeout == 0: block indefinitely
    std::unique_ptr<Socket> accept(std::chrono::milliseconds timeout) //throw SysError
    {
        pollfd fds[] = {{.fd = socket_, .events = POLLIN}};
        int rv = 0;
        for (;;)
        {
            rv = ::poll(fds, 1, timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1);
            if (rv >= 0 || errno != EINTR)
                break;
        }
        if (rv < 0)
            THROW_LAST_SYS_ERROR("poll");
        if (rv == 0)
            throw SysError(formatSystemError("accept, " + numberTo<std::string>(timeout.count()) + " ms", ETIMEDOUT));

        const SocketType clientSocket = ::accept4(socket_, nullptr, nullptr, SOCK_CLOEXEC);
        if (clientSocket == invalidSocket)
            THROW_LAST_SYS_ERROR("accept4");

        return std::make_unique<Socket>(clientSocket);
    }

    void shutdownBoth() //throw SysError; unblock accept() on other threads
    {
        if (::shutdown(socket_, SHUT_RDWR) != 0 && errno != ENOTCONN)
            THROW_LAST_SYS_ERROR("shutdown");
    }

private:
    ServerSocket           (const ServerSocket&) = delete;
    ServerSocket& operator=(const ServerSocket&) = delete;

    SocketType socket_ = invalidSocket;
    uint16_t port_ = 0;
};


//more socket helper functions:
inline
size_t tryReadSocket(SocketType socket, void* buffer, size_t bytesToRead) //throw SysError; may return short, only 0 means EOF!
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    ssize_t bytesReceived = 0;
    for (;;)
    {
        bytesReceived = ::recv(socket, buffer, bytesToRead, 0);
        if (bytesReceived >= 0 || errno != EINTR)
            break;
    }
    if (bytesReceived < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK) //SO_RCVTIMEO expired
            throw SysError(formatSystemError("recv", ETIMEDOUT));
        THROW_LAST_SYS_ERROR("recv");
    }

    ASSERT_SYSERROR(static_cast<size_t>(bytesReceived) <= bytesToRead); //better safe than sorry

    return bytesReceived; //"zero indicates end of file"
}


inline
size_t tryWriteSocket(SocketType socket, const void* buffer, size_t bytesToWrite) //throw SysError; may return short! CONTRACT: bytesToWrite > 0
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    ssize_t bytesWritten = 0;
    for (;;)
    {
        bytesWritten = ::send(socket, buffer, bytesToWrite, MSG_NOSIGNAL);
        if (bytesWritten >= 0 || errno != EINTR)
            break;
    }
    if (bytesWritten < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK) //SO_SNDTIMEO expired
            throw SysError(formatSystemError("send", ETIMEDOUT));
        THROW_LAST_SYS_ERROR("send");
    }

    if (bytesWritten == 0)
        throw SysError(formatSystemError("send", "", "Zero bytes processed."));

    ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite); //better safe than sorry

    return bytesWritten;
}


//timeoutMs < 0: wait indefinitely
inline
bool waitForSocketReadable(SocketType socket, int timeoutMs) //throw SysError
{
    pollfd fds[] = {{.fd = socket, .events = POLLIN}};
    int rv = 0;
    for (;;)
    {
        rv = ::poll(fds, 1, timeoutMs);
        if (rv >= 0 || errno != EINTR)
            break;
    }
    if (rv < 0)
        THROW_LAST_SYS_ERROR("poll");

    return rv > 0; //POLLHUP/POLLERR count as "readable": next recv() reports the details
}


//initiate termination of connection by sending TCP FIN package
inline
void shutdownSocketSend(SocketType socket) //throw SysError
{
    if (::shutdown(socket, SHUT_WR) != 0 && errno != ENOTCONN) //peer is gone already
        THROW_LAST_SYS_ERROR("shutdown");
}


inline
void setNonBlocking(SocketType socket, bool nonBlocking) //throw SysError
{
    int flags = ::fcntl(socket, F_GETFL);
    if (flags == -1)
        THROW_LAST_SYS_ERROR("fcntl(F_GETFL)");

    if (nonBlocking)
        flags |= O_NONBLOCK;
    else
        flags &= ~O_NONBLOCK;

    if (::fcntl(socket, F_SETFL, flags) != 0)
        THROW_LAST_SYS_ERROR(nonBlocking ? "fcntl(F_SETFL, O_NONBLOCK)" : "fcntl(F_SETFL, ~O_NONBLOCK)");
}


namespace impl
{
inline
SocketAddress toSocketAddress(const sockaddr_storage& addr) //throw SysError
{
    SocketAddress output;
    output.family = addr.ss_family;

    char ipBuf[INET6_ADDRSTRLEN] = {};
    const void* rawAddr = nullptr;
    if (addr.ss_family == AF_INET)
    {
        const auto& addr4 = reinterpret_cast<const sockaddr_in&>(addr);
        rawAddr = &addr4.sin_addr;
        output.port = ntohs(addr4.sin_port);
    }
    else if (addr.ss_family == AF_INET6)
    {
        const auto& addr6 = reinterpret_cast<const sockaddr_in6&>(addr);
        rawAddr = &addr6.sin6_addr;
        output.port = ntohs(addr6.sin6_port);
    }
    else
        throw SysError(formatSystemError("getsockname", "", "Unexpected address family " + numberTo<std::string>(addr.ss_family) + '.'));

    if (!::inet_ntop(addr.ss_family, rawAddr, ipBuf, sizeof(ipBuf)))
        THROW_LAST_SYS_ERROR("inet_ntop");

    output.ip = ipBuf;

    //IPv4-mapped IPv6 address: "::ffff:127.0.0.1"
    if (output.family == AF_INET6 && startsWith(output.ip, "::ffff:") && contains(output.ip, '.'))
    {
        output.ip = afterLast(output.ip, ':', IfNotFoundReturn::none);
        output.family = AF_INET;
    }
    return output;
}
}


inline
SocketAddress getLocalAddress(SocketType socket) //throw SysError
{
    sockaddr_storage addr = {};
    socklen_t addrLen = sizeof(addr);
    if (::getsockname(socket, reinterpret_cast<sockaddr*>(&addr), &addrLen) != 0)
        THROW_LAST_SYS_ERROR("getsockname");
    return impl::toSocketAddress(addr); //throw SysError
}


inline
SocketAddress getPeerAddress(SocketType socket) //throw SysError
{
    sockaddr_storage addr = {};
    socklen_t addrLen = sizeof(addr);
    if (::getpeername(socket, reinterpret_cast<sockaddr*>(&addr), &addrLen) != 0)
        THROW_LAST_SYS_ERROR("getpeername");
    return impl::toSocketAddress(addr); //throw SysError
}
}

#endif //SOCKET_H_8912374019283471092
