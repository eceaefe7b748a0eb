#include "network/socket.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "protocol/error.hpp"
#include "util/logger.hpp"

namespace portal {
namespace network {

using protocol::ErrorKind;
using protocol::PortalError;

namespace {

std::string errnoText(const std::string &what)
{
    return what + ": " + std::strerror(errno);
}

} // namespace

SocketAddress SocketAddress::parse(const std::string &text)
{
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        throw std::invalid_argument("expected host:port, got '" + text + "'");
    }
    SocketAddress addr;
    addr.host = text.substr(0, colon);

    std::string portText = text.substr(colon + 1);
    size_t idx = 0;
    unsigned long port = 0;
    try {
        port = std::stoul(portText, &idx, 10);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad port in '" + text + "'");
    }
    if (idx != portText.size() || port == 0 || port > 65535) {
        throw std::invalid_argument("bad port in '" + text + "'");
    }
    addr.port = static_cast<uint16_t>(port);
    return addr;
}

// ---------------------------------------------------------------------------

SocketHandle::~SocketHandle()
{
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void SocketHandle::shutdown()
{
    if (!shutdown_.exchange(true) && fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

// ---------------------------------------------------------------------------

size_t ReadHalf::read(uint8_t *buf, size_t len)
{
    if (!handle_) {
        throw PortalError(ErrorKind::Io, "read on an empty stream half");
    }
    while (true) {
        ssize_t n = ::recv(handle_->fd(), buf, len, 0);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == ECONNRESET) {
            throw PortalError(ErrorKind::Disconnected, "connection reset by peer");
        }
        throw PortalError(ErrorKind::Io, errnoText("recv failed"));
    }
}

void WriteHalf::writeAll(const uint8_t *buf, size_t len)
{
    if (!handle_) {
        throw PortalError(ErrorKind::Io, "write on an empty stream half");
    }
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(handle_->fd(), buf + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE || errno == ECONNRESET) {
                throw PortalError(ErrorKind::Disconnected, "peer closed the connection");
            }
            throw PortalError(ErrorKind::Io, errnoText("send failed"));
        }
        sent += static_cast<size_t>(n);
    }
}

void WriteHalf::shutdownWrite()
{
    if (handle_) {
        ::shutdown(handle_->fd(), SHUT_WR);
    }
}

void WriteHalf::shutdown()
{
    if (handle_) {
        handle_->shutdown();
    }
}

// ---------------------------------------------------------------------------

Stream::Stream(int fd, SocketAddress peer)
    : handle_(std::make_shared<SocketHandle>(fd))
    , peer_(std::move(peer))
{
}

Stream Stream::connectTo(const SocketAddress &address)
{
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw PortalError(ErrorKind::ConnectionFailed, errnoText("socket failed"));
    }

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(address.port);
    if (::inet_pton(AF_INET, address.host.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        throw PortalError(ErrorKind::ConnectionFailed, "invalid IPv4 address: " + address.host);
    }

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string detail = errnoText("connect to " + address.toString() + " failed");
        ::close(fd);
        throw PortalError(ErrorKind::ConnectionFailed, detail);
    }

    util::logger::info("[Stream] Connected to " + address.toString());
    return Stream(fd, address);
}

std::pair<Stream, Stream> Stream::connectedPair()
{
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) < 0) {
        throw PortalError(ErrorKind::Io, errnoText("socketpair failed"));
    }
    return {Stream(fds[0], SocketAddress{"local", 0}), Stream(fds[1], SocketAddress{"local", 0})};
}

std::pair<ReadHalf, WriteHalf> Stream::split() const
{
    if (!handle_) {
        throw PortalError(ErrorKind::Io, "split of an unconnected stream");
    }
    return {ReadHalf(handle_), WriteHalf(handle_)};
}

void Stream::shutdown()
{
    if (handle_) {
        handle_->shutdown();
    }
}

// ---------------------------------------------------------------------------

TcpListener::~TcpListener()
{
    close();
}

void TcpListener::bind(const std::string &bindAddress, uint16_t port, int backlog)
{
    if (fd_ >= 0) {
        throw PortalError(ErrorKind::Io, "listener already bound");
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw PortalError(ErrorKind::Io, errnoText("socket failed"));
    }

    int optval = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, bindAddress.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        throw PortalError(ErrorKind::Io, "invalid bind address: " + bindAddress);
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string detail = errnoText("bind on " + bindAddress + ":" + std::to_string(port));
        ::close(fd);
        throw PortalError(ErrorKind::Io, detail);
    }
    if (::listen(fd, backlog) < 0) {
        std::string detail = errnoText("listen failed");
        ::close(fd);
        throw PortalError(ErrorKind::Io, detail);
    }

    sockaddr_in bound;
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        localPort_ = ntohs(bound.sin_port);
    } else {
        localPort_ = port;
    }

    fd_ = fd;
    closed_ = false;
    util::logger::info("[TcpListener] Listening on " + bindAddress + ":" + std::to_string(localPort_));
}

Stream TcpListener::accept()
{
    while (true) {
        if (closed_ || fd_ < 0) {
            throw PortalError(ErrorKind::Disconnected, "listener closed");
        }
        sockaddr_in clientAddr;
        socklen_t clientLen = sizeof(clientAddr);
        int clientFd = ::accept(fd_.load(), reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
        if (clientFd < 0) {
            if (closed_) {
                throw PortalError(ErrorKind::Disconnected, "listener closed");
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            throw PortalError(ErrorKind::Io, errnoText("accept failed"));
        }

        char ipStr[INET_ADDRSTRLEN];
        ::inet_ntop(AF_INET, &clientAddr.sin_addr, ipStr, INET_ADDRSTRLEN);
        return Stream(clientFd, SocketAddress{ipStr, ntohs(clientAddr.sin_port)});
    }
}

void TcpListener::close()
{
    if (closed_.exchange(true)) {
        return;
    }
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        // shutdown() wakes a thread blocked in accept() on Linux
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

} // namespace network
} // namespace portal
