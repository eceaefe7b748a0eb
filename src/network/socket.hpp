#ifndef PORTAL_NETWORK_SOCKET_HPP
#define PORTAL_NETWORK_SOCKET_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

/**
 * @file socket.hpp
 * @brief Blocking TCP plumbing shared by both protocol roles.
 *
 * DESIGN GOALS:
 *   - One connected socket is owned by a Stream.
 *   - split() hands out a ReadHalf and a WriteHalf that share the descriptor,
 *     so one thread can block in recv() while another writes.
 *   - The descriptor closes when the last half (or the Stream) goes away.
 *   - Failures throw protocol::PortalError.
 */

namespace portal {
namespace network {

/**
 * @struct SocketAddress
 * @brief IPv4 address plus port, the unit produced by discovery.
 */
struct SocketAddress
{
    std::string host;
    uint16_t port = 0;

    std::string toString() const { return host + ":" + std::to_string(port); }

    /// Parse "a.b.c.d:port". Throws std::invalid_argument on junk.
    static SocketAddress parse(const std::string &text);

    bool operator==(const SocketAddress &o) const { return host == o.host && port == o.port; }
    bool operator<(const SocketAddress &o) const
    {
        return host < o.host || (host == o.host && port < o.port);
    }
};

/**
 * @brief RAII owner of a socket descriptor.
 */
class SocketHandle
{
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle();

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int fd() const { return fd_; }

    /// Wake any thread blocked on this socket; both directions end.
    void shutdown();

private:
    int fd_;
    std::atomic<bool> shutdown_{false};
};

class ReadHalf
{
public:
    ReadHalf() = default;
    explicit ReadHalf(std::shared_ptr<SocketHandle> handle) : handle_(std::move(handle)) {}

    /**
     * @brief Read up to @p len bytes.
     * @return 0 once the peer has closed its side.
     * @throw PortalError(Io) on a read failure.
     */
    size_t read(uint8_t *buf, size_t len);

    bool valid() const { return static_cast<bool>(handle_); }

private:
    std::shared_ptr<SocketHandle> handle_;
};

class WriteHalf
{
public:
    WriteHalf() = default;
    explicit WriteHalf(std::shared_ptr<SocketHandle> handle) : handle_(std::move(handle)) {}

    /**
     * @brief Write the whole buffer, retrying partial sends.
     * @throw PortalError(Disconnected) if the peer is gone, PortalError(Io) otherwise.
     */
    void writeAll(const uint8_t *buf, size_t len);

    /// Half-close: the peer reads end-of-stream after pending data.
    void shutdownWrite();

    /// Close both directions, waking a reader blocked on the same socket.
    void shutdown();

    bool valid() const { return static_cast<bool>(handle_); }

private:
    std::shared_ptr<SocketHandle> handle_;
};

/**
 * @class Stream
 * @brief A connected, bidirectional byte stream.
 */
class Stream
{
public:
    Stream() = default;
    Stream(int fd, SocketAddress peer);

    /**
     * @brief Dial a TCP peer.
     * @throw PortalError(ConnectionFailed) if the dial fails.
     */
    static Stream connectTo(const SocketAddress &address);

    /**
     * @brief Two already-connected local streams (socketpair).
     *        Used when both roles live in one process.
     */
    static std::pair<Stream, Stream> connectedPair();

    /// Hand out the two directions; the Stream itself keeps a reference too.
    std::pair<ReadHalf, WriteHalf> split() const;

    const SocketAddress& peer() const { return peer_; }
    bool valid() const { return static_cast<bool>(handle_); }
    void shutdown();

private:
    std::shared_ptr<SocketHandle> handle_;
    SocketAddress peer_;
};

/**
 * @class TcpListener
 * @brief Accepts inbound connections for the receiver role.
 */
class TcpListener
{
public:
    TcpListener() = default;
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    /**
     * @brief Bind and listen. Port 0 picks an ephemeral port, see localPort().
     * @throw PortalError(Io) if the socket cannot be bound.
     */
    void bind(const std::string &bindAddress, uint16_t port, int backlog = 8);

    /**
     * @brief Wait for the next connection.
     * @throw PortalError(Disconnected) once close() has been called.
     */
    Stream accept();

    uint16_t localPort() const { return localPort_; }

    /// Stop listening; a blocked accept() returns with an error.
    void close();

private:
    std::atomic<int> fd_{-1};
    uint16_t localPort_ = 0;
    std::atomic<bool> closed_{false};
};

} // namespace network
} // namespace portal

#endif // PORTAL_NETWORK_SOCKET_HPP
