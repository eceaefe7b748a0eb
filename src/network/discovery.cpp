#include "network/discovery.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "protocol/error.hpp"
#include "util/logger.hpp"

namespace portal {
namespace network {

using protocol::ErrorKind;
using protocol::PortalError;

std::vector<uint8_t> buildAnnouncement(uint16_t servicePort)
{
    std::vector<uint8_t> payload(kDiscoveryMagic.begin(), kDiscoveryMagic.end());
    payload.push_back(static_cast<uint8_t>(servicePort >> 8));
    payload.push_back(static_cast<uint8_t>(servicePort & 0xFF));
    return payload;
}

std::optional<SocketAddress> parseAnnouncement(const uint8_t *data, size_t len,
                                               const std::string &sourceHost)
{
    if (len < kAnnouncementSize) {
        return std::nullopt;
    }
    if (!std::equal(kDiscoveryMagic.begin(), kDiscoveryMagic.end(), data)) {
        return std::nullopt;
    }
    size_t p = kDiscoveryMagic.size();
    uint16_t port = static_cast<uint16_t>((data[p] << 8) | data[p + 1]);
    if (port == 0) {
        return std::nullopt;
    }
    return SocketAddress{sourceHost, port};
}

// ---------------------------------------------------------------------------
//  BroadcastSender
// ---------------------------------------------------------------------------

BroadcastSender::BroadcastSender(uint16_t servicePort, uint16_t broadcastPort,
                                 const std::string &targetHost)
    : fd_(::socket(AF_INET, SOCK_DGRAM, 0))
    , payload_(buildAnnouncement(servicePort))
    , targetHost_(targetHost)
    , broadcastPort_(broadcastPort)
{
    if (fd_ < 0) {
        throw PortalError(ErrorKind::Io, std::string("udp socket failed: ") + std::strerror(errno));
    }
    int enable = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0) {
        util::logger::warn("[BroadcastSender] SO_BROADCAST rejected: " + std::string(std::strerror(errno)));
    }
}

BroadcastSender::~BroadcastSender()
{
    stop();
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void BroadcastSender::sendOnce()
{
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(broadcastPort_);
    if (::inet_pton(AF_INET, targetHost_.c_str(), &addr.sin_addr) != 1) {
        throw PortalError(ErrorKind::Io, "invalid broadcast address: " + targetHost_);
    }

    ssize_t n = ::sendto(fd_, payload_.data(), payload_.size(), 0,
                         reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (n != static_cast<ssize_t>(payload_.size())) {
        throw PortalError(ErrorKind::Io, std::string("sendto failed: ") + std::strerror(errno));
    }
    util::logger::debug("[BroadcastSender] Sent announcement to " + targetHost_ + ":" +
                        std::to_string(broadcastPort_));
}

void BroadcastSender::start(std::chrono::milliseconds period)
{
    if (running_.exchange(true)) {
        throw std::runtime_error("BroadcastSender: already running.");
    }
    thread_ = std::thread(&BroadcastSender::loop, this, period);
    util::logger::info("[BroadcastSender] Announcing every " + std::to_string(period.count()) + " ms");
}

void BroadcastSender::stop()
{
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    util::logger::info("[BroadcastSender] Stopped.");
}

void BroadcastSender::loop(std::chrono::milliseconds period)
{
    while (running_) {
        try {
            sendOnce();
        } catch (const PortalError &ex) {
            util::logger::warn(std::string("[BroadcastSender] ") + ex.what());
        }
        std::unique_lock<std::mutex> lock(waitMutex_);
        wake_.wait_for(lock, period, [this] { return !running_; });
    }
}

// ---------------------------------------------------------------------------
//  BroadcastListener
// ---------------------------------------------------------------------------

BroadcastListener::BroadcastListener(uint16_t listeningPort)
    : fd_(::socket(AF_INET, SOCK_DGRAM, 0))
    , port_(listeningPort)
{
    if (fd_ < 0) {
        throw PortalError(ErrorKind::Io, std::string("udp socket failed: ") + std::strerror(errno));
    }
    int reuse = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    ::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &reuse, sizeof(reuse));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(listeningPort);
    addr.sin_addr.s_addr = INADDR_ANY;
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string detail = "bind udp port " + std::to_string(listeningPort) + ": " + std::strerror(errno);
        ::close(fd_);
        throw PortalError(ErrorKind::Io, detail);
    }

    sockaddr_in bound;
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        port_ = ntohs(bound.sin_port);
    }
    util::logger::debug("[BroadcastListener] Listening on udp port " + std::to_string(port_));
}

BroadcastListener::~BroadcastListener()
{
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::optional<SocketAddress> BroadcastListener::recvOnce(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    uint8_t buffer[1024];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt;
        }
        timeval tv;
        tv.tv_sec = static_cast<time_t>(remaining.count() / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(remaining.count() % 1000000);
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in sender;
        socklen_t senderLen = sizeof(sender);
        ssize_t n = ::recvfrom(fd_, buffer, sizeof(buffer), 0,
                               reinterpret_cast<sockaddr*>(&sender), &senderLen);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return std::nullopt;
            }
            if (errno == EINTR) {
                continue;
            }
            throw PortalError(ErrorKind::Io, std::string("recvfrom failed: ") + std::strerror(errno));
        }

        char ipStr[INET_ADDRSTRLEN];
        ::inet_ntop(AF_INET, &sender.sin_addr, ipStr, INET_ADDRSTRLEN);
        auto addr = parseAnnouncement(buffer, static_cast<size_t>(n), ipStr);
        if (addr) {
            util::logger::debug("[BroadcastListener] Remote service at " + addr->toString());
            return addr;
        }
        util::logger::debug(std::string("[BroadcastListener] Ignored foreign datagram from ") + ipStr);
    }
}

// ---------------------------------------------------------------------------
//  DeviceRegistry
// ---------------------------------------------------------------------------

size_t DeviceRegistry::scan(BroadcastListener &listener, std::chrono::milliseconds window)
{
    auto deadline = std::chrono::steady_clock::now() + window;
    size_t added = 0;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        auto addr = listener.recvOnce(remaining);
        if (!addr) {
            break;
        }
        if (add(*addr)) {
            ++added;
        }
    }
    return added;
}

bool DeviceRegistry::add(const SocketAddress &address)
{
    std::lock_guard<std::mutex> lock(mutex_);
    bool inserted = devices_.insert(address).second;
    if (inserted) {
        util::logger::info("[DeviceRegistry] Discovered " + address.toString());
    }
    return inserted;
}

std::vector<SocketAddress> DeviceRegistry::list() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<SocketAddress>(devices_.begin(), devices_.end());
}

void DeviceRegistry::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.clear();
}

} // namespace network
} // namespace portal
