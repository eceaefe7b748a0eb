#ifndef PORTAL_NETWORK_DISCOVERY_HPP
#define PORTAL_NETWORK_DISCOVERY_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "network/socket.hpp"

/**
 * @file discovery.hpp
 * @brief UDP broadcast announce/listen that turns a LAN peer into a dialable address.
 *
 * Announcement datagram:
 *   | magic: 0B 2D 0E 13 13 08 0A | service port: u16 big-endian |
 *
 * The receiver role announces; the sender role listens and records
 * (source IP, advertised port) in a DeviceRegistry.
 *
 * SAMPLE USAGE:
 *   @code
 *   using namespace portal::network;
 *
 *   BroadcastSender announcer(11451, 8964);
 *   announcer.start(std::chrono::milliseconds(1000));
 *
 *   BroadcastListener listener(8964);
 *   DeviceRegistry devices;
 *   devices.scan(listener, std::chrono::seconds(5));
 *   @endcode
 */

namespace portal {
namespace network {

constexpr std::array<uint8_t, 7> kDiscoveryMagic = {0x0B, 0x2D, 0x0E, 0x13, 0x13, 0x08, 0x0A};
constexpr size_t kAnnouncementSize = kDiscoveryMagic.size() + 2;

/// Datagram announcing @p servicePort.
std::vector<uint8_t> buildAnnouncement(uint16_t servicePort);

/**
 * @brief Decode a datagram received from @p sourceHost.
 * @return std::nullopt unless it starts with the magic and carries a port.
 */
std::optional<SocketAddress> parseAnnouncement(const uint8_t *data, size_t len,
                                               const std::string &sourceHost);

/**
 * @class BroadcastSender
 * @brief Periodically announces this peer's service port.
 */
class BroadcastSender
{
public:
    /**
     * @param servicePort TCP port peers should dial.
     * @param broadcastPort UDP port the listeners are bound to.
     * @param targetHost Defaults to the limited broadcast address.
     * @throw PortalError(Io) if the UDP socket cannot be created.
     */
    BroadcastSender(uint16_t servicePort, uint16_t broadcastPort,
                    const std::string &targetHost = "255.255.255.255");
    ~BroadcastSender();

    BroadcastSender(const BroadcastSender&) = delete;
    BroadcastSender& operator=(const BroadcastSender&) = delete;

    /// Send one announcement. @throw PortalError(Io) on failure.
    void sendOnce();

    /**
     * @brief Announce every @p period on a background thread until stop().
     * @throw std::runtime_error if already running.
     */
    void start(std::chrono::milliseconds period);
    void stop();

    bool isRunning() const { return running_; }

private:
    void loop(std::chrono::milliseconds period);

    int fd_;
    std::vector<uint8_t> payload_;
    std::string targetHost_;
    uint16_t broadcastPort_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex waitMutex_;
    std::condition_variable wake_;
};

/**
 * @class BroadcastListener
 * @brief Receives announcements on the discovery port.
 */
class BroadcastListener
{
public:
    /// @throw PortalError(Io) if the port cannot be bound.
    explicit BroadcastListener(uint16_t listeningPort);
    ~BroadcastListener();

    BroadcastListener(const BroadcastListener&) = delete;
    BroadcastListener& operator=(const BroadcastListener&) = delete;

    /**
     * @brief Wait for one valid announcement, skipping foreign datagrams.
     * @return std::nullopt if none arrived before the timeout.
     */
    std::optional<SocketAddress> recvOnce(std::chrono::milliseconds timeout);

    uint16_t port() const { return port_; }

private:
    int fd_;
    uint16_t port_;
};

/**
 * @class DeviceRegistry
 * @brief Discovered peer addresses; several scans may run at once.
 */
class DeviceRegistry
{
public:
    /**
     * @brief Listen for up to @p window and record every announcer heard.
     * @return Number of addresses that were new.
     */
    size_t scan(BroadcastListener &listener, std::chrono::milliseconds window);

    bool add(const SocketAddress &address);
    std::vector<SocketAddress> list() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::set<SocketAddress> devices_;
};

} // namespace network
} // namespace portal

#endif // PORTAL_NETWORK_DISCOVERY_HPP
