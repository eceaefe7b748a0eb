#ifndef PORTAL_CONFIG_PORTAL_CONFIG_HPP
#define PORTAL_CONFIG_PORTAL_CONFIG_HPP

#include <cstdint>
#include <string>

/**
 * @file portal_config.hpp
 * @brief Process-wide settings handed to the transfer engines at construction time.
 *
 * USAGE:
 *   - Populate manually or through util/config_parser.hpp.
 *   - The engines only ever see plain values copied out of this struct.
 */

namespace portal {
namespace config {

/**
 * @struct PortalConfig
 * @brief Holds the local settings of one peer:
 *   - servicePort: TCP port the receiver role listens on.
 *   - discoveryPort: UDP port used for broadcast announcements.
 *   - storageDirectory: where verified files are materialized.
 *   - broadcastIntervalMillis / scanTimeoutMillis: discovery pacing.
 *   - pauseBackoffMillis: how long a paused transfer sleeps between polls.
 *   - transferWorkers: size of the sender's file-job pool.
 *   - logLevel / logFile: logger setup.
 */
struct PortalConfig
{
    PortalConfig()
        : servicePort(11451),
          discoveryPort(8964),
          storageDirectory("received_files"),
          broadcastIntervalMillis(1000),
          scanTimeoutMillis(30000),
          pauseBackoffMillis(1000),
          transferWorkers(4),
          logLevel("info")
    {
    }

    uint16_t servicePort;
    uint16_t discoveryPort;
    std::string storageDirectory;
    uint32_t broadcastIntervalMillis;
    uint32_t scanTimeoutMillis;
    uint32_t pauseBackoffMillis;
    uint16_t transferWorkers;

    /// One of debug, info, warn, error, critical.
    std::string logLevel;

    /// Empty means console only.
    std::string logFile;
};

} // namespace config
} // namespace portal

#endif // PORTAL_CONFIG_PORTAL_CONFIG_HPP
