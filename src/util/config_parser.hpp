#ifndef PORTAL_UTIL_CONFIG_PARSER_HPP
#define PORTAL_UTIL_CONFIG_PARSER_HPP

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include "portal_config.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Minimal parser for the peer configuration file.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" style configuration file.
 *   - Populate portal::config::PortalConfig fields (servicePort, storageDirectory, ...).
 *   - Unknown keys are logged and ignored; malformed lines and bad numbers throw.
 *   - A missing file keeps the defaults.
 *
 * USAGE:
 *   @code
 *   portal::config::PortalConfig cfg;
 *   portal::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("portal.conf");
 *   parser.applyEnvironment();
 *   @endcode
 */

namespace portal {
namespace util {

/**
 * @class ConfigParser
 * @brief Reads a plain text key=value config and updates PortalConfig fields.
 */
class ConfigParser
{
public:
    /// Overrides storageDirectory when set.
    static constexpr const char *kStorageEnvVar = "RECEIVED_FILE_FOLDER";
    /// Older misspelled name, read only when kStorageEnvVar is unset.
    static constexpr const char *kLegacyStorageEnvVar = "RECEVIED_FILE_FOLDER";

    explicit ConfigParser(portal::config::PortalConfig &config)
        : config_(config)
    {
    }

    /**
     * @brief Read the given file line by line, storing recognized keys.
     * @throw std::runtime_error if a line is malformed.
     */
    inline void loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        logger::info("ConfigParser: Config loaded.");
    }

    /**
     * @brief Same as loadFromFile(), for text already in memory.
     */
    inline void loadFromStream(std::istream &in)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo) +
                                         " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    /**
     * @brief Apply environment overrides on top of whatever was loaded.
     */
    inline void applyEnvironment()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const char *name = kStorageEnvVar;
        const char *folder = std::getenv(name);
        if (folder == nullptr || *folder == '\0') {
            name = kLegacyStorageEnvVar;
            folder = std::getenv(name);
        }
        if (folder != nullptr && *folder != '\0') {
            config_.storageDirectory = folder;
            logger::debug(std::string("ConfigParser: storageDirectory overridden by ") +
                          name + " = " + folder);
        }
    }

private:
    portal::config::PortalConfig &config_;
    std::mutex mutex_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "servicePort") {
            config_.servicePort = parseUInt<uint16_t>(key, val);
        }
        else if (key == "discoveryPort") {
            config_.discoveryPort = parseUInt<uint16_t>(key, val);
        }
        else if (key == "storageDirectory") {
            config_.storageDirectory = val;
        }
        else if (key == "broadcastIntervalMillis") {
            config_.broadcastIntervalMillis = parseUInt<uint32_t>(key, val);
        }
        else if (key == "scanTimeoutMillis") {
            config_.scanTimeoutMillis = parseUInt<uint32_t>(key, val);
        }
        else if (key == "pauseBackoffMillis") {
            config_.pauseBackoffMillis = parseUInt<uint32_t>(key, val);
        }
        else if (key == "transferWorkers") {
            config_.transferWorkers = parseUInt<uint16_t>(key, val);
            if (config_.transferWorkers == 0) {
                throw std::runtime_error("ConfigParser: transferWorkers must be at least 1");
            }
        }
        else if (key == "logLevel") {
            // validate now so a typo fails at startup, not at first use
            logger::parseLogLevel(val);
            config_.logLevel = val;
        }
        else if (key == "logFile") {
            config_.logFile = val;
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "' with value '" + val + "'");
            return;
        }
        logger::debug("ConfigParser: " + key + " set to " + val);
    }

    inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    /**
     * @brief Parse an unsigned integer that must fit in T.
     * @throw std::runtime_error on junk, negative numbers or overflow.
     */
    template<typename T>
    T parseUInt(const std::string &key, const std::string &val) const
    {
        try {
            if (val.empty() || val[0] == '-' || val[0] == '+') {
                throw std::runtime_error("not an unsigned number");
            }
            size_t idx = 0;
            unsigned long long n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            if (n > std::numeric_limits<T>::max()) {
                throw std::runtime_error("out of range");
            }
            return static_cast<T>(n);
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: bad value for '" + key + "': '" + val +
                                     "': " + ex.what());
        }
    }
};

} // namespace util
} // namespace portal

#endif // PORTAL_UTIL_CONFIG_PARSER_HPP
